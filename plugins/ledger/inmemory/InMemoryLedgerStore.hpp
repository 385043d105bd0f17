#pragma once

#include "ILedgerStore.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// Реализация: InMemoryLedgerStore
// ═══════════════════════════════════════════════════════════════════════════════
//
// Журнал в памяти процесса. Сессии по одному счету сериализуются
// мьютексом счета; данные защищены общим shared_mutex, поэтому чтения
// видят только полностью примененные коммиты.

class InMemoryLedgerStore : public ILedgerStore {
public:
    InMemoryLedgerStore() = default;
    ~InMemoryLedgerStore() override = default;

    InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
    InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

    LedgerResult<Account> createAccount(
        std::string_view userId,
        Cents startingBalance,
        const TimePoint& createdAt) override;

    LedgerResult<Account> readAccount(std::string_view userId) override;

    LedgerResult<std::vector<std::string>> listAccounts() override;

    LedgerResult<std::vector<Transaction>> readTransactions(
        std::string_view userId) override;

    LedgerResult<LedgerSnapshot> readSnapshot(std::string_view userId) override;

    LedgerResult<std::unique_ptr<ILedgerSession>> beginSession(
        std::string_view userId) override;

    // Следующий commit завершится StoreFailure без изменений (для тестов отката)
    void failNextCommit(std::string reason = "Injected commit failure");

private:
    class Session;

    std::shared_ptr<std::mutex> accountLock(const std::string& userId);

    LedgerResult<Transaction> applyCommit(
        const Account& original,
        const Account& updated,
        const Transaction& transaction);

    mutable std::shared_mutex dataMutex_;
    std::map<std::string, Account> accounts_;
    std::map<std::string, std::vector<Transaction>> journal_;
    std::int64_t nextTransactionId_ = 1;
    bool failNextCommit_ = false;
    std::string failReason_;

    std::mutex locksMutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> accountLocks_;
};

}  // namespace brokerage
