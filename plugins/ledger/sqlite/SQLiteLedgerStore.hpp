#pragma once

#include "ILedgerStore.hpp"
#include <sqlite3.h>
#include <mutex>
#include <optional>
#include <string>
#include <boost/program_options.hpp>

namespace brokerage {

class SQLiteLedgerStore : public ILedgerStore {
public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // Пустой путь: хранилище инициализируется позже через initializeFromOptions
    explicit SQLiteLedgerStore(std::string_view dbPath);
    ~SQLiteLedgerStore() override;

    SQLiteLedgerStore(const SQLiteLedgerStore&) = delete;
    SQLiteLedgerStore& operator=(const SQLiteLedgerStore&) = delete;

    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    // ═════════════════════════════════════════════════════════════════════════
    // ILedgerStore interface
    // ═════════════════════════════════════════════════════════════════════════

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

    const std::string& path() const noexcept { return dbPath_; }

private:
    class Session;

    sqlite3* db_ = nullptr;
    std::string dbPath_;
    bool initialized_ = false;

    // Одно соединение на хранилище: сессия держит мьютекс
    // и транзакцию BEGIN IMMEDIATE до commit/abort
    std::mutex mutex_;

    // ═════════════════════════════════════════════════════════════════════════
    // Вспомогательные методы (вызываются под mutex_)
    // ═════════════════════════════════════════════════════════════════════════

    Result initializeDatabase(std::string_view path);
    Result createTables();
    Result execute(const char* sql);

    LedgerResult<Account> selectAccount(std::string_view userId);

    // symbol == nullopt: все сделки счета
    LedgerResult<std::vector<Transaction>> selectTransactions(
        std::string_view userId,
        std::optional<std::string_view> symbol);

    LedgerResult<std::optional<std::int64_t>> selectLastTimestamp(std::string_view userId);

    Error storeError(std::string_view context) const;

    static std::int64_t toMicros(const TimePoint& tp) noexcept;
    static TimePoint fromMicros(std::int64_t micros) noexcept;
};

}  // namespace brokerage
