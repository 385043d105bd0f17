#pragma once

#include "LedgerTypes.hpp"
#include "LedgerError.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <boost/program_options.hpp>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ILedgerSession
// ═══════════════════════════════════════════════════════════════════════════════

// Сессия атомарной операции над одним счетом.
// Пока сессия открыта, другие сессии по тому же счету ждут.
// Все изменения применяются только в commit(); деструктор незакрытой
// сессии выполняет abort(), и хранилище остается без изменений.
class ILedgerSession {
public:
    virtual ~ILedgerSession() = default;

    // Состояние счета на момент открытия сессии
    virtual const Account& account() const noexcept = 0;

    // Сделки счета по инструменту в порядке журнала
    virtual LedgerResult<std::vector<Transaction>> transactions(
        std::string_view symbol) = 0;

    // Атомарно записывает новый баланс и добавляет сделку в журнал.
    // Хранилище назначает id, а createdAt не опускается ниже последней
    // записи этого счета. Возвращает сохраненную сделку.
    // Разница балансов обязана совпадать с cashEffect(transaction).
    virtual LedgerResult<Transaction> commit(
        const Account& updatedAccount,
        const Transaction& transaction) = 0;

    virtual void abort() noexcept = 0;

    virtual bool isOpen() const noexcept = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ILedgerStore
// ═══════════════════════════════════════════════════════════════════════════════

class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    // Инициализация хранилища из опций командной строки.
    // Плагин извлекает только свои опции.
    virtual Result initializeFromOptions(
        [[maybe_unused]] const boost::program_options::variables_map& options) {
        return {};
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Счета
    // ═══════════════════════════════════════════════════════════════════════

    virtual LedgerResult<Account> createAccount(
        std::string_view userId,
        Cents startingBalance,
        const TimePoint& createdAt) = 0;

    virtual LedgerResult<Account> readAccount(std::string_view userId) = 0;

    virtual LedgerResult<std::vector<std::string>> listAccounts() = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Журнал сделок
    // ═══════════════════════════════════════════════════════════════════════

    // Все сделки счета: по возрастанию createdAt, при равенстве по id
    virtual LedgerResult<std::vector<Transaction>> readTransactions(
        std::string_view userId) = 0;

    // Счет и журнал из одного согласованного снимка:
    // наполовину примененная сделка в нем не видна
    virtual LedgerResult<LedgerSnapshot> readSnapshot(std::string_view userId) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Сессии
    // ═══════════════════════════════════════════════════════════════════════

    virtual LedgerResult<std::unique_ptr<ILedgerSession>> beginSession(
        std::string_view userId) = 0;
};

// Общая проверка коммита для реализаций хранилища: тот же счет,
// неизменный startingBalance, баланс >= 0 и меняется ровно на cashEffect
LedgerResult<void> validateCommit(
    const Account& original,
    const Account& updated,
    const Transaction& transaction);

}  // namespace brokerage
