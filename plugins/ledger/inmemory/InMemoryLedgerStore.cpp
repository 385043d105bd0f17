#include "InMemoryLedgerStore.hpp"
#include <algorithm>
#include <iostream>

namespace brokerage {

// ═════════════════════════════════════════════════════════════════════════════
// Сессия
// ═════════════════════════════════════════════════════════════════════════════

class InMemoryLedgerStore::Session : public ILedgerSession {
public:
    Session(InMemoryLedgerStore& store,
            std::shared_ptr<std::mutex> lockHandle,
            std::unique_lock<std::mutex> lock,
            Account account)
        : store_(store)
        , lockHandle_(std::move(lockHandle))
        , lock_(std::move(lock))
        , account_(std::move(account))
    {
    }

    ~Session() override {
        abort();
    }

    const Account& account() const noexcept override {
        return account_;
    }

    LedgerResult<std::vector<Transaction>> transactions(std::string_view symbol) override {
        if (!lock_.owns_lock()) {
            return makeError(ErrorKind::StoreFailure, "Session is closed");
        }

        std::shared_lock guard(store_.dataMutex_);
        std::vector<Transaction> result;
        auto it = store_.journal_.find(account_.userId);
        if (it != store_.journal_.end()) {
            for (const auto& txn : it->second) {
                if (txn.symbol == symbol) {
                    result.push_back(txn);
                }
            }
        }
        return result;
    }

    LedgerResult<Transaction> commit(
        const Account& updatedAccount,
        const Transaction& transaction) override {

        if (!lock_.owns_lock()) {
            return makeError(ErrorKind::StoreFailure, "Session is closed");
        }

        auto committed = store_.applyCommit(account_, updatedAccount, transaction);
        if (committed) {
            account_ = updatedAccount;
        }
        lock_.unlock();
        return committed;
    }

    void abort() noexcept override {
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
    }

    bool isOpen() const noexcept override {
        return lock_.owns_lock();
    }

private:
    InMemoryLedgerStore& store_;
    std::shared_ptr<std::mutex> lockHandle_;
    std::unique_lock<std::mutex> lock_;
    Account account_;
};

// ═════════════════════════════════════════════════════════════════════════════
// Счета
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<Account> InMemoryLedgerStore::createAccount(
    std::string_view userId,
    Cents startingBalance,
    const TimePoint& createdAt)
{
    if (userId.empty()) {
        return makeError(ErrorKind::InvalidInput, "User id is empty");
    }
    if (startingBalance < 0) {
        return makeError(ErrorKind::InvalidInput, "Starting balance must not be negative");
    }

    std::unique_lock guard(dataMutex_);

    std::string key(userId);
    if (accounts_.contains(key)) {
        return makeError(ErrorKind::AccountExists, "Account already exists: " + key);
    }

    Account account{key, startingBalance, startingBalance, createdAt};
    accounts_[key] = account;
    journal_[key];
    return account;
}

LedgerResult<Account> InMemoryLedgerStore::readAccount(std::string_view userId)
{
    std::shared_lock guard(dataMutex_);

    auto it = accounts_.find(std::string(userId));
    if (it == accounts_.end()) {
        return makeError(ErrorKind::AccountNotFound, "User not found");
    }
    return it->second;
}

LedgerResult<std::vector<std::string>> InMemoryLedgerStore::listAccounts()
{
    std::shared_lock guard(dataMutex_);

    std::vector<std::string> users;
    users.reserve(accounts_.size());
    for (const auto& [userId, account] : accounts_) {
        users.push_back(userId);
    }
    return users;
}

// ═════════════════════════════════════════════════════════════════════════════
// Журнал
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<std::vector<Transaction>> InMemoryLedgerStore::readTransactions(
    std::string_view userId)
{
    auto snapshot = readSnapshot(userId);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return std::move(snapshot->transactions);
}

LedgerResult<LedgerSnapshot> InMemoryLedgerStore::readSnapshot(std::string_view userId)
{
    std::shared_lock guard(dataMutex_);

    std::string key(userId);
    auto accountIt = accounts_.find(key);
    if (accountIt == accounts_.end()) {
        return makeError(ErrorKind::AccountNotFound, "User not found");
    }

    LedgerSnapshot snapshot;
    snapshot.account = accountIt->second;

    auto journalIt = journal_.find(key);
    if (journalIt != journal_.end()) {
        snapshot.transactions = journalIt->second;
    }

    // createdAt монотонен при коммите, сортировка нужна только для порядка при равенстве
    std::stable_sort(snapshot.transactions.begin(), snapshot.transactions.end(),
                     [](const Transaction& a, const Transaction& b) {
                         if (a.createdAt != b.createdAt) {
                             return a.createdAt < b.createdAt;
                         }
                         return a.id < b.id;
                     });
    return snapshot;
}

// ═════════════════════════════════════════════════════════════════════════════
// Сессии и коммит
// ═════════════════════════════════════════════════════════════════════════════

std::shared_ptr<std::mutex> InMemoryLedgerStore::accountLock(const std::string& userId)
{
    std::lock_guard guard(locksMutex_);
    auto& lock = accountLocks_[userId];
    if (!lock) {
        lock = std::make_shared<std::mutex>();
    }
    return lock;
}

LedgerResult<std::unique_ptr<ILedgerSession>> InMemoryLedgerStore::beginSession(
    std::string_view userId)
{
    std::string key(userId);
    auto lockHandle = accountLock(key);
    std::unique_lock<std::mutex> lock(*lockHandle);

    auto account = readAccount(key);
    if (!account) {
        return std::unexpected(account.error());
    }

    return std::make_unique<Session>(
        *this, std::move(lockHandle), std::move(lock), std::move(*account));
}

void InMemoryLedgerStore::failNextCommit(std::string reason)
{
    std::unique_lock guard(dataMutex_);
    failNextCommit_ = true;
    failReason_ = std::move(reason);
}

LedgerResult<Transaction> InMemoryLedgerStore::applyCommit(
    const Account& original,
    const Account& updated,
    const Transaction& transaction)
{
    auto valid = validateCommit(original, updated, transaction);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    std::unique_lock guard(dataMutex_);

    if (failNextCommit_) {
        failNextCommit_ = false;
        std::cerr << "✗ In-memory ledger: commit rejected (" << failReason_ << ")" << std::endl;
        return makeError(ErrorKind::StoreFailure, failReason_);
    }

    auto& entries = journal_[original.userId];

    Transaction committed = transaction;
    committed.id = nextTransactionId_++;
    committed.userId = original.userId;

    if (!entries.empty() && entries.back().createdAt &&
        (!committed.createdAt || *committed.createdAt < *entries.back().createdAt)) {
        committed.createdAt = entries.back().createdAt;
    }

    entries.push_back(committed);
    accounts_[original.userId].cashBalance = updated.cashBalance;

    return committed;
}

}  // namespace brokerage
