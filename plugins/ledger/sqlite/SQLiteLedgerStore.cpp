#include "SQLiteLedgerStore.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace brokerage {

// ═════════════════════════════════════════════════════════════════════════════
// Сессия: BEGIN IMMEDIATE ... COMMIT | ROLLBACK
// ═════════════════════════════════════════════════════════════════════════════

class SQLiteLedgerStore::Session : public ILedgerSession {
public:
    Session(SQLiteLedgerStore& store, std::unique_lock<std::mutex> lock, Account account)
        : store_(store)
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
        return store_.selectTransactions(account_.userId, symbol);
    }

    LedgerResult<Transaction> commit(
        const Account& updatedAccount,
        const Transaction& transaction) override;

    void abort() noexcept override {
        if (!lock_.owns_lock()) {
            return;
        }
        sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        lock_.unlock();
    }

    bool isOpen() const noexcept override {
        return lock_.owns_lock();
    }

private:
    LedgerResult<Transaction> fail(Error error) {
        abort();
        std::cerr << "✗ SQLite ledger: transaction rolled back: "
                  << error.message << std::endl;
        return std::unexpected(std::move(error));
    }

    SQLiteLedgerStore& store_;
    std::unique_lock<std::mutex> lock_;
    Account account_;
};

LedgerResult<Transaction> SQLiteLedgerStore::Session::commit(
    const Account& updatedAccount,
    const Transaction& transaction)
{
    if (!lock_.owns_lock()) {
        return makeError(ErrorKind::StoreFailure, "Session is closed");
    }

    auto valid = validateCommit(account_, updatedAccount, transaction);
    if (!valid) {
        return fail(valid.error());
    }

    Transaction committed = transaction;
    committed.userId = account_.userId;

    // Метки хранятся в микросекундах; createdAt не опускается ниже последней записи
    if (committed.createdAt) {
        committed.createdAt = fromMicros(toMicros(*committed.createdAt));
    }

    auto lastTimestamp = store_.selectLastTimestamp(account_.userId);
    if (!lastTimestamp) {
        return fail(lastTimestamp.error());
    }
    if (*lastTimestamp &&
        (!committed.createdAt || toMicros(*committed.createdAt) < **lastTimestamp)) {
        committed.createdAt = fromMicros(**lastTimestamp);
    }

    sqlite3* db = store_.db_;

    // Обновляем баланс
    const char* updateSql = "UPDATE accounts SET cash_balance = ? WHERE user_id = ?";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db, updateSql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail(store_.storeError("Failed to prepare balance update"));
    }

    sqlite3_bind_int64(stmt, 1, updatedAccount.cashBalance);
    sqlite3_bind_text(stmt, 2, account_.userId.data(), account_.userId.size(), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return fail(store_.storeError("Failed to update balance"));
    }

    // Добавляем запись в журнал
    const char* insertSql = R"(
        INSERT INTO transactions
            (user_id, symbol, type, quantity, price, total_amount, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    rc = sqlite3_prepare_v2(db, insertSql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail(store_.storeError("Failed to prepare transaction insert"));
    }

    std::string_view typeName = toString(committed.type);

    sqlite3_bind_text(stmt, 1, committed.userId.data(), committed.userId.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, committed.symbol.data(), committed.symbol.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, typeName.data(), typeName.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, committed.quantity);
    sqlite3_bind_double(stmt, 5, committed.price);
    sqlite3_bind_int64(stmt, 6, committed.totalAmount);
    if (committed.createdAt) {
        sqlite3_bind_int64(stmt, 7, toMicros(*committed.createdAt));
    } else {
        sqlite3_bind_null(stmt, 7);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return fail(store_.storeError("Failed to append transaction"));
    }

    committed.id = sqlite3_last_insert_rowid(db);

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, "COMMIT", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return fail(Error{ErrorKind::StoreFailure, "Failed to commit transaction: " + error});
    }

    account_ = updatedAccount;
    lock_.unlock();
    return committed;
}

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteLedgerStore::SQLiteLedgerStore(std::string_view dbPath)
    : dbPath_(dbPath), initialized_(false) {
    if (!dbPath.empty()) {
        auto result = initializeDatabase(dbPath);
        if (!result) {
            throw std::runtime_error("Failed to initialize ledger: " + result.error());
        }
    }
}

SQLiteLedgerStore::~SQLiteLedgerStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteLedgerStore::initializeFromOptions(
    const boost::program_options::variables_map& options) {

    if (initialized_) {
        return {};
    }

    if (!options.count("sqlite-path")) {
        return std::unexpected(
            "SQLite ledger path not specified.\n"
            "Use --sqlite-path <path>");
    }

    std::lock_guard guard(mutex_);
    return initializeDatabase(options.at("sqlite-path").as<std::string>());
}

Result SQLiteLedgerStore::initializeDatabase(std::string_view path) {
    if (initialized_) {
        return {};
    }

    dbPath_ = std::string(path);

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    // Другой процесс может держать запись: ждем, а не падаем сразу
    sqlite3_busy_timeout(db_, 5000);

    auto pragmaResult = execute("PRAGMA foreign_keys = ON");
    if (!pragmaResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return pragmaResult;
    }

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    initialized_ = true;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// СХЕМА
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteLedgerStore::createTables() {
    const char* sql = R"(
        -- Счета: баланс в центах
        CREATE TABLE IF NOT EXISTS accounts (
            user_id TEXT PRIMARY KEY,
            cash_balance INTEGER NOT NULL CHECK (cash_balance >= 0),
            starting_balance INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        );

        -- Журнал сделок: только добавление
        -- created_at: микросекунды от эпохи (UTC)
        CREATE TABLE IF NOT EXISTS transactions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id TEXT NOT NULL,
            symbol TEXT NOT NULL,
            type TEXT NOT NULL,
            quantity INTEGER NOT NULL,
            price REAL NOT NULL,
            total_amount INTEGER NOT NULL,
            created_at INTEGER,
            FOREIGN KEY (user_id) REFERENCES accounts(user_id) ON DELETE RESTRICT
        );

        CREATE INDEX IF NOT EXISTS idx_transactions_user_time
            ON transactions(user_id, created_at, id);
        CREATE INDEX IF NOT EXISTS idx_transactions_user_symbol
            ON transactions(user_id, symbol);

        -- Записи журнала неизменяемы
        CREATE TRIGGER IF NOT EXISTS transactions_no_update
        BEFORE UPDATE ON transactions
        BEGIN
            SELECT RAISE(ABORT, 'transactions are append-only');
        END;

        CREATE TRIGGER IF NOT EXISTS transactions_no_delete
        BEFORE DELETE ON transactions
        BEGIN
            SELECT RAISE(ABORT, 'transactions are append-only');
        END;

        -- Начальный баланс не меняется после создания счета
        CREATE TRIGGER IF NOT EXISTS accounts_starting_balance_immutable
        BEFORE UPDATE OF starting_balance ON accounts
        WHEN NEW.starting_balance <> OLD.starting_balance
        BEGIN
            SELECT RAISE(ABORT, 'starting_balance is immutable');
        END;
    )";

    auto result = execute(sql);
    if (!result) {
        return std::unexpected("Failed to create tables: " + result.error());
    }
    return {};
}

Result SQLiteLedgerStore::execute(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected(error);
    }
    return {};
}

Error SQLiteLedgerStore::storeError(std::string_view context) const {
    return Error{ErrorKind::StoreFailure,
                 std::string(context) + ": " + sqlite3_errmsg(db_)};
}

std::int64_t SQLiteLedgerStore::toMicros(const TimePoint& tp) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
}

TimePoint SQLiteLedgerStore::fromMicros(std::int64_t micros) noexcept {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::microseconds(micros)));
}

// ═════════════════════════════════════════════════════════════════════════════
// Запросы
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<Account> SQLiteLedgerStore::selectAccount(std::string_view userId) {
    const char* sql =
        "SELECT user_id, cash_balance, starting_balance, created_at "
        "FROM accounts WHERE user_id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(storeError("Failed to prepare account select"));
    }

    sqlite3_bind_text(stmt, 1, userId.data(), userId.size(), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return makeError(ErrorKind::AccountNotFound, "User not found");
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::unexpected(storeError("Failed to read account"));
    }

    Account account;
    const unsigned char* id = sqlite3_column_text(stmt, 0);
    account.userId = id ? reinterpret_cast<const char*>(id) : "";
    account.cashBalance = sqlite3_column_int64(stmt, 1);
    account.startingBalance = sqlite3_column_int64(stmt, 2);
    account.createdAt = fromMicros(sqlite3_column_int64(stmt, 3));

    sqlite3_finalize(stmt);
    return account;
}

LedgerResult<std::vector<Transaction>> SQLiteLedgerStore::selectTransactions(
    std::string_view userId,
    std::optional<std::string_view> symbol)
{
    std::string sql =
        "SELECT id, user_id, symbol, type, quantity, price, total_amount, created_at "
        "FROM transactions WHERE user_id = ?";
    if (symbol) {
        sql += " AND symbol = ?";
    }
    sql += " ORDER BY created_at ASC, id ASC";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(storeError("Failed to prepare transaction select"));
    }

    sqlite3_bind_text(stmt, 1, userId.data(), userId.size(), SQLITE_TRANSIENT);
    if (symbol) {
        sqlite3_bind_text(stmt, 2, symbol->data(), symbol->size(), SQLITE_TRANSIENT);
    }

    std::vector<Transaction> transactions;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Transaction txn;
        txn.id = sqlite3_column_int64(stmt, 0);

        const unsigned char* user = sqlite3_column_text(stmt, 1);
        const unsigned char* sym = sqlite3_column_text(stmt, 2);
        const unsigned char* type = sqlite3_column_text(stmt, 3);

        txn.userId = user ? reinterpret_cast<const char*>(user) : "";
        txn.symbol = sym ? reinterpret_cast<const char*>(sym) : "";
        txn.type = type ? parseTransactionType(reinterpret_cast<const char*>(type))
                        : TransactionType::Unknown;
        txn.quantity = sqlite3_column_int64(stmt, 4);
        txn.price = sqlite3_column_double(stmt, 5);
        txn.totalAmount = sqlite3_column_int64(stmt, 6);

        if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
            txn.createdAt = fromMicros(sqlite3_column_int64(stmt, 7));
        }

        transactions.push_back(std::move(txn));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected(storeError("Error reading transactions"));
    }

    return transactions;
}

LedgerResult<std::optional<std::int64_t>> SQLiteLedgerStore::selectLastTimestamp(
    std::string_view userId)
{
    const char* sql = "SELECT MAX(created_at) FROM transactions WHERE user_id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(storeError("Failed to prepare timestamp select"));
    }

    sqlite3_bind_text(stmt, 1, userId.data(), userId.size(), SQLITE_TRANSIENT);

    std::optional<std::int64_t> last;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        last = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return std::unexpected(storeError("Failed to read last timestamp"));
    }
    return last;
}

// ═════════════════════════════════════════════════════════════════════════════
// Счета
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<Account> SQLiteLedgerStore::createAccount(
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

    std::lock_guard guard(mutex_);

    if (!initialized_ || !db_) {
        return makeError(ErrorKind::StoreFailure, "Database not initialized");
    }

    const char* sql = R"(
        INSERT INTO accounts (user_id, cash_balance, starting_balance, created_at)
        VALUES (?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(storeError("Failed to prepare account insert"));
    }

    sqlite3_bind_text(stmt, 1, userId.data(), userId.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, startingBalance);
    sqlite3_bind_int64(stmt, 3, startingBalance);
    sqlite3_bind_int64(stmt, 4, toMicros(createdAt));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return makeError(ErrorKind::AccountExists,
                         "Account already exists: " + std::string(userId));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(storeError("Failed to create account"));
    }

    return Account{std::string(userId), startingBalance, startingBalance,
                   fromMicros(toMicros(createdAt))};
}

LedgerResult<Account> SQLiteLedgerStore::readAccount(std::string_view userId) {
    std::lock_guard guard(mutex_);

    if (!initialized_ || !db_) {
        return makeError(ErrorKind::StoreFailure, "Database not initialized");
    }
    return selectAccount(userId);
}

LedgerResult<std::vector<std::string>> SQLiteLedgerStore::listAccounts() {
    std::lock_guard guard(mutex_);

    if (!initialized_ || !db_) {
        return makeError(ErrorKind::StoreFailure, "Database not initialized");
    }

    const char* sql = "SELECT user_id FROM accounts ORDER BY user_id";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected(storeError("Failed to prepare statement"));
    }

    std::vector<std::string> users;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* user = sqlite3_column_text(stmt, 0);
        if (user) {
            users.emplace_back(reinterpret_cast<const char*>(user));
        }
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected(storeError("Error reading accounts"));
    }

    return users;
}

// ═════════════════════════════════════════════════════════════════════════════
// Журнал и снимки
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<std::vector<Transaction>> SQLiteLedgerStore::readTransactions(
    std::string_view userId)
{
    auto snapshot = readSnapshot(userId);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return std::move(snapshot->transactions);
}

LedgerResult<LedgerSnapshot> SQLiteLedgerStore::readSnapshot(std::string_view userId) {
    std::lock_guard guard(mutex_);

    if (!initialized_ || !db_) {
        return makeError(ErrorKind::StoreFailure, "Database not initialized");
    }

    // Читающая транзакция: счет и журнал из одного снимка
    auto begin = execute("BEGIN");
    if (!begin) {
        return makeError(ErrorKind::StoreFailure, "Failed to begin read: " + begin.error());
    }

    LedgerSnapshot snapshot;

    auto account = selectAccount(userId);
    if (!account) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return std::unexpected(account.error());
    }
    snapshot.account = std::move(*account);

    auto transactions = selectTransactions(userId, std::nullopt);
    if (!transactions) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return std::unexpected(transactions.error());
    }
    snapshot.transactions = std::move(*transactions);

    auto end = execute("COMMIT");
    if (!end) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return makeError(ErrorKind::StoreFailure, "Failed to finish read: " + end.error());
    }

    return snapshot;
}

// ═════════════════════════════════════════════════════════════════════════════
// Сессии
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<std::unique_ptr<ILedgerSession>> SQLiteLedgerStore::beginSession(
    std::string_view userId)
{
    std::unique_lock lock(mutex_);

    if (!initialized_ || !db_) {
        return makeError(ErrorKind::StoreFailure, "Database not initialized");
    }

    auto begin = execute("BEGIN IMMEDIATE");
    if (!begin) {
        return makeError(ErrorKind::StoreFailure, "Failed to begin session: " + begin.error());
    }

    auto account = selectAccount(userId);
    if (!account) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return std::unexpected(account.error());
    }

    return std::make_unique<Session>(*this, std::move(lock), std::move(*account));
}

}  // namespace brokerage
