#include "storage/sqlite_store.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>

namespace mailfwd {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("SQL prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void reset() {
        sqlite3_reset(stmt_);
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("SQL step failed: ") + sqlite3_errmsg(db_));
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    std::string text(int col) const {
        auto* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }

    std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) return std::nullopt;
        return text(col);
    }

    int64_t int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string msg = std::string("SQL error: ") + (err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        throw StoreError(msg);
    }
}

// Commits only when commit() is reached; otherwise rolls back on scope exit.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_or_throw(db_, "BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!committed_) {
            char* err_msg = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
                LOG_ERROR_FMT("Rollback failed: {}", err_msg ? err_msg : "unknown");
                sqlite3_free(err_msg);
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_or_throw(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

int64_t to_epoch(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

Timestamp from_epoch(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

constexpr const char* kDomainColumns =
    "id, name, owner_id, dkim_private_key, dkim_selector, catch_all_email, is_deleted";

Domain read_domain(const Statement& stmt) {
    Domain d;
    d.id = stmt.int64(0);
    d.name = stmt.text(1);
    d.owner_id = stmt.int64(2);
    d.dkim_private_key = stmt.optional_text(3);
    d.dkim_selector = stmt.text(4);
    d.catch_all_email = stmt.optional_text(5);
    d.is_deleted = stmt.int64(6) != 0;
    return d;
}

Alias read_alias(const Statement& stmt) {
    Alias a;
    a.id = stmt.int64(0);
    a.domain_id = stmt.int64(1);
    a.local_part = stmt.text(2);
    a.targets = stmt.text(3);
    if (!stmt.is_null(4)) {
        a.expires_at = from_epoch(stmt.int64(4));
    }
    a.is_deleted = stmt.int64(5) != 0;
    return a;
}

ForwardingRule read_rule(const Statement& stmt) {
    ForwardingRule r;
    r.id = stmt.int64(0);
    r.alias_id = stmt.int64(1);
    r.priority = static_cast<int>(stmt.int64(2));

    auto condition = stmt.text(3);
    auto condition_type = parse_condition_type(condition);
    if (!condition_type) {
        throw DecodeError("Rule " + std::to_string(r.id) + " has unknown condition type '" + condition + "'");
    }
    r.condition_type = *condition_type;
    r.condition_value = stmt.text(4);

    auto action = stmt.text(5);
    auto action_type = parse_action_type(action);
    if (!action_type) {
        throw DecodeError("Rule " + std::to_string(r.id) + " has unknown action type '" + action + "'");
    }
    r.action_type = *action_type;
    r.action_value = stmt.optional_text(6);
    r.is_active = stmt.int64(7) != 0;
    r.match_count = stmt.int64(8);
    return r;
}

constexpr const char* kMessageColumns =
    "id, message_id, domain_id, sender_email, recipient_email, forwarded_to, subject, "
    "size_bytes, has_attachments, status, error_message";

Message read_message(const Statement& stmt) {
    Message m;
    m.id = stmt.int64(0);
    m.message_id = stmt.text(1);
    m.domain_id = stmt.int64(2);
    m.sender_email = stmt.text(3);
    m.recipient_email = stmt.text(4);
    m.forwarded_to = stmt.optional_text(5);
    m.subject = stmt.text(6);
    m.size_bytes = static_cast<size_t>(stmt.int64(7));
    m.has_attachments = stmt.int64(8) != 0;

    auto status = stmt.text(9);
    auto parsed = parse_message_status(status);
    if (!parsed) {
        throw DecodeError("Message " + std::to_string(m.id) + " has unknown status '" + status + "'");
    }
    m.status = *parsed;
    m.error_message = stmt.optional_text(10);
    return m;
}

}  // namespace

SqliteStore::SqliteStore(const std::filesystem::path& db_path)
    : db_path_(db_path) {
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto parent = db_path_.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            last_error_ = "Cannot create database directory: " + ec.message();
            LOG_ERROR(last_error_);
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.string().c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("Cannot open database: ") + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    execute_sql("PRAGMA journal_mode=WAL;");
    execute_sql("PRAGMA foreign_keys=ON;");

    return create_tables();
}

bool SqliteStore::create_tables() {
    const char* domains_table = R"(
        CREATE TABLE IF NOT EXISTS domains (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL COLLATE NOCASE,
            owner_id INTEGER NOT NULL DEFAULT 0,
            dkim_private_key TEXT,
            dkim_selector TEXT NOT NULL DEFAULT 'mailfwd',
            catch_all_email TEXT,
            is_deleted INTEGER NOT NULL DEFAULT 0,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
    )";

    const char* domains_index = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_domains_name
            ON domains(name) WHERE is_deleted = 0;
    )";

    const char* aliases_table = R"(
        CREATE TABLE IF NOT EXISTS aliases (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            domain_id INTEGER NOT NULL,
            local_part TEXT NOT NULL COLLATE NOCASE,
            targets TEXT NOT NULL,
            expires_at INTEGER,
            is_deleted INTEGER NOT NULL DEFAULT 0,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY(domain_id) REFERENCES domains(id)
        );
    )";

    const char* aliases_index = R"(
        CREATE UNIQUE INDEX IF NOT EXISTS idx_aliases_local_part
            ON aliases(domain_id, local_part) WHERE is_deleted = 0;
    )";

    const char* rules_table = R"(
        CREATE TABLE IF NOT EXISTS forwarding_rules (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            alias_id INTEGER NOT NULL,
            priority INTEGER NOT NULL DEFAULT 0,
            condition_type TEXT NOT NULL,
            condition_value TEXT NOT NULL DEFAULT '',
            action_type TEXT NOT NULL,
            action_value TEXT,
            is_active INTEGER NOT NULL DEFAULT 1,
            match_count INTEGER NOT NULL DEFAULT 0,
            FOREIGN KEY(alias_id) REFERENCES aliases(id)
        );
    )";

    const char* rules_index = R"(
        CREATE INDEX IF NOT EXISTS idx_rules_alias ON forwarding_rules(alias_id, priority);
    )";

    const char* messages_table = R"(
        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            message_id TEXT NOT NULL,
            domain_id INTEGER NOT NULL,
            sender_email TEXT NOT NULL,
            recipient_email TEXT NOT NULL,
            forwarded_to TEXT,
            subject TEXT NOT NULL DEFAULT '',
            size_bytes INTEGER NOT NULL DEFAULT 0,
            has_attachments INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL,
            error_message TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(message_id, recipient_email)
        );
    )";

    const char* preferences_table = R"(
        CREATE TABLE IF NOT EXISTS notification_preferences (
            user_id INTEGER PRIMARY KEY,
            notify_on_failure INTEGER NOT NULL DEFAULT 1
        );
    )";

    if (!execute_sql(domains_table)) return false;
    if (!execute_sql(domains_index)) return false;
    if (!execute_sql(aliases_table)) return false;
    if (!execute_sql(aliases_index)) return false;
    if (!execute_sql(rules_table)) return false;
    if (!execute_sql(rules_index)) return false;
    if (!execute_sql(messages_table)) return false;
    if (!execute_sql(preferences_table)) return false;

    return true;
}

bool SqliteStore::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("SQL error: ") + (err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        LOG_ERROR(last_error_);
        return false;
    }
    return true;
}

void SqliteStore::require_open() const {
    if (!db_) {
        throw StoreError("Database not initialized: " + db_path_.string());
    }
}

std::optional<Domain> SqliteStore::find_domain(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    std::string sql = std::string("SELECT ") + kDomainColumns +
                      " FROM domains WHERE name = ? COLLATE NOCASE AND is_deleted = 0;";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, name);

    std::optional<Domain> result;
    if (stmt.step()) {
        result = read_domain(stmt);
    }
    stmt.reset();
    txn.commit();
    return result;
}

std::optional<Alias> SqliteStore::find_alias(int64_t domain_id, const std::string& local_part) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "SELECT id, domain_id, local_part, targets, expires_at, is_deleted FROM aliases "
        "WHERE domain_id = ? AND local_part = ? COLLATE NOCASE AND is_deleted = 0;");
    stmt.bind(1, domain_id);
    stmt.bind(2, local_part);

    std::optional<Alias> result;
    if (stmt.step()) {
        result = read_alias(stmt);
    }
    stmt.reset();
    txn.commit();
    return result;
}

std::vector<ForwardingRule> SqliteStore::active_rules(int64_t alias_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "SELECT id, alias_id, priority, condition_type, condition_value, action_type, "
        "action_value, is_active, match_count FROM forwarding_rules "
        "WHERE alias_id = ? AND is_active = 1 ORDER BY priority ASC, id ASC;");
    stmt.bind(1, alias_id);

    std::vector<ForwardingRule> rules;
    while (stmt.step()) {
        rules.push_back(read_rule(stmt));
    }
    txn.commit();
    return rules;
}

void SqliteStore::increment_match_count(int64_t rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_, "UPDATE forwarding_rules SET match_count = match_count + 1 WHERE id = ?;");
    stmt.bind(1, rule_id);
    stmt.step();
    txn.commit();
}

int64_t SqliteStore::insert_message(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "INSERT INTO messages (message_id, domain_id, sender_email, recipient_email, "
        "forwarded_to, subject, size_bytes, has_attachments, status, error_message) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.bind(1, message.message_id);
    stmt.bind(2, message.domain_id);
    stmt.bind(3, message.sender_email);
    stmt.bind(4, message.recipient_email);
    stmt.bind(5, message.forwarded_to);
    stmt.bind(6, message.subject);
    stmt.bind(7, static_cast<int64_t>(message.size_bytes));
    stmt.bind(8, static_cast<int64_t>(message.has_attachments ? 1 : 0));
    stmt.bind(9, std::string(message_status_name(message.status)));
    stmt.bind(10, message.error_message);
    stmt.step();

    int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();
    return id;
}

void SqliteStore::update_message_status(int64_t id, MessageStatus status,
                                        const std::optional<std::string>& error_message,
                                        const std::optional<std::string>& forwarded_to) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);

    MessageStatus current;
    {
        Statement select(db_, "SELECT status FROM messages WHERE id = ?;");
        select.bind(1, id);
        if (!select.step()) {
            throw StoreError("Message " + std::to_string(id) + " not found");
        }
        auto name = select.text(0);
        auto parsed = parse_message_status(name);
        if (!parsed) {
            throw DecodeError("Message " + std::to_string(id) + " has unknown status '" + name + "'");
        }
        current = *parsed;
    }

    if (!can_transition(current, status)) {
        throw InvalidTransitionError(current, status);
    }

    Statement update(db_,
        "UPDATE messages SET status = ?, "
        "error_message = COALESCE(?, error_message), "
        "forwarded_to = COALESCE(?, forwarded_to), "
        "updated_at = CURRENT_TIMESTAMP WHERE id = ?;");
    update.bind(1, std::string(message_status_name(status)));
    update.bind(2, error_message);
    update.bind(3, forwarded_to);
    update.bind(4, id);
    update.step();

    txn.commit();
}

std::optional<Message> SqliteStore::find_message(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    std::string sql = std::string("SELECT ") + kMessageColumns + " FROM messages WHERE id = ?;";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, id);

    std::optional<Message> result;
    if (stmt.step()) {
        result = read_message(stmt);
    }
    stmt.reset();
    txn.commit();
    return result;
}

UserPreferences SqliteStore::notification_preferences(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_, "SELECT notify_on_failure FROM notification_preferences WHERE user_id = ?;");
    stmt.bind(1, user_id);

    UserPreferences prefs;
    prefs.user_id = user_id;
    if (stmt.step()) {
        prefs.notify_on_failure = stmt.int64(0) != 0;
    }
    stmt.reset();
    txn.commit();
    return prefs;
}

int64_t SqliteStore::create_domain(const std::string& name, int64_t owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_, "INSERT INTO domains (name, owner_id) VALUES (?, ?);");
    stmt.bind(1, to_lower(name));
    stmt.bind(2, owner_id);
    stmt.step();

    int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();
    return id;
}

bool SqliteStore::delete_domain(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_, "UPDATE domains SET is_deleted = 1 WHERE name = ? COLLATE NOCASE AND is_deleted = 0;");
    stmt.bind(1, name);
    stmt.step();

    bool changed = sqlite3_changes(db_) > 0;
    txn.commit();
    return changed;
}

bool SqliteStore::set_catch_all(const std::string& name, const std::optional<std::string>& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_, "UPDATE domains SET catch_all_email = ? WHERE name = ? COLLATE NOCASE AND is_deleted = 0;");
    stmt.bind(1, email);
    stmt.bind(2, name);
    stmt.step();

    bool changed = sqlite3_changes(db_) > 0;
    txn.commit();
    return changed;
}

bool SqliteStore::set_dkim_key(const std::string& name, const std::string& private_key_pem,
                               const std::string& selector) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "UPDATE domains SET dkim_private_key = ?, dkim_selector = ? "
        "WHERE name = ? COLLATE NOCASE AND is_deleted = 0;");
    stmt.bind(1, private_key_pem);
    stmt.bind(2, selector);
    stmt.bind(3, name);
    stmt.step();

    bool changed = sqlite3_changes(db_) > 0;
    txn.commit();
    return changed;
}

std::vector<Domain> SqliteStore::list_domains() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    std::string sql = std::string("SELECT ") + kDomainColumns +
                      " FROM domains WHERE is_deleted = 0 ORDER BY name;";
    Statement stmt(db_, sql.c_str());

    std::vector<Domain> domains;
    while (stmt.step()) {
        domains.push_back(read_domain(stmt));
    }
    txn.commit();
    return domains;
}

int64_t SqliteStore::create_alias(int64_t domain_id, const std::string& local_part,
                                  const std::string& targets,
                                  const std::optional<Timestamp>& expires_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "INSERT INTO aliases (domain_id, local_part, targets, expires_at) VALUES (?, ?, ?, ?);");
    stmt.bind(1, domain_id);
    stmt.bind(2, to_lower(local_part));
    stmt.bind(3, targets);
    if (expires_at) {
        stmt.bind(4, to_epoch(*expires_at));
    } else {
        stmt.bind_null(4);
    }
    stmt.step();

    int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();
    return id;
}

bool SqliteStore::delete_alias(int64_t domain_id, const std::string& local_part) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "UPDATE aliases SET is_deleted = 1 "
        "WHERE domain_id = ? AND local_part = ? COLLATE NOCASE AND is_deleted = 0;");
    stmt.bind(1, domain_id);
    stmt.bind(2, local_part);
    stmt.step();

    bool changed = sqlite3_changes(db_) > 0;
    txn.commit();
    return changed;
}

std::vector<Alias> SqliteStore::list_aliases(int64_t domain_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "SELECT id, domain_id, local_part, targets, expires_at, is_deleted FROM aliases "
        "WHERE domain_id = ? AND is_deleted = 0 ORDER BY local_part;");
    stmt.bind(1, domain_id);

    std::vector<Alias> aliases;
    while (stmt.step()) {
        aliases.push_back(read_alias(stmt));
    }
    txn.commit();
    return aliases;
}

int64_t SqliteStore::create_rule(const ForwardingRule& rule) {
    if (rule.action_type == RuleActionType::Redirect &&
        (!rule.action_value || rule.action_value->empty())) {
        throw StoreError("REDIRECT rule requires an action value");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "INSERT INTO forwarding_rules (alias_id, priority, condition_type, condition_value, "
        "action_type, action_value, is_active) VALUES (?, ?, ?, ?, ?, ?, ?);");
    stmt.bind(1, rule.alias_id);
    stmt.bind(2, static_cast<int64_t>(rule.priority));
    stmt.bind(3, std::string(condition_type_name(rule.condition_type)));
    stmt.bind(4, rule.condition_value);
    stmt.bind(5, std::string(action_type_name(rule.action_type)));
    stmt.bind(6, rule.action_value);
    stmt.bind(7, static_cast<int64_t>(rule.is_active ? 1 : 0));
    stmt.step();

    int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();
    return id;
}

std::vector<ForwardingRule> SqliteStore::list_rules(int64_t alias_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "SELECT id, alias_id, priority, condition_type, condition_value, action_type, "
        "action_value, is_active, match_count FROM forwarding_rules "
        "WHERE alias_id = ? ORDER BY priority ASC, id ASC;");
    stmt.bind(1, alias_id);

    std::vector<ForwardingRule> rules;
    while (stmt.step()) {
        rules.push_back(read_rule(stmt));
    }
    txn.commit();
    return rules;
}

void SqliteStore::set_notification_preferences(const UserPreferences& prefs) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    Statement stmt(db_,
        "INSERT INTO notification_preferences (user_id, notify_on_failure) VALUES (?, ?) "
        "ON CONFLICT(user_id) DO UPDATE SET notify_on_failure = excluded.notify_on_failure;");
    stmt.bind(1, prefs.user_id);
    stmt.bind(2, static_cast<int64_t>(prefs.notify_on_failure ? 1 : 0));
    stmt.step();
    txn.commit();
}

std::vector<Message> SqliteStore::list_messages(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction txn(db_);
    std::string sql = std::string("SELECT ") + kMessageColumns +
                      " FROM messages ORDER BY id DESC LIMIT ?;";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<Message> messages;
    while (stmt.step()) {
        messages.push_back(read_message(stmt));
    }
    txn.commit();
    return messages;
}

}  // namespace mailfwd
