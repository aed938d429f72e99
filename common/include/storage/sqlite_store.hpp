#pragma once

#include "storage/store.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace mailfwd {

class SqliteStore : public Store {
public:
    explicit SqliteStore(const std::filesystem::path& db_path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool initialize();

    // Store
    std::optional<Domain> find_domain(const std::string& name) override;
    std::optional<Alias> find_alias(int64_t domain_id, const std::string& local_part) override;
    std::vector<ForwardingRule> active_rules(int64_t alias_id) override;
    void increment_match_count(int64_t rule_id) override;

    int64_t insert_message(const Message& message) override;
    void update_message_status(int64_t id, MessageStatus status,
                               const std::optional<std::string>& error_message = std::nullopt,
                               const std::optional<std::string>& forwarded_to = std::nullopt) override;
    std::optional<Message> find_message(int64_t id) override;

    UserPreferences notification_preferences(int64_t user_id) override;

    // Management
    int64_t create_domain(const std::string& name, int64_t owner_id = 0);
    bool delete_domain(const std::string& name);
    bool set_catch_all(const std::string& name, const std::optional<std::string>& email);
    bool set_dkim_key(const std::string& name, const std::string& private_key_pem,
                      const std::string& selector);
    std::vector<Domain> list_domains();

    int64_t create_alias(int64_t domain_id, const std::string& local_part,
                         const std::string& targets,
                         const std::optional<Timestamp>& expires_at = std::nullopt);
    bool delete_alias(int64_t domain_id, const std::string& local_part);
    std::vector<Alias> list_aliases(int64_t domain_id);

    int64_t create_rule(const ForwardingRule& rule);
    std::vector<ForwardingRule> list_rules(int64_t alias_id);

    void set_notification_preferences(const UserPreferences& prefs);

    std::vector<Message> list_messages(size_t limit = 50);

    std::string last_error() const { return last_error_; }

private:
    bool execute_sql(const std::string& sql);
    bool create_tables();
    void require_open() const;

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
    std::mutex mutex_;
};

}  // namespace mailfwd
