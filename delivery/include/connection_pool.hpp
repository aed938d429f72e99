#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "smtp_client.hpp"

namespace mailfwd::delivery {

class ConnectionPool;

// Exclusive use of one authenticated relay connection. Goes back to the pool
// on destruction unless invalidated.
class PooledConnection {
public:
    PooledConnection(ConnectionPool* pool, std::unique_ptr<SmtpClient> client, bool pooled);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&&) = delete;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    SmtpClient* operator->() { return client_.get(); }
    SmtpClient& operator*() { return *client_; }

    // The connection's state is unknown; close it instead of reusing it.
    void invalidate() { healthy_ = false; }
    bool is_temporary() const { return !pooled_; }

private:
    ConnectionPool* pool_;
    std::unique_ptr<SmtpClient> client_;
    bool pooled_;
    bool healthy_ = true;
};

class ConnectionPool {
public:
    ConnectionPool(const RelayConfig& config, std::string hostname, SmtpClientFactory factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Opens up to capacity() connections; failures are logged and the slots
    // are filled lazily by acquire().
    void warm_up();

    // Waits up to the acquire timeout for a pooled connection, then falls
    // back to a temporary one. Throws SmtpError when no connection can be
    // opened.
    PooledConnection acquire();

    void close();

    size_t capacity() const { return config_.pool_size; }
    size_t size() const;
    size_t idle() const;

private:
    friend class PooledConnection;

    std::unique_ptr<SmtpClient> open();
    void release(std::unique_ptr<SmtpClient> client, bool pooled, bool healthy);

    RelayConfig config_;
    std::string hostname_;
    SmtpClientFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<std::unique_ptr<SmtpClient>> idle_;
    size_t open_count_ = 0;   // idle plus checked-out pooled connections
    bool closed_ = false;
};

}  // namespace mailfwd::delivery
