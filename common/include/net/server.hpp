#pragma once

#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <boost/asio.hpp>

#include "logger.hpp"
#include "session.hpp"

namespace mailfwd {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Accept loop plus a thread pool running one io_context. SessionType must
// derive from Session. Connections over the global or per-address limit get
// the refusal line (if any) and are closed without creating a session.
template<typename SessionType>
class Server {
public:
    using SessionFactory = std::function<std::shared_ptr<SessionType>(
        asio::io_context&, tcp::socket)>;

    Server(const std::string& name, const std::string& bind_address,
           uint16_t port, size_t thread_count = 4);

    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_; }
    size_t connection_count() const;
    size_t connections_from(const asio::ip::address& address) const;
    // Actual listening port; differs from the configured one when that was 0.
    uint16_t port() const { return bound_port_; }

    void set_max_connections(size_t max) { max_connections_ = max; }
    // 0 disables the per-address limit.
    void set_max_connections_per_address(size_t max) { max_per_address_ = max; }
    void set_refusal_line(std::string line) { refusal_line_ = std::move(line); }
    void set_connection_timeout(std::chrono::seconds timeout) { connection_timeout_ = timeout; }
    void set_session_factory(SessionFactory factory) { session_factory_ = std::move(factory); }

protected:
    virtual std::shared_ptr<SessionType> create_session(
        asio::io_context& io_ctx, tcp::socket socket);

    virtual void on_session_start(std::shared_ptr<SessionType> session);
    virtual void on_session_end(std::shared_ptr<SessionType> session);

private:
    void do_accept();
    void admit(tcp::socket socket);
    void refuse(tcp::socket& socket, const std::string& reason);
    void remove_session(std::shared_ptr<SessionType> session);

    std::string name_;
    std::string bind_address_;
    uint16_t port_;
    uint16_t bound_port_ = 0;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;

    std::atomic<bool> running_{false};
    size_t thread_count_;
    size_t max_connections_ = 1000;
    size_t max_per_address_ = 0;
    std::chrono::seconds connection_timeout_{300};
    std::string refusal_line_;

    // session -> peer address, for per-address accounting
    std::map<std::shared_ptr<SessionType>, asio::ip::address> sessions_;
    mutable std::mutex sessions_mutex_;

    SessionFactory session_factory_;
};

template<typename SessionType>
Server<SessionType>::Server(const std::string& name, const std::string& bind_address,
                            uint16_t port, size_t thread_count)
    : name_(name)
    , bind_address_(bind_address)
    , port_(port)
    , acceptor_(io_context_)
    , thread_count_(thread_count == 0 ? 1 : thread_count) {
}

template<typename SessionType>
Server<SessionType>::~Server() {
    stop();
}

template<typename SessionType>
void Server<SessionType>::start() {
    if (running_) return;

    tcp::endpoint endpoint(asio::ip::make_address(bind_address_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();

    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    LOG_INFO_FMT("{} listening on {}:{}", name_, bind_address_, bound_port_);
}

template<typename SessionType>
void Server<SessionType>::stop() {
    if (!running_) return;

    running_ = false;

    boost::system::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();

    std::map<std::shared_ptr<SessionType>, asio::ip::address> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [session, address] : sessions) {
        session->stop();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG_INFO_FMT("{} stopped", name_);
}

template<typename SessionType>
size_t Server<SessionType>::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

template<typename SessionType>
size_t Server<SessionType>::connections_from(const asio::ip::address& address) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    size_t count = 0;
    for (const auto& [session, peer] : sessions_) {
        if (peer == address) ++count;
    }
    return count;
}

template<typename SessionType>
void Server<SessionType>::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) return;

            if (ec) {
                LOG_WARNING_FMT("{} accept failed: {}", name_, ec.message());
            } else {
                admit(std::move(socket));
            }

            do_accept();
        });
}

template<typename SessionType>
void Server<SessionType>::admit(tcp::socket socket) {
    boost::system::error_code ec;
    auto peer = socket.remote_endpoint(ec);
    if (ec) {
        socket.close(ec);
        return;
    }
    auto address = peer.address();

    if (connection_count() >= max_connections_) {
        refuse(socket, std::format("connection limit {} reached", max_connections_));
        return;
    }
    if (max_per_address_ > 0 && connections_from(address) >= max_per_address_) {
        refuse(socket, std::format("{} already has {} connections", address.to_string(), max_per_address_));
        return;
    }

    auto session = create_session(io_context_, std::move(socket));
    if (!session) return;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(session, address);
    }
    std::weak_ptr<SessionType> weak = session;
    session->set_close_handler([this, weak]() {
        if (auto s = weak.lock()) {
            on_session_end(s);
        }
    });
    session->set_timeout(connection_timeout_);
    on_session_start(session);
    session->start();
}

template<typename SessionType>
void Server<SessionType>::refuse(tcp::socket& socket, const std::string& reason) {
    LOG_WARNING_FMT("{} refusing client: {}", name_, reason);

    boost::system::error_code ec;
    if (!refusal_line_.empty()) {
        // Best effort; a blocking write of one short line on a fresh socket
        asio::write(socket, asio::buffer(refusal_line_ + "\r\n"), ec);
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

template<typename SessionType>
std::shared_ptr<SessionType> Server<SessionType>::create_session(
    asio::io_context& io_ctx, tcp::socket socket) {
    if (session_factory_) {
        return session_factory_(io_ctx, std::move(socket));
    }
    return std::make_shared<SessionType>(io_ctx, std::move(socket));
}

template<typename SessionType>
void Server<SessionType>::on_session_start(std::shared_ptr<SessionType> /* session */) {
}

template<typename SessionType>
void Server<SessionType>::on_session_end(std::shared_ptr<SessionType> session) {
    remove_session(session);
}

template<typename SessionType>
void Server<SessionType>::remove_session(std::shared_ptr<SessionType> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

}  // namespace mailfwd
