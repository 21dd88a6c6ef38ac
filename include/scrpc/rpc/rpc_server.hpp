#pragma once

/// @file rpc_server.hpp
/// @brief Thread-per-connection RPC server
///
/// The server owns a listening socket and a function registry. An accept
/// loop hands every connection to an rpc_worker running on its own thread.
/// Shutdown is cooperative: the accept loop and each idle worker wake up
/// every poll_interval and check a shared flag.
///
/// Usage:
/// @code
/// rpc_server server(net::ipv4_address(8080));
/// server.register_function("add", [](int32_t a, int32_t b) { return a + b; });
/// server.start();
/// ...
/// server.teardown();
/// @endcode

#include "function_registry.hpp"
#include "rpc_protocol.hpp"

#include <scrpc/log/macros.hpp>
#include <scrpc/net/timed_socket.hpp>

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace scrpc::rpc {

/// Server configuration
struct server_options {
    /// How often the accept loop and idle workers check for shutdown
    std::chrono::milliseconds poll_interval{1000};
    /// listen(2) backlog
    int backlog = 5;
    /// Options for the listening socket and every accepted connection
    net::transport_options transport;
};

/// Lifecycle of an rpc_server
enum class server_state : uint8_t {
    idle,           ///< Constructed, never started
    running,        ///< Accept loop active
    shutting_down,  ///< Flag set, loop exits after its current poll
    stopped,        ///< Loop exited; may be started again
    torn_down,      ///< Listener closed; terminal
};

inline const char* server_state_str(server_state s) {
    switch (s) {
        case server_state::idle: return "idle";
        case server_state::running: return "running";
        case server_state::shutting_down: return "shutting down";
        case server_state::stopped: return "stopped";
        case server_state::torn_down: return "torn down";
        default: return "unknown";
    }
}

// ============================================================================
// RPC Worker
// ============================================================================

/// Serves one accepted connection until the peer leaves, the connection
/// breaks or the server shuts down
class rpc_worker : public std::enable_shared_from_this<rpc_worker> {
public:
    using ptr = std::shared_ptr<rpc_worker>;

    /// Invoked once when the worker leaves, with its id
    using exit_callback = std::function<void(uint64_t)>;

    /// Create a worker owning `socket`. `registry` and `shutdown` must stay
    /// valid until `on_exit` has been called.
    static ptr create(uint64_t id,
                      net::timed_socket socket,
                      const function_registry& registry,
                      const std::atomic<bool>& shutdown,
                      std::chrono::milliseconds poll_interval,
                      exit_callback on_exit)
    {
        return ptr(new rpc_worker(id, std::move(socket), registry, shutdown,
                                  poll_interval, std::move(on_exit)));
    }

    /// Process commands until exit, then disconnect
    void run() {
        auto self = shared_from_this();
        SCRPC_LOG_DEBUG("Worker {} serving {}", id_, peer_.to_string());

        while (!shutdown_.load(std::memory_order_acquire)) {
            std::optional<std::vector<uint8_t>> frame;
            try {
                frame = socket_.recv_framed(poll_interval_);
            } catch (const net::timeout_error&) {
                continue;
            } catch (const net::socket_error& e) {
                SCRPC_LOG_WARNING("Worker {}: broken connection from {}: {}",
                                  id_, peer_.to_string(), e.what());
                break;
            }

            if (!frame) {
                SCRPC_LOG_INFO("Worker {}: connection closed by {}", id_, peer_.to_string());
                break;
            }

            auto name = parse_perform(*frame);
            if (!name) {
                SCRPC_LOG_WARNING("Worker {}: ignoring unknown command '{}'",
                                  id_, as_text(*frame).substr(0, 64));
                continue;
            }

            bool keep_going = false;
            try {
                keep_going = perform(*name);
            } catch (const std::exception& e) {
                SCRPC_LOG_ERROR("Worker {}: failed to perform '{}': {}", id_, *name, e.what());
            }
            if (!keep_going) {
                break;
            }
        }

        disconnect();
    }

    /// Deregister from the server and close the socket. Only the first call
    /// has an effect.
    void disconnect() {
        if (disconnected_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        SCRPC_LOG_DEBUG("Worker {} leaving", id_);
        if (on_exit_) {
            // Last access to server state
            on_exit_(id_);
        }
        socket_.close();
    }

    uint64_t id() const noexcept { return id_; }

    const net::ipv4_address& peer_address() const noexcept { return peer_; }

    bool is_connected() const noexcept {
        return !disconnected_.load(std::memory_order_acquire);
    }

private:
    rpc_worker(uint64_t id,
               net::timed_socket socket,
               const function_registry& registry,
               const std::atomic<bool>& shutdown,
               std::chrono::milliseconds poll_interval,
               exit_callback on_exit)
        : id_(id)
        , socket_(std::move(socket))
        , peer_(socket_.peer_address())
        , registry_(registry)
        , shutdown_(shutdown)
        , poll_interval_(poll_interval)
        , on_exit_(std::move(on_exit)) {}

    /// Run one PERFORM sequence
    /// @return false if the connection must be dropped
    bool perform(const std::string& name) {
        const function_entry* entry = registry_.find(name);
        if (!entry) {
            SCRPC_LOG_INFO("Worker {}: function '{}' does not exist", id_, name);
            return send_frame(build_nack(fmt::format("Function ({}) does not exist.", name)));
        }
        if (!send_frame(build_ack())) {
            return false;
        }

        const function_entry* intent = registry_.find(name + std::string(intent_suffix));
        notify_intent(intent, false);

        std::optional<std::vector<uint8_t>> payload;
        try {
            payload = socket_.recv_framed();
        } catch (const net::socket_error& e) {
            SCRPC_LOG_WARNING("Worker {}: no arguments received for '{}': {}", id_, name, e.what());
            notify_intent(intent, true);
            return false;
        }
        if (!payload) {
            SCRPC_LOG_INFO("Worker {}: connection closed before arguments for '{}'", id_, name);
            notify_intent(intent, true);
            return false;
        }

        bound_call call;
        try {
            buffer_view reader(*payload);
            auto header = read_argument_header(reader);
            if (!header.is_tuple()) {
                notify_intent(intent, true);
                return send_frame(build_nack("Argument must be a tuple."));
            }
            // Arity is checked here, so a wrong count is a NACK and never reaches the callable
            if (header.count != entry->arity()) {
                notify_intent(intent, true);
                return send_frame(build_nack(fmt::format(
                    "Function ({}) takes {} arguments ({} given).",
                    name, entry->arity(), header.count)));
            }
            call = entry->bind(reader);
        } catch (const marshaling_error& e) {
            SCRPC_LOG_WARNING("Worker {}: cannot decode arguments for '{}': {}", id_, name, e.what());
            notify_intent(intent, true);
            return send_frame(build_exception(e));
        }

        if (!send_frame(build_ack())) {
            notify_intent(intent, true);
            return false;
        }

        auto result = begin_result();
        try {
            call(result);
        } catch (const std::exception& e) {
            SCRPC_LOG_INFO("Worker {}: '{}' raised: {}", id_, name, e.what());
            return send_frame(build_exception(e));
        } catch (...) {
            SCRPC_LOG_WARNING("Worker {}: '{}' raised a non-standard exception", id_, name);
            return send_frame(build_unknown_exception());
        }

        if (result.size() > socket_.options().max_message_size) {
            return send_frame(build_exception(marshaling_error(fmt::format(
                "result of {} bytes exceeds the frame size limit", result.size()))));
        }
        return send_frame(result);
    }

    /// Call the `<name>_intent` hook, if registered. Failures are logged.
    void notify_intent(const function_entry* intent, bool failed) {
        if (!intent) {
            return;
        }
        if (intent->arity() != 1) {
            SCRPC_LOG_WARNING("Worker {}: intent hook '{}' must take one argument",
                              id_, intent->name());
            return;
        }
        try {
            auto args = pack_arguments(failed);
            auto reader = args.view();
            read_argument_header(reader);
            auto call = intent->bind(reader);
            buffer_writer discarded;
            call(discarded);
        } catch (const std::exception& e) {
            SCRPC_LOG_WARNING("Worker {}: intent hook '{}' failed: {}", id_, intent->name(), e.what());
        } catch (...) {
            SCRPC_LOG_WARNING("Worker {}: intent hook '{}' raised a non-standard exception",
                              id_, intent->name());
        }
    }

    /// @return false if the frame could not be sent
    bool send_frame(const buffer_writer& frame) {
        try {
            socket_.send_framed(frame.span());
            return true;
        } catch (const net::socket_error& e) {
            SCRPC_LOG_WARNING("Worker {}: send to {} failed: {}", id_, peer_.to_string(), e.what());
            return false;
        }
    }

    uint64_t id_;
    net::timed_socket socket_;
    net::ipv4_address peer_;
    const function_registry& registry_;
    const std::atomic<bool>& shutdown_;
    std::chrono::milliseconds poll_interval_;
    exit_callback on_exit_;
    std::atomic<bool> disconnected_{false};
};

// ============================================================================
// RPC Server
// ============================================================================

/// Listens for connections and runs one worker per connection
class rpc_server {
public:
    /// Bind and listen on `addr` (default 0.0.0.0, ephemeral port)
    /// @throws std::system_error if bind or listen fails
    explicit rpc_server(const net::ipv4_address& addr = {}, const server_options& opts = {})
        : rpc_server(addr, function_registry{}, opts) {}

    /// Same, serving the functions of an existing registry
    rpc_server(const net::ipv4_address& addr, function_registry registry,
               const server_options& opts = {})
        : opts_(opts)
        , registry_(std::move(registry))
        , listener_(opts.transport)
    {
        if (opts_.poll_interval.count() <= 0) {
            throw std::invalid_argument("poll interval must be positive");
        }
        listener_.bind(addr);
        listener_.listen(opts_.backlog);
        SCRPC_LOG_INFO("RPC server bound to {}", listener_.local_address().to_string());
    }

    /// Tear down, then wait for every worker to leave
    ~rpc_server() {
        try {
            teardown();
        } catch (const std::exception& e) {
            SCRPC_LOG_ERROR("RPC server teardown failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(workers_mutex_);
        workers_cv_.wait(lock, [this] { return workers_.empty(); });
    }

    // Non-copyable, non-movable
    rpc_server(const rpc_server&) = delete;
    rpc_server& operator=(const rpc_server&) = delete;
    rpc_server(rpc_server&&) = delete;
    rpc_server& operator=(rpc_server&&) = delete;

    /// Register a callable. Only allowed before the server first starts.
    /// @throws duplicate_registration_error if the name is taken
    template<typename F>
    void register_function(std::string name, F&& func) {
        ensure_idle();
        registry_.register_function(std::move(name), std::forward<F>(func));
    }

    /// Register a member function invoked on `obj`
    template<typename T, typename M>
    void register_method(std::string name, T* obj, M method) {
        ensure_idle();
        registry_.register_method(std::move(name), obj, method);
    }

    const function_registry& registry() const noexcept { return registry_; }

    /// Run the accept loop on the calling thread until stop() or teardown()
    /// @throws std::logic_error if already running or torn down
    void run() {
        enter_running();
        accept_loop();
    }

    /// Run the accept loop on a background thread
    /// @throws std::logic_error if already running or torn down
    void start() {
        std::lock_guard<std::mutex> thread_lock(thread_mutex_);
        enter_running();
        if (accept_thread_.joinable()) {
            // Left over from a previous start(); that loop has already exited
            accept_thread_.join();
        }
        try {
            accept_thread_ = std::thread([this] { accept_loop(); });
        } catch (const std::system_error&) {
            finish_loop();
            throw;
        }
    }

    /// Request shutdown. Idle workers leave at their next poll, in-flight
    /// calls run to completion.
    /// @param block Wait until the accept loop has exited
    void stop(bool block = false) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ != server_state::running && state_ != server_state::shutting_down) {
            return;
        }
        shutdown_.store(true, std::memory_order_release);
        state_ = server_state::shutting_down;
        if (block) {
            state_cv_.wait(lock, [this] { return state_ != server_state::shutting_down; });
        }
    }

    /// Stop, join the accept thread and close the listening socket. The
    /// server cannot be started again. Concurrent callers are serialized.
    void teardown() {
        std::lock_guard<std::mutex> thread_lock(thread_mutex_);
        stop(true);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == server_state::torn_down) {
            return;
        }
        shutdown_.store(true, std::memory_order_release);
        listener_.close();
        state_ = server_state::torn_down;
        SCRPC_LOG_INFO("RPC server torn down");
    }

    server_state state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    bool is_running() const {
        return state() == server_state::running;
    }

    /// Actual bound address; the port is real even when 0 was requested
    const net::ipv4_address& address() const noexcept {
        return listener_.local_address();
    }

    /// Number of live workers
    size_t worker_count() const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        return workers_.size();
    }

    /// Peers of the live workers
    std::vector<net::ipv4_address> peers() const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        std::vector<net::ipv4_address> result;
        result.reserve(workers_.size());
        for (const auto& [id, peer] : workers_) {
            result.push_back(peer);
        }
        return result;
    }

    /// Log the registered function names
    void log_functions() const {
        auto names = registry_.names();
        SCRPC_LOG_INFO("RPC server on {} exposes {} function(s)",
                       address().to_string(), names.size());
        for (const auto& name : names) {
            SCRPC_LOG_INFO("  {}", name);
        }
    }

private:
    void ensure_idle() const {
        if (state() != server_state::idle) {
            throw std::logic_error("functions must be registered before the server starts");
        }
    }

    void enter_running() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == server_state::torn_down) {
            throw std::logic_error("server has been torn down");
        }
        if (state_ == server_state::running || state_ == server_state::shutting_down) {
            throw std::logic_error("server is already running");
        }
        shutdown_.store(false, std::memory_order_release);
        state_ = server_state::running;
    }

    void accept_loop() {
        SCRPC_LOG_INFO("RPC server accepting on {}", address().to_string());

        while (!shutdown_.load(std::memory_order_acquire)) {
            try {
                auto conn = listener_.accept(opts_.poll_interval);
                if (shutdown_.load(std::memory_order_acquire)) {
                    break;
                }
                spawn_worker(std::move(conn));
            } catch (const net::timeout_error&) {
                continue;
            } catch (const net::socket_error& e) {
                if (shutdown_.load(std::memory_order_acquire)) {
                    break;
                }
                SCRPC_LOG_ERROR("RPC server: accept failed: {}", e.what());
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        finish_loop();
    }

    void finish_loop() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = server_state::stopped;
        }
        state_cv_.notify_all();
        SCRPC_LOG_INFO("RPC server stopped accepting on {}", address().to_string());
    }

    void spawn_worker(net::timed_socket conn) {
        uint64_t id = next_worker_id_++;
        auto peer = conn.peer_address();
        auto worker = rpc_worker::create(id, std::move(conn), registry_, shutdown_,
                                         opts_.poll_interval,
                                         [this](uint64_t worker_id) { remove_worker(worker_id); });
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.emplace(id, peer);
        }
        SCRPC_LOG_INFO("Accepted connection from {} (worker {})", peer.to_string(), id);

        try {
            std::thread([worker] { worker->run(); }).detach();
        } catch (const std::system_error& e) {
            SCRPC_LOG_ERROR("Cannot start worker {}: {}", id, e.what());
            worker->disconnect();
        }
    }

    void remove_worker(uint64_t id) {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.erase(id);
        workers_cv_.notify_all();
    }

    server_options opts_;
    function_registry registry_;
    net::timed_socket listener_;

    std::atomic<bool> shutdown_{false};
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    server_state state_ = server_state::idle;
    std::thread accept_thread_;
    /// Guards accept_thread_; held for the whole of start() and teardown()
    std::mutex thread_mutex_;

    mutable std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    std::unordered_map<uint64_t, net::ipv4_address> workers_;
    uint64_t next_worker_id_ = 1;
};

} // namespace scrpc::rpc
