/// @file rpc_server_example.cpp
/// @brief RPC Server Example
///
/// This example demonstrates how to build an RPC server with scrpc.
/// The server exposes get_user, create_user, list_users, calculate and echo,
/// plus an intent hook for create_user and a deliberately slow function.
///
/// Usage: ./rpc_server_example [port]
/// Default port: 9000

#include <scrpc/scrpc.hpp>

#include <pthread.h>
#include <signal.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace scrpc;
using namespace scrpc::net;
using namespace scrpc::rpc;

// ============================================================================
// Message definitions
// ============================================================================

struct User {
    int32_t id;
    std::string name;
    std::string email;
    int32_t age;
    std::vector<std::string> roles;

    SCRPC_FIELDS(User, id, name, email, age, roles)
};

// ============================================================================
// Server implementation
// ============================================================================

// In-memory user store
class UserStore {
public:
    std::optional<User> get_user(int32_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(id);
        if (it != users_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    int32_t create_user(const std::string& name, const std::string& email,
                        int32_t age, const std::vector<std::string>& roles) {
        if (name.empty()) {
            throw std::invalid_argument("Name is required");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        int32_t id = next_id_++;
        users_[id] = User{id, name, email, age, roles};
        return id;
    }

    std::vector<User> list_users(int32_t offset, int32_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<User> result;
        int32_t count = 0;
        for (const auto& [id, user] : users_) {
            if (count >= offset && result.size() < static_cast<size_t>(limit)) {
                result.push_back(user);
            }
            ++count;
        }
        return result;
    }

private:
    std::mutex mutex_;
    std::map<int32_t, User> users_;
    int32_t next_id_ = 1;
};

double calculate(const std::string& operation, const std::vector<double>& operands) {
    if (operands.empty()) {
        throw std::invalid_argument("No operands provided");
    }

    double result = operands[0];
    for (size_t i = 1; i < operands.size(); ++i) {
        if (operation == "add") {
            result += operands[i];
        } else if (operation == "subtract") {
            result -= operands[i];
        } else if (operation == "multiply") {
            result *= operands[i];
        } else if (operation == "divide") {
            if (operands[i] == 0) {
                throw std::domain_error("Division by zero");
            }
            result /= operands[i];
        } else {
            throw std::invalid_argument("Unknown operation: " + operation);
        }
    }
    return result;
}

int main(int argc, char* argv[]) {
    uint16_t port = 9000;
    if (argc > 1) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }

    // Block signals BEFORE any worker thread exists so sigwait sees them
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    UserStore store;

    try {
        rpc_server server{ipv4_address(port)};

        server.register_method("get_user", &store, &UserStore::get_user);
        server.register_method("create_user", &store, &UserStore::create_user);
        server.register_method("list_users", &store, &UserStore::list_users);
        server.register_function("create_user_intent", [](bool failed) {
            if (failed) {
                SCRPC_LOG_WARNING("create_user was announced but not performed");
            } else {
                SCRPC_LOG_INFO("create_user about to run");
            }
        });

        SCRPC_REGISTER(server, calculate);
        server.register_function("echo", [](const std::string& message, int32_t repeat) {
            return std::vector<std::string>(static_cast<size_t>(std::max(repeat, 0)), message);
        });
        server.register_function("sleep_ms", [](int32_t ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return ms;
        });

        server.log_functions();
        server.start();
        SCRPC_LOG_INFO("Press Ctrl+C to stop");

        int signo = 0;
        sigwait(&sigs, &signo);
        SCRPC_LOG_INFO("Received signal {} - initiating shutdown", signo);

        server.teardown();
    } catch (const std::exception& e) {
        SCRPC_LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }

    SCRPC_LOG_INFO("Server stopped");
    return 0;
}
