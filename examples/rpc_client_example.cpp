/// @file rpc_client_example.cpp
/// @brief RPC Client Example
///
/// This example demonstrates how to call functions on the rpc_server_example
/// with an rpc_proxy, including remote failures, result codes and several
/// threads sharing one proxy.
///
/// Usage: ./rpc_client_example [host] [port]
/// Default: 127.0.0.1:9000

#include <scrpc/scrpc.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace scrpc;
using namespace scrpc::net;
using namespace scrpc::rpc;

// ============================================================================
// Message definitions (same as server)
// ============================================================================

struct User {
    int32_t id;
    std::string name;
    std::string email;
    int32_t age;
    std::vector<std::string> roles;

    SCRPC_FIELDS(User, id, name, email, age, roles)
};

void print_user(const User& user) {
    std::cout << "  User #" << user.id << ": " << user.name
              << " <" << user.email << ">, age " << user.age << ", roles:";
    for (const auto& role : user.roles) {
        std::cout << " " << role;
    }
    std::cout << std::endl;
}

void run_demo(rpc_proxy& proxy) {
    // Test 1: Create users
    std::cout << "\n--- Test 1: Create users ---" << std::endl;
    auto create_user = proxy.method<int32_t>("create_user");
    int32_t alice = create_user("Alice", "alice@example.com", 30,
                                std::vector<std::string>{"admin", "user"});
    int32_t bob = create_user("Bob", "bob@example.com", 25, std::vector<std::string>{"user"});
    std::cout << "Created users " << alice << " and " << bob << std::endl;

    // Test 2: Get a user
    std::cout << "\n--- Test 2: Get user ---" << std::endl;
    auto user = proxy.call<std::optional<User>>("get_user", alice);
    if (user) {
        print_user(*user);
    } else {
        std::cout << "User not found (unexpected)" << std::endl;
    }

    // Test 3: List users
    std::cout << "\n--- Test 3: List users ---" << std::endl;
    for (const auto& u : proxy.call<std::vector<User>>("list_users", 0, 10)) {
        print_user(u);
    }

    // Test 4: Calculate
    std::cout << "\n--- Test 4: Calculate ---" << std::endl;
    double sum = proxy.call<double>("calculate", "add", std::vector<double>{1.5, 2.5, 3.0});
    std::cout << "1.5 + 2.5 + 3.0 = " << sum << std::endl;

    // Test 5: Remote exception
    std::cout << "\n--- Test 5: Division by zero ---" << std::endl;
    try {
        proxy.call<double>("calculate", "divide", std::vector<double>{1.0, 0.0});
        std::cout << "No error (unexpected)" << std::endl;
    } catch (const remote_error& e) {
        std::cout << "Server raised " << e.exception_type() << ": " << e.what() << std::endl;
    }

    // Test 6: Rejected calls come back as error codes
    std::cout << "\n--- Test 6: try_call ---" << std::endl;
    auto missing = proxy.try_call<int32_t>("no_such_function");
    std::cout << "no_such_function: " << rpc_errc_str(missing.error())
              << " (" << missing.error_message() << ")" << std::endl;

    auto invalid = proxy.try_call<int32_t>("create_user", "", "", 0, std::vector<std::string>{});
    std::cout << "create_user with no name: " << invalid.error_message() << std::endl;

    // Test 7: Concurrent callers share the connection
    std::cout << "\n--- Test 7: Concurrent echo ---" << std::endl;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&proxy, t] {
            auto echoed = proxy.call<std::vector<std::string>>(
                "echo", "thread " + std::to_string(t), 2);
            std::cout << "  " + echoed.front() + " x" + std::to_string(echoed.size()) + "\n";
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    // Test 8: A call that takes a while
    std::cout << "\n--- Test 8: Slow call ---" << std::endl;
    int32_t slept = proxy.call<int32_t>("sleep_ms", 200);
    std::cout << "Server slept " << slept << " ms" << std::endl;

    std::cout << "\n=== Demo Complete ===" << std::endl;
}

int main(int argc, char* argv[]) {
    // Parse arguments
    const char* host = "127.0.0.1";
    uint16_t port = 9000;

    if (argc > 1) {
        host = argv[1];
    }
    if (argc > 2) {
        port = static_cast<uint16_t>(std::stoi(argv[2]));
    }

    std::cout << "Connecting to " << host << ":" << port << "..." << std::endl;

    try {
        proxy_options opts;
        opts.max_call_length = std::chrono::seconds(30);
        rpc_proxy proxy(host, port, opts);
        std::cout << "Connected!" << std::endl;

        run_demo(proxy);
    } catch (const rpc_exception& e) {
        std::cerr << "RPC failed (" << rpc_errc_str(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
