#include <catch2/catch.hpp>
#include <scrpc/rpc/rpc_types.hpp>

#include <array>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace scrpc::rpc;

// ============================================================================
// Test message types
// ============================================================================

struct SimpleMessage {
    int32_t id;
    std::string name;

    SCRPC_FIELDS(SimpleMessage, id, name)
};

struct NestedParent {
    std::string name;
    SimpleMessage child;
    std::vector<SimpleMessage> children;
    std::optional<SimpleMessage> extra;

    SCRPC_FIELDS(NestedParent, name, child, children, extra)
};

struct EmptyMessage {
    SCRPC_EMPTY_FIELDS(EmptyMessage)
};

enum class Color : uint8_t { red = 1, green = 2 };

// ============================================================================
// Buffer tests
// ============================================================================

TEST_CASE("buffer_writer basic operations", "[rpc][buffer]") {
    buffer_writer writer;

    SECTION("write primitive types") {
        writer.write(int32_t{42});
        writer.write(int64_t{12345678901234LL});
        writer.write(double{3.14159});

        REQUIRE(writer.size() == sizeof(int32_t) + sizeof(int64_t) + sizeof(double));
    }

    SECTION("write string") {
        writer.write_string("Hello, World!");

        // 4 bytes length prefix + 13 bytes string
        REQUIRE(writer.size() == 4 + 13);
    }

    SECTION("raw bytes carry no prefix") {
        writer.write_bytes(std::string_view("RESULT "));
        REQUIRE(writer.size() == 7);
        REQUIRE(std::string(writer.data(), writer.data() + writer.size()) == "RESULT ");
    }
}

TEST_CASE("buffer_view basic operations", "[rpc][buffer]") {
    buffer_writer writer;
    writer.write(int32_t{42});
    writer.write(int64_t{12345});
    writer.write_string("test");

    buffer_view view = writer.view();

    SECTION("read values") {
        REQUIRE(view.read<int32_t>() == 42);
        REQUIRE(view.read<int64_t>() == 12345);
        REQUIRE(view.read_string() == "test");
        REQUIRE(view.remaining() == 0);
    }

    SECTION("views are independent cursors") {
        buffer_view other = writer.view();
        REQUIRE(view.read<int32_t>() == 42);
        REQUIRE(other.read<int32_t>() == 42);
        REQUIRE(view.remaining() == other.remaining());
    }
}

TEST_CASE("buffer error handling", "[rpc][buffer]") {
    buffer_writer writer;
    writer.write(int32_t{42});

    buffer_view view = writer.view();

    SECTION("read past end throws") {
        view.read<int32_t>();
        REQUIRE_THROWS_AS(view.read<int32_t>(), marshaling_error);
    }

    SECTION("string length beyond the buffer throws") {
        buffer_writer bad;
        bad.write(uint32_t{1000});
        bad.write_bytes(std::string_view("abc"));
        buffer_view v = bad.view();
        REQUIRE_THROWS_AS(v.read_string(), marshaling_error);
    }

    SECTION("marshaling_error carries its code") {
        try {
            view.read<int64_t>();
            FAIL("expected marshaling_error");
        } catch (const rpc_exception& e) {
            REQUIRE(e.code() == rpc_errc::marshaling_error);
        }
    }
}

// ============================================================================
// Serialization tests
// ============================================================================

TEST_CASE("serialize scalars and enums", "[rpc][serialize]") {
    buffer_writer writer;
    serialize(writer, std::numeric_limits<int64_t>::min());
    serialize(writer, 2.5f);
    serialize(writer, true);
    serialize(writer, Color::green);

    buffer_view view = writer.view();
    REQUIRE(deserialize<int64_t>(view) == std::numeric_limits<int64_t>::min());
    REQUIRE(deserialize<float>(view) == 2.5f);
    REQUIRE(deserialize<bool>(view) == true);
    REQUIRE(deserialize<Color>(view) == Color::green);
    REQUIRE(view.remaining() == 0);
}

TEST_CASE("string-like values share one encoding", "[rpc][serialize]") {
    buffer_writer a, b, c;
    serialize(a, std::string("hello"));
    serialize(b, std::string_view("hello"));
    serialize(c, "hello");

    REQUIRE(a.size() == 4 + 5);
    REQUIRE(a.size() == b.size());
    REQUIRE(a.size() == c.size());
    REQUIRE(std::memcmp(a.data(), b.data(), a.size()) == 0);
    REQUIRE(std::memcmp(a.data(), c.data(), a.size()) == 0);
}

TEST_CASE("serialize containers", "[rpc][serialize]") {
    SECTION("empty vector") {
        auto writer = serialize(std::vector<int32_t>{});
        buffer_view view = writer.view();
        REQUIRE(deserialize<std::vector<int32_t>>(view).empty());
    }

    SECTION("vector of bool") {
        std::vector<bool> flags = {true, false, true};
        auto writer = serialize(flags);
        REQUIRE(writer.size() == 4 + 3);
        buffer_view view = writer.view();
        REQUIRE(deserialize<std::vector<bool>>(view) == flags);
    }

    SECTION("std::array has no size prefix") {
        std::array<uint16_t, 3> arr = {1, 2, 3};
        auto writer = serialize(arr);
        REQUIRE(writer.size() == 6);
        buffer_view view = writer.view();
        REQUIRE((deserialize<std::array<uint16_t, 3>>(view) == arr));
    }

    SECTION("maps") {
        std::map<std::string, int32_t> ordered = {{"a", 1}, {"b", 2}};
        std::unordered_map<int32_t, std::string> hashed = {{1, "x"}, {2, "y"}};
        buffer_writer writer;
        serialize(writer, ordered);
        serialize(writer, hashed);

        buffer_view view = writer.view();
        REQUIRE((deserialize<std::map<std::string, int32_t>>(view) == ordered));
        REQUIRE((deserialize<std::unordered_map<int32_t, std::string>>(view) == hashed));
    }

    SECTION("corrupt element count fails instead of allocating") {
        buffer_writer writer;
        writer.write(uint32_t{0xFFFFFFFF});
        writer.write(int32_t{1});
        buffer_view view = writer.view();
        REQUIRE_THROWS_AS(deserialize<std::vector<int32_t>>(view), marshaling_error);
    }
}

TEST_CASE("serialize tuples and pairs", "[rpc][serialize]") {
    std::tuple<int32_t, std::string, double> original{7, "seven", 7.5};
    auto writer = serialize(original);

    buffer_view view = writer.view();
    auto result = deserialize<std::tuple<int32_t, std::string, double>>(view);
    REQUIRE(result == original);

    auto pair_writer = serialize(std::pair<std::string, uint8_t>("k", 9));
    buffer_view pair_view = pair_writer.view();
    auto p = deserialize<std::pair<std::string, uint8_t>>(pair_view);
    REQUIRE(p.first == "k");
    REQUIRE(p.second == 9);
}

TEST_CASE("serialize nested structs", "[rpc][serialize]") {
    NestedParent original;
    original.name = "parent";
    original.child = {10, "child1"};
    original.children = {{20, "child2"}, {30, "child3"}};

    auto writer = serialize(original);
    buffer_view view = writer.view();
    auto result = deserialize<NestedParent>(view);

    REQUIRE(result.name == "parent");
    REQUIRE(result.child.id == 10);
    REQUIRE(result.children.size() == 2);
    REQUIRE(result.children[1].name == "child3");
    REQUIRE_FALSE(result.extra.has_value());
    REQUIRE(view.remaining() == 0);
}

TEST_CASE("struct without fields encodes to nothing", "[rpc][serialize]") {
    auto writer = serialize(std::vector<EmptyMessage>(3));
    REQUIRE(writer.size() == 4);

    buffer_view view = writer.view();
    REQUIRE(deserialize<std::vector<EmptyMessage>>(view).size() == 3);
}

TEST_CASE("truncated struct fails to deserialize", "[rpc][serialize]") {
    auto writer = serialize(SimpleMessage{1, "a long enough name"});
    buffer_view view(writer.data(), writer.size() - 3);
    REQUIRE_THROWS_AS(deserialize<SimpleMessage>(view), marshaling_error);
}

// ============================================================================
// Wire types and callable introspection
// ============================================================================

TEST_CASE("wire types decay string views to strings", "[rpc][types]") {
    STATIC_REQUIRE(std::is_same_v<wire_type_t<const char*>, std::string>);
    STATIC_REQUIRE(std::is_same_v<wire_type_t<const char(&)[4]>, std::string>);
    STATIC_REQUIRE(std::is_same_v<wire_type_t<std::string_view>, std::string>);
    STATIC_REQUIRE(std::is_same_v<wire_type_t<const std::string&>, std::string>);
    STATIC_REQUIRE(std::is_same_v<wire_type_t<const SimpleMessage&>, SimpleMessage>);
    STATIC_REQUIRE(std::is_same_v<wire_type_t<int32_t>, int32_t>);

    const char* text = "abc";
    std::string converted = to_wire(text);
    REQUIRE(converted == "abc");
}

namespace {

int32_t free_add(int32_t a, int32_t b) { return a + b; }

struct Counter {
    int32_t total = 0;
    int32_t add(int32_t n) { return total += n; }
    int32_t get() const { return total; }
};

} // namespace

TEST_CASE("function_traits inspects callables", "[rpc][types]") {
    using free_traits = function_traits<decltype(&free_add)>;
    STATIC_REQUIRE(free_traits::arity == 2);
    STATIC_REQUIRE(std::is_same_v<free_traits::return_type, int32_t>);

    auto lambda = [](const std::string& s, std::string_view v) { return s.size() + v.size(); };
    using lambda_traits = function_traits<decltype(lambda)>;
    STATIC_REQUIRE(lambda_traits::arity == 2);
    STATIC_REQUIRE(std::is_same_v<lambda_traits::args_tuple, std::tuple<std::string, std::string>>);

    STATIC_REQUIRE(function_traits<decltype(&Counter::add)>::arity == 1);
    STATIC_REQUIRE(function_traits<decltype(&Counter::get)>::arity == 0);
    STATIC_REQUIRE(std::is_void_v<function_traits<void(*)()>::return_type>);
}

// ============================================================================
// rpc_result
// ============================================================================

TEST_CASE("rpc_result holds value or error", "[rpc][result]") {
    SECTION("success") {
        rpc_result<int32_t> r(5);
        REQUIRE(r.ok());
        REQUIRE(static_cast<bool>(r));
        REQUIRE(r.value() == 5);
        REQUIRE(*r == 5);
        REQUIRE(r.error() == rpc_errc::success);
        REQUIRE(r.error_message().empty());
    }

    SECTION("failure rethrows the matching exception") {
        rpc_result<int32_t> remote(rpc_errc::remote_error, "nope");
        REQUIRE_FALSE(remote.ok());
        REQUIRE(remote.value_or(-1) == -1);
        REQUIRE_THROWS_AS(remote.value(), remote_error);

        rpc_result<int32_t> comm(rpc_errc::communication_error, "gone");
        REQUIRE_THROWS_AS(comm.value(), communication_error);

        rpc_result<int32_t> marsh(rpc_errc::marshaling_error, "bad");
        REQUIRE_THROWS_AS(marsh.value(), marshaling_error);
    }

    SECTION("void specialization") {
        REQUIRE(rpc_result<void>::success().ok());
        rpc_result<void> failed(rpc_errc::communication_error, "closed");
        REQUIRE(failed.error() == rpc_errc::communication_error);
        REQUIRE(failed.error_message() == "closed");
    }

    SECTION("error code names") {
        REQUIRE(std::string(rpc_errc_str(rpc_errc::remote_error)) == "remote error");
        REQUIRE(std::string(rpc_errc_str(rpc_errc::success)) == "success");
    }
}
