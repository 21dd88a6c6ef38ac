#pragma once

/// @file rpc_types.hpp
/// @brief Serialization of argument and result types
///
/// Supported types:
/// - Primitive types (integers, floats, bool, enums)
/// - Strings
/// - Containers (vectors, arrays, maps)
/// - Optionals, tuples and pairs
/// - Structs declaring their fields with SCRPC_FIELDS
///
/// Usage:
/// @code
/// struct Point {
///     int32_t x;
///     int32_t y;
///
///     SCRPC_FIELDS(Point, x, y)
/// };
/// @endcode

#include "rpc_buffer.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scrpc::rpc {

// ============================================================================
// Type traits
// ============================================================================

/// Check if T is a primitive type that can be directly memcpy'd
template<typename T>
struct is_primitive : std::bool_constant<
    std::is_arithmetic_v<T> || std::is_enum_v<T>> {};

template<typename T>
inline constexpr bool is_primitive_v = is_primitive<T>::value;

/// Check if T is a string-like type that travels as std::string
template<typename T>
struct is_string_type : std::bool_constant<
    std::is_same_v<T, std::string> ||
    std::is_same_v<T, std::string_view> ||
    std::is_same_v<T, const char*> ||
    std::is_same_v<T, char*>> {};

template<typename T>
inline constexpr bool is_string_type_v = is_string_type<std::decay_t<T>>::value;

/// Check if T is a map type
template<typename T>
struct is_map_type : std::false_type {};

template<typename K, typename V, typename C, typename A>
struct is_map_type<std::map<K, V, C, A>> : std::true_type {};

template<typename K, typename V, typename H, typename E, typename A>
struct is_map_type<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template<typename T>
inline constexpr bool is_map_type_v = is_map_type<T>::value;

/// Get key and value types for maps
template<typename T>
struct map_types;

template<typename K, typename V, typename C, typename A>
struct map_types<std::map<K, V, C, A>> {
    using key_type = K;
    using value_type = V;
};

template<typename K, typename V, typename H, typename E, typename A>
struct map_types<std::unordered_map<K, V, H, E, A>> {
    using key_type = K;
    using value_type = V;
};

/// The owning type a value is encoded and decoded as. String views and C
/// strings travel as std::string; everything else as its decayed self.
template<typename T>
using wire_type_t = std::conditional_t<is_string_type_v<T>, std::string, std::decay_t<T>>;

/// Convert a value to its wire type, copying only when the types differ
template<typename T>
decltype(auto) to_wire(const T& value) {
    if constexpr (std::is_same_v<wire_type_t<T>, std::decay_t<T>>) {
        return (value);
    } else {
        return wire_type_t<T>(value);
    }
}

// ============================================================================
// Callable introspection
// ============================================================================

/// Signature of a callable: return type and decoded argument tuple.
/// Works for functions, function pointers, member function pointers and
/// class types with a single non-template operator().
template<typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct function_traits<R(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<wire_type_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename R, typename... Args>
struct function_traits<R(Args...) noexcept> : function_traits<R(Args...)> {};

template<typename R, typename... Args>
struct function_traits<R(*)(Args...)> : function_traits<R(Args...)> {};

template<typename R, typename... Args>
struct function_traits<R(*)(Args...) noexcept> : function_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...)> : function_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const> : function_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) noexcept> : function_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const noexcept> : function_traits<R(Args...)> {};

// ============================================================================
// Struct field introspection
// ============================================================================

/// Marker type to detect if a struct has field definitions
struct rpc_fields_marker {};

/// Check if T has SCRPC_FIELDS defined
template<typename T, typename = void>
struct has_rpc_fields : std::false_type {};

template<typename T>
struct has_rpc_fields<T, std::void_t<typename T::_scrpc_fields_tag>> : std::true_type {};

template<typename T>
inline constexpr bool has_rpc_fields_v = has_rpc_fields<T>::value;

/// Field descriptor for compile-time reflection
template<typename T, typename Class>
struct field_descriptor {
    using value_type = T;
    using class_type = Class;

    T Class::* ptr;
    const char* name;

    constexpr field_descriptor(T Class::* p, const char* n) : ptr(p), name(n) {}

    const T& get(const Class& obj) const { return obj.*ptr; }
    T& get(Class& obj) const { return obj.*ptr; }
};

template<typename T, typename Class>
constexpr auto make_field(T Class::* ptr, const char* name) {
    return field_descriptor<T, Class>{ptr, name};
}

// ============================================================================
// Serialization
// ============================================================================

template<typename T>
void serialize(buffer_writer& writer, const T& value);

template<typename T>
void deserialize(buffer_view& reader, T& value);

template<typename T>
requires is_primitive_v<T>
void serialize_impl(buffer_writer& writer, const T& value) {
    writer.write(value);
}

template<typename T>
requires is_primitive_v<T>
void deserialize_impl(buffer_view& reader, T& value) {
    value = reader.read<T>();
}

inline void serialize_impl(buffer_writer& writer, const std::string& value) {
    writer.write_string(value);
}

inline void serialize_impl(buffer_writer& writer, std::string_view value) {
    writer.write_string(value);
}

inline void serialize_impl(buffer_writer& writer, const char* value) {
    writer.write_string(value);
}

inline void deserialize_impl(buffer_view& reader, std::string& value) {
    std::string_view sv = reader.read_string();
    value.assign(sv.data(), sv.size());
}

template<typename T, typename A>
void serialize_impl(buffer_writer& writer, const std::vector<T, A>& vec) {
    writer.write_array_size(vec.size());
    for (const auto& elem : vec) {
        serialize(writer, elem);
    }
}

template<typename T, typename A>
void deserialize_impl(buffer_view& reader, std::vector<T, A>& vec) {
    uint32_t count = reader.read_array_size();
    vec.clear();
    // A corrupt count must not drive a huge allocation up front
    vec.reserve(std::min<size_t>(count, reader.remaining()));
    for (uint32_t i = 0; i < count; ++i) {
        T elem{};
        deserialize(reader, elem);
        vec.push_back(std::move(elem));
    }
}

template<typename A>
void serialize_impl(buffer_writer& writer, const std::vector<bool, A>& vec) {
    writer.write_array_size(vec.size());
    for (bool b : vec) {
        writer.write(static_cast<uint8_t>(b ? 1 : 0));
    }
}

template<typename A>
void deserialize_impl(buffer_view& reader, std::vector<bool, A>& vec) {
    uint32_t count = reader.read_array_size();
    vec.clear();
    for (uint32_t i = 0; i < count; ++i) {
        vec.push_back(reader.read<uint8_t>() != 0);
    }
}

/// Fixed-size arrays carry no size prefix
template<typename T, size_t N>
void serialize_impl(buffer_writer& writer, const std::array<T, N>& arr) {
    for (const auto& elem : arr) {
        serialize(writer, elem);
    }
}

template<typename T, size_t N>
void deserialize_impl(buffer_view& reader, std::array<T, N>& arr) {
    for (auto& elem : arr) {
        deserialize(reader, elem);
    }
}

template<typename Map>
requires is_map_type_v<Map>
void serialize_impl(buffer_writer& writer, const Map& map) {
    writer.write_array_size(map.size());
    for (const auto& [key, value] : map) {
        serialize(writer, key);
        serialize(writer, value);
    }
}

template<typename Map>
requires is_map_type_v<Map>
void deserialize_impl(buffer_view& reader, Map& map) {
    using K = typename map_types<Map>::key_type;
    using V = typename map_types<Map>::value_type;

    uint32_t count = reader.read_array_size();
    map.clear();
    for (uint32_t i = 0; i < count; ++i) {
        K key{};
        V value{};
        deserialize(reader, key);
        deserialize(reader, value);
        map.emplace(std::move(key), std::move(value));
    }
}

template<typename T>
void serialize_impl(buffer_writer& writer, const std::optional<T>& opt) {
    writer.write(static_cast<uint8_t>(opt.has_value() ? 1 : 0));
    if (opt.has_value()) {
        serialize(writer, *opt);
    }
}

template<typename T>
void deserialize_impl(buffer_view& reader, std::optional<T>& opt) {
    uint8_t has_value = reader.read<uint8_t>();
    if (has_value) {
        T value{};
        deserialize(reader, value);
        opt = std::move(value);
    } else {
        opt.reset();
    }
}

template<typename... Ts>
void serialize_impl(buffer_writer& writer, const std::tuple<Ts...>& tup) {
    std::apply([&](const auto&... elem) {
        (serialize(writer, elem), ...);
    }, tup);
}

template<typename... Ts>
void deserialize_impl(buffer_view& reader, std::tuple<Ts...>& tup) {
    std::apply([&](auto&... elem) {
        (deserialize(reader, elem), ...);
    }, tup);
}

template<typename A, typename B>
void serialize_impl(buffer_writer& writer, const std::pair<A, B>& p) {
    serialize(writer, p.first);
    serialize(writer, p.second);
}

template<typename A, typename B>
void deserialize_impl(buffer_view& reader, std::pair<A, B>& p) {
    deserialize(reader, p.first);
    deserialize(reader, p.second);
}

/// Serialize struct with fields
template<typename T>
requires has_rpc_fields_v<T>
void serialize_impl(buffer_writer& writer, const T& obj) {
    auto fields = T::_scrpc_get_fields();
    std::apply([&](const auto&... field) {
        (serialize(writer, field.get(obj)), ...);
    }, fields);
}

/// Deserialize struct with fields
template<typename T>
requires has_rpc_fields_v<T>
void deserialize_impl(buffer_view& reader, T& obj) {
    auto fields = T::_scrpc_get_fields();
    std::apply([&](const auto&... field) {
        (deserialize(reader, field.get(obj)), ...);
    }, fields);
}

/// Main serialize function - dispatches to appropriate impl
template<typename T>
void serialize(buffer_writer& writer, const T& value) {
    serialize_impl(writer, value);
}

/// Main deserialize function - dispatches to appropriate impl
template<typename T>
void deserialize(buffer_view& reader, T& value) {
    deserialize_impl(reader, value);
}

/// Convenience: serialize to new buffer
template<typename T>
buffer_writer serialize(const T& value) {
    buffer_writer writer;
    serialize(writer, value);
    return writer;
}

/// Convenience: deserialize from view
template<typename T>
T deserialize(buffer_view& reader) {
    T value{};
    deserialize(reader, value);
    return value;
}

// ============================================================================
// Macro for field definition
// ============================================================================

#define _SCRPC_FIELD_IMPL(Class, field) \
    ::scrpc::rpc::make_field(&Class::field, #field)

#define _SCRPC_EXPAND(x) x

#define _SCRPC_FOR_EACH_1(Class, macro, x) macro(Class, x)
#define _SCRPC_FOR_EACH_2(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_1(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_3(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_2(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_4(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_3(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_5(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_4(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_6(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_5(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_7(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_6(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_8(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_7(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_9(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_8(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_10(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_9(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_11(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_10(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_12(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_11(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_13(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_12(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_14(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_13(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_15(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_14(Class, macro, __VA_ARGS__))
#define _SCRPC_FOR_EACH_16(Class, macro, x, ...) macro(Class, x), _SCRPC_EXPAND(_SCRPC_FOR_EACH_15(Class, macro, __VA_ARGS__))

#define _SCRPC_GET_MACRO(_1,_2,_3,_4,_5,_6,_7,_8,_9,_10,_11,_12,_13,_14,_15,_16,NAME,...) NAME
#define _SCRPC_FOR_EACH(Class, macro, ...) \
    _SCRPC_EXPAND(_SCRPC_GET_MACRO(__VA_ARGS__, \
        _SCRPC_FOR_EACH_16, _SCRPC_FOR_EACH_15, _SCRPC_FOR_EACH_14, _SCRPC_FOR_EACH_13, \
        _SCRPC_FOR_EACH_12, _SCRPC_FOR_EACH_11, _SCRPC_FOR_EACH_10, _SCRPC_FOR_EACH_9, \
        _SCRPC_FOR_EACH_8, _SCRPC_FOR_EACH_7, _SCRPC_FOR_EACH_6, _SCRPC_FOR_EACH_5, \
        _SCRPC_FOR_EACH_4, _SCRPC_FOR_EACH_3, _SCRPC_FOR_EACH_2, _SCRPC_FOR_EACH_1) \
    (Class, macro, __VA_ARGS__))

/// Declare the serializable fields of a struct (up to 16)
/// @param ClassName The name of the enclosing struct/class
/// @param ... The field names to serialize, in wire order
#define SCRPC_FIELDS(ClassName, ...) \
    using _scrpc_fields_tag = ::scrpc::rpc::rpc_fields_marker; \
    static constexpr auto _scrpc_get_fields() { \
        return std::make_tuple(_SCRPC_FOR_EACH(ClassName, _SCRPC_FIELD_IMPL, __VA_ARGS__)); \
    }

/// Mark a struct without fields as serializable
/// @code
/// struct Ping {
///     SCRPC_EMPTY_FIELDS(Ping)
/// };
/// @endcode
#define SCRPC_EMPTY_FIELDS(ClassName) \
    using _scrpc_fields_tag = ::scrpc::rpc::rpc_fields_marker; \
    static constexpr auto _scrpc_get_fields() { \
        return std::make_tuple(); \
    }

// ============================================================================
// RPC result type
// ============================================================================

/// Value-or-error result of rpc_proxy::try_call
template<typename T>
class rpc_result {
public:
    rpc_result() = default;

    explicit rpc_result(T value)
        : value_(std::move(value))
        , error_(rpc_errc::success) {}

    rpc_result(rpc_errc err, std::string message)
        : error_(err), message_(std::move(message)) {}

    bool ok() const noexcept { return error_ == rpc_errc::success; }
    explicit operator bool() const noexcept { return ok(); }

    rpc_errc error() const noexcept { return error_; }

    /// Failure description; empty on success
    const std::string& error_message() const noexcept { return message_; }

    /// Get value, rethrowing the typed error on failure
    T& value() & {
        if (!ok()) throw_error();
        return value_;
    }
    const T& value() const& {
        if (!ok()) throw_error();
        return value_;
    }
    T&& value() && {
        if (!ok()) throw_error();
        return std::move(value_);
    }

    template<typename U>
    T value_or(U&& default_value) const& {
        return ok() ? value_ : static_cast<T>(std::forward<U>(default_value));
    }

    /// Access value (undefined if error)
    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }
    T& operator*() & { return value_; }
    const T& operator*() const& { return value_; }

    /// Throw the exception this result stands for
    [[noreturn]] void throw_error() const {
        switch (error_) {
            case rpc_errc::communication_error: throw communication_error(message_);
            case rpc_errc::remote_error: throw remote_error(message_);
            case rpc_errc::marshaling_error: throw marshaling_error(message_);
            default: throw std::logic_error("rpc_result holds no error");
        }
    }

private:
    T value_{};
    rpc_errc error_ = rpc_errc::success;
    std::string message_;
};

/// Specialization for void
template<>
class rpc_result<void> {
public:
    rpc_result() = default;
    rpc_result(rpc_errc err, std::string message)
        : error_(err), message_(std::move(message)) {}

    static rpc_result success() { return rpc_result(); }

    bool ok() const noexcept { return error_ == rpc_errc::success; }
    explicit operator bool() const noexcept { return ok(); }

    rpc_errc error() const noexcept { return error_; }
    const std::string& error_message() const noexcept { return message_; }

private:
    rpc_errc error_ = rpc_errc::success;
    std::string message_;
};

} // namespace scrpc::rpc
