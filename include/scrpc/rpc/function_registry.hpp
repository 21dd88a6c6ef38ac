#pragma once

/// @file function_registry.hpp
/// @brief Name to callable map shared by the workers of one server
///
/// Callables are type-erased behind function_entry. Binding an entry decodes
/// the argument tuple from a received envelope; invoking the bound call runs
/// the callable and serializes its return value.
///
/// Usage:
/// @code
/// function_registry registry;
/// registry.register_function("add", [](int32_t a, int32_t b) { return a + b; });
/// SCRPC_REGISTER(registry, my_free_function);
/// @endcode

#include "rpc_buffer.hpp"
#include "rpc_types.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scrpc::rpc {

/// A call with decoded arguments, ready to run. Writes the serialized
/// return value (nothing for void) into the given writer.
using bound_call = std::function<void(buffer_writer&)>;

/// Type-erased registered callable
class function_entry {
public:
    using binder_t = std::function<bound_call(buffer_view&)>;

    function_entry(std::string name, size_t arity, binder_t binder)
        : name_(std::move(name)), arity_(arity), binder_(std::move(binder)) {}

    const std::string& name() const noexcept { return name_; }

    /// Number of positional parameters the callable takes
    size_t arity() const noexcept { return arity_; }

    /// Decode the arguments remaining in `args`
    /// @throws marshaling_error if they do not match the parameter types
    bound_call bind(buffer_view& args) const {
        return binder_(args);
    }

private:
    std::string name_;
    size_t arity_;
    binder_t binder_;
};

namespace detail {

template<typename F>
function_entry::binder_t make_binder(std::shared_ptr<F> fn) {
    using traits = function_traits<F>;
    using args_tuple = typename traits::args_tuple;
    using return_type = typename traits::return_type;

    return [fn = std::move(fn)](buffer_view& reader) -> bound_call {
        args_tuple args{};
        deserialize(reader, args);
        if (reader.remaining() != 0) {
            throw marshaling_error("trailing bytes after arguments");
        }

        return [fn, args = std::move(args)](buffer_writer& out) mutable {
            if constexpr (std::is_void_v<return_type>) {
                std::apply(*fn, std::move(args));
            } else {
                auto result = std::apply(*fn, std::move(args));
                serialize(out, to_wire(result));
            }
        };
    };
}

} // namespace detail

/// Registry of callables by name. Append-only.
class function_registry {
public:
    function_registry() = default;

    /// Register a callable under a name
    /// @throws std::invalid_argument if the name is empty
    /// @throws duplicate_registration_error if the name is taken
    template<typename F>
    void register_function(std::string name, F&& func) {
        using fn_type = std::decay_t<F>;
        check_name(name);
        size_t arity = function_traits<fn_type>::arity;
        auto binder = detail::make_binder(std::make_shared<fn_type>(std::forward<F>(func)));
        add(std::move(name), arity, std::move(binder));
    }

    /// Register a member function invoked on `obj`, which must outlive
    /// the registry
    template<typename T, typename R, typename... Args>
    void register_method(std::string name, T* obj, R (T::*method)(Args...)) {
        register_function(std::move(name), [obj, method](Args... args) -> R {
            return (obj->*method)(std::forward<Args>(args)...);
        });
    }

    template<typename T, typename R, typename... Args>
    void register_method(std::string name, const T* obj, R (T::*method)(Args...) const) {
        register_function(std::move(name), [obj, method](Args... args) -> R {
            return (obj->*method)(std::forward<Args>(args)...);
        });
    }

    /// Find an entry by name
    /// @return The entry, or nullptr if nothing is registered under `name`
    const function_entry* find(std::string_view name) const {
        auto it = entries_.find(std::string(name));
        return it != entries_.end() ? &it->second : nullptr;
    }

    bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    size_t size() const noexcept { return entries_.size(); }

    bool empty() const noexcept { return entries_.empty(); }

    /// Registered names in sorted order
    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            result.push_back(name);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

private:
    void check_name(const std::string& name) const {
        if (name.empty()) {
            throw std::invalid_argument("function name must not be empty");
        }
        if (entries_.count(name) != 0) {
            throw duplicate_registration_error(
                "The function name " + name + " is already taken.");
        }
    }

    void add(std::string name, size_t arity, function_entry::binder_t binder) {
        std::string key = name;
        entries_.emplace(std::move(key),
                         function_entry(std::move(name), arity, std::move(binder)));
    }

    std::unordered_map<std::string, function_entry> entries_;
};

/// Register a free function under its own identifier
#define SCRPC_REGISTER(registry, fn) (registry).register_function(#fn, fn)

} // namespace scrpc::rpc
