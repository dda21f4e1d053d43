#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "efb/core/error.hpp"

namespace efb::channels {

using json = nlohmann::json;

/// Placeholder a description may use for the id the function is exposed as.
inline constexpr std::string_view kFunctionNamePlaceholder = "{function_name}";

/// Descriptor attached to a channel's "extra function".
struct ExtraFunctionInfo {
    bool extra_fn = true;
    std::string name;         // human readable name
    std::string description;  // usage text, may contain {function_name}
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExtraFunctionInfo, extra_fn, name, description)

/// A callable tagged as an extra function. Calls are forwarded to the
/// wrapped callable untouched.
template <typename F>
class ExtraFunction {
public:
    ExtraFunction(F fn, ExtraFunctionInfo info)
        : fn_(std::move(fn)), info_(std::move(info)) {}

    template <typename... Args>
    auto operator()(Args&&... args) -> std::invoke_result_t<F&, Args...> {
        return std::invoke(fn_, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto operator()(Args&&... args) const -> std::invoke_result_t<const F&, Args...> {
        return std::invoke(fn_, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto info() const noexcept -> const ExtraFunctionInfo& { return info_; }
    [[nodiscard]] auto function() const noexcept -> const F& { return fn_; }

private:
    F fn_;
    ExtraFunctionInfo info_;
};

/// Produced by extra(); tags the callables it is applied to.
class ExtraMarker {
public:
    ExtraMarker(std::string name, std::string description)
        : info_{true, std::move(name), std::move(description)} {}

    template <typename F>
    auto operator()(F fn) const -> ExtraFunction<F> {
        return ExtraFunction<F>(std::move(fn), info_);
    }

    /// Re-marking replaces the previous descriptor instead of nesting.
    template <typename F>
    auto operator()(ExtraFunction<F> fn) const -> ExtraFunction<F> {
        return ExtraFunction<F>(fn.function(), info_);
    }

    [[nodiscard]] auto info() const noexcept -> const ExtraFunctionInfo& { return info_; }

private:
    ExtraFunctionInfo info_;
};

/// Marks a callable as an extra function exposed by a channel.
///
///     auto fn = extra("Show history", "Usage: {function_name} <count>")(
///         [](std::string_view arg) { return std::string(arg); });
inline auto extra(std::string name, std::string description) -> ExtraMarker {
    return ExtraMarker(std::move(name), std::move(description));
}

/// Extra functions take the raw argument text and reply with text.
using ExtraFunctionHandler = std::function<std::string(std::string_view)>;

struct RegisteredExtraFunction {
    ExtraFunctionInfo info;
    ExtraFunctionHandler handler;
};

/// Discovery table for the extra functions a channel exposes, keyed by the
/// id each function is invoked under.
class ExtraFunctionRegistry {
public:
    ExtraFunctionRegistry() = default;

    ExtraFunctionRegistry(const ExtraFunctionRegistry&) = delete;
    ExtraFunctionRegistry& operator=(const ExtraFunctionRegistry&) = delete;
    ExtraFunctionRegistry(ExtraFunctionRegistry&&) = default;
    ExtraFunctionRegistry& operator=(ExtraFunctionRegistry&&) = default;

    /// Register a marked function under `id`. An existing entry with the
    /// same id is replaced.
    template <typename F>
    void add(std::string id, ExtraFunction<F> fn) {
        auto info = fn.info();
        add(std::move(id), std::move(info), ExtraFunctionHandler(std::move(fn)));
    }

    void add(std::string id, ExtraFunctionInfo info, ExtraFunctionHandler handler);

    /// Returns nullptr if no function is registered under `id`.
    [[nodiscard]] auto get(std::string_view id) const -> const RegisteredExtraFunction*;

    [[nodiscard]] auto contains(std::string_view id) const -> bool;

    auto remove(std::string_view id) -> bool;

    /// Registered ids in lexicographic order.
    [[nodiscard]] auto list() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /// Invoke the function registered under `id`.
    auto call(std::string_view id, std::string_view param) const -> Result<std::string>;

    /// Description of `id` with every {function_name} replaced by the id.
    [[nodiscard]] auto describe(std::string_view id) const -> Result<std::string>;

    /// {"<id>": {"extra_fn": true, "name": ..., "description": ...}, ...}
    [[nodiscard]] auto to_json() const -> json;

private:
    std::map<std::string, RegisteredExtraFunction, std::less<>> functions_;
};

} // namespace efb::channels
