#include "efb/channels/extra_function.hpp"

#include "efb/core/logger.hpp"

namespace efb::channels {

void ExtraFunctionRegistry::add(std::string id, ExtraFunctionInfo info,
                                ExtraFunctionHandler handler) {
    if (!handler) {
        LOG_WARN("Attempted to register extra function {} without a handler", id);
        return;
    }

    if (functions_.contains(id)) {
        LOG_WARN("Replacing existing extra function: {}", id);
    } else {
        LOG_DEBUG("Registered extra function: {} ({})", id, info.name);
    }

    functions_[std::move(id)] = RegisteredExtraFunction{std::move(info), std::move(handler)};
}

auto ExtraFunctionRegistry::get(std::string_view id) const -> const RegisteredExtraFunction* {
    auto it = functions_.find(id);
    if (it != functions_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto ExtraFunctionRegistry::contains(std::string_view id) const -> bool {
    return functions_.find(id) != functions_.end();
}

auto ExtraFunctionRegistry::remove(std::string_view id) -> bool {
    auto it = functions_.find(id);
    if (it != functions_.end()) {
        functions_.erase(it);
        return true;
    }
    return false;
}

auto ExtraFunctionRegistry::list() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(functions_.size());
    for (const auto& [id, fn] : functions_) {
        ids.push_back(id);
    }
    return ids;
}

auto ExtraFunctionRegistry::size() const noexcept -> std::size_t {
    return functions_.size();
}

auto ExtraFunctionRegistry::call(std::string_view id, std::string_view param) const
    -> Result<std::string> {
    const auto* fn = get(id);
    if (!fn) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Extra function not found", std::string(id)));
    }

    LOG_DEBUG("Calling extra function {} with: {}", id, param);
    return fn->handler(param);
}

auto ExtraFunctionRegistry::describe(std::string_view id) const -> Result<std::string> {
    const auto* fn = get(id);
    if (!fn) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Extra function not found", std::string(id)));
    }

    std::string text = fn->info.description;
    size_t pos = 0;
    while ((pos = text.find(kFunctionNamePlaceholder, pos)) != std::string::npos) {
        text.replace(pos, kFunctionNamePlaceholder.size(), id);
        pos += id.size();
    }
    return text;
}

auto ExtraFunctionRegistry::to_json() const -> json {
    auto out = json::object();
    for (const auto& [id, fn] : functions_) {
        out[id] = fn.info;
    }
    return out;
}

} // namespace efb::channels
