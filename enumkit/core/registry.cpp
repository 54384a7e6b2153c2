/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Write-once registry of runtime enums

**************************************************/

#include "registry.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "enumkit/core/errors.hpp"

namespace enumkit::core {

auto EnumRegistry::instance() -> EnumRegistry& {
    static EnumRegistry instance;
    return instance;
}

auto EnumRegistry::find(std::string_view name) const -> std::optional<Enum> {
    std::shared_lock lock(mutex_);
    auto iter = enums_.find(std::string(name));
    if (iter == enums_.end()) {
        return std::nullopt;
    }
    return iter->second;
}

auto EnumRegistry::contains(std::string_view name) const -> bool {
    std::shared_lock lock(mutex_);
    return enums_.contains(std::string(name));
}

auto EnumRegistry::getEnums() const -> std::unordered_map<std::string, Enum> {
    std::shared_lock lock(mutex_);
    spdlog::debug("Taking snapshot of {} registered enums", enums_.size());
    return enums_;
}

auto EnumRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return enums_.size();
}

void EnumRegistry::registerEnum(const Enum& value) {
    std::unique_lock lock(mutex_);
    // Checked again under the writer lock; a concurrent createEnum may have
    // registered the name after the factory's early check.
    if (enums_.contains(value.name())) {
        spdlog::error("Enum '{}' is already registered", value.name());
        THROW_DUPLICATE_ENUM("Enum '{}' is already registered", value.name());
    }
    enums_.emplace(value.name(), value);
}

}  // namespace enumkit::core
