/*
 * item_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Factory for frozen enum items

**************************************************/

#include "item_factory.hpp"

#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "enumkit/core/constants.hpp"

namespace enumkit::core {

auto ItemFactory::createItem(std::string_view enumType, std::string_view name,
                             const json& data) -> EnumItem {
    if (enumType.empty()) {
        spdlog::error("Cannot create item '{}': enum type is empty", name);
        THROW_INVALID_ARGUMENT_TYPE(
            "Enum type of item '{}' must be a non-empty string", name);
    }
    if (!data.is_null() && !data.is_object()) {
        spdlog::error("Data of item {}.{} is a {}, expected an object",
                      enumType, name, data.type_name());
        THROW_INVALID_ARGUMENT_TYPE(
            "Data of item {}.{} must be an object, got {}", enumType, name,
            data.type_name());
    }

    auto state = std::make_shared<EnumItem::State>();
    state->data = data.is_null() ? json::object() : data;
    for (const auto& key : RESERVED_DATA_KEYS) {
        if (state->data.contains(std::string(key))) {
            spdlog::error("Data of item {}.{} uses reserved key '{}'",
                          enumType, name, key);
            THROW_RESERVED_KEY_ERROR(
                "Key '{}' is reserved and cannot be used in the data of item "
                "{}.{}",
                key, enumType, name);
        }
    }
    state->name = std::string(name);
    state->enumType = std::string(enumType);
    state->identity = mintIdentity();

    EnumItem item{std::shared_ptr<const EnumItem::State>(std::move(state))};
    spdlog::debug("Created enum item {} (identity {})", item, item.identity());
    return item;
}

}  // namespace enumkit::core
