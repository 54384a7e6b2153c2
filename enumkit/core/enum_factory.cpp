/*
 * enum_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-5

Description: Assembly and registration of runtime enums

**************************************************/

#include "enum_factory.hpp"

#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "enumkit/core/constants.hpp"
#include "enumkit/core/errors.hpp"
#include "enumkit/core/identity.hpp"
#include "enumkit/core/item_factory.hpp"

namespace enumkit::core {

auto EnumFactory::createEnum(std::string_view enumName,
                             const std::vector<EnumItem>& items,
                             EnumRegistry& registry) -> Enum {
    if (registry.contains(enumName)) {
        spdlog::error("Enum '{}' is already registered", enumName);
        THROW_DUPLICATE_ENUM("Enum '{}' is already registered", enumName);
    }

    auto state = std::make_shared<Enum::State>();
    state->name = std::string(enumName);
    state->items.reserve(items.size());
    state->members.reserve(items.size());

    for (std::size_t index = 0; index < items.size(); ++index) {
        const auto& item = items[index];
        if (!item.valid()) {
            spdlog::error("Element {} passed to enum '{}' is an empty handle",
                          index, enumName);
            THROW_INVALID_ARGUMENT_TYPE(
                "Element {} passed to enum '{}' is not an enum item", index,
                enumName);
        }
        const auto& itemName = item.name();
#if ENUMKIT_ENABLE_DEBUG
        spdlog::trace("Validating {} for enum '{}'", item, enumName);
#endif
        if (isReservedItemName(itemName)) {
            spdlog::error("{} uses a reserved member name", item);
            THROW_RESERVED_ITEM_NAME(
                "'{}' is reserved and cannot name a member of enum '{}'",
                itemName, enumName);
        }
        if (state->members.contains(itemName)) {
            spdlog::error("Enum '{}' already has a member named '{}'",
                          enumName, itemName);
            THROW_DUPLICATE_ITEM("Enum '{}' already has a member named '{}'",
                                 enumName, itemName);
        }
        if (item.enumType() != enumName) {
            spdlog::error("{} was created for enum '{}', not '{}'", item,
                          item.enumType(), enumName);
            THROW_ENUM_TYPE_MISMATCH(
                "{} was created for enum '{}' and cannot be added to '{}'",
                item, item.enumType(), enumName);
        }
        state->members.emplace(itemName, item);
        state->items.push_back(item);
    }
    state->identity = mintIdentity();

    Enum result{std::shared_ptr<const Enum::State>(std::move(state))};
    registry.registerEnum(result);
    spdlog::info("Registered enum {} with {} items", result, result.size());
    return result;
}

auto EnumFactory::createEnumFromMapping(std::string_view enumName,
                                        const json& rawItems,
                                        EnumRegistry& registry) -> Enum {
    if (!rawItems.is_object()) {
        spdlog::error("Items of enum '{}' are a {}, expected an object",
                      enumName, rawItems.type_name());
        THROW_INVALID_ARGUMENT_TYPE("Items of enum '{}' must be an object, got {}",
                                    enumName, rawItems.type_name());
    }

    std::vector<EnumItem> items;
    items.reserve(rawItems.size());
    for (const auto& entry : rawItems.items()) {
        items.push_back(
            ItemFactory::createItem(enumName, entry.key(), entry.value()));
    }
    return createEnum(enumName, items, registry);
}

}  // namespace enumkit::core
