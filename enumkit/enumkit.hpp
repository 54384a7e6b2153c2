/*
 * enumkit.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-5

Description: Public entry points of the runtime enum library

**************************************************/

#ifndef ENUMKIT_ENUMKIT_HPP
#define ENUMKIT_ENUMKIT_HPP

#include <string_view>
#include <vector>

#include "enumkit/core/constants.hpp"
#include "enumkit/core/enum.hpp"
#include "enumkit/core/enum_factory.hpp"
#include "enumkit/core/errors.hpp"
#include "enumkit/core/item.hpp"
#include "enumkit/core/item_factory.hpp"
#include "enumkit/core/registry.hpp"

namespace enumkit {

using core::Enum;
using core::EnumItem;
using core::EnumRegistry;
using core::json;

inline auto createItem(std::string_view enumType, std::string_view name,
                       const json& data = json::object()) -> EnumItem {
    return core::ItemFactory::createItem(enumType, name, data);
}

inline auto createEnum(std::string_view enumName,
                       const std::vector<EnumItem>& items,
                       EnumRegistry& registry = EnumRegistry::instance())
    -> Enum {
    return core::EnumFactory::createEnum(enumName, items, registry);
}

inline auto createEnumFromMapping(
    std::string_view enumName, const json& rawItems,
    EnumRegistry& registry = EnumRegistry::instance()) -> Enum {
    return core::EnumFactory::createEnumFromMapping(enumName, rawItems,
                                                    registry);
}

/**
 * @brief Process-wide registry, e.g. enums()["Color"]
 */
inline auto enums() -> EnumRegistry& { return EnumRegistry::instance(); }

}  // namespace enumkit

#endif  // ENUMKIT_ENUMKIT_HPP
