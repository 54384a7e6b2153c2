/*
 * constants.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Reserved names and rendering constants of runtime enums

**************************************************/

#ifndef ENUMKIT_CORE_CONSTANTS_HPP
#define ENUMKIT_CORE_CONSTANTS_HPP

#include <algorithm>
#include <array>
#include <string_view>

namespace enumkit::core {

// Prefix of every rendered enum and enum item, e.g. "Enum.Color.Red"
inline constexpr std::string_view RENDER_PREFIX = "Enum";

inline constexpr std::string_view NAME_KEY = "Name";
inline constexpr std::string_view ENUM_TYPE_KEY = "EnumType";
inline constexpr std::string_view ITEMS_QUERY = "GetEnumItems";

// Keys an item payload may not define; they are the item's own fields
inline constexpr std::array<std::string_view, 2> RESERVED_DATA_KEYS = {
    NAME_KEY, ENUM_TYPE_KEY};

// Member names that would shadow the public surface of an Enum
inline constexpr std::array<std::string_view, 2> RESERVED_ITEM_NAMES = {
    NAME_KEY, ITEMS_QUERY};

[[nodiscard]] constexpr auto isReservedDataKey(std::string_view key) noexcept
    -> bool {
    return std::find(RESERVED_DATA_KEYS.begin(), RESERVED_DATA_KEYS.end(),
                     key) != RESERVED_DATA_KEYS.end();
}

[[nodiscard]] constexpr auto isReservedItemName(std::string_view name) noexcept
    -> bool {
    return std::find(RESERVED_ITEM_NAMES.begin(), RESERVED_ITEM_NAMES.end(),
                     name) != RESERVED_ITEM_NAMES.end();
}

}  // namespace enumkit::core

#endif  // ENUMKIT_CORE_CONSTANTS_HPP
