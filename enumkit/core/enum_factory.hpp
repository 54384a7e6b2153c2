/*
 * enum_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-5

Description: Assembly and registration of runtime enums

**************************************************/

#ifndef ENUMKIT_CORE_ENUM_FACTORY_HPP
#define ENUMKIT_CORE_ENUM_FACTORY_HPP

#include <string_view>
#include <vector>

#include "enumkit/core/enum.hpp"
#include "enumkit/core/item.hpp"
#include "enumkit/core/registry.hpp"

namespace enumkit::core {

/**
 * @brief Assembles enums from items and registers them.
 *
 * Construction is all-or-nothing: when any check fails nothing is
 * registered.
 */
class EnumFactory {
public:
    /**
     * @brief Build an enum from previously created items and register it.
     *
     * Items are checked in sequence order and the first failure is reported,
     * so the error names the first offending item.
     *
     * @param enumName Name of the new enum.
     * @param items Members, in the order getEnumItems() returns them.
     * @param registry Registry the enum is published to.
     * @return The registered enum.
     * @throws InvalidArgumentType If an item handle is empty.
     * @throws DuplicateEnum If enumName is already registered.
     * @throws ReservedItemName If an item is named "Name" or "GetEnumItems".
     * @throws DuplicateItem If two items share a name.
     * @throws EnumTypeMismatch If an item was created for another enum.
     */
    static auto createEnum(std::string_view enumName,
                           const std::vector<EnumItem>& items,
                           EnumRegistry& registry = EnumRegistry::instance())
        -> Enum;

    /**
     * @brief Build an enum from a JSON object of member name to payload.
     *
     * Every entry goes through ItemFactory::createItem, then the items go
     * through createEnum. Members are ordered by key, the iteration order of
     * a JSON object.
     *
     * @param enumName Name of the new enum.
     * @param rawItems Object mapping member names to payload objects (or
     * null for no payload).
     * @param registry Registry the enum is published to.
     * @throws InvalidArgumentType If rawItems is not an object, plus every
     * failure of createItem and createEnum.
     */
    static auto createEnumFromMapping(
        std::string_view enumName, const json& rawItems,
        EnumRegistry& registry = EnumRegistry::instance()) -> Enum;
};

}  // namespace enumkit::core

#endif  // ENUMKIT_CORE_ENUM_FACTORY_HPP
