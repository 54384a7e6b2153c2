/*
 * item_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Factory for frozen enum items

**************************************************/

#ifndef ENUMKIT_CORE_ITEM_FACTORY_HPP
#define ENUMKIT_CORE_ITEM_FACTORY_HPP

#include <string_view>

#include "enumkit/core/item.hpp"

namespace enumkit::core {

/**
 * @brief Creates enum items.
 *
 * ItemFactory is the only place identity tokens of items are minted. It does
 * not touch any registry.
 */
class ItemFactory {
public:
    /**
     * @brief Create a new enum item.
     *
     * @param enumType Name of the enum the item is created for.
     * @param name Member identifier.
     * @param data Auxiliary payload, a JSON object or null for none.
     * @return A frozen item with a fresh identity.
     * @throws InvalidArgumentType If enumType is empty, or data is neither an
     * object nor null.
     * @throws ReservedKeyError If data defines "Name" or "EnumType".
     */
    [[nodiscard]] static auto createItem(std::string_view enumType,
                                         std::string_view name,
                                         const json& data = json::object())
        -> EnumItem;
};

}  // namespace enumkit::core

#endif  // ENUMKIT_CORE_ITEM_FACTORY_HPP
