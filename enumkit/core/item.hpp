/*
 * item.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Immutable, identity-compared member of a runtime enum

**************************************************/

#ifndef ENUMKIT_CORE_ITEM_HPP
#define ENUMKIT_CORE_ITEM_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "enumkit/core/errors.hpp"
#include "enumkit/core/identity.hpp"

namespace enumkit::core {

using json = nlohmann::json;

class ItemFactory;

/**
 * @brief A single member of a runtime enum.
 *
 * EnumItem is a handle to frozen state created by ItemFactory. Copies share
 * that state, and with it the identity token, so a copied handle compares
 * equal to its source while two separately created items never do, even when
 * every field matches. No member function mutates the item.
 *
 * A default-constructed EnumItem is an empty handle. Accessing the fields of
 * an empty handle throws InvalidArgumentType.
 */
class EnumItem {
public:
    EnumItem() = default;

    /**
     * @brief Member identifier, unique within the owning enum.
     */
    [[nodiscard]] auto name() const -> const std::string&;

    /**
     * @brief Name of the enum this item was created for.
     */
    [[nodiscard]] auto enumType() const -> const std::string&;

    /**
     * @brief Auxiliary payload supplied at creation, always a JSON object.
     */
    [[nodiscard]] auto data() const -> const json&;

    /**
     * @brief Check whether an attribute exists.
     *
     * The reserved keys "Name" and "EnumType" are always present.
     */
    [[nodiscard]] auto has(std::string_view key) const -> bool;

    /**
     * @brief Look up an attribute by key.
     *
     * @param key Payload key, or one of the reserved keys.
     * @return The attribute value, or std::nullopt if it does not exist.
     */
    [[nodiscard]] auto get(std::string_view key) const -> std::optional<json>;

    /**
     * @brief Read an attribute converted to T.
     *
     * @throws ItemNotFound If the attribute does not exist.
     * @throws InvalidArgumentType If the attribute cannot be converted to T.
     */
    template <typename T>
    [[nodiscard]] auto value(std::string_view key) const -> T;

    [[nodiscard]] auto identity() const noexcept -> IdentityToken;

    [[nodiscard]] auto valid() const noexcept -> bool {
        return state_ != nullptr;
    }

    explicit operator bool() const noexcept { return valid(); }

    /**
     * @brief Render as "Enum.<EnumType>.<Name>".
     */
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator==(const EnumItem& lhs, const EnumItem& rhs) noexcept
        -> bool {
        return lhs.identity() == rhs.identity();
    }

private:
    struct State {
        IdentityToken identity{NULL_IDENTITY};
        std::string name;
        std::string enumType;
        json data;
    };

    explicit EnumItem(std::shared_ptr<const State> state) noexcept;

    [[nodiscard]] auto state() const -> const State&;

    std::shared_ptr<const State> state_;

    friend class ItemFactory;
};

auto operator<<(std::ostream& out, const EnumItem& item) -> std::ostream&;

template <typename T>
auto EnumItem::value(std::string_view key) const -> T {
    auto attribute = get(key);
    if (!attribute) {
        THROW_ITEM_NOT_FOUND("{} has no attribute '{}'", toString(), key);
    }
    try {
        return attribute->template get<T>();
    } catch (const json::exception& e) {
        THROW_INVALID_ARGUMENT_TYPE("Attribute '{}' of {} has the wrong type: {}",
                                    key, toString(), e.what());
    }
}

}  // namespace enumkit::core

template <>
struct std::hash<enumkit::core::EnumItem> {
    auto operator()(const enumkit::core::EnumItem& item) const noexcept
        -> std::size_t {
        return std::hash<enumkit::core::IdentityToken>{}(item.identity());
    }
};

template <>
struct fmt::formatter<enumkit::core::EnumItem>
    : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const enumkit::core::EnumItem& item, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(item.toString(), ctx);
    }
};

#endif  // ENUMKIT_CORE_ITEM_HPP
