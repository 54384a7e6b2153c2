/*
 * enum.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Immutable, identity-compared runtime enumeration

**************************************************/

#ifndef ENUMKIT_CORE_ENUM_HPP
#define ENUMKIT_CORE_ENUM_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "enumkit/core/identity.hpp"
#include "enumkit/core/item.hpp"

namespace enumkit::core {

class EnumFactory;

/**
 * @brief A closed, named set of enum items.
 *
 * Enums are created and registered by EnumFactory and never change after
 * that. Like EnumItem, Enum is a handle: copies share the frozen state and
 * compare equal, separately created enums never do.
 *
 * Every member has EnumType equal to the enum name, no two members share a
 * name, and no member is called "Name" or "GetEnumItems".
 */
class Enum {
public:
    Enum() = default;

    [[nodiscard]] auto name() const -> const std::string&;

    /**
     * @brief Snapshot of all members in construction order.
     *
     * The returned vector is independent of the enum; modifying it has no
     * effect on later calls.
     */
    [[nodiscard]] auto getEnumItems() const -> std::vector<EnumItem>;

    /**
     * @brief Member names in construction order.
     */
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto find(std::string_view itemName) const
        -> std::optional<EnumItem>;

    /**
     * @brief Look up a member by name.
     * @throws ItemNotFound If the enum has no such member.
     */
    [[nodiscard]] auto at(std::string_view itemName) const -> EnumItem;

    auto operator[](std::string_view itemName) const -> EnumItem {
        return at(itemName);
    }

    [[nodiscard]] auto contains(std::string_view itemName) const -> bool;

    /**
     * @brief Check membership by identity.
     *
     * An item created separately with the same name is not a member.
     */
    [[nodiscard]] auto contains(const EnumItem& item) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool { return size() == 0; }

    [[nodiscard]] auto identity() const noexcept -> IdentityToken;

    [[nodiscard]] auto valid() const noexcept -> bool {
        return state_ != nullptr;
    }

    explicit operator bool() const noexcept { return valid(); }

    /**
     * @brief Render as "Enum.<Name>".
     */
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator==(const Enum& lhs, const Enum& rhs) noexcept
        -> bool {
        return lhs.identity() == rhs.identity();
    }

private:
    struct State {
        IdentityToken identity{NULL_IDENTITY};
        std::string name;
        std::vector<EnumItem> items;
        std::unordered_map<std::string, EnumItem> members;
    };

    explicit Enum(std::shared_ptr<const State> state) noexcept;

    [[nodiscard]] auto state() const -> const State&;

    std::shared_ptr<const State> state_;

    friend class EnumFactory;
};

auto operator<<(std::ostream& out, const Enum& value) -> std::ostream&;

}  // namespace enumkit::core

template <>
struct std::hash<enumkit::core::Enum> {
    auto operator()(const enumkit::core::Enum& value) const noexcept
        -> std::size_t {
        return std::hash<enumkit::core::IdentityToken>{}(value.identity());
    }
};

template <>
struct fmt::formatter<enumkit::core::Enum> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const enumkit::core::Enum& value, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(value.toString(), ctx);
    }
};

#endif  // ENUMKIT_CORE_ENUM_HPP
