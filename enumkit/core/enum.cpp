/*
 * enum.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Immutable, identity-compared runtime enumeration

**************************************************/

#include "enum.hpp"

#include <utility>

#include "enumkit/core/constants.hpp"
#include "enumkit/core/errors.hpp"

namespace enumkit::core {

Enum::Enum(std::shared_ptr<const State> state) noexcept
    : state_(std::move(state)) {}

auto Enum::state() const -> const State& {
    if (!state_) {
        THROW_INVALID_ARGUMENT_TYPE("Enum handle is empty");
    }
    return *state_;
}

auto Enum::name() const -> const std::string& { return state().name; }

auto Enum::getEnumItems() const -> std::vector<EnumItem> {
    return state().items;
}

auto Enum::names() const -> std::vector<std::string> {
    const auto& items = state().items;
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(item.name());
    }
    return result;
}

auto Enum::find(std::string_view itemName) const -> std::optional<EnumItem> {
    const auto& members = state().members;
    auto iter = members.find(std::string(itemName));
    if (iter == members.end()) {
        return std::nullopt;
    }
    return iter->second;
}

auto Enum::at(std::string_view itemName) const -> EnumItem {
    auto item = find(itemName);
    if (!item) {
        THROW_ITEM_NOT_FOUND("'{}' is not a member of {}", itemName,
                             toString());
    }
    return *item;
}

auto Enum::contains(std::string_view itemName) const -> bool {
    return state().members.contains(std::string(itemName));
}

auto Enum::contains(const EnumItem& item) const -> bool {
    if (!item.valid()) {
        return false;
    }
    auto member = find(item.name());
    return member && *member == item;
}

auto Enum::size() const -> std::size_t { return state().items.size(); }

auto Enum::identity() const noexcept -> IdentityToken {
    return state_ ? state_->identity : NULL_IDENTITY;
}

auto Enum::toString() const -> std::string {
    if (!state_) {
        return fmt::format("{}.<empty>", RENDER_PREFIX);
    }
    return fmt::format("{}.{}", RENDER_PREFIX, state_->name);
}

auto operator<<(std::ostream& out, const Enum& value) -> std::ostream& {
    return out << value.toString();
}

}  // namespace enumkit::core
