/*
 * item.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Immutable, identity-compared member of a runtime enum

**************************************************/

#include "item.hpp"

#include <utility>

#include "enumkit/core/constants.hpp"

namespace enumkit::core {

EnumItem::EnumItem(std::shared_ptr<const State> state) noexcept
    : state_(std::move(state)) {}

auto EnumItem::state() const -> const State& {
    if (!state_) {
        THROW_INVALID_ARGUMENT_TYPE("EnumItem handle is empty");
    }
    return *state_;
}

auto EnumItem::name() const -> const std::string& { return state().name; }

auto EnumItem::enumType() const -> const std::string& {
    return state().enumType;
}

auto EnumItem::data() const -> const json& { return state().data; }

auto EnumItem::has(std::string_view key) const -> bool {
    return isReservedDataKey(key) || state().data.contains(std::string(key));
}

auto EnumItem::get(std::string_view key) const -> std::optional<json> {
    const auto& current = state();
    if (key == NAME_KEY) {
        return json(current.name);
    }
    if (key == ENUM_TYPE_KEY) {
        return json(current.enumType);
    }
    auto iter = current.data.find(std::string(key));
    if (iter == current.data.end()) {
        return std::nullopt;
    }
    return *iter;
}

auto EnumItem::identity() const noexcept -> IdentityToken {
    return state_ ? state_->identity : NULL_IDENTITY;
}

auto EnumItem::toString() const -> std::string {
    if (!state_) {
        return fmt::format("{}.<empty>", RENDER_PREFIX);
    }
    return fmt::format("{}.{}.{}", RENDER_PREFIX, state_->enumType,
                       state_->name);
}

auto operator<<(std::ostream& out, const EnumItem& item) -> std::ostream& {
    return out << item.toString();
}

}  // namespace enumkit::core
