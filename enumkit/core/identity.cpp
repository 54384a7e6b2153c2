/*
 * identity.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Process-unique identity tokens for enums and enum items

**************************************************/

#include "identity.hpp"

#include <atomic>

namespace enumkit::core {

namespace {
std::atomic<IdentityToken> nextIdentity{NULL_IDENTITY + 1};
}  // namespace

auto mintIdentity() noexcept -> IdentityToken {
    return nextIdentity.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace enumkit::core
