/*
 * identity.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Process-unique identity tokens for enums and enum items

**************************************************/

#ifndef ENUMKIT_CORE_IDENTITY_HPP
#define ENUMKIT_CORE_IDENTITY_HPP

#include <cstdint>

namespace enumkit::core {

using IdentityToken = std::uint64_t;

// Token of an empty handle; never minted
inline constexpr IdentityToken NULL_IDENTITY = 0;

/**
 * @brief Mint a fresh identity token.
 *
 * Tokens are unique for the lifetime of the process and safe to mint from
 * any thread.
 */
[[nodiscard]] auto mintIdentity() noexcept -> IdentityToken;

}  // namespace enumkit::core

#endif  // ENUMKIT_CORE_IDENTITY_HPP
