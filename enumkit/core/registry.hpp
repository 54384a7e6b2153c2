/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Write-once registry of runtime enums

**************************************************/

#ifndef ENUMKIT_CORE_REGISTRY_HPP
#define ENUMKIT_CORE_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "enumkit/core/enum.hpp"

namespace enumkit::core {

/**
 * @brief Maps enum names to enums.
 *
 * Each name can be registered exactly once and entries are never removed.
 * The only writer is EnumFactory; everything else is read-only. All members
 * are safe to call concurrently.
 *
 * The process-wide registry is reached through instance(). Separate
 * registries can be constructed and handed to EnumFactory, e.g. to keep test
 * cases isolated from each other.
 */
class EnumRegistry {
public:
    EnumRegistry() = default;
    ~EnumRegistry() = default;

    EnumRegistry(const EnumRegistry&) = delete;
    auto operator=(const EnumRegistry&) -> EnumRegistry& = delete;

    /**
     * @brief Get the process-wide registry
     * @return EnumRegistry& Singleton instance
     */
    static auto instance() -> EnumRegistry&;

    /**
     * @brief Look up an enum by name
     * @param name Enum name
     * @return The enum, or std::nullopt if nothing is registered under name
     */
    [[nodiscard]] auto find(std::string_view name) const
        -> std::optional<Enum>;

    auto operator[](std::string_view name) const -> std::optional<Enum> {
        return find(name);
    }

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /**
     * @brief Snapshot of every registered enum keyed by name
     *
     * The returned map is a copy; changing it does not affect the registry.
     */
    [[nodiscard]] auto getEnums() const
        -> std::unordered_map<std::string, Enum>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    /**
     * @brief Insert a fully built enum
     * @throws DuplicateEnum If the name is already registered
     */
    void registerEnum(const Enum& value);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Enum> enums_;

    friend class EnumFactory;
};

}  // namespace enumkit::core

#endif  // ENUMKIT_CORE_REGISTRY_HPP
