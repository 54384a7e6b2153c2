/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Error taxonomy of enum and enum item construction

**************************************************/

#ifndef ENUMKIT_CORE_ERRORS_HPP
#define ENUMKIT_CORE_ERRORS_HPP

#include "enumkit/error/exception.hpp"

namespace enumkit::core {

/**
 * @brief Common base of every enum construction and lookup failure.
 */
class EnumError : public error::Exception {
public:
    using error::Exception::Exception;
};

/**
 * @brief A value of the wrong kind was passed to a public operation.
 */
class InvalidArgumentType : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief An item payload defines one of the item's own field names.
 */
class ReservedKeyError : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief A member name collides with the public surface of Enum.
 */
class ReservedItemName : public EnumError {
public:
    using EnumError::EnumError;
};

class DuplicateItem : public EnumError {
public:
    using EnumError::EnumError;
};

class DuplicateEnum : public EnumError {
public:
    using EnumError::EnumError;
};

/**
 * @brief An item was created for a different enum than the one it is added
 * to.
 */
class EnumTypeMismatch : public EnumError {
public:
    using EnumError::EnumError;
};

class ItemNotFound : public EnumError {
public:
    using EnumError::EnumError;
};

}  // namespace enumkit::core

#define THROW_INVALID_ARGUMENT_TYPE(...)                  \
    throw enumkit::core::InvalidArgumentType(             \
        ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_RESERVED_KEY_ERROR(...)                                    \
    throw enumkit::core::ReservedKeyError(ENUMKIT_FILE_NAME,             \
                                          ENUMKIT_FILE_LINE,             \
                                          ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_RESERVED_ITEM_NAME(...)                                    \
    throw enumkit::core::ReservedItemName(ENUMKIT_FILE_NAME,             \
                                          ENUMKIT_FILE_LINE,             \
                                          ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_DUPLICATE_ITEM(...)                                     \
    throw enumkit::core::DuplicateItem(ENUMKIT_FILE_NAME,             \
                                       ENUMKIT_FILE_LINE,             \
                                       ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_DUPLICATE_ENUM(...)                                     \
    throw enumkit::core::DuplicateEnum(ENUMKIT_FILE_NAME,             \
                                       ENUMKIT_FILE_LINE,             \
                                       ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_ENUM_TYPE_MISMATCH(...)                                    \
    throw enumkit::core::EnumTypeMismatch(ENUMKIT_FILE_NAME,             \
                                          ENUMKIT_FILE_LINE,             \
                                          ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_ITEM_NOT_FOUND(...)                                    \
    throw enumkit::core::ItemNotFound(ENUMKIT_FILE_NAME,             \
                                      ENUMKIT_FILE_LINE,             \
                                      ENUMKIT_FUNC_NAME, __VA_ARGS__)

#endif  // ENUMKIT_CORE_ERRORS_HPP
