/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Base exception carrying the throw site of every enumkit error

**************************************************/

#ifndef ENUMKIT_ERROR_EXCEPTION_HPP
#define ENUMKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "enumkit/macro.hpp"

namespace enumkit::error {

/**
 * @brief Exception that remembers where it was thrown.
 *
 * The message is built with fmt-style formatting. what() renders a full
 * report with the file, line, function and thread; getMessage() returns only
 * the formatted message.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Construct an exception from a throw site and a message.
     *
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function containing the throw site.
     * @param format fmt format string for the message.
     * @param args Arguments substituted into the format string.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          full_message_(buildReport()) {}

    /**
     * @brief Full diagnostic report of the exception.
     *
     * The report is built once at construction, so what() is safe to call
     * from several threads on a shared exception.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    [[nodiscard]] auto buildReport() const -> std::string;

    std::string file_;
    int line_;
    std::string func_;
    std::thread::id thread_id_;
    std::string message_;
    std::string full_message_;
};

}  // namespace enumkit::error

#define THROW_EXCEPTION(...)                                          \
    throw enumkit::error::Exception(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                    ENUMKIT_FUNC_NAME, __VA_ARGS__)

#endif  // ENUMKIT_ERROR_EXCEPTION_HPP
