/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Base exception carrying the throw site of every enumkit error

**************************************************/

#include "exception.hpp"

#include <sstream>

namespace enumkit::error {
auto Exception::buildReport() const -> std::string {
    std::ostringstream oss;
    oss << "Exception occurred:\n";
    oss << "  File: " << file_ << "\n";
    oss << "  Line: " << line_ << "\n";
    oss << "  Function: " << func_ << "()\n";
    oss << "  Thread ID: " << thread_id_ << "\n";
    oss << "  Message: " << message_ << "\n";
    return oss.str();
}

auto Exception::what() const noexcept -> const char* {
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }
}  // namespace enumkit::error
