/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"

#include <exception>
#include <string>

#include <fmt/format.h>

/**
 * Throws an nsd::Exception with a message formatted by fmt, annotated with the location of the throw.
 */
#define NSD_THROW_EXCEPTION(...) throw nsd::Exception(fmt::format(__VA_ARGS__), __FILE__, __LINE__, NSD_FUNCTION)

namespace nsd {

class Exception: public std::exception {
  public:
    explicit
    Exception(const char* msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(msg), file_(file), line_(line), function_name_(function_name) {}

    explicit
    Exception(std::string msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(std::move(msg)), file_(file), line_(line), function_name_(function_name) {}

    /**
     * @returns The error message.
     */
    [[nodiscard]] const char* what() const noexcept override {
        return error_.c_str();
    }

    /**
     * @return The file where the error occurred.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    /**
     * @return The line number where the error occurred.
     */
    [[nodiscard]] int line() const {
        return line_;
    }

    /**
     * @return The name of the function where the error occurred.
     */
    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

  private:
    std::string error_;
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};
};

}  // namespace nsd
