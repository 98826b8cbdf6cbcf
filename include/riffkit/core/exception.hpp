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
#include <utility>

/**
 * Throws a riff::Exception which remembers where it was thrown from.
 */
#define RIFF_THROW_EXCEPTION(msg) throw riff::Exception(msg, __FILE__, __LINE__, RIFF_FUNCTION)

namespace riff {

/**
 * Thrown where a failure can't be reported through a return value, like in constructors. Everything on the codec
 * paths reports failures as riff::Error instead.
 */
class Exception: public std::exception {
  public:
    explicit Exception(std::string message, const char* file = nullptr, const int line = -1,
                       const char* function_name = nullptr) :
        message_(std::move(message)), file_(file), line_(line), function_name_(function_name) {}

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    /**
     * @return The source file which threw, or nullptr when unknown.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    /**
     * @return The source line which threw, or -1 when unknown.
     */
    [[nodiscard]] int line() const {
        return line_;
    }

    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

  private:
    std::string message_;
    const char* file_ {};
    int line_ {-1};
    const char* function_name_ {};
};

}  // namespace riff
