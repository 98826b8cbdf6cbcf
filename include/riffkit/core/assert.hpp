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

#include "exception.hpp"
#include "log.hpp"

#include <cstdio>
#include <cstdlib>

// Assertions guard against programming errors, not against bad input. What happens when one fails is configured at
// compile time. By default the failure is logged and execution continues.

#ifndef RIFF_LOG_ON_ASSERT
    #define RIFF_LOG_ON_ASSERT 1
#endif

#ifndef RIFF_THROW_EXCEPTION_ON_ASSERT
    #define RIFF_THROW_EXCEPTION_ON_ASSERT 0
#endif

#ifndef RIFF_ABORT_ON_ASSERT
    #define RIFF_ABORT_ON_ASSERT 0
#endif

#define RIFF_ASSERTION_FAILED(message)                                      \
    do {                                                                    \
        if (RIFF_LOG_ON_ASSERT) {                                           \
            RIFF_CRITICAL("Assertion failure: {}", message);                \
        }                                                                   \
        if (RIFF_THROW_EXCEPTION_ON_ASSERT) {                               \
            RIFF_THROW_EXCEPTION("Assertion failure: " message);            \
        }                                                                   \
        if (RIFF_ABORT_ON_ASSERT) {                                         \
            std::fprintf(stderr, "Abort on assertion: %s\n", message);      \
            std::abort();                                                   \
        }                                                                   \
    } while (false)

/**
 * Reports a failed assertion when condition is false. See above for what reporting means.
 */
#define RIFF_ASSERT(condition, message)     \
    do {                                    \
        if (!(condition)) {                 \
            RIFF_ASSERTION_FAILED(message); \
        }                                   \
    } while (false)

/**
 * Like RIFF_ASSERT, and returns return_value from the enclosing function when condition is false.
 */
#define RIFF_ASSERT_RETURN_WITH(condition, message, return_value) \
    do {                                                          \
        if (!(condition)) {                                       \
            RIFF_ASSERTION_FAILED(message);                       \
            return return_value;                                  \
        }                                                         \
    } while (false)
