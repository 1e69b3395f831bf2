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

#include <cstdlib>
#include <iostream>

#include "exception.hpp"
#include "log.hpp"

/**
 * When NSD_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default is on.
 */
#ifndef NSD_LOG_ON_ASSERT
    #define NSD_LOG_ON_ASSERT 1
#endif

/**
 * When NSD_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off.
 */
#ifndef NSD_THROW_EXCEPTION_ON_ASSERT
    #define NSD_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When NSD_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default is
 * off.
 */
#ifndef NSD_ABORT_ON_ASSERT
    #define NSD_ABORT_ON_ASSERT 0
#endif

#define NSD_LOG_IF_ENABLED(msg) \
    if (NSD_LOG_ON_ASSERT) {    \
        NSD_CRITICAL(msg);      \
    }

#define NSD_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (NSD_THROW_EXCEPTION_ON_ASSERT) {    \
        NSD_THROW_EXCEPTION(msg);           \
    }

#define NSD_ABORT_IF_ENABLED(msg)                                  \
    if (NSD_ABORT_ON_ASSERT) {                                     \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define NSD_ASSERT(condition, message)                                    \
    do {                                                                  \
        if (!(condition)) {                                               \
            NSD_LOG_IF_ENABLED("Assertion failure: " message)             \
            NSD_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            NSD_ABORT_IF_ENABLED(message)                                 \
        }                                                                 \
    } while (false)

/**
 * Same as NSD_ASSERT, but returns from the enclosing (void) function when the condition is false.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define NSD_ASSERT_RETURN(condition, message)                             \
    do {                                                                  \
        if (!(condition)) {                                               \
            NSD_LOG_IF_ENABLED("Assertion failure: " message)             \
            NSD_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            NSD_ABORT_IF_ENABLED(message)                                 \
            return;                                                       \
        }                                                                 \
    } while (false)

/**
 * Asserts given condition, but never throws. Useful for places where an exception cannot be thrown like destructors.
 * @param condition The condition to test.
 * @param message The message to log or abort with.
 */
#define NSD_ASSERT_NO_THROW(condition, message)               \
    do {                                                      \
        if (!(condition)) {                                   \
            NSD_LOG_IF_ENABLED("Assertion failure: " message) \
            NSD_ABORT_IF_ENABLED(message)                     \
        }                                                     \
    } while (false)

/**
 * Asserts with false, as a quick way to assert that a branch is invalid.
 * @param message The message to log, throw, abort with.
 */
#define NSD_ASSERT_FALSE(message) NSD_ASSERT(false, message)
