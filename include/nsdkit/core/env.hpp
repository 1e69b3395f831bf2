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

#if NSD_WINDOWS
    #include <windows.h>
    #include <processenv.h>
#endif

#include <cstdlib>
#include <optional>
#include <string>

namespace nsd {

/**
 * Gets the value of an environment variable.
 * @param name The name of the variable to retrieve. Pointer must be non-null and \0 terminated.
 * @return The environment variable value, or an empty optional if the variable was not found.
 */
inline std::optional<std::string> get_env(const char* name) {
#if NSD_WINDOWS
    std::string value(64, 0);
    auto length = GetEnvironmentVariableA(name, value.data(), static_cast<DWORD>(value.size()));
    if (length == 0) {
        return {};
    }
    if (length > value.size() - 1) {
        value.resize(length, 0);
        length = GetEnvironmentVariableA(name, value.data(), static_cast<DWORD>(value.size()));
        if (length == 0) {
            return {};
        }
    }
    value.resize(length);
    return value;
#else
    if (auto* value = std::getenv(name)) {
        return value;
    }
    return {};
#endif
}

}  // namespace nsd
