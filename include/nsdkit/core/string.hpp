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

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace nsd {

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Splits a string in two at the first occurrence of the delimiter.
 * @param string The string to split.
 * @param delimiter The delimiter to split on.
 * @return The part before and the part after the delimiter, or an empty optional if the delimiter was not found.
 */
inline std::optional<std::pair<std::string_view, std::string_view>>
string_split_once(const std::string_view string, const char delimiter) {
    const auto pos = string.find(delimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(string.substr(0, pos), string.substr(pos + 1));
}

}  // namespace nsd
