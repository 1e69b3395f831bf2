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

#include "expected.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors

#include <string>
#include <string_view>

namespace nsd {

/**
 * Parses given string as JSON and converts it to T using the boost::json value_to machinery (tag_invoke).
 * @tparam T The type to convert to.
 * @param json_str The JSON string.
 * @return The converted value, or a description of the error.
 */
template<typename T>
tl::expected<T, std::string> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return tl::unexpected(fmt::format("Failed to parse json: {}", ec.message()));
    }
    try {
        return boost::json::value_to<T>(jv);
    } catch (const std::exception& e) {
        return tl::unexpected(fmt::format("Failed to convert json: {}", e.what()));
    }
}

}  // namespace nsd
