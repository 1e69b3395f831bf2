/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/dnssd_session.hpp"
#include "nsdkit/dnssd/mock/dnssd_mock_provider.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nsd::Session::Configuration") {
    SECTION("Default") {
        const nsd::dnssd::Session::Configuration config;
        REQUIRE_FALSE(config.exclude_own_service);
    }

    SECTION("To json") {
        nsd::dnssd::Session::Configuration config;
        config.exclude_own_service = true;
        const auto json = config.to_json();
        REQUIRE(json.is_object());
        REQUIRE(json.at("exclude_own_service").as_bool() == true);
    }

    SECTION("To json and back") {
        nsd::dnssd::Session::Configuration config;
        config.exclude_own_service = true;
        const auto restored = nsd::dnssd::Session::Configuration::from_json(config.to_json());
        REQUIRE(restored.has_value());
        REQUIRE(*restored == config);
    }

    SECTION("Parse from string") {
        const auto json = nsd::parse_json<nsd::dnssd::Session::Configuration>(R"({"exclude_own_service": true})");
        REQUIRE(json.has_value());
        REQUIRE(json->exclude_own_service);
    }

    SECTION("Missing keys keep their default value") {
        const auto config = nsd::dnssd::Session::Configuration::from_json(boost::json::object {});
        REQUIRE(config.has_value());
        REQUIRE(*config == nsd::dnssd::Session::Configuration {});
    }

    SECTION("Wrong type is an error") {
        const auto config =
            nsd::dnssd::Session::Configuration::from_json(boost::json::parse(R"({"exclude_own_service": "yes"})"));
        REQUIRE_FALSE(config.has_value());
        REQUIRE_FALSE(config.error().empty());
    }

    SECTION("Not an object is an error") {
        const auto config = nsd::dnssd::Session::Configuration::from_json(boost::json::array {1, 2, 3});
        REQUIRE_FALSE(config.has_value());
    }
}

TEST_CASE("nsd::Session | Configuration") {
    boost::asio::io_context io_context;
    nsd::dnssd::Session session(std::make_unique<nsd::dnssd::MockProvider>(io_context), io_context.get_executor());

    nsd::dnssd::Session::Configuration config;
    config.exclude_own_service = true;
    session.set_configuration(config);
    REQUIRE(session.get_configuration() == config);

    session.set_exclude_own_service(false);
    REQUIRE_FALSE(session.get_configuration().exclude_own_service);
}
