/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/core/log.hpp"
#include "nsdkit/core/string.hpp"
#include "nsdkit/dnssd/dnssd_session.hpp"

#include <CLI/App.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <iostream>
#include <thread>

/**
 * This example registers a service and/or discovers services of a type, resolving every service it finds. All session
 * notifications are logged.
 *
 * Example: dnssd_session_example --register "My service" --type _test._tcp --port 1234 --txt key1=value1 --discover
 * _test._tcp
 */

int main(int const argc, char* argv[]) {
    nsd::set_log_level_from_env();

    CLI::App app {"DNS-SD session example"};
    argv = app.ensure_utf8(argv);

    std::string service_name;
    std::string service_type;
    uint16_t port = 0;
    std::vector<std::string> txt_entries;
    std::string discover_type;
    bool exclude_own_service = false;

    auto* register_option = app.add_option("--register", service_name, "Register a service with this name");
    app.add_option("--type", service_type, "The type of the service to register (i.e. _http._tcp)")
        ->needs(register_option);
    app.add_option("--port", port, "The port of the service to register")->needs(register_option);
    app.add_option("--txt", txt_entries, "TXT record entries as key=value")->needs(register_option);
    app.add_option("--discover", discover_type, "Discover services of this type (i.e. _http._tcp)");
    app.add_flag("--exclude-own", exclude_own_service, "Don't report the service registered by this example");

    CLI11_PARSE(app, argc, argv);

    if (service_name.empty() && discover_type.empty()) {
        std::cout << "Nothing to do, specify --register and/or --discover" << std::endl;
        return 1;
    }

    nsd::dnssd::TxtRecord txt_record;
    for (auto& entry : txt_entries) {
        if (auto key_value = nsd::string_split_once(entry, '=')) {
            txt_record[std::string(key_value->first)] = std::string(key_value->second);
        } else {
            txt_record[entry] = {};
        }
    }

    boost::asio::io_context io_context;

    auto provider = nsd::dnssd::Provider::create(io_context);
    if (provider == nullptr) {
        NSD_ERROR("No DNS-SD implementation available for this platform");
        return 1;
    }

    nsd::dnssd::Session session(std::move(provider), io_context.get_executor());
    session.set_exclude_own_service(exclude_own_service);

    session.on_service_registered = [](const std::string& name) {
        NSD_INFO("Service registered: {}", name);
    };
    session.on_service_found = [&session](const nsd::dnssd::ServiceReference& reference) {
        NSD_INFO("Service found: {}", reference.to_string());
        session.resolve(reference);
    };
    session.on_service_lost = [](const nsd::dnssd::ServiceReference& reference) {
        NSD_INFO("Service lost: {}", reference.to_string());
    };
    session.on_service_resolved = [](const nsd::dnssd::ResolvedService& service) {
        NSD_INFO("Service resolved: {}", service.to_string());
    };
    session.on_error = [&session](const nsd::dnssd::ErrorKind kind, const nsd::dnssd::ProviderStatus code) {
        NSD_ERROR("{}: {} ({})", nsd::dnssd::to_string(kind), session.describe_status(code), code);
    };

    try {
        if (!service_name.empty()) {
            session.register_service({service_name, service_type, port, txt_record});
        }
        if (!discover_type.empty()) {
            session.discover(discover_type);
        }
    } catch (const std::exception& e) {
        NSD_ERROR("{}", e.what());
        return 1;
    }

    auto work_guard = boost::asio::make_work_guard(io_context);
    std::thread io_context_thread([&io_context] {
        io_context.run();
    });

    std::cout << "Press enter to exit..." << std::endl;
    std::cin.get();

    work_guard.reset();
    io_context.stop();
    io_context_thread.join();

    return 0;
}
