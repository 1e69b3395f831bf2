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

#include "nsdkit/core/exception.hpp"
#include "nsdkit/core/log.hpp"

nsd::dnssd::Session::Session(std::unique_ptr<Provider> provider, boost::asio::any_io_executor notification_executor) :
    provider_(provider ? std::move(provider) : throw Exception("Provider must not be nullptr")),
    strand_(boost::asio::make_strand(std::move(notification_executor))),
    registration_(*provider_, lifetime_.get_weak()),
    discovery_(*provider_, lifetime_.get_weak(), registration_),
    resolver_(*provider_, lifetime_.get_weak()) {
    registration_.on_registered = [this](const std::string& effective_name) {
        post_notification([this, effective_name] {
            on_service_registered(effective_name);
        });
    };
    registration_.on_error = [this](const ErrorKind kind, const ProviderStatus code) {
        report_error(kind, code);
    };

    discovery_.on_service_found = [this](const ServiceReference& reference) {
        post_notification([this, reference] {
            on_service_found(reference);
        });
    };
    discovery_.on_service_lost = [this](const ServiceReference& reference) {
        post_notification([this, reference] {
            on_service_lost(reference);
        });
    };
    discovery_.on_error = [this](const ErrorKind kind, const ProviderStatus code) {
        report_error(kind, code);
    };

    resolver_.on_service_resolved = [this](const ResolvedService& service) {
        post_notification([this, service] {
            on_service_resolved(service);
        });
    };
    resolver_.on_error = [this](const ErrorKind kind, const ProviderStatus code) {
        report_error(kind, code);
    };
}

nsd::dnssd::Session::~Session() {
    lifetime_.invalidate();
    // Stops the provider before the controllers its handlers point to are destroyed.
    provider_.reset();
}

void nsd::dnssd::Session::register_service(const ServiceDescriptor& descriptor) {
    std::lock_guard guard(lifetime_.mutex());
    registration_.register_service(descriptor);
}

void nsd::dnssd::Session::unregister_service() {
    std::lock_guard guard(lifetime_.mutex());
    registration_.unregister_service();
}

void nsd::dnssd::Session::discover(const std::string& reg_type) {
    std::lock_guard guard(lifetime_.mutex());
    discovery_.discover(reg_type);
}

void nsd::dnssd::Session::stop_discovery() {
    std::lock_guard guard(lifetime_.mutex());
    discovery_.stop_discovery();
}

void nsd::dnssd::Session::resolve(const ServiceReference& reference) {
    std::lock_guard guard(lifetime_.mutex());
    resolver_.resolve(reference);
}

std::vector<nsd::dnssd::ServiceReference> nsd::dnssd::Session::get_known_services() const {
    std::lock_guard guard(lifetime_.mutex());
    return discovery_.get_known_services();
}

std::optional<std::string> nsd::dnssd::Session::get_registered_name() const {
    std::lock_guard guard(lifetime_.mutex());
    return registration_.get_registered_name();
}

void nsd::dnssd::Session::set_exclude_own_service(const bool exclude) {
    std::lock_guard guard(lifetime_.mutex());
    discovery_.set_exclude_own_service(exclude);
}

void nsd::dnssd::Session::set_configuration(const Configuration& config) {
    std::lock_guard guard(lifetime_.mutex());
    discovery_.set_exclude_own_service(config.exclude_own_service);
    NSD_DEBUG("Configuration updated: {}", boost::json::serialize(config.to_json()));
}

nsd::dnssd::Session::Configuration nsd::dnssd::Session::get_configuration() const {
    std::lock_guard guard(lifetime_.mutex());
    Configuration config;
    config.exclude_own_service = discovery_.get_exclude_own_service();
    return config;
}

nsd::dnssd::RegistrationController::State nsd::dnssd::Session::get_registration_state() const {
    std::lock_guard guard(lifetime_.mutex());
    return registration_.get_state();
}

nsd::dnssd::DiscoveryController::State nsd::dnssd::Session::get_discovery_state() const {
    std::lock_guard guard(lifetime_.mutex());
    return discovery_.get_state();
}

std::string nsd::dnssd::Session::describe_status(const ProviderStatus code) const {
    return provider_->status_to_string(code);
}

void nsd::dnssd::Session::report_error(const ErrorKind kind, const ProviderStatus code) {
    post_notification([this, kind, code] {
        on_error(kind, code);
    });
}

boost::json::value nsd::dnssd::Session::Configuration::to_json() const {
    return boost::json::value_from(*this);
}

tl::expected<nsd::dnssd::Session::Configuration, std::string>
nsd::dnssd::Session::Configuration::from_json(const boost::json::value& json) {
    try {
        return boost::json::value_to<Configuration>(json);
    } catch (const std::exception& e) {
        return tl::unexpected(fmt::format("Failed to parse Session::Configuration: {}", e.what()));
    }
}

void nsd::dnssd::tag_invoke(
    const boost::json::value_from_tag&, boost::json::value& jv, const Session::Configuration& config
) {
    jv = {
        {"exclude_own_service", config.exclude_own_service},
    };
}

nsd::dnssd::Session::Configuration
nsd::dnssd::tag_invoke(const boost::json::value_to_tag<Session::Configuration>&, const boost::json::value& jv) {
    Session::Configuration config;
    const auto& object = jv.as_object();
    if (const auto* exclude = object.if_contains("exclude_own_service")) {
        config.exclude_own_service = exclude->as_bool();
    }
    return config;
}
