/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/detail/dnssd_registration_controller.hpp"

#include "nsdkit/core/assert.hpp"
#include "nsdkit/core/exception.hpp"
#include "nsdkit/core/log.hpp"

nsd::dnssd::RegistrationController::RegistrationController(
    Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime
) :
    provider_(provider), lifetime_(std::move(lifetime)) {}

void nsd::dnssd::RegistrationController::register_service(const ServiceDescriptor& descriptor) {
    if (descriptor.reg_type.empty()) {
        NSD_THROW_EXCEPTION("Service type must not be empty (service name: \"{}\")", descriptor.name);
    }

    NSD_ASSERT(descriptor.port != 0, "Port must not be 0");

    switch (state_) {
        case State::registering:
            NSD_TRACE("Registration already in progress, ignoring request for {}", descriptor.to_string());
            return;
        case State::registered:
            NSD_DEBUG("Service already registered, re-registering once withdrawn: {}", descriptor.to_string());
            pending_descriptor_ = descriptor;
            unregister_service();
            return;
        case State::idle:
            break;
    }

    NSD_DEBUG("Registering service: {}", descriptor.to_string());

    state_ = State::registering;

    provider_.advertise(
        descriptor,
        [this, lifetime = lifetime_](const tl::expected<std::string, ProviderStatus>& result) {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (result) {
                advertise_succeeded(*result);
            } else {
                advertise_failed(result.error());
            }
        }
    );
}

void nsd::dnssd::RegistrationController::unregister_service() {
    if (state_ != State::registered) {
        NSD_TRACE("No service registered, ignoring request to unregister (state: {})", to_string(state_));
        return;
    }

    if (withdraw_pending_) {
        NSD_TRACE("Withdrawal already in progress");
        return;
    }

    NSD_DEBUG("Unregistering service: {}", registered_name_.value_or(""));

    withdraw_pending_ = true;

    provider_.withdraw([this, lifetime = lifetime_](const tl::expected<void, ProviderStatus>& result) {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        if (result) {
            withdraw_succeeded();
        } else {
            withdraw_failed(result.error());
        }
    });
}

void nsd::dnssd::RegistrationController::advertise_succeeded(const std::string& effective_name) {
    NSD_ASSERT(state_ == State::registering, "Expected to be registering");

    state_ = State::registered;
    registered_name_ = effective_name;

    NSD_INFO("Service registered under name: {}", effective_name);
    on_registered(effective_name);
}

void nsd::dnssd::RegistrationController::advertise_failed(const ProviderStatus code) {
    NSD_ASSERT(state_ == State::registering, "Expected to be registering");

    state_ = State::idle;
    registered_name_.reset();

    NSD_WARNING("Registration failed: {} ({})", provider_.status_to_string(code), code);
    on_error(ErrorKind::registration_failed, code);
}

void nsd::dnssd::RegistrationController::withdraw_succeeded() {
    NSD_ASSERT(withdraw_pending_, "Expected a pending withdrawal");

    withdraw_pending_ = false;
    state_ = State::idle;
    registered_name_.reset();

    NSD_DEBUG("Service unregistered");

    if (pending_descriptor_) {
        auto descriptor = std::move(*pending_descriptor_);
        pending_descriptor_.reset();
        register_service(descriptor);
    }
}

void nsd::dnssd::RegistrationController::withdraw_failed(const ProviderStatus code) {
    NSD_ASSERT(withdraw_pending_, "Expected a pending withdrawal");

    withdraw_pending_ = false;

    if (pending_descriptor_) {
        NSD_WARNING("Dropping pending registration of {}", pending_descriptor_->to_string());
        pending_descriptor_.reset();
    }

    NSD_WARNING("Unregistration failed: {} ({})", provider_.status_to_string(code), code);
    on_error(ErrorKind::unregistration_failed, code);
}

const char* nsd::dnssd::to_string(const RegistrationController::State state) {
    switch (state) {
        case RegistrationController::State::idle:
            return "idle";
        case RegistrationController::State::registering:
            return "registering";
        case RegistrationController::State::registered:
            return "registered";
    }
    return "unknown";
}
