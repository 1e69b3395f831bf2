/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/detail/dnssd_discovery_controller.hpp"

#include "nsdkit/core/assert.hpp"
#include "nsdkit/core/exception.hpp"
#include "nsdkit/core/log.hpp"

nsd::dnssd::DiscoveryController::DiscoveryController(
    Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime, const RegistrationController& registration
) :
    provider_(provider), lifetime_(std::move(lifetime)), registration_(registration) {
    provider_.on_service_found = [this, lifetime = lifetime_](const ServiceReference& reference) {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        service_found(reference);
    };
    provider_.on_service_lost = [this, lifetime = lifetime_](const ServiceReference& reference) {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        service_lost(reference);
    };
}

void nsd::dnssd::DiscoveryController::discover(const std::string& reg_type) {
    if (reg_type.empty()) {
        NSD_THROW_EXCEPTION("Service type must not be empty");
    }

    // Results belong to the discovery which is about to start.
    known_services_.clear();

    switch (state_) {
        case State::starting:
            NSD_TRACE("Discovery already starting, ignoring request for {}", reg_type);
            return;
        case State::active:
            NSD_DEBUG("Discovery active for {}, restarting for {} once stopped", reg_type_.value_or(""), reg_type);
            pending_reg_type_ = reg_type;
            stop_discovery();
            return;
        case State::idle:
            break;
    }

    NSD_DEBUG("Starting discovery for {}", reg_type);

    state_ = State::starting;
    reg_type_ = reg_type;

    provider_.watch(reg_type, [this, lifetime = lifetime_](const tl::expected<void, ProviderStatus>& result) {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        if (result) {
            watch_succeeded();
        } else {
            watch_failed(result.error());
        }
    });
}

void nsd::dnssd::DiscoveryController::stop_discovery() {
    if (state_ != State::active) {
        NSD_TRACE("Discovery not active, ignoring request to stop (state: {})", to_string(state_));
        return;
    }

    if (unwatch_pending_) {
        NSD_TRACE("Stopping discovery already in progress");
        return;
    }

    NSD_DEBUG("Stopping discovery for {}", reg_type_.value_or(""));

    unwatch_pending_ = true;

    provider_.unwatch([this, lifetime = lifetime_](const tl::expected<void, ProviderStatus>& result) {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        if (result) {
            unwatch_succeeded();
        } else {
            unwatch_failed(result.error());
        }
    });
}

void nsd::dnssd::DiscoveryController::watch_succeeded() {
    NSD_ASSERT(state_ == State::starting, "Expected discovery to be starting");
    state_ = State::active;
    NSD_DEBUG("Discovery started for {}", reg_type_.value_or(""));
}

void nsd::dnssd::DiscoveryController::watch_failed(const ProviderStatus code) {
    NSD_ASSERT(state_ == State::starting, "Expected discovery to be starting");

    state_ = State::idle;
    reg_type_.reset();

    NSD_WARNING("Starting discovery failed: {} ({})", provider_.status_to_string(code), code);
    on_error(ErrorKind::start_discovery_failed, code);
}

void nsd::dnssd::DiscoveryController::unwatch_succeeded() {
    NSD_ASSERT(unwatch_pending_, "Expected a pending stop");

    unwatch_pending_ = false;
    state_ = State::idle;
    reg_type_.reset();

    NSD_DEBUG("Discovery stopped");

    if (pending_reg_type_) {
        auto reg_type = std::move(*pending_reg_type_);
        pending_reg_type_.reset();
        discover(reg_type);
    }
}

void nsd::dnssd::DiscoveryController::unwatch_failed(const ProviderStatus code) {
    NSD_ASSERT(unwatch_pending_, "Expected a pending stop");

    unwatch_pending_ = false;

    if (pending_reg_type_) {
        NSD_WARNING("Dropping pending discovery of {}", *pending_reg_type_);
        pending_reg_type_.reset();
    }

    NSD_WARNING("Stopping discovery failed: {} ({})", provider_.status_to_string(code), code);
    on_error(ErrorKind::stop_discovery_failed, code);
}

void nsd::dnssd::DiscoveryController::service_found(const ServiceReference& reference) {
    const auto& own_name = registration_.get_registered_name();
    if (exclude_own_service_ && own_name.has_value() && reference.name == *own_name) {
        NSD_TRACE("Ignoring own service: {}", reference.name);
        return;
    }

    NSD_DEBUG("Found: {}", reference.to_string());

    known_services_.push_back(reference);
    on_service_found(reference);
}

void nsd::dnssd::DiscoveryController::service_lost(const ServiceReference& reference) {
    NSD_DEBUG("Lost: {}", reference.to_string());

    for (auto it = known_services_.begin(); it != known_services_.end(); ++it) {
        if (it->name == reference.name) {
            known_services_.erase(it);
            break;
        }
    }

    on_service_lost(reference);
}

const char* nsd::dnssd::to_string(const DiscoveryController::State state) {
    switch (state) {
        case DiscoveryController::State::idle:
            return "idle";
        case DiscoveryController::State::starting:
            return "starting";
        case DiscoveryController::State::active:
            return "active";
    }
    return "unknown";
}
