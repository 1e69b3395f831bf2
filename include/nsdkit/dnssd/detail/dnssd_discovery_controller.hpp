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

#include "dnssd_registration_controller.hpp"
#include "nsdkit/core/util/lifetime_guard.hpp"
#include "nsdkit/dnssd/dnssd_error.hpp"
#include "nsdkit/dnssd/dnssd_provider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nsd::dnssd {

/**
 * Owns the watch/unwatch lifecycle for a single service type and keeps the list of services which are currently
 * believed to be alive.
 *
 * The public functions expect the caller to hold the mutex of the session. Handlers given to the provider lock the
 * session through its lifetime guard, and do nothing once the session is gone.
 */
class DiscoveryController {
  public:
    enum class State {
        idle,
        starting,
        active,
    };

    /// Called when a service was found (and not excluded).
    SafeFunction<void(const ServiceReference& reference)> on_service_found;

    /// Called when a service was lost.
    SafeFunction<void(const ServiceReference& reference)> on_service_lost;

    /// Called when starting or stopping discovery failed.
    SafeFunction<void(ErrorKind kind, ProviderStatus code)> on_error;

    /**
     * Constructs the controller and subscribes to found and lost notifications of the provider.
     * @param provider The provider to watch with.
     * @param lifetime The lifetime guard of the session, whose mutex guards this controller.
     * @param registration The registration of the session, used to filter out the own service.
     */
    DiscoveryController(
        Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime, const RegistrationController& registration
    );

    DiscoveryController(const DiscoveryController&) = delete;
    DiscoveryController& operator=(const DiscoveryController&) = delete;

    DiscoveryController(DiscoveryController&&) = delete;
    DiscoveryController& operator=(DiscoveryController&&) = delete;

    /**
     * Starts discovering services of given type. The list of known services is cleared immediately. If discovery is
     * active, it will be stopped first and restarted with the given type once stopped.
     * @param reg_type The service type (i.e. _http._tcp).
     * @throws nsd::Exception when the service type is empty.
     */
    void discover(const std::string& reg_type);

    /**
     * Stops discovery. Does nothing unless discovery is active.
     */
    void stop_discovery();

    /**
     * When enabled, the service registered by the session is not reported as found.
     * @param exclude True to exclude the own service.
     */
    void set_exclude_own_service(const bool exclude) {
        exclude_own_service_ = exclude;
    }

    /**
     * @return True if the own service is excluded.
     */
    [[nodiscard]] bool get_exclude_own_service() const {
        return exclude_own_service_;
    }

    /**
     * @return The current state.
     */
    [[nodiscard]] State get_state() const {
        return state_;
    }

    /**
     * @return The services which are currently known, in the order in which they were found.
     */
    [[nodiscard]] const std::vector<ServiceReference>& get_known_services() const {
        return known_services_;
    }

    // Transitions driven by the provider.
    void watch_succeeded();
    void watch_failed(ProviderStatus code);
    void unwatch_succeeded();
    void unwatch_failed(ProviderStatus code);
    void service_found(const ServiceReference& reference);
    void service_lost(const ServiceReference& reference);

  private:
    Provider& provider_;
    std::weak_ptr<LifetimeGuard::State> lifetime_;
    const RegistrationController& registration_;
    State state_ {State::idle};
    bool unwatch_pending_ {false};
    bool exclude_own_service_ {false};
    std::optional<std::string> reg_type_;
    std::optional<std::string> pending_reg_type_;
    std::vector<ServiceReference> known_services_;
};

/**
 * @param state The state.
 * @return A string representation of the state.
 */
const char* to_string(DiscoveryController::State state);

}  // namespace nsd::dnssd
