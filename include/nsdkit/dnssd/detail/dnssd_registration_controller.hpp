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

#include "nsdkit/dnssd/dnssd_error.hpp"
#include "nsdkit/core/util/lifetime_guard.hpp"
#include "nsdkit/dnssd/dnssd_provider.hpp"

#include <memory>
#include <optional>
#include <string>

namespace nsd::dnssd {

/**
 * Owns the advertise/withdraw lifecycle of a single local service.
 *
 * The public functions expect the caller to hold the mutex of the session. Completion handlers given to the provider
 * lock the session through its lifetime guard before changing state, and do nothing once the session is gone.
 */
class RegistrationController {
  public:
    enum class State {
        idle,
        registering,
        registered,
    };

    /// Called when the provider confirmed the registration, with the effective service name.
    SafeFunction<void(const std::string& effective_name)> on_registered;

    /// Called when advertising or withdrawing failed.
    SafeFunction<void(ErrorKind kind, ProviderStatus code)> on_error;

    /**
     * @param provider The provider to advertise with.
     * @param lifetime The lifetime guard of the session, whose mutex guards this controller.
     */
    RegistrationController(Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime);

    RegistrationController(const RegistrationController&) = delete;
    RegistrationController& operator=(const RegistrationController&) = delete;

    RegistrationController(RegistrationController&&) = delete;
    RegistrationController& operator=(RegistrationController&&) = delete;

    /**
     * Registers given service. Ignored while another registration is in flight. When a service is already registered,
     * it is withdrawn first and the given descriptor is registered once the withdrawal completed.
     * @param descriptor The service to register.
     * @throws nsd::Exception when the descriptor has no service type.
     */
    void register_service(const ServiceDescriptor& descriptor);

    /**
     * Withdraws the registered service. Does nothing unless a service is registered.
     */
    void unregister_service();

    /**
     * @return The current state.
     */
    [[nodiscard]] State get_state() const {
        return state_;
    }

    /**
     * @return The name the service was registered with, or an empty optional if no service is registered.
     */
    [[nodiscard]] const std::optional<std::string>& get_registered_name() const {
        return registered_name_;
    }

    // Transitions driven by the provider.
    void advertise_succeeded(const std::string& effective_name);
    void advertise_failed(ProviderStatus code);
    void withdraw_succeeded();
    void withdraw_failed(ProviderStatus code);

  private:
    Provider& provider_;
    std::weak_ptr<LifetimeGuard::State> lifetime_;
    State state_ {State::idle};
    bool withdraw_pending_ {false};
    std::optional<ServiceDescriptor> pending_descriptor_;
    std::optional<std::string> registered_name_;
};

/**
 * @param state The state.
 * @return A string representation of the state.
 */
const char* to_string(RegistrationController::State state);

}  // namespace nsd::dnssd
