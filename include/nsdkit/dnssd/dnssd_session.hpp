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

#include "dnssd_error.hpp"
#include "dnssd_provider.hpp"
#include "detail/dnssd_discovery_controller.hpp"
#include "detail/dnssd_registration_controller.hpp"
#include "detail/dnssd_resolver.hpp"
#include "nsdkit/core/json.hpp"
#include "nsdkit/core/util/lifetime_guard.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nsd::dnssd {

/**
 * Registers a local service, discovers services of a given type and resolves discovered services, sequencing all
 * requests against a single Provider.
 *
 * All functions are thread safe and return immediately, results are reported through the notification callbacks. The
 * callbacks are invoked through a strand on the executor given to the constructor, in the order in which the
 * underlying events happened.
 *
 * The session can be destroyed while requests are outstanding. Completions and notifications which arrive afterwards
 * are dropped. Destroying the session from another thread while one of its callbacks is running is not supported.
 */
class Session {
  public:
    struct Configuration {
        /// When true, the service registered by this session will not be reported as found.
        bool exclude_own_service {false};

        /**
         * @returns A JSON representation of the configuration.
         */
        [[nodiscard]] boost::json::value to_json() const;

        /**
         * Creates a Configuration from a JSON object. Keys which are not present keep their default value.
         * @param json The JSON object to parse.
         * @return A newly constructed Configuration object, or an error message.
         */
        static tl::expected<Configuration, std::string> from_json(const boost::json::value& json);

        friend bool operator==(const Configuration& lhs, const Configuration& rhs) {
            return lhs.exclude_own_service == rhs.exclude_own_service;
        }

        friend bool operator!=(const Configuration& lhs, const Configuration& rhs) {
            return !(lhs == rhs);
        }
    };

    /// Called when an operation failed. The code is provider specific, see describe_status().
    SafeFunction<void(ErrorKind kind, ProviderStatus code)> on_error;

    /// Called when the service was registered, with the name under which it was registered.
    SafeFunction<void(const std::string& effective_name)> on_service_registered;

    /// Called when a service was found during discovery. The service is not resolved.
    SafeFunction<void(const ServiceReference& reference)> on_service_found;

    /// Called when a service was lost during discovery.
    SafeFunction<void(const ServiceReference& reference)> on_service_lost;

    /// Called when a service was resolved.
    SafeFunction<void(const ResolvedService& service)> on_service_resolved;

    /**
     * Constructs a session.
     * @param provider The provider to use. Must not be nullptr.
     * @param notification_executor The executor used to invoke the notification callbacks.
     * @throws nsd::Exception when provider is nullptr.
     */
    Session(std::unique_ptr<Provider> provider, boost::asio::any_io_executor notification_executor);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    /**
     * Registers a service. If a service is already registered, it will be unregistered before the new service is
     * registered. Ignored while a registration is in progress.
     * @param descriptor The service to register.
     */
    void register_service(const ServiceDescriptor& descriptor);

    /**
     * Unregisters the registered service. Has no effect when no service is registered.
     */
    void unregister_service();

    /**
     * Discovers services of given type. If discovery is already started, it will be stopped and started again. The
     * list of known services is cleared right away.
     * @param reg_type The service type (i.e. _http._tcp).
     */
    void discover(const std::string& reg_type);

    /**
     * Stops discovery. Has no effect when discovery is not started.
     */
    void stop_discovery();

    /**
     * Resolves a found service.
     * @param reference The service to resolve.
     */
    void resolve(const ServiceReference& reference);

    /**
     * @return A copy of the services which are currently known. Lost services are removed.
     */
    [[nodiscard]] std::vector<ServiceReference> get_known_services() const;

    /**
     * @return The name under which the own service is registered, which might differ from the requested name.
     */
    [[nodiscard]] std::optional<std::string> get_registered_name() const;

    /**
     * Sets whether the service registered by this session should be excluded from discovery results.
     * @param exclude True to exclude. Default is false.
     */
    void set_exclude_own_service(bool exclude);

    /**
     * Applies given configuration.
     * @param config The new configuration.
     */
    void set_configuration(const Configuration& config);

    /**
     * @return The current configuration.
     */
    [[nodiscard]] Configuration get_configuration() const;

    /**
     * @return The state of the registration.
     */
    [[nodiscard]] RegistrationController::State get_registration_state() const;

    /**
     * @return The state of discovery.
     */
    [[nodiscard]] DiscoveryController::State get_discovery_state() const;

    /**
     * @param code A code reported through on_error.
     * @return A human-readable description of the code.
     */
    [[nodiscard]] std::string describe_status(ProviderStatus code) const;

  private:
    LifetimeGuard lifetime_;
    std::unique_ptr<Provider> provider_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    RegistrationController registration_;
    DiscoveryController discovery_;
    Resolver resolver_;

    template<class Fn>
    void post_notification(Fn&& fn) {
        boost::asio::post(strand_, [lifetime = lifetime_.get_weak(), fn = std::forward<Fn>(fn)]() mutable {
            if (!LifetimeGuard::is_alive(lifetime)) {
                return;
            }
            fn();
        });
    }

    void report_error(ErrorKind kind, ProviderStatus code);
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Session::Configuration& config);

Session::Configuration
tag_invoke(const boost::json::value_to_tag<Session::Configuration>&, const boost::json::value& jv);

}  // namespace nsd::dnssd
