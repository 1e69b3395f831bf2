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

#include "dnssd_service_description.hpp"
#include "nsdkit/core/expected.hpp"
#include "nsdkit/core/util/safe_function.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace nsd::dnssd {

/// Status code reported by a provider when an operation fails. The meaning of the value is provider specific.
using ProviderStatus = int32_t;

/**
 * Generic status codes. Providers which don't have their own codes report these.
 */
namespace status {
    constexpr ProviderStatus internal_error = 0;
    constexpr ProviderStatus already_active = 3;
    constexpr ProviderStatus max_limit = 4;
}  // namespace status

/**
 * @param code The status code.
 * @return A human-readable description of one of the generic status codes.
 */
const char* generic_status_to_string(ProviderStatus code);

/**
 * Interface to the platform DNS-SD implementation. All operations are asynchronous and complete exactly once by calling
 * the given handler with either a value or a status code.
 *
 * Implementations must never invoke a handler (or one of the push notifications) from within the call that initiated
 * the operation. Handlers may be invoked from any thread, but never concurrently with each other.
 */
class Provider {
  public:
    using AdvertiseHandler = std::function<void(tl::expected<std::string, ProviderStatus> effective_name)>;
    using CompletionHandler = std::function<void(tl::expected<void, ProviderStatus> result)>;
    using ResolveHandler = std::function<void(tl::expected<ResolvedService, ProviderStatus> result)>;

    /// Called when a service was found while watching.
    SafeFunction<void(const ServiceReference& reference)> on_service_found;

    /// Called when a previously found service went away while watching.
    SafeFunction<void(const ServiceReference& reference)> on_service_lost;

    virtual ~Provider() = default;

    /**
     * Starts advertising the given service. On success the handler receives the name under which the service was
     * registered, which might differ from the requested name.
     * @param descriptor The service to advertise.
     * @param handler Called once when the operation completes.
     */
    virtual void advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) = 0;

    /**
     * Withdraws the currently advertised service.
     * @param handler Called once when the operation completes.
     */
    virtual void withdraw(CompletionHandler handler) = 0;

    /**
     * Starts watching for services of given type. While watching, found and lost services are reported through
     * on_service_found and on_service_lost.
     * @param reg_type The service type (i.e. _http._tcp).
     * @param handler Called once when watching started, or failed to start.
     */
    virtual void watch(const std::string& reg_type, CompletionHandler handler) = 0;

    /**
     * Stops watching.
     * @param handler Called once when the operation completes.
     */
    virtual void unwatch(CompletionHandler handler) = 0;

    /**
     * Resolves given reference. Multiple resolutions might be outstanding at the same time.
     * @param reference The service to resolve.
     * @param handler Called once with the resolved service or an error.
     */
    virtual void resolve(const ServiceReference& reference, ResolveHandler handler) = 0;

    /**
     * @param code A status code reported by this provider.
     * @return A human-readable description of the code.
     */
    [[nodiscard]] virtual std::string status_to_string(const ProviderStatus code) const {
        return generic_status_to_string(code);
    }

    /**
     * Creates the most appropriate provider implementation for the platform.
     * @param io_context The context used to process results of the platform implementation.
     * @return The created provider instance, or nullptr if no implementation is available.
     */
    static std::unique_ptr<Provider> create(boost::asio::io_context& io_context);
};

}  // namespace nsd::dnssd
