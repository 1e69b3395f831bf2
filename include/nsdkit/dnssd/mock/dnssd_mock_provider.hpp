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

#include "nsdkit/core/util/lifetime_guard.hpp"
#include "nsdkit/dnssd/dnssd_provider.hpp"

#include <boost/asio/io_context.hpp>

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace nsd::dnssd {

/**
 * Provider which doesn't touch the network. Requests are recorded and complete only when one of the mock_* functions
 * is called, after which the completion is posted to the io_context.
 *
 * The provider throws when it's used in a way a real provider would reject (i.e. advertising twice), which makes it
 * suitable for verifying the sequencing done by a Session.
 *
 * All functions are thread safe. Handlers are called without holding the internal lock, and completions posted before
 * the provider is destroyed are dropped.
 */
class MockProvider: public Provider {
  public:
    explicit MockProvider(boost::asio::io_context& io_context);
    ~MockProvider() override;

    MockProvider(const MockProvider&) = delete;
    MockProvider& operator=(const MockProvider&) = delete;

    /**
     * Completes the pending advertise request successfully.
     * @param effective_name The name under which the service got registered. When empty, the requested name is used.
     */
    void mock_advertise_succeeded(const std::optional<std::string>& effective_name = std::nullopt);

    /**
     * Fails the pending advertise request.
     * @param code The status code to report.
     */
    void mock_advertise_failed(ProviderStatus code);

    /**
     * Completes the pending withdraw request successfully.
     */
    void mock_withdraw_succeeded();

    /**
     * Fails the pending withdraw request. The service stays advertised.
     * @param code The status code to report.
     */
    void mock_withdraw_failed(ProviderStatus code);

    /**
     * Completes the pending watch request successfully.
     */
    void mock_watch_succeeded();

    /**
     * Fails the pending watch request.
     * @param code The status code to report.
     */
    void mock_watch_failed(ProviderStatus code);

    /**
     * Completes the pending unwatch request successfully.
     */
    void mock_unwatch_succeeded();

    /**
     * Fails the pending unwatch request. Watching continues.
     * @param code The status code to report.
     */
    void mock_unwatch_failed(ProviderStatus code);

    /**
     * Mocks finding a service. Requires an active watch.
     * @param name The name of the service.
     * @param reg_type The type of the service. When empty, the watched type is used.
     * @param domain The domain of the service.
     */
    void mock_service_found(const std::string& name, const std::string& reg_type = {}, const std::string& domain = "local.");

    /**
     * Mocks losing a service. Requires an active watch.
     * @param name The name of the service.
     * @param reg_type The type of the service. When empty, the watched type is used.
     * @param domain The domain of the service.
     */
    void mock_service_lost(const std::string& name, const std::string& reg_type = {}, const std::string& domain = "local.");

    /**
     * Completes the oldest pending resolve request for the service with given name.
     * @param name The name of the service which is being resolved.
     * @param host_target The host target of the service.
     * @param address The address of the host.
     * @param port The port of the service.
     * @param txt The TXT record of the service.
     */
    void mock_resolve_succeeded(
        const std::string& name, const std::string& host_target, const std::string& address, uint16_t port,
        const TxtRecord& txt
    );

    /**
     * Fails the oldest pending resolve request for the service with given name.
     * @param name The name of the service which is being resolved.
     * @param code The status code to report.
     */
    void mock_resolve_failed(const std::string& name, ProviderStatus code);

    /**
     * @return Every request made to this provider, in order. Entries look like "advertise:<name>", "withdraw",
     * "watch:<type>", "unwatch" and "resolve:<name>".
     */
    [[nodiscard]] std::vector<std::string> get_requests() const;

    /**
     * @return The service which is currently advertised.
     */
    [[nodiscard]] std::optional<ServiceDescriptor> get_advertised_service() const;

    /**
     * @return The service type currently being watched.
     */
    [[nodiscard]] std::optional<std::string> get_watched_type() const;

    /**
     * @return The number of resolve requests which didn't complete yet.
     */
    [[nodiscard]] size_t get_pending_resolve_count() const;

    // Provider overrides
    void advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) override;
    void withdraw(CompletionHandler handler) override;
    void watch(const std::string& reg_type, CompletionHandler handler) override;
    void unwatch(CompletionHandler handler) override;
    void resolve(const ServiceReference& reference, ResolveHandler handler) override;

  private:
    struct PendingAdvertise {
        ServiceDescriptor descriptor;
        AdvertiseHandler handler;
    };

    struct PendingWatch {
        std::string reg_type;
        CompletionHandler handler;
    };

    struct PendingResolve {
        ServiceReference reference;
        ResolveHandler handler;
    };

    boost::asio::io_context& io_context_;
    LifetimeGuard lifetime_;
    std::vector<std::string> requests_;
    std::optional<ServiceDescriptor> advertised_;
    std::optional<std::string> watched_type_;
    std::optional<PendingAdvertise> pending_advertise_;
    CompletionHandler pending_withdraw_;
    std::optional<PendingWatch> pending_watch_;
    CompletionHandler pending_unwatch_;
    std::deque<PendingResolve> pending_resolves_;

    PendingResolve take_pending_resolve(const std::string& name);
};

}  // namespace nsd::dnssd
