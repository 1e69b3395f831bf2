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

#include "bonjour.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#if NSD_HAS_DNSSD

    #include "bonjour_scoped_dns_service_ref.hpp"
    #include "bonjour_shared_connection.hpp"
    #include "nsdkit/core/util/lifetime_guard.hpp"
    #include "nsdkit/dnssd/dnssd_provider.hpp"

    #include <list>
    #include <map>
    #include <set>

namespace nsd::dnssd {

/**
 * Provider implemented on top of dns_sd.h. Works with Bonjour on macOS and Windows, and with mDNSResponder on Linux.
 *
 * All operations share a single connection to the daemon. Requests are executed on the given io_context, which is also
 * where results are processed and handlers are called. The io_context is assumed to be run by a single thread. Work
 * which is still queued when the provider is destroyed is dropped.
 */
class BonjourProvider: public Provider {
  public:
    /**
     * Constructs a Bonjour provider.
     * @param io_context The context to use for processing results.
     * @throws nsd::Exception if no connection to the daemon could be made.
     */
    explicit BonjourProvider(boost::asio::io_context& io_context);
    ~BonjourProvider() override;

    BonjourProvider(const BonjourProvider&) = delete;
    BonjourProvider& operator=(const BonjourProvider&) = delete;

    // Provider overrides
    void advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) override;
    void withdraw(CompletionHandler handler) override;
    void watch(const std::string& reg_type, CompletionHandler handler) override;
    void unwatch(CompletionHandler handler) override;
    void resolve(const ServiceReference& reference, ResolveHandler handler) override;
    [[nodiscard]] std::string status_to_string(ProviderStatus code) const override;

  private:
    struct PendingResolve {
        BonjourProvider& owner;
        ServiceReference reference;
        ResolveHandler handler;
        BonjourScopedDnsServiceRef resolve_ref;
        BonjourScopedDnsServiceRef get_addr_ref;
        ResolvedService result;
    };

    boost::asio::ip::tcp::socket service_socket_;
    BonjourSharedConnection shared_connection_;
    BonjourScopedDnsServiceRef register_ref_;
    AdvertiseHandler advertise_handler_;
    BonjourScopedDnsServiceRef browse_ref_;
    std::map<std::string, std::set<uint32_t>> browse_results_;  // fullname -> interfaces
    std::list<PendingResolve> pending_resolves_;
    size_t process_results_failed_attempts_ = 0;
    LifetimeGuard lifetime_;

    void do_advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler);
    void do_resolve(const ServiceReference& reference, ResolveHandler handler);
    void async_process_results();
    void complete_resolve(PendingResolve* pending, tl::expected<ResolvedService, ProviderStatus> result);

    /**
     * Called by dns_sd in response to DNSServiceRegister.
     * @param service_ref The DNSServiceRef.
     * @param flags kDNSServiceFlagsAdd when the service was registered.
     * @param error_code Will be kDNSServiceErr_NoError (0) on success, otherwise the failure that occurred.
     * @param service_name The name under which the service was registered.
     * @param reg_type The type of the service.
     * @param reply_domain The domain of the service.
     * @param context The BonjourProvider.
     */
    static void DNSSD_API register_callback(
        DNSServiceRef service_ref, DNSServiceFlags flags, DNSServiceErrorType error_code, const char* service_name,
        const char* reg_type, const char* reply_domain, void* context
    );

    /**
     * Called by dns_sd in response to a browse reply.
     * @param browse_service_ref The DNSServiceRef.
     * @param flags Possible values are kDNSServiceFlagsMoreComing and kDNSServiceFlagsAdd.
     * @param interface_index The interface on which the service is advertised.
     * @param error_code Will be kDNSServiceErr_NoError (0) on success, otherwise the failure that occurred.
     * @param name The discovered service name.
     * @param type The service type.
     * @param domain The domain of the discovered service instance.
     * @param context The BonjourProvider.
     */
    static void DNSSD_API browse_reply(
        DNSServiceRef browse_service_ref, DNSServiceFlags flags, uint32_t interface_index,
        DNSServiceErrorType error_code, const char* name, const char* type, const char* domain, void* context
    );

    static void DNSSD_API resolve_callback(
        DNSServiceRef service_ref, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType error_code,
        const char* fullname, const char* host_target, uint16_t port, uint16_t txt_len, const unsigned char* txt_record,
        void* context
    );

    static void DNSSD_API get_addr_info_callback(
        DNSServiceRef service_ref, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType error_code,
        const char* hostname, const struct sockaddr* address, uint32_t ttl, void* context
    );
};

}  // namespace nsd::dnssd

#endif
