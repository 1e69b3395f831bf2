/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/bonjour/bonjour_provider.hpp"

#if NSD_HAS_DNSSD

    #include "nsdkit/core/assert.hpp"
    #include "nsdkit/dnssd/bonjour/bonjour_txt_record.hpp"

    #include <boost/asio/post.hpp>

    #include <tuple>

nsd::dnssd::BonjourProvider::BonjourProvider(boost::asio::io_context& io_context) : service_socket_(io_context) {
    const int service_fd = DNSServiceRefSockFD(shared_connection_.service_ref());

    if (service_fd < 0) {
        NSD_THROW_EXCEPTION("Invalid file descriptor");
    }

    service_socket_.assign(boost::asio::ip::tcp::v6(), service_fd);
    async_process_results();
}

nsd::dnssd::BonjourProvider::~BonjourProvider() {
    lifetime_.invalidate();

    // The descriptor is owned by the shared connection.
    boost::system::error_code ec;
    service_socket_.cancel(ec);
    std::ignore = service_socket_.release(ec);
    if (ec) {
        NSD_WARNING("Failed to release service socket: {}", ec.message());
    }
}

void nsd::dnssd::BonjourProvider::advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) {
    NSD_ASSERT(!descriptor.reg_type.empty(), "Service type must not be empty");
    NSD_ASSERT(descriptor.port != 0, "Port must not be 0");
    boost::asio::post(
        service_socket_.get_executor(),
        [this, lifetime = lifetime_.get_weak(), descriptor, h = std::move(handler)]() mutable {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            do_advertise(descriptor, std::move(h));
        }
    );
}

void nsd::dnssd::BonjourProvider::withdraw(CompletionHandler handler) {
    boost::asio::post(service_socket_.get_executor(), [this, lifetime = lifetime_.get_weak(), h = std::move(handler)] {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        if (!register_ref_) {
            h(tl::unexpected<ProviderStatus>(kDNSServiceErr_BadState));
            return;
        }
        register_ref_.reset();
        advertise_handler_ = nullptr;
        h({});
    });
}

void nsd::dnssd::BonjourProvider::watch(const std::string& reg_type, CompletionHandler handler) {
    boost::asio::post(
        service_socket_.get_executor(),
        [this, lifetime = lifetime_.get_weak(), reg_type, h = std::move(handler)] {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (browse_ref_) {
                h(tl::unexpected<ProviderStatus>(kDNSServiceErr_AlreadyRegistered));
                return;
            }

            DNSServiceRef browse_ref = shared_connection_.service_ref();
            const auto error = DNSServiceBrowse(
                &browse_ref, kDNSServiceFlagsShareConnection, kDNSServiceInterfaceIndexAny, reg_type.c_str(), nullptr,
                browse_reply, this
            );
            if (error != kDNSServiceErr_NoError) {
                h(tl::unexpected(error));
                return;
            }

            browse_ref_ = browse_ref;
            browse_results_.clear();
            h({});
        }
    );
}

void nsd::dnssd::BonjourProvider::unwatch(CompletionHandler handler) {
    boost::asio::post(service_socket_.get_executor(), [this, lifetime = lifetime_.get_weak(), h = std::move(handler)] {
        const auto lock = LifetimeGuard::lock(lifetime);
        if (!lock) {
            return;
        }
        if (!browse_ref_) {
            h(tl::unexpected<ProviderStatus>(kDNSServiceErr_BadState));
            return;
        }
        browse_ref_.reset();
        browse_results_.clear();
        h({});
    });
}

void nsd::dnssd::BonjourProvider::resolve(const ServiceReference& reference, ResolveHandler handler) {
    boost::asio::post(
        service_socket_.get_executor(),
        [this, lifetime = lifetime_.get_weak(), reference, h = std::move(handler)]() mutable {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            do_resolve(reference, std::move(h));
        }
    );
}

std::string nsd::dnssd::BonjourProvider::status_to_string(const ProviderStatus code) const {
    return dns_service_error_to_string(code);
}

void nsd::dnssd::BonjourProvider::do_advertise(const ServiceDescriptor& descriptor, AdvertiseHandler handler) {
    if (register_ref_) {
        handler(tl::unexpected<ProviderStatus>(kDNSServiceErr_AlreadyRegistered));
        return;
    }

    DNSServiceErrorType result = kDNSServiceErr_NoError;
    DNSServiceRef service_ref = shared_connection_.service_ref();

    try {
        const BonjourTxtRecord record(descriptor.txt);
        result = DNSServiceRegister(
            &service_ref, kDNSServiceFlagsShareConnection, kDNSServiceInterfaceIndexAny,
            descriptor.name.empty() ? nullptr : descriptor.name.c_str(), descriptor.reg_type.c_str(), nullptr, nullptr,
            htons(descriptor.port), record.length(), record.bytes_ptr(), register_callback, this
        );
    } catch (const std::exception& e) {
        NSD_ERROR("Failed to build TXT record: {}", e.what());
        result = kDNSServiceErr_BadParam;
    }

    if (result != kDNSServiceErr_NoError) {
        handler(tl::unexpected(result));
        return;
    }

    register_ref_ = service_ref;
    advertise_handler_ = std::move(handler);
}

void nsd::dnssd::BonjourProvider::do_resolve(const ServiceReference& reference, ResolveHandler handler) {
    auto& pending = pending_resolves_.emplace_back(PendingResolve {*this, reference, std::move(handler), {}, {}, {}});
    pending.result.name = reference.name;
    pending.result.reg_type = reference.reg_type;
    pending.result.domain = reference.domain;

    DNSServiceRef resolve_ref = shared_connection_.service_ref();
    const auto result = DNSServiceResolve(
        &resolve_ref, kDNSServiceFlagsShareConnection, kDNSServiceInterfaceIndexAny, reference.name.c_str(),
        reference.reg_type.c_str(), reference.domain.c_str(), resolve_callback, &pending
    );

    if (result != kDNSServiceErr_NoError) {
        complete_resolve(&pending, tl::unexpected(result));
        return;
    }

    pending.resolve_ref = resolve_ref;
}

void nsd::dnssd::BonjourProvider::async_process_results() {
    service_socket_.async_wait(
        boost::asio::ip::tcp::socket::wait_read,
        [this, lifetime = lifetime_.get_weak()](const boost::system::error_code& ec) {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }

            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    NSD_ERROR("Error in async_wait_for_results: {}", ec.message());
                }
                return;
            }

            const auto result = DNSServiceProcessResult(shared_connection_.service_ref());

            if (result != kDNSServiceErr_NoError) {
                NSD_ERROR("DNSServiceError: {}", dns_service_error_to_string(result));
                if (++process_results_failed_attempts_ > 10) {
                    NSD_ERROR("Too many failed attempts to process results, stopping");
                    return;
                }
            } else {
                process_results_failed_attempts_ = 0;
            }

            async_process_results();
        }
    );
}

void nsd::dnssd::BonjourProvider::complete_resolve(
    PendingResolve* pending, tl::expected<ResolvedService, ProviderStatus> result
) {
    auto handler = std::move(pending->handler);
    // Deallocating a DNSServiceRef from within its own callback is allowed.
    pending_resolves_.remove_if([pending](const PendingResolve& p) {
        return &p == pending;
    });
    handler(std::move(result));
}

void nsd::dnssd::BonjourProvider::register_callback(
    [[maybe_unused]] DNSServiceRef service_ref, const DNSServiceFlags flags, const DNSServiceErrorType error_code,
    const char* service_name, const char* reg_type, [[maybe_unused]] const char* reply_domain, void* context
) {
    NSD_ASSERT_RETURN(context != nullptr, "Expected non-null context");
    auto* provider = static_cast<BonjourProvider*>(context);

    if (!provider->advertise_handler_) {
        // The registration already completed. Later callbacks report conflicts or removal.
        if (error_code != kDNSServiceErr_NoError) {
            NSD_WARNING("Registration of {}.{} changed: {}", service_name, reg_type, dns_service_error_to_string(error_code));
        }
        return;
    }

    auto handler = std::move(provider->advertise_handler_);
    provider->advertise_handler_ = nullptr;

    if (error_code != kDNSServiceErr_NoError) {
        provider->register_ref_.reset();
        handler(tl::unexpected(error_code));
        return;
    }

    if ((flags & kDNSServiceFlagsAdd) == 0) {
        NSD_WARNING("Service {}.{} was removed during registration", service_name, reg_type);
        provider->register_ref_.reset();
        handler(tl::unexpected(kDNSServiceErr_NameConflict));
        return;
    }

    handler(std::string(service_name));
}

void nsd::dnssd::BonjourProvider::browse_reply(
    [[maybe_unused]] DNSServiceRef browse_service_ref, const DNSServiceFlags flags, const uint32_t interface_index,
    const DNSServiceErrorType error_code, const char* name, const char* type, const char* domain, void* context
) {
    NSD_ASSERT_RETURN(context != nullptr, "Expected non-null context");
    auto* provider = static_cast<BonjourProvider*>(context);

    if (error_code != kDNSServiceErr_NoError) {
        NSD_WARNING("Browse reply called with error: {}", dns_service_error_to_string(error_code));
        return;
    }

    NSD_TRACE("browse_reply name={} type={} domain={} interface_index={}", name, type, domain, interface_index);

    char fullname[kDNSServiceMaxDomainName] = {};
    const auto result = DNSServiceConstructFullName(fullname, name, type, domain);
    if (result != kDNSServiceErr_NoError) {
        NSD_WARNING("Failed to construct full name: {}", dns_service_error_to_string(result));
        return;
    }

    // Services are reported once per interface, but only the first and the last report matter here.
    if (flags & kDNSServiceFlagsAdd) {
        auto& interfaces = provider->browse_results_[fullname];
        const bool first = interfaces.empty();
        interfaces.insert(interface_index);
        if (first) {
            provider->on_service_found(ServiceReference {name, type, domain});
        }
        return;
    }

    const auto found = provider->browse_results_.find(fullname);
    if (found == provider->browse_results_.end()) {
        NSD_WARNING("Service with fullname \"{}\" not found", fullname);
        return;
    }

    found->second.erase(interface_index);
    if (found->second.empty()) {
        provider->browse_results_.erase(found);
        provider->on_service_lost(ServiceReference {name, type, domain});
    }
}

void nsd::dnssd::BonjourProvider::resolve_callback(
    [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] DNSServiceFlags flags, const uint32_t interface_index,
    const DNSServiceErrorType error_code, [[maybe_unused]] const char* fullname, const char* host_target,
    const uint16_t port, const uint16_t txt_len, const unsigned char* txt_record, void* context
) {
    NSD_ASSERT_RETURN(context != nullptr, "Expected non-null context");
    auto* pending = static_cast<PendingResolve*>(context);
    auto& owner = pending->owner;

    if (error_code != kDNSServiceErr_NoError) {
        owner.complete_resolve(pending, tl::unexpected(error_code));
        return;
    }

    if (pending->get_addr_ref) {
        return;  // Already looking up the address
    }

    pending->result.host_target = host_target;
    pending->result.port = ntohs(port);
    pending->result.txt = BonjourTxtRecord::get_txt_record_from_raw_bytes(txt_record, txt_len);

    DNSServiceRef get_addr_ref = owner.shared_connection_.service_ref();
    const auto result = DNSServiceGetAddrInfo(
        &get_addr_ref, kDNSServiceFlagsShareConnection | kDNSServiceFlagsTimeout, interface_index,
        kDNSServiceProtocol_IPv4 | kDNSServiceProtocol_IPv6, host_target, get_addr_info_callback, pending
    );

    if (result != kDNSServiceErr_NoError) {
        owner.complete_resolve(pending, tl::unexpected(result));
        return;
    }

    pending->get_addr_ref = get_addr_ref;
}

void nsd::dnssd::BonjourProvider::get_addr_info_callback(
    [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] DNSServiceFlags flags,
    [[maybe_unused]] uint32_t interface_index, const DNSServiceErrorType error_code,
    [[maybe_unused]] const char* hostname, const struct sockaddr* address, [[maybe_unused]] uint32_t ttl,
    void* context
) {
    NSD_ASSERT_RETURN(context != nullptr, "Expected non-null context");
    auto* pending = static_cast<PendingResolve*>(context);
    auto& owner = pending->owner;

    if (error_code != kDNSServiceErr_NoError) {
        owner.complete_resolve(pending, tl::unexpected(error_code));
        return;
    }

    const void* ip_addr_data = nullptr;
    if (address->sa_family == AF_INET) {
        ip_addr_data = &reinterpret_cast<const sockaddr_in*>(address)->sin_addr;
    } else if (address->sa_family == AF_INET6) {
        ip_addr_data = &reinterpret_cast<const sockaddr_in6*>(address)->sin6_addr;
    } else {
        return;  // Wait for an address family we understand
    }

    char ip_addr[INET6_ADDRSTRLEN] = {};
    // Winsock version requires the const cast.
    if (inet_ntop(address->sa_family, const_cast<void*>(ip_addr_data), ip_addr, INET6_ADDRSTRLEN) == nullptr) {
        NSD_WARNING("Failed to convert address of {}", pending->result.host_target);
        return;
    }

    auto result = std::move(pending->result);
    result.address = ip_addr;
    owner.complete_resolve(pending, std::move(result));
}

#endif
