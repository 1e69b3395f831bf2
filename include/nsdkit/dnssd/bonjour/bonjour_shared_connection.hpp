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
#include "bonjour_scoped_dns_service_ref.hpp"

#if NSD_HAS_DNSSD

namespace nsd::dnssd {

/**
 * Represents a shared connection to the mdns responder. Operations created with kDNSServiceFlagsShareConnection on top
 * of this connection deliver their results through the socket of this connection.
 */
class BonjourSharedConnection {
  public:
    /**
     * Creates the connection.
     * @throws nsd::Exception when the connection could not be created (i.e. the daemon is not running).
     */
    BonjourSharedConnection();

    /**
     * @return The DNSServiceRef held by this instance. Ownership stays with this instance.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept {
        return service_ref_.service_ref();
    }

    /**
     * Deallocates the connection, and with it all operations sharing it.
     */
    void reset() noexcept {
        service_ref_.reset();
    }

  private:
    BonjourScopedDnsServiceRef service_ref_;
};

}  // namespace nsd::dnssd

#endif
