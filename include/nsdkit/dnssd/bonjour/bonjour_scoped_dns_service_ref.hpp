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

#if NSD_HAS_DNSSD

namespace nsd::dnssd {

/**
 * RAII wrapper around DNSServiceRef.
 */
class BonjourScopedDnsServiceRef {
  public:
    BonjourScopedDnsServiceRef() = default;
    ~BonjourScopedDnsServiceRef();

    explicit BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept;

    BonjourScopedDnsServiceRef(const BonjourScopedDnsServiceRef&) = delete;
    BonjourScopedDnsServiceRef& operator=(const BonjourScopedDnsServiceRef& other) = delete;

    BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept;
    BonjourScopedDnsServiceRef& operator=(BonjourScopedDnsServiceRef&& other) noexcept;

    /**
     * Takes ownership of given DNSServiceRef. An existing DNSServiceRef will be deallocated first.
     * @param service_ref The DNSServiceRef to own.
     * @return A reference to this instance.
     */
    BonjourScopedDnsServiceRef& operator=(DNSServiceRef service_ref);

    /**
     * @return The contained DNSServiceRef, which might be nullptr.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept;

    /**
     * @return True if a DNSServiceRef is held.
     */
    explicit operator bool() const noexcept {
        return service_ref_ != nullptr;
    }

    /**
     * Deallocates the contained DNSServiceRef, if any.
     */
    void reset() noexcept;

  private:
    DNSServiceRef service_ref_ = nullptr;
};

}  // namespace nsd::dnssd

#endif
