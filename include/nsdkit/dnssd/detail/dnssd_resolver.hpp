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

namespace nsd::dnssd {

/**
 * Passes resolve requests straight to the provider. There is no queuing or deduplication, any number of resolutions
 * can be outstanding.
 */
class Resolver {
  public:
    SafeFunction<void(const ResolvedService& service)> on_service_resolved;
    SafeFunction<void(ErrorKind kind, ProviderStatus code)> on_error;

    Resolver(Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime);

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    Resolver(Resolver&&) = delete;
    Resolver& operator=(Resolver&&) = delete;

    /**
     * Resolves given service.
     * @param reference The service to resolve.
     * @throws nsd::Exception when the reference has no name.
     */
    void resolve(const ServiceReference& reference);

  private:
    Provider& provider_;
    std::weak_ptr<LifetimeGuard::State> lifetime_;
};

}  // namespace nsd::dnssd
