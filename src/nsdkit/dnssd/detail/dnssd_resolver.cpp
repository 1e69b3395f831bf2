/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/detail/dnssd_resolver.hpp"

#include "nsdkit/core/exception.hpp"
#include "nsdkit/core/log.hpp"

nsd::dnssd::Resolver::Resolver(Provider& provider, std::weak_ptr<LifetimeGuard::State> lifetime) :
    provider_(provider), lifetime_(std::move(lifetime)) {}

void nsd::dnssd::Resolver::resolve(const ServiceReference& reference) {
    if (reference.name.empty()) {
        NSD_THROW_EXCEPTION("Service name must not be empty (type: \"{}\")", reference.reg_type);
    }

    NSD_TRACE("Resolving: {}", reference.to_string());

    provider_.resolve(
        reference,
        [this, lifetime = lifetime_, name = reference.name](const tl::expected<ResolvedService, ProviderStatus>& result) {
            const auto lock = LifetimeGuard::lock(lifetime);
            if (!lock) {
                return;
            }
            if (!result) {
                NSD_WARNING(
                    "Resolving {} failed: {} ({})", name, provider_.status_to_string(result.error()), result.error()
                );
                on_error(ErrorKind::resolve_failed, result.error());
                return;
            }
            NSD_DEBUG("Resolved: {}", result->to_string());
            on_service_resolved(*result);
        }
    );
}
