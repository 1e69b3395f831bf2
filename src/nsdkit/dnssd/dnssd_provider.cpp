/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/dnssd_provider.hpp"
#include "nsdkit/dnssd/bonjour/bonjour_provider.hpp"

#include <tuple>

const char* nsd::dnssd::generic_status_to_string(const ProviderStatus code) {
    switch (code) {
        case status::internal_error:
            return "Internal error.";
        case status::already_active:
            return "The operation failed because it is already active.";
        case status::max_limit:
            return "The operation failed because the maximum outstanding requests from the applications have reached.";
        default:
            return "Unknown error.";
    }
}

std::unique_ptr<nsd::dnssd::Provider> nsd::dnssd::Provider::create(boost::asio::io_context& io_context) {
#if NSD_HAS_DNSSD
    #if NSD_WINDOWS
    if (!is_bonjour_service_running()) {
        return {};
    }
    #endif
    return std::make_unique<BonjourProvider>(io_context);
#else
    std::ignore = io_context;
    return {};
#endif
}
