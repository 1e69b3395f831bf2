/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/bonjour/bonjour.hpp"

#if NSD_HAS_DNSSD

bool nsd::dnssd::is_bonjour_service_running() {
    DNSServiceRef ref = nullptr;
    const auto result = DNSServiceCreateConnection(&ref);
    if (result != kDNSServiceErr_NoError) {
        NSD_WARNING("Bonjour service not available: {}", dns_service_error_to_string(result));
        return false;
    }
    DNSServiceRefDeallocate(ref);
    return true;
}

const char* nsd::dnssd::dns_service_error_to_string(const DNSServiceErrorType error) noexcept {
    switch (error) {
        case kDNSServiceErr_NoError:
            return "NoError";
        case kDNSServiceErr_Unknown:
            return "Unknown";
        case kDNSServiceErr_NoSuchName:
            return "NoSuchName";
        case kDNSServiceErr_NoMemory:
            return "NoMemory";
        case kDNSServiceErr_BadParam:
            return "BadParam";
        case kDNSServiceErr_BadReference:
            return "BadReference";
        case kDNSServiceErr_BadState:
            return "BadState";
        case kDNSServiceErr_BadFlags:
            return "BadFlags";
        case kDNSServiceErr_Unsupported:
            return "Unsupported";
        case kDNSServiceErr_NotInitialized:
            return "NotInitialized";
        case kDNSServiceErr_AlreadyRegistered:
            return "AlreadyRegistered";
        case kDNSServiceErr_NameConflict:
            return "NameConflict";
        case kDNSServiceErr_Invalid:
            return "Invalid";
        case kDNSServiceErr_Firewall:
            return "Firewall";
        case kDNSServiceErr_Incompatible:
            return "Incompatible (client library and daemon versions differ)";
        case kDNSServiceErr_BadInterfaceIndex:
            return "BadInterfaceIndex";
        case kDNSServiceErr_Refused:
            return "Refused";
        case kDNSServiceErr_NoSuchRecord:
            return "NoSuchRecord";
        case kDNSServiceErr_NoAuth:
            return "NoAuth";
        case kDNSServiceErr_NoSuchKey:
            return "NoSuchKey";
        case kDNSServiceErr_NATTraversal:
            return "NATTraversal";
        case kDNSServiceErr_DoubleNAT:
            return "DoubleNAT";
        case kDNSServiceErr_BadTime:
            return "BadTime";
        case kDNSServiceErr_BadSig:
            return "BadSig";
        case kDNSServiceErr_BadKey:
            return "BadKey";
        case kDNSServiceErr_Transient:
            return "Transient";
        case kDNSServiceErr_ServiceNotRunning:
            return "ServiceNotRunning (background daemon not running)";
        case kDNSServiceErr_NATPortMappingUnsupported:
            return "NATPortMappingUnsupported";
        case kDNSServiceErr_NATPortMappingDisabled:
            return "NATPortMappingDisabled";
        case kDNSServiceErr_NoRouter:
            return "NoRouter";
        case kDNSServiceErr_PollingMode:
            return "PollingMode";
        case kDNSServiceErr_Timeout:
            return "Timeout";
        default:
            return "Unknown error";
    }
}

#endif
