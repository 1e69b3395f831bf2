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

#include "nsdkit/core/platform.hpp"
#include "nsdkit/core/exception.hpp"
#include "nsdkit/core/log.hpp"

// Set by the build system when dns_sd.h and its library were found.
#ifndef NSD_HAS_DNSSD
    #define NSD_HAS_DNSSD 0
#endif

#if NSD_HAS_DNSSD

    #if NSD_WINDOWS
        #define _WINSOCKAPI_  // Prevents inclusion of winsock.h in windows.h
        #include <Ws2tcpip.h>
        #include <winsock2.h>
    #else
        #include <arpa/inet.h>
    #endif

    #include <dns_sd.h>

    #define DNSSD_THROW_IF_ERROR(result, msg)                                                                       \
        if (const DNSServiceErrorType dnssd_error = (result); dnssd_error != kDNSServiceErr_NoError) {              \
            throw nsd::Exception(                                                                                   \
                std::string(msg) + ": " + nsd::dnssd::dns_service_error_to_string(dnssd_error), __FILE__, __LINE__, \
                NSD_FUNCTION                                                                                        \
            );                                                                                                      \
        }

namespace nsd::dnssd {

/**
 * @return True if the Bonjour service is installed and running. Always true on platforms other than Windows.
 */
bool is_bonjour_service_running();

/**
 * @param error The error code.
 * @return A human-readable description of the dns_sd error code.
 */
const char* dns_service_error_to_string(DNSServiceErrorType error) noexcept;

}  // namespace nsd::dnssd

#endif
