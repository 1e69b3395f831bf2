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

namespace nsd::dnssd {

/**
 * Identifies which operation failed when an error is reported by a session.
 */
enum class ErrorKind {
    registration_failed = 1,
    unregistration_failed = 2,
    start_discovery_failed = 3,
    stop_discovery_failed = 4,
    resolve_failed = 5,
};

/**
 * @param kind The error kind.
 * @return A string representation of the error kind.
 */
inline const char* to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::registration_failed:
            return "registration_failed";
        case ErrorKind::unregistration_failed:
            return "unregistration_failed";
        case ErrorKind::start_discovery_failed:
            return "start_discovery_failed";
        case ErrorKind::stop_discovery_failed:
            return "stop_discovery_failed";
        case ErrorKind::resolve_failed:
            return "resolve_failed";
    }
    return "unknown";
}

}  // namespace nsd::dnssd
