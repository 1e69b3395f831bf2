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

#include <cstdint>
#include <map>
#include <string>

namespace nsd::dnssd {

/// Simple typedef for representing a TXT record.
using TxtRecord = std::map<std::string, std::string>;

/**
 * A service to advertise on the local network.
 */
struct ServiceDescriptor {
    /// The requested name of the service. The provider might register the service under a different name to avoid a
    /// conflict.
    std::string name;

    /// The type of the service followed by the protocol (i.e. _http._tcp).
    std::string reg_type;

    /// The port of the service (in native endian).
    uint16_t port {};

    /// The TXT record of the service, represented as a map of keys and values.
    TxtRecord txt;

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ServiceDescriptor& lhs, const ServiceDescriptor& rhs) {
        return lhs.name == rhs.name && lhs.reg_type == rhs.reg_type && lhs.port == rhs.port && lhs.txt == rhs.txt;
    }

    friend bool operator!=(const ServiceDescriptor& lhs, const ServiceDescriptor& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * A service discovered on the network which has not (necessarily) been resolved. Services are identified by their
 * name.
 */
struct ServiceReference {
    /// The name of the service.
    std::string name;

    /// The type of the service (i.e. _http._tcp.).
    std::string reg_type;

    /// The domain of the service (i.e. local.).
    std::string domain;

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ServiceReference& lhs, const ServiceReference& rhs) {
        return lhs.name == rhs.name && lhs.reg_type == rhs.reg_type && lhs.domain == rhs.domain;
    }

    friend bool operator!=(const ServiceReference& lhs, const ServiceReference& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * A service with resolved connection details.
 */
struct ResolvedService {
    /// The name of the service.
    std::string name;

    /// The type of the service (i.e. _http._tcp.).
    std::string reg_type;

    /// The domain of the service (i.e. local.).
    std::string domain;

    /// The host target of the service (name.local.).
    std::string host_target;

    /// The address of the host, empty if the provider only resolved the host target.
    std::string address;

    /// The port of the service (in native endian).
    uint16_t port {};

    /// The TXT record of the service.
    TxtRecord txt;

    /// @returns The reference this service was resolved from.
    [[nodiscard]] ServiceReference reference() const {
        return ServiceReference {name, reg_type, domain};
    }

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string to_string() const;
};

}  // namespace nsd::dnssd
