/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/dnssd_service_description.hpp"

#include <fmt/format.h>

namespace {

std::string txt_record_to_string(const nsd::dnssd::TxtRecord& txt) {
    std::string output;
    for (auto& [key, value] : txt) {
        if (!output.empty()) {
            output += ", ";
        }
        output += key;
        output += "=";
        output += value;
    }
    return output;
}

}  // namespace

std::string nsd::dnssd::ServiceDescriptor::to_string() const {
    return fmt::format("name: {}, type: {}, port: {}, txt: [{}]", name, reg_type, port, txt_record_to_string(txt));
}

std::string nsd::dnssd::ServiceReference::to_string() const {
    return fmt::format("name: {}, type: {}, domain: {}", name, reg_type, domain);
}

std::string nsd::dnssd::ResolvedService::to_string() const {
    return fmt::format(
        "name: {}, type: {}, domain: {}, host_target: {}, address: {}, port: {}, txt: [{}]", name, reg_type, domain,
        host_target, address, port, txt_record_to_string(txt)
    );
}
