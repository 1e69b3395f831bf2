/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nsdkit/dnssd/bonjour/bonjour_txt_record.hpp"

#if NSD_HAS_DNSSD

nsd::dnssd::BonjourTxtRecord::BonjourTxtRecord(const TxtRecord& txt_record) {
    // Passing 0 and nullptr lets TXTRecordCreate allocate the buffer.
    TXTRecordCreate(&txt_record_ref_, 0, nullptr);

    try {
        for (const auto& [key, value] : txt_record) {
            set_value(key, value);
        }
    } catch (...) {
        TXTRecordDeallocate(&txt_record_ref_);
        throw;
    }
}

nsd::dnssd::BonjourTxtRecord::~BonjourTxtRecord() {
    TXTRecordDeallocate(&txt_record_ref_);
}

void nsd::dnssd::BonjourTxtRecord::set_value(const std::string& key, const std::string& value) {
    if (value.size() > 255) {
        NSD_THROW_EXCEPTION("TXT record value for key \"{}\" is too long", key);
    }

    if (value.empty()) {
        DNSSD_THROW_IF_ERROR(
            TXTRecordSetValue(&txt_record_ref_, key.c_str(), 0, nullptr), "Failed to set txt record key"
        );
        return;
    }

    DNSSD_THROW_IF_ERROR(
        TXTRecordSetValue(&txt_record_ref_, key.c_str(), static_cast<uint8_t>(value.length()), value.c_str()),
        "Failed to set txt record value"
    );
}

uint16_t nsd::dnssd::BonjourTxtRecord::length() const noexcept {
    return TXTRecordGetLength(&txt_record_ref_);
}

const void* nsd::dnssd::BonjourTxtRecord::bytes_ptr() const noexcept {
    return TXTRecordGetBytesPtr(&txt_record_ref_);
}

nsd::dnssd::TxtRecord nsd::dnssd::BonjourTxtRecord::get_txt_record_from_raw_bytes(
    const unsigned char* txt_record, const uint16_t txt_record_length
) {
    TxtRecord result;

    constexpr uint16_t key_buffer_length = 256;
    char key[key_buffer_length] = {};
    uint8_t value_length = 0;
    const void* value = nullptr;

    const auto count = TXTRecordGetCount(txt_record_length, txt_record);
    for (uint16_t i = 0; i < count; i++) {
        const auto error =
            TXTRecordGetItemAtIndex(txt_record_length, txt_record, i, key_buffer_length, key, &value_length, &value);
        if (error != kDNSServiceErr_NoError) {
            NSD_WARNING("Failed to read TXT record item {}: {}", i, dns_service_error_to_string(error));
            continue;
        }
        std::string value_string;
        if (value != nullptr) {
            value_string.assign(static_cast<const char*>(value), value_length);
        }
        result.insert({key, std::move(value_string)});
    }

    return result;
}

#endif
