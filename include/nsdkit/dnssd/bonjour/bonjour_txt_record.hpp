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
#include "nsdkit/dnssd/dnssd_service_description.hpp"

#if NSD_HAS_DNSSD

namespace nsd::dnssd {

/**
 * Owns a TXTRecordRef built from a TxtRecord.
 */
class BonjourTxtRecord {
  public:
    explicit BonjourTxtRecord(const TxtRecord& txt_record);
    ~BonjourTxtRecord();

    BonjourTxtRecord(const BonjourTxtRecord&) = delete;
    BonjourTxtRecord& operator=(const BonjourTxtRecord&) = delete;

    /**
     * Sets a value inside the TXT record.
     * @param key Key.
     * @param value Value. An empty value results in a key without value.
     * @throws nsd::Exception if the value could not be set (i.e. the value is too long).
     */
    void set_value(const std::string& key, const std::string& value);

    /**
     * @return The length of the TXT record in bytes.
     */
    [[nodiscard]] uint16_t length() const noexcept;

    /**
     * @return A pointer to the TXT record data, valid for as long as this instance lives.
     */
    [[nodiscard]] const void* bytes_ptr() const noexcept;

    /**
     * Parses raw TXT record bytes.
     * @param txt_record The txt record data.
     * @param txt_record_length The length of the txt record.
     * @return The parsed TxtRecord.
     */
    static TxtRecord get_txt_record_from_raw_bytes(const unsigned char* txt_record, uint16_t txt_record_length);

  private:
    TXTRecordRef txt_record_ref_ {};
};

}  // namespace nsd::dnssd

#endif
