/**
 * @file AdvertRecord.cpp
 * @brief JSON advertisement record codec
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/AdvertRecord.h"
#include "fastdrop/config.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace FastDrop {

namespace {

// Cut at a byte limit without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

}  // namespace

std::vector<uint8_t> encodeAdvertRecord(const AdvertRecord& record) {
    json j;
    j["fastdrop"] = ADVERT_RECORD_VERSION;
    j["service"] = record.serviceTag;
    j["name"] = truncateUtf8(record.displayName, MAX_ADVERT_NAME_BYTES);

    const std::string text = j.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool decodeAdvertRecord(const std::vector<uint8_t>& bytes, AdvertRecord& out, std::string& errorMsg) {
    if (bytes.empty()) {
        errorMsg = "empty record";
        return false;
    }
    if (bytes.size() > MAX_ADVERT_RECORD_BYTES) {
        errorMsg = "record too large (" + std::to_string(bytes.size()) + " bytes)";
        return false;
    }

    try {
        json j = json::parse(bytes.begin(), bytes.end());

        if (!j.is_object() || !j.contains("fastdrop") || !j["fastdrop"].is_number_integer()) {
            errorMsg = "not a FastDrop record";
            return false;
        }
        if (j["fastdrop"].get<int>() != ADVERT_RECORD_VERSION) {
            errorMsg = "unsupported record version " + std::to_string(j["fastdrop"].get<int>());
            return false;
        }
        if (!j.contains("service") || !j["service"].is_string()) {
            errorMsg = "missing service tag";
            return false;
        }
        if (!j.contains("name") || !j["name"].is_string()) {
            errorMsg = "missing name";
            return false;
        }

        out.serviceTag = j["service"].get<std::string>();
        out.displayName = truncateUtf8(j["name"].get<std::string>(), MAX_ADVERT_NAME_BYTES);
        if (out.serviceTag.empty()) {
            errorMsg = "empty service tag";
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        errorMsg = std::string("invalid JSON: ") + e.what();
        return false;
    }
}

}  // namespace FastDrop
