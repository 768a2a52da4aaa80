/**
 * @file AdvertRecord.h
 * @brief Advertisement record broadcast by a sender
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace FastDrop {

/// Longest display name carried in an advertisement
constexpr size_t MAX_ADVERT_NAME_BYTES = 64;

/**
 * @brief Decoded advertisement: {"fastdrop":1,"service":<tag>,"name":<display name>}
 */
struct AdvertRecord {
    std::string serviceTag;
    std::string displayName;
};

/**
 * @brief Serialize a record; names longer than MAX_ADVERT_NAME_BYTES are cut
 */
std::vector<uint8_t> encodeAdvertRecord(const AdvertRecord& record);

/**
 * @brief Parse a record heard from the air
 * @return false for anything that is not a well-formed FastDrop record
 */
bool decodeAdvertRecord(const std::vector<uint8_t>& bytes, AdvertRecord& out, std::string& errorMsg);

}  // namespace FastDrop
