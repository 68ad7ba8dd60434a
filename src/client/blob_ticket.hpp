#pragma once

#include "common/crypto.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace peerdrop {

// ============================================================================
// Blob Ticket
// ============================================================================
//
// Text form: "blob" + base32(lowercase, no padding) of
//   version:u8 | node_id:32 | addr_count:u16 | (addr:string)* | hash:32 | format:u8
//

enum class BlobFormat : uint8_t {
    Raw = 0,
    HashSeq = 1,
};

const char* blob_format_name(BlobFormat format);

enum class TicketError {
    MISSING_PREFIX,
    INVALID_ENCODING,
    TRUNCATED,
    UNSUPPORTED_VERSION,
    INVALID_FORMAT,
    TRAILING_DATA,
};

std::string ticket_error_message(TicketError error);

struct BlobTicket {
    static constexpr std::string_view PREFIX = "blob";
    static constexpr uint8_t VERSION = 1;

    crypto::NodeId node_id{};
    std::vector<std::string> addresses;     // "host:port"
    crypto::BlobHash hash{};
    BlobFormat format = BlobFormat::Raw;

    std::string serialize() const;
    static std::expected<BlobTicket, TicketError> parse(std::string_view text);

    bool operator==(const BlobTicket&) const = default;
};

} // namespace peerdrop
