#include "client/blob_ticket.hpp"
#include "common/binary_codec.hpp"

namespace peerdrop {

const char* blob_format_name(BlobFormat format) {
    switch (format) {
        case BlobFormat::Raw: return "raw";
        case BlobFormat::HashSeq: return "hash_seq";
        default: return "unknown";
    }
}

std::string ticket_error_message(TicketError error) {
    switch (error) {
        case TicketError::MISSING_PREFIX: return "Ticket does not start with 'blob'";
        case TicketError::INVALID_ENCODING: return "Ticket is not valid base32";
        case TicketError::TRUNCATED: return "Ticket is truncated";
        case TicketError::UNSUPPORTED_VERSION: return "Unsupported ticket version";
        case TicketError::INVALID_FORMAT: return "Unknown blob format in ticket";
        case TicketError::TRAILING_DATA: return "Unexpected trailing data in ticket";
        default: return "Unknown ticket error";
    }
}

std::string BlobTicket::serialize() const {
    wire::BinaryWriter writer(1 + crypto::NODE_ID_SIZE + 2 + crypto::BLOB_HASH_SIZE + 1 + 32 * addresses.size());

    writer.write_u8(VERSION);
    writer.write_fixed_bytes(node_id);
    writer.write_array_header(static_cast<uint16_t>(addresses.size()));
    for (const auto& addr : addresses) {
        writer.write_string(addr);
    }
    writer.write_fixed_bytes(hash);
    writer.write_u8(static_cast<uint8_t>(format));

    return std::string(PREFIX) + wire::base32_encode(writer.data());
}

std::expected<BlobTicket, TicketError> BlobTicket::parse(std::string_view text) {
    if (text.substr(0, PREFIX.size()) != PREFIX) {
        return std::unexpected(TicketError::MISSING_PREFIX);
    }

    auto bytes = wire::base32_decode(text.substr(PREFIX.size()));
    if (!bytes) {
        return std::unexpected(TicketError::INVALID_ENCODING);
    }

    wire::BinaryReader reader(*bytes);
    BlobTicket ticket;

    auto version = reader.read_u8();
    if (!version) return std::unexpected(TicketError::TRUNCATED);
    if (*version != VERSION) return std::unexpected(TicketError::UNSUPPORTED_VERSION);

    auto node_id = reader.read_fixed_array<crypto::NODE_ID_SIZE>();
    if (!node_id) return std::unexpected(TicketError::TRUNCATED);
    ticket.node_id = *node_id;

    auto count = reader.read_array_header();
    if (!count) return std::unexpected(TicketError::TRUNCATED);
    ticket.addresses.reserve(*count);
    for (uint16_t i = 0; i < *count; ++i) {
        auto addr = reader.read_string();
        if (!addr) return std::unexpected(TicketError::TRUNCATED);
        ticket.addresses.push_back(std::move(*addr));
    }

    auto hash = reader.read_fixed_array<crypto::BLOB_HASH_SIZE>();
    if (!hash) return std::unexpected(TicketError::TRUNCATED);
    ticket.hash = *hash;

    auto format = reader.read_u8();
    if (!format) return std::unexpected(TicketError::TRUNCATED);
    if (*format > static_cast<uint8_t>(BlobFormat::HashSeq)) {
        return std::unexpected(TicketError::INVALID_FORMAT);
    }
    ticket.format = static_cast<BlobFormat>(*format);

    if (reader.remaining() != 0) {
        return std::unexpected(TicketError::TRAILING_DATA);
    }
    return ticket;
}

} // namespace peerdrop
