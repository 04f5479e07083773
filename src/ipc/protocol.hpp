/**
 * mcpguard control protocol
 *
 * Binary framing for CLI/IDE <-> orchestrator traffic on the control socket.
 * Header: 17 bytes (magic + correlation id + opcode + payload_size), packed,
 * little-endian. Payloads are JSON. Responses echo the request's correlation
 * id and opcode and carry {"ok": bool, ...}.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace mcpguard::ipc {

constexpr uint32_t MAGIC_BYTES = 0x4D435047; // "MCPG"
constexpr size_t HEADER_SIZE = 17;
constexpr size_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;

enum class ControlOp : uint8_t {
    NOOP              = 0x00,  // Echo, for liveness checks
    SUBMIT            = 0x01,  // ExecutionRequest -> ExecutionResult (when finished)
    CANCEL            = 0x02,  // {"id"}
    INVALIDATE_SCHEMA = 0x10,  // {"mcpName"}
    GET_SCHEMA        = 0x11,  // {"mcpName", "configHash"?}
    LIST_ACTIVE       = 0x20,  // in-flight execution ids
    GET_AUDIT_LOG     = 0x30,  // {"category"?, "executionId"?, "sinceId"?, "limit"?}
    SHUTDOWN          = 0xFF   // Graceful shutdown
};

// Wire protocol header (17 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint32_t request_id;    // Correlation id chosen by the client
    ControlOp opcode;
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

struct Message {
    uint32_t request_id;
    ControlOp opcode;
    std::vector<uint8_t> payload;

    Message() : request_id(0), opcode(ControlOp::NOOP) {}

    Message(uint32_t id, ControlOp op, const std::vector<uint8_t>& data = {})
        : request_id(id), opcode(op), payload(data) {}

    Message(uint32_t id, ControlOp op, const std::string& data)
        : request_id(id), opcode(op), payload(data.begin(), data.end()) {}

    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.request_id = request_id;
        header.opcode = opcode;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }
        return buffer;
    }

    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto total = get_message_size(data, len);
        if (!total || len < *total) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.request_id = header.request_id;
        msg.opcode = header.opcode;
        if (header.payload_size > 0) {
            msg.payload.assign(data + HEADER_SIZE, data + HEADER_SIZE + header.payload_size);
        }
        return msg;
    }

    // nullopt while the header is incomplete or invalid; check header_valid()
    // to tell the two apart
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE || !header_valid(data, len)) {
            return std::nullopt;
        }
        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);
        return HEADER_SIZE + header.payload_size;
    }

    // True for a short buffer: nothing to reject yet
    static bool header_valid(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return true;
        }
        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);
        return header.magic == MAGIC_BYTES && header.payload_size <= MAX_PAYLOAD_SIZE;
    }
};

inline const char* opcode_to_string(ControlOp op) {
    switch (op) {
        case ControlOp::NOOP:              return "NOOP";
        case ControlOp::SUBMIT:            return "SUBMIT";
        case ControlOp::CANCEL:            return "CANCEL";
        case ControlOp::INVALIDATE_SCHEMA: return "INVALIDATE_SCHEMA";
        case ControlOp::GET_SCHEMA:        return "GET_SCHEMA";
        case ControlOp::LIST_ACTIVE:       return "LIST_ACTIVE";
        case ControlOp::GET_AUDIT_LOG:     return "GET_AUDIT_LOG";
        case ControlOp::SHUTDOWN:          return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

inline std::optional<ControlOp> opcode_from_string(const std::string& name) {
    for (ControlOp op : {ControlOp::NOOP, ControlOp::SUBMIT, ControlOp::CANCEL,
                         ControlOp::INVALIDATE_SCHEMA, ControlOp::GET_SCHEMA,
                         ControlOp::LIST_ACTIVE, ControlOp::GET_AUDIT_LOG,
                         ControlOp::SHUTDOWN}) {
        if (name == opcode_to_string(op)) {
            return op;
        }
    }
    return std::nullopt;
}

} // namespace mcpguard::ipc
