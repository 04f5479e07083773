/**
 * mcpguard bridge channel frames
 *
 * The sandboxed runtime talks to the orchestrator over a socketpair
 * inherited as fd 3, one JSON object per line.
 *
 * Runtime -> orchestrator:
 *   {"op":"call","id":N,"tool":"name","args":{...}}
 *   {"op":"fetch","id":N,"url":"...","init":{...}}
 *   {"op":"read","id":N,"path":"..."}
 *   {"op":"write","id":N,"path":"...","content":"..."}
 *   {"op":"result","value":...}                       final, at most once
 *   {"op":"error","name":"...","message":"...","stack":"..."}
 *
 * Orchestrator -> runtime:
 *   {"id":N,"ok":true,"value":...}
 *   {"id":N,"ok":false,"error":{"kind":"UnknownTool","message":"..."}}
 */
#pragma once
#include <string>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace mcpguard::bridge {

constexpr int BRIDGE_CHANNEL_FD = 3;
constexpr size_t MAX_FRAME_BYTES = 4 * 1024 * 1024;

enum class FrameOp {
    CALL,
    FETCH,
    READ,
    WRITE,
    RESULT,
    ERROR,
    UNKNOWN
};

inline FrameOp frame_op_from_string(const std::string& op) {
    if (op == "call")   return FrameOp::CALL;
    if (op == "fetch")  return FrameOp::FETCH;
    if (op == "read")   return FrameOp::READ;
    if (op == "write")  return FrameOp::WRITE;
    if (op == "result") return FrameOp::RESULT;
    if (op == "error")  return FrameOp::ERROR;
    return FrameOp::UNKNOWN;
}

inline FrameOp frame_op(const nlohmann::json& frame) {
    if (!frame.is_object() || !frame.contains("op") || !frame["op"].is_string()) {
        return FrameOp::UNKNOWN;
    }
    return frame_op_from_string(frame["op"].get<std::string>());
}

// Answer to one request frame
struct BridgeReply {
    bool ok = false;
    nlohmann::json value;
    std::optional<core::ExecutionError> error;

    static BridgeReply success(nlohmann::json value) {
        BridgeReply reply;
        reply.ok = true;
        reply.value = std::move(value);
        return reply;
    }

    static BridgeReply denied(core::ErrorKind kind, std::string message) {
        BridgeReply reply;
        reply.error = core::ExecutionError::make(kind, std::move(message));
        return reply;
    }

    nlohmann::json to_frame(const nlohmann::json& id) const {
        nlohmann::json frame;
        frame["id"] = id;
        frame["ok"] = ok;
        if (ok) {
            frame["value"] = value;
        } else if (error) {
            frame["error"] = {
                {"kind", core::error_kind_to_string(error->kind)},
                {"message", error->message}
            };
        }
        return frame;
    }
};

// Splits a byte stream into newline-terminated frames
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_frame_bytes = MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    // False once an unterminated frame grows past the limit
    bool feed(const char* data, size_t len) {
        size_t old_size = buffer_.size();
        buffer_.append(data, len);
        for (size_t i = buffer_.size(); i > old_size; --i) {
            if (buffer_[i - 1] == '\n') {
                tail_start_ = i;
                break;
            }
        }
        return buffer_.size() - tail_start_ <= max_frame_bytes_;
    }

    std::optional<std::string> next() {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos || nl >= tail_start_) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        tail_start_ -= nl + 1;
        return line;
    }

    size_t buffered() const { return buffer_.size(); }

private:
    size_t max_frame_bytes_;
    std::string buffer_;
    size_t tail_start_ = 0;    // first byte after the last newline
};

} // namespace mcpguard::bridge
