// Control messages and their JSON wire form
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace linkshare {

using Bytes = std::vector<std::uint8_t>;

// What the sender announces for one file. Immutable once sent.
struct FileDescriptor {
    std::string name;
    std::uint64_t size{};
    std::string media_type;
};

bool operator==(const FileDescriptor& a, const FileDescriptor& b);

namespace msg {

// `offer_id` names one announcement. ReadyToReceive and TransferCompleteAck
// echo it back so a reply to a withdrawn offer cannot drive a later one.
// 0 means untagged and is left off the wire.
struct Meta {
    FileDescriptor descriptor;
    std::uint64_t offer_id{};
};

struct ReadyToReceive {
    std::uint64_t offer_id{};
};

struct End {
    std::string sha256; // hex digest of the whole file, empty when not computed
};

struct TransferCompleteAck {
    std::uint64_t offer_id{};
};

enum class CancelOrigin { Unknown, Sender, Receiver };

struct Cancelled {
    CancelOrigin origin{CancelOrigin::Unknown};
    std::string reason;
};

} // namespace msg

using ControlMessage = std::variant<msg::Meta, msg::ReadyToReceive, msg::End,
                                    msg::TransferCompleteAck, msg::Cancelled>;

// Everything a Channel can deliver: a control frame or a raw binary chunk.
using InboundEvent = std::variant<ControlMessage, Bytes>;

// Wire "type" tag of a control message ("meta", "end", ...)
const char* type_name(const ControlMessage& m);

// JSON text frame for a control message.
std::string encode_control(const ControlMessage& m);

// Parses a JSON text frame. Unknown types and malformed JSON yield nullopt with `err` filled in.
std::optional<ControlMessage> decode_control(const std::string& text, std::string* err = nullptr);

// Best-effort MIME type from the file extension; "application/octet-stream" when unknown.
std::string guess_media_type(const std::string& name);

// Last path component with anything outside [A-Za-z0-9._- ] replaced by '_'.
std::string sanitize_filename(const std::string& name);

std::string basename_only(const std::string& path);

} // namespace linkshare
