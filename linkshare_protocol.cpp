#include "linkshare_protocol.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <nlohmann/json.hpp>

namespace linkshare {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char* origin_name(msg::CancelOrigin o) {
    switch (o) {
        case msg::CancelOrigin::Sender:   return "sender";
        case msg::CancelOrigin::Receiver: return "receiver";
        default:                          return "";
    }
}

} // namespace

bool operator==(const FileDescriptor& a, const FileDescriptor& b) {
    return a.name == b.name && a.size == b.size && a.media_type == b.media_type;
}

const char* type_name(const ControlMessage& m) {
    return std::visit(overloaded{
        [](const msg::Meta&)                { return "meta"; },
        [](const msg::ReadyToReceive&)      { return "ready_to_receive"; },
        [](const msg::End&)                 { return "end"; },
        [](const msg::TransferCompleteAck&) { return "transfer_complete_ack"; },
        [](const msg::Cancelled&)           { return "transfer_cancelled"; },
    }, m);
}

std::string encode_control(const ControlMessage& m) {
    nlohmann::json j;
    j["type"] = type_name(m);
    std::visit(overloaded{
        [&](const msg::Meta& meta) {
            j["meta"] = {{"name", meta.descriptor.name},
                         {"size", meta.descriptor.size},
                         {"type", meta.descriptor.media_type}};
            if (meta.offer_id) j["id"] = meta.offer_id;
        },
        [&](const msg::ReadyToReceive& r) {
            if (r.offer_id) j["id"] = r.offer_id;
        },
        [&](const msg::TransferCompleteAck& a) {
            if (a.offer_id) j["id"] = a.offer_id;
        },
        [&](const msg::End& end) {
            if (!end.sha256.empty()) j["sha256"] = end.sha256;
        },
        [&](const msg::Cancelled& c) {
            if (c.origin != msg::CancelOrigin::Unknown) j["origin"] = origin_name(c.origin);
            if (!c.reason.empty()) j["reason"] = c.reason;
        },
        [](const auto&) {},
    }, m);
    return j.dump();
}

std::optional<ControlMessage> decode_control(const std::string& text, std::string* err) {
    auto fail = [&](const std::string& why) -> std::optional<ControlMessage> {
        if (err) *err = why;
        return std::nullopt;
    };

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return fail(std::string("invalid JSON: ") + ex.what());
    }
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
        return fail("missing 'type'");

    const std::string type = j["type"].get<std::string>();
    std::uint64_t id = 0;
    if (j.contains("id")) {
        if (!j["id"].is_number_unsigned()) return fail("'id' must be a non-negative integer");
        id = j["id"].get<std::uint64_t>();
    }
    if (type == "meta") {
        if (!j.contains("meta") || !j["meta"].is_object()) return fail("meta without 'meta' object");
        const auto& m = j["meta"];
        if (!m.contains("name") || !m["name"].is_string()) return fail("meta.name missing");
        if (!m.contains("size") || !m["size"].is_number_unsigned()) return fail("meta.size missing or negative");
        msg::Meta meta;
        meta.descriptor.name = m["name"].get<std::string>();
        meta.descriptor.size = m["size"].get<std::uint64_t>();
        if (m.contains("type") && m["type"].is_string()) meta.descriptor.media_type = m["type"].get<std::string>();
        meta.offer_id = id;
        return ControlMessage{meta};
    }
    if (type == "ready_to_receive") return ControlMessage{msg::ReadyToReceive{id}};
    if (type == "end") {
        msg::End end;
        if (j.contains("sha256") && j["sha256"].is_string()) end.sha256 = j["sha256"].get<std::string>();
        return ControlMessage{end};
    }
    if (type == "transfer_complete_ack") return ControlMessage{msg::TransferCompleteAck{id}};
    if (type == "transfer_cancelled") {
        msg::Cancelled c;
        if (j.contains("origin") && j["origin"].is_string()) {
            const std::string o = j["origin"].get<std::string>();
            if (o == "sender") c.origin = msg::CancelOrigin::Sender;
            else if (o == "receiver") c.origin = msg::CancelOrigin::Receiver;
        }
        if (j.contains("reason") && j["reason"].is_string()) c.reason = j["reason"].get<std::string>();
        return ControlMessage{c};
    }
    return fail("unknown control type '" + type + "'");
}

std::string guess_media_type(const std::string& name) {
    static const std::map<std::string, std::string> kTypes = {
        {"txt", "text/plain"},        {"json", "application/json"}, {"html", "text/html"},
        {"csv", "text/csv"},          {"pdf", "application/pdf"},    {"zip", "application/zip"},
        {"jpg", "image/jpeg"},        {"jpeg", "image/jpeg"},        {"png", "image/png"},
        {"gif", "image/gif"},         {"mp3", "audio/mpeg"},         {"wav", "audio/wav"},
        {"mp4", "video/mp4"},         {"mkv", "video/x-matroska"},   {"gz", "application/gzip"},
    };
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == name.size()) return "application/octet-stream";
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    auto it = kTypes.find(ext);
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

std::string basename_only(const std::string& p) {
    auto pos = p.find_last_of("/\\");
    return (pos == std::string::npos) ? p : p.substr(pos + 1);
}

std::string sanitize_filename(const std::string& name) {
    std::string out;
    for (char c : basename_only(name)) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' || c == ' ';
        out.push_back(ok ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") out = "file";
    return out;
}

} // namespace linkshare
