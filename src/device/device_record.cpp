#include "device_record.hpp"
#include "../core/errors.hpp"

namespace keyward {
namespace device {

const char* device_status_name(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::PENDING: return "pending";
        case DeviceStatus::APPROVED: return "approved";
        case DeviceStatus::REVOKED: return "revoked";
        default: return "pending";
    }
}

DeviceStatus parse_device_status(const std::string& name) {
    if (name == "approved") return DeviceStatus::APPROVED;
    if (name == "revoked") return DeviceStatus::REVOKED;
    return DeviceStatus::PENDING;
}

std::string DeviceRecord::description() const {
    std::string out;
    auto append = [&](const char* key) {
        auto it = device_details.find(key);
        if (it == device_details.end() || it->second.empty()) return;
        if (!out.empty()) out += ' ';
        out += it->second;
    };
    append("manufacturer");
    append("model");
    return out.empty() ? name : out;
}

namespace {

std::optional<std::string> optional_string(const remote::Document& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Unparsable timestamps read as absent rather than failing the whole record
std::optional<Timestamp> optional_time(const remote::Document& doc, const char* key) {
    auto text = optional_string(doc, key);
    if (!text) return std::nullopt;
    try {
        return parse_iso8601(*text);
    } catch (const KeywardError&) {
        return std::nullopt;
    }
}

} // namespace

DeviceRecord DeviceRecord::from_document(const std::string& id, const remote::Document& doc) {
    if (!doc.is_object()) throw KeywardError("device " + id + ": document is not an object");

    DeviceRecord r;
    r.id = id;
    if (auto v = optional_string(doc, fields::NAME)) r.name = *v;
    if (auto v = optional_string(doc, fields::PLATFORM)) r.platform = *v;

    auto pk = optional_string(doc, fields::PUBLIC_KEY);
    if (!pk) throw KeywardError("device " + id + ": missing public_key");
    r.public_key = *pk;

    r.wrapped_umk = optional_string(doc, fields::WRAPPED_UMK);
    r.wrapped_umk_nonce = optional_string(doc, fields::WRAPPED_UMK_NONCE);
    r.approved_by_public_key = optional_string(doc, fields::APPROVED_BY_PUBLIC_KEY);
    r.status = parse_device_status(optional_string(doc, fields::STATUS).value_or("pending"));
    r.created_at = optional_time(doc, fields::CREATED_AT);
    r.approved_at = optional_time(doc, fields::APPROVED_AT);
    r.revoked_at = optional_time(doc, fields::REVOKED_AT);

    auto details = doc.find(fields::DEVICE_DETAILS);
    if (details != doc.end() && details->is_object()) {
        for (auto it = details->begin(); it != details->end(); ++it) {
            if (it.value().is_null()) continue;
            r.device_details[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                                : it.value().dump();
        }
    }

    auto recovered = doc.find(fields::RECOVERED);
    r.recovered = recovered != doc.end() && recovered->is_boolean() && recovered->get<bool>();
    return r;
}

remote::Document DeviceRecord::to_document() const {
    remote::Document doc = remote::Document::object();
    doc[fields::NAME] = name;
    doc[fields::PLATFORM] = platform;
    doc[fields::PUBLIC_KEY] = public_key;
    if (wrapped_umk) doc[fields::WRAPPED_UMK] = *wrapped_umk;
    if (wrapped_umk_nonce) doc[fields::WRAPPED_UMK_NONCE] = *wrapped_umk_nonce;
    if (approved_by_public_key) doc[fields::APPROVED_BY_PUBLIC_KEY] = *approved_by_public_key;
    doc[fields::STATUS] = device_status_name(status);
    if (created_at) doc[fields::CREATED_AT] = format_iso8601(*created_at);
    if (approved_at) doc[fields::APPROVED_AT] = format_iso8601(*approved_at);
    if (revoked_at) doc[fields::REVOKED_AT] = format_iso8601(*revoked_at);
    if (!device_details.empty()) doc[fields::DEVICE_DETAILS] = device_details;
    if (recovered) doc[fields::RECOVERED] = true;
    return doc;
}

ApprovalRequest ApprovalRequest::from_record(const DeviceRecord& record) {
    ApprovalRequest req;
    req.device_id = record.id;
    req.device_name = record.name;
    req.platform = record.platform;
    req.public_key = record.public_key;
    req.requested_at = record.created_at;
    req.description = record.description();
    return req;
}

} // namespace device
} // namespace keyward
