/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/codec.hpp"

namespace qmgr {

namespace {
using nlohmann::json;

// Free text from hooks and exceptions may carry invalid UTF-8; it is stored
// with U+FFFD substitutes instead of making the record unwritable.
json freeText(const std::string& text) {
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace));
}

DecodeResult invalid(std::string message) {
    DecodeResult r;
    r.status = DecodeStatus::Invalid;
    r.error = std::move(message);
    return r;
}

bool readTimestamp(const json& j, const char* key, Timestamp& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return false;
    }
    out = it->get<Timestamp>();
    return out >= 0;
}

bool readString(const json& j, const char* key, std::string& out, bool required) {
    auto it = j.find(key);
    if (it == j.end()) {
        return !required;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

DecodeResult decodeTombstone(const json& j) {
    Tombstone t;
    if (!readString(j, "job_id", t.id, true) || t.id.empty()) {
        return invalid("tombstone without job_id");
    }
    if (!readTimestamp(j, "deleted_at", t.deletedAt)) {
        return invalid("tombstone '" + t.id + "' has no valid deleted_at");
    }
    DecodeResult r;
    r.status = DecodeStatus::Ok;
    r.tombstone = std::move(t);
    return r;
}

DecodeResult decodeRecord(const json& j) {
    JobRecord rec;
    if (!readString(j, "job_id", rec.id, true) || rec.id.empty()) {
        return invalid("record without a non-empty job_id");
    }
    const std::string where = "record '" + rec.id + "': ";

    if (!readString(j, "job_type", rec.type, false)) {
        return invalid(where + "job_type is not a string");
    }

    std::string statusText;
    if (!readString(j, "status", statusText, true)) {
        return invalid(where + "missing status");
    }
    auto status = statusFromString(statusText);
    if (!status) {
        return invalid(where + "unknown status '" + statusText + "'");
    }
    rec.status = *status;

    if (auto it = j.find("params"); it != j.end()) {
        if (!it->is_object()) {
            return invalid(where + "params is not an object");
        }
        rec.params = *it;
    }

    if (auto it = j.find("result"); it != j.end()) {
        rec.result = *it;
    }

    if (auto it = j.find("error"); it != j.end()) {
        if (!it->is_object()) {
            return invalid(where + "error is not an object");
        }
        JobError err;
        if (!readString(*it, "kind", err.kind, true) || !readString(*it, "message", err.message, true)) {
            return invalid(where + "error needs string kind and message");
        }
        rec.error = std::move(err);
    }

    if (auto it = j.find("progress"); it != j.end()) {
        if (!it->is_number_integer()) {
            return invalid(where + "progress is not an integer");
        }
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() > 100) {
            return invalid(where + "progress out of range");
        }
        rec.progress = static_cast<int>(it->get<std::uint64_t>());
    }

    if (!readString(j, "description", rec.description, false)) {
        return invalid(where + "description is not a string");
    }

    if (!readTimestamp(j, "created_at", rec.createdAt) || !readTimestamp(j, "updated_at", rec.updatedAt)) {
        return invalid(where + "missing or negative timestamps");
    }
    if (rec.updatedAt < rec.createdAt) {
        return invalid(where + "updated_at precedes created_at");
    }

    if (auto it = j.find("size_bytes"); it != j.end()) {
        if (!it->is_number_unsigned()) {
            return invalid(where + "size_bytes is not an unsigned integer");
        }
        rec.sizeBytes = it->get<std::uint64_t>();
    }

    if (rec.result && rec.error) {
        return invalid(where + "result and error are mutually exclusive");
    }
    if (rec.result && rec.status != Status::Completed) {
        return invalid(where + "result present on a " + statusText + " record");
    }
    if (rec.error && rec.status != Status::Failed) {
        return invalid(where + "error present on a " + statusText + " record");
    }

    DecodeResult r;
    r.status = DecodeStatus::Ok;
    r.record = std::move(rec);
    return r;
}
}

std::string encode(const JobRecord& record) {
    json j;
    j["job_id"] = record.id;
    j["job_type"] = record.type;
    j["status"] = statusToString(record.status);
    j["params"] = record.params;
    if (record.result) {
        j["result"] = *record.result;
    }
    if (record.error) {
        j["error"] = {{"kind", freeText(record.error->kind)}, {"message", freeText(record.error->message)}};
    }
    j["progress"] = record.progress;
    j["description"] = freeText(record.description);
    j["created_at"] = record.createdAt;
    j["updated_at"] = record.updatedAt;
    j["size_bytes"] = record.sizeBytes;
    // Params and results were screened on the way in; anything else that is
    // not valid UTF-8 fails the write rather than being altered.
    return j.dump();
}

std::string encode(const Tombstone& tombstone) {
    json j;
    j["job_id"] = tombstone.id;
    j["deleted_at"] = tombstone.deletedAt;
    return j.dump();
}

DecodeResult decode(std::string_view line) noexcept {
    try {
        json j = json::parse(line.begin(), line.end(), nullptr, false);
        if (j.is_discarded()) {
            DecodeResult r;
            r.status = DecodeStatus::Malformed;
            r.error = "unparseable line (" + std::to_string(line.size()) + " bytes)";
            return r;
        }
        if (!j.is_object()) {
            return invalid("line is not a JSON object");
        }
        if (j.contains("deleted_at") && !j.contains("status")) {
            return decodeTombstone(j);
        }
        return decodeRecord(j);
    } catch (const std::exception& e) {
        DecodeResult r;
        r.status = DecodeStatus::Malformed;
        r.error = std::string("decode failure: ") + e.what();
        return r;
    }
}

std::optional<std::uint64_t> encodedSize(const nlohmann::json& value) noexcept {
    try {
        return static_cast<std::uint64_t>(value.dump().size());
    } catch (const nlohmann::json::type_error&) {
        return std::nullopt;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

}
