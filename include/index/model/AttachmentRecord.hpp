#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::index::model {

struct AttachmentRecord {
    std::string url;
    std::string createdAt;
    std::string fileName;
    std::string hash;   // SHA-256 hex, unique across the whole index once persisted

    bool operator==(const AttachmentRecord&) const = default;
};

struct TicketEntry {
    std::vector<AttachmentRecord> attachments;

    bool operator==(const TicketEntry&) const = default;
};

// ticket id -> entry; only tickets with at least one persisted attachment are present
using WorkspaceIndex = std::map<std::string, TicketEntry>;

void to_json(nlohmann::json& j, const AttachmentRecord& r);
void from_json(const nlohmann::json& j, AttachmentRecord& r);

void to_json(nlohmann::json& j, const TicketEntry& e);
void from_json(const nlohmann::json& j, TicketEntry& e);

}
