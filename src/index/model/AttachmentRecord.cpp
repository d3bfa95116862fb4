#include "index/model/AttachmentRecord.hpp"

#include <nlohmann/json.hpp>

namespace ts::index::model {

void to_json(nlohmann::json& j, const AttachmentRecord& r) {
    j = {
        {"url", r.url},
        {"createdAt", r.createdAt},
        {"fileName", r.fileName},
        {"hash", r.hash}
    };
}

void from_json(const nlohmann::json& j, AttachmentRecord& r) {
    r.url = j.value("url", "");
    r.createdAt = j.value("createdAt", "");
    r.fileName = j.value("fileName", "");
    r.hash = j.value("hash", "");
}

void to_json(nlohmann::json& j, const TicketEntry& e) {
    j = {{"attachments", e.attachments}};
}

void from_json(const nlohmann::json& j, TicketEntry& e) {
    e.attachments = j.value("attachments", std::vector<AttachmentRecord>{});
}

}
