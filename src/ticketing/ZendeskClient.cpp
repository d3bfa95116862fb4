#include "ticketing/ZendeskClient.hpp"
#include "ticketing/fileNames.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace ts::ticketing;
using namespace ts::log;
using json = nlohmann::json;

namespace {

std::string idToString(const json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    throw std::runtime_error(fmt::format("unexpected id value: {}", id.dump()));
}

std::string stringOr(const json& obj, const char* key, std::string fallback = "") {
    if (const auto it = obj.find(key); it != obj.end() && it->is_string()) return it->get<std::string>();
    return fallback;
}

std::optional<std::string> nextPage(const json& page) {
    if (const auto it = page.find("next_page"); it != page.end() && it->is_string() && !it->get<std::string>().empty())
        return it->get<std::string>();
    return std::nullopt;
}

}

ZendeskClient::ZendeskClient(std::shared_ptr<http::Transport> transport, const std::string& subdomain,
                             const unsigned int statusBatchSize)
    : transport_(std::move(transport)),
      baseUrl_(fmt::format("https://{}.zendesk.com/api/v2", subdomain)),
      statusBatchSize_(statusBatchSize == 0 ? 100 : statusBatchSize) {
    if (!transport_) throw std::invalid_argument("ZendeskClient requires a transport");
}

Lookup<json> ZendeskClient::getJson(const std::string& url) const {
    const auto res = transport_->get(url);
    if (!res.ok()) return Failed{fmt::format("GET {} failed: {}", url, res.error)};

    try {
        return Found<json>{json::parse(res.body)};
    } catch (const json::parse_error& e) {
        return Failed{fmt::format("GET {} returned invalid JSON: {}", url, e.what())};
    }
}

template<typename OnPage>
std::optional<Failed> ZendeskClient::forEachPage(std::string url, OnPage&& onPage) const {
    std::unordered_set<std::string> visited;
    while (visited.insert(url).second) {
        auto page = getJson(url);
        if (auto* f = std::get_if<Failed>(&page)) return *f;

        const auto& body = std::get<Found<json>>(page).value;
        onPage(body);

        const auto next = nextPage(body);
        if (!next) break;
        url = *next;
    }
    return std::nullopt;
}

Lookup<std::string> ZendeskClient::searchAssigneeId(const std::string& email) {
    const auto url = fmt::format("{}/users/search.json?query={}", baseUrl_, transport_->escape(email));
    auto res = getJson(url);
    if (auto* f = std::get_if<Failed>(&res)) {
        Registry::ticketing()->error("[ZendeskClient] User search failed: {}", f->cause);
        return *f;
    }

    try {
        const auto& body = std::get<Found<json>>(res).value;
        const auto users = body.value("users", json::array());
        if (users.empty()) {
            Registry::ticketing()->info("[ZendeskClient] No user found for {}", email);
            return NotFound{};
        }
        return Found<std::string>{idToString(users.front().at("id"))};
    } catch (const std::exception& e) {
        return Failed{fmt::format("Unexpected user search payload: {}", e.what())};
    }
}

Lookup<std::vector<std::string>> ZendeskClient::listOpenTicketIds(const std::string& assigneeId) {
    const auto query = fmt::format("type:ticket assignee_id:{} status<solved", assigneeId);
    std::vector<std::string> ids;

    try {
        const auto err = forEachPage(fmt::format("{}/search.json?query={}", baseUrl_, transport_->escape(query)),
                                     [&](const json& page) {
            for (const auto& t : page.value("results", json::array())) ids.push_back(idToString(t.at("id")));
        });
        if (err) {
            Registry::ticketing()->error("[ZendeskClient] Ticket search failed: {}", err->cause);
            return *err;
        }
    } catch (const std::exception& e) {
        return Failed{fmt::format("Unexpected ticket search payload: {}", e.what())};
    }

    if (ids.empty()) {
        Registry::ticketing()->info("[ZendeskClient] No open tickets assigned to {}", assigneeId);
        return NotFound{};
    }
    return Found<std::vector<std::string>>{std::move(ids)};
}

Lookup<std::vector<AttachmentMeta>> ZendeskClient::listAttachments(const std::string& ticketId) {
    std::vector<AttachmentMeta> out;

    try {
        const auto err = forEachPage(fmt::format("{}/tickets/{}/comments.json", baseUrl_, transport_->escape(ticketId)),
                                     [&](const json& page) {
            for (const auto& comment : page.value("comments", json::array())) {
                const auto createdAt = stringOr(comment, "created_at");
                for (const auto& a : comment.value("attachments", json::array())) {
                    out.push_back({
                        .url = stringOr(a, "content_url"),
                        .createdAt = createdAt,
                        .fileName = sanitizeFileName(stringOr(a, "file_name")),
                        .id = a.contains("id") ? idToString(a.at("id")) : ""
                    });
                }
            }
        });
        if (err) {
            Registry::ticketing()->error("[ZendeskClient] Comments for ticket {} failed: {}", ticketId, err->cause);
            return *err;
        }
    } catch (const std::exception& e) {
        return Failed{fmt::format("Unexpected comments payload for ticket {}: {}", ticketId, e.what())};
    }

    if (out.empty()) return NotFound{};

    std::vector<std::string> names;
    names.reserve(out.size());
    for (const auto& a : out) names.push_back(a.fileName);
    disambiguateFileNames(names);
    for (size_t i = 0; i < out.size(); ++i) out[i].fileName = std::move(names[i]);

    return Found<std::vector<AttachmentMeta>>{std::move(out)};
}

std::vector<TicketStatus> ZendeskClient::fetchTicketStatuses(const std::vector<std::string>& ticketIds) {
    std::vector<TicketStatus> out;

    for (size_t start = 0; start < ticketIds.size(); start += statusBatchSize_) {
        const auto end = std::min(ticketIds.size(), start + statusBatchSize_);

        std::string ids;
        for (size_t i = start; i < end; ++i) {
            if (!ids.empty()) ids += ',';
            ids += transport_->escape(ticketIds[i]);
        }

        auto res = getJson(fmt::format("{}/tickets/show_many.json?ids={}", baseUrl_, ids));
        if (const auto* f = std::get_if<Failed>(&res)) {
            Registry::ticketing()->error("[ZendeskClient] Status batch {}-{} failed: {}", start, end - 1, f->cause);
            continue;
        }

        try {
            for (const auto& t : std::get<Found<json>>(res).value.value("tickets", json::array()))
                out.push_back({idToString(t.at("id")), stringOr(t, "status")});
        } catch (const std::exception& e) {
            Registry::ticketing()->error("[ZendeskClient] Status batch {}-{} unreadable: {}", start, end - 1, e.what());
        }
    }

    return out;
}
