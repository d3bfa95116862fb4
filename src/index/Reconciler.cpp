#include "index/Reconciler.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>
#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/format.h>

using namespace ts::index;
using namespace ts::index::model;
using namespace ts::log;
namespace fs = std::filesystem;

Reconciler::Reconciler(std::shared_ptr<Store> store, fs::path ticketsRoot, FolderRemover removeFolder)
    : store_(std::move(store)), ticketsRoot_(std::move(ticketsRoot)), removeFolder_(std::move(removeFolder)) {
    if (!store_) throw std::invalid_argument("Reconciler requires a store");
    if (!removeFolder_) throw std::invalid_argument("Reconciler requires a folder remover");
}

Reconciler::FolderRemover Reconciler::defaultRemover() {
    return [](const fs::path& dir, std::error_code& ec) { fs::remove_all(dir, ec); };
}

bool Reconciler::isValidTicketId(const std::string& id) {
    return !id.empty() && id != "." && id != ".." && id.find_first_of("/\\") == std::string::npos;
}

WorkspaceIndex Reconciler::load() const {
    const auto raw = store_->get(INDEX_KEY);
    if (!raw || raw->is_null()) return {};
    return raw->get<WorkspaceIndex>();
}

void Reconciler::persist(const WorkspaceIndex& index) {
    store_->set(INDEX_KEY, nlohmann::json(index));
}

AddResult Reconciler::add(const WorkspaceIndex& newEntries) {
    std::scoped_lock lock(mutex_);
    auto index = load();
    AddResult result;

    for (const auto& [ticketId, entry] : newEntries) {
        if (entry.attachments.empty()) continue;

        if (index.contains(ticketId)) {
            result.alreadyPresentTickets.push_back(ticketId);
            continue;
        }

        index.emplace(ticketId, entry);
        result.addedTickets.push_back(ticketId);
    }

    if (!result.addedTickets.empty()) persist(index);

    for (const auto& id : result.alreadyPresentTickets)
        Registry::index()->warn("[Reconciler] Ticket {} already indexed, new attachments not merged", id);
    Registry::index()->info("[Reconciler] Added {} ticket(s), {} already present",
                            result.addedTickets.size(), result.alreadyPresentTickets.size());
    return result;
}

RemoveResult Reconciler::remove(const std::vector<std::string>& ticketIds) {
    std::scoped_lock lock(mutex_);
    auto index = load();
    RemoveResult result;

    for (const auto& id : ticketIds) {
        if (isValidTicketId(id) && index.erase(id) > 0) result.removed.push_back(id);
        else result.notFound.push_back(id);
    }

    if (result.removed.empty()) {
        result.notices.push_back("No matching tickets in the index");
        return result;
    }

    // Index first: if this throws no folder has been touched
    persist(index);

    for (const auto& id : result.removed) {
        std::error_code ec;
        removeFolder_(ticketsRoot_ / id, ec);
        if (ec) {
            Registry::index()->warn("[Reconciler] Ticket {} removed from index but its folder was not deleted: {}",
                                    id, ec.message());
            result.failedDeletions.push_back({id, ec.message()});
        }
    }

    if (!result.failedDeletions.empty())
        result.notices.push_back(fmt::format("{} folder(s) could not be deleted", result.failedDeletions.size()));

    Registry::index()->info("[Reconciler] Removed {} ticket(s), {} not found",
                            result.removed.size(), result.notFound.size());
    return result;
}

RemoveResult Reconciler::scrubByStatus(const std::vector<ticketing::TicketStatus>& statuses,
                                       const std::vector<std::string>& closedStatuses) {
    std::unordered_set<std::string> closed;
    for (const auto& s : closedStatuses) closed.insert(boost::algorithm::to_lower_copy(s));

    std::vector<std::string> ids;
    for (const auto& s : statuses) {
        if (!closed.contains(boost::algorithm::to_lower_copy(s.status))) continue;
        if (std::ranges::find(ids, s.id) == ids.end()) ids.push_back(s.id);
    }

    if (ids.empty()) {
        Registry::index()->info("[Reconciler] No closed tickets to scrub");
        RemoveResult result;
        result.notices.push_back("No closed tickets to scrub");
        return result;
    }

    return remove(ids);
}

void Reconciler::reset() {
    std::scoped_lock lock(mutex_);
    persist({});
    Registry::index()->info("[Reconciler] Workspace index cleared");
}

WorkspaceIndex Reconciler::snapshot() const {
    std::scoped_lock lock(mutex_);
    return load();
}

std::unordered_set<std::string> Reconciler::knownHashes() const {
    std::scoped_lock lock(mutex_);
    std::unordered_set<std::string> hashes;
    for (const auto& entry : load() | std::views::values)
        for (const auto& a : entry.attachments)
            if (!a.hash.empty()) hashes.insert(a.hash);
    return hashes;
}
