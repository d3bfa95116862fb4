#include "sync/AttachmentSync.hpp"
#include "ticketing/fileNames.hpp"
#include "log/Registry.hpp"

#include <iterator>
#include <set>
#include <fmt/format.h>

using namespace ts::sync;
using namespace ts::log;
using namespace ts::ticketing;
using ts::index::model::AttachmentRecord;
namespace fs = std::filesystem;

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void removeIfEmpty(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) return;
    fs::remove(dir, ec);
    if (ec) Registry::sync()->warn("[AttachmentSync] Could not remove empty folder {}: {}", dir.string(), ec.message());
}

}

AttachmentSync::AttachmentSync(std::shared_ptr<Client> client,
                               std::shared_ptr<Downloader> downloader,
                               std::shared_ptr<archive::Expander> expander,
                               std::shared_ptr<index::Reconciler> reconciler)
    : client_(std::move(client)), downloader_(std::move(downloader)),
      expander_(std::move(expander)), reconciler_(std::move(reconciler)) {
    if (!client_ || !downloader_ || !expander_ || !reconciler_)
        throw std::invalid_argument("AttachmentSync: missing dependency");
}

std::string AttachmentSync::dateFolder(const std::string& createdAt) {
    const auto date = createdAt.substr(0, createdAt.find('T'));
    return date.empty() ? "undated" : sanitizeFileName(date);
}

SyncReport AttachmentSync::sync(const std::vector<std::string>& ticketIds) {
    SyncReport report;
    HashSet hashes(reconciler_->knownHashes());

    for (const auto& id : ticketIds) syncTicket(id, hashes, report);

    report.added = reconciler_->add(report.persisted);

    const auto& c = report.counters;
    Registry::sync()->info("[AttachmentSync] {} saved, {} duplicate, {} failed, {} archive(s) expanded, {} skipped ticket(s)",
                           c.saved, c.duplicates, c.failed, c.expanded, report.skippedTickets.size());
    return report;
}

void AttachmentSync::syncTicket(const std::string& ticketId, HashSet& hashes, SyncReport& report) const {
    const auto skip = [&](std::string notice) {
        Registry::sync()->info("[AttachmentSync] {}", notice);
        report.skippedTickets.push_back(ticketId);
        report.notices.push_back(std::move(notice));
    };

    if (!index::Reconciler::isValidTicketId(ticketId)) {
        skip(fmt::format("Ticket id '{}' is not valid, skipped", ticketId));
        return;
    }

    const auto meta = client_->listAttachments(ticketId);
    if (std::holds_alternative<NotFound>(meta)) {
        skip(fmt::format("Ticket {} has no attachments", ticketId));
        return;
    }
    if (const auto* f = std::get_if<ticketing::Failed>(&meta)) {
        skip(fmt::format("Ticket {} skipped: {}", ticketId, f->cause));
        return;
    }

    std::vector<AttachmentRecord> accepted;
    std::set<fs::path> touched;
    const auto ticketFolder = reconciler_->ticketsRoot() / ticketId;

    for (const auto& a : std::get<Found<std::vector<AttachmentMeta>>>(meta).value) {
        const auto fileName = sanitizeFileName(a.fileName);

        try {
            const auto folder = ticketFolder / dateFolder(a.createdAt);
            fs::create_directories(folder);
            touched.insert(folder);

            const auto result = downloader_->download(a.url, folder / fileName, hashes);

            std::visit(Overloaded{
                [&](const Saved& s) {
                    ++report.counters.saved;

                    if (expander_->isArchive(s.path)) {
                        const auto expanded = expander_->expand(s.path, folder);
                        if (const auto* ef = std::get_if<archive::Failed>(&expanded)) {
                            ++report.counters.expandFailed;
                            report.notices.push_back(fmt::format("Ticket {}: {} kept unexpanded ({})",
                                                                 ticketId, fileName, ef->cause));
                        } else ++report.counters.expanded;
                    }

                    hashes.insert(s.hash);
                    accepted.push_back({a.url, a.createdAt, s.path.filename().string(), s.hash});
                },
                [&](const Duplicate&) {
                    ++report.counters.duplicates;
                    report.notices.push_back(fmt::format("Ticket {}: {} is a duplicate, skipped", ticketId, fileName));
                },
                [&](const sync::Failed& df) {
                    ++report.counters.failed;
                    report.notices.push_back(fmt::format("Ticket {}: {} failed ({})", ticketId, fileName, df.cause));
                }
            }, result);
        } catch (const std::exception& e) {
            ++report.counters.failed;
            Registry::sync()->error("[AttachmentSync] Ticket {}: {} failed: {}", ticketId, fileName, e.what());
            report.notices.push_back(fmt::format("Ticket {}: {} failed ({})", ticketId, fileName, e.what()));
        }
    }

    // Folders made for attachments that were all skipped stay off disk
    for (const auto& folder : touched) removeIfEmpty(folder);
    removeIfEmpty(ticketFolder);

    if (accepted.empty()) return;

    auto& entry = report.persisted[ticketId].attachments;
    entry.insert(entry.end(), std::make_move_iterator(accepted.begin()), std::make_move_iterator(accepted.end()));
}
