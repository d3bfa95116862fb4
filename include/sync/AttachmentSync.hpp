#pragma once

#include "archive/Expander.hpp"
#include "index/Reconciler.hpp"
#include "sync/Downloader.hpp"
#include "ticketing/Client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ts::sync {

struct SyncCounters {
    size_t saved = 0;
    size_t duplicates = 0;
    size_t failed = 0;
    size_t expanded = 0;
    size_t expandFailed = 0;
};

struct SyncReport {
    index::model::WorkspaceIndex persisted;   // only tickets with at least one saved attachment
    index::AddResult added;
    SyncCounters counters;
    std::vector<std::string> skippedTickets;
    std::vector<std::string> notices;
};

// Downloads every attachment of the given tickets one at a time, expands archives,
// and hands the successes to the reconciler in a single add.
class AttachmentSync {
public:
    AttachmentSync(std::shared_ptr<ticketing::Client> client,
                   std::shared_ptr<Downloader> downloader,
                   std::shared_ptr<archive::Expander> expander,
                   std::shared_ptr<index::Reconciler> reconciler);

    // Per-attachment failures are reported, never thrown. index::PersistenceError is.
    SyncReport sync(const std::vector<std::string>& ticketIds);

    // "2024-03-05T10:00:00Z" -> "2024-03-05"
    static std::string dateFolder(const std::string& createdAt);

private:
    std::shared_ptr<ticketing::Client> client_;
    std::shared_ptr<Downloader> downloader_;
    std::shared_ptr<archive::Expander> expander_;
    std::shared_ptr<index::Reconciler> reconciler_;

    void syncTicket(const std::string& ticketId, HashSet& hashes, SyncReport& report) const;
};

}
