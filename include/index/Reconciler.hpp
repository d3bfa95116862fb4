#pragma once

#include "index/Store.hpp"
#include "index/model/AttachmentRecord.hpp"
#include "ticketing/Client.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace ts::index {

struct AddResult {
    std::vector<std::string> addedTickets;
    std::vector<std::string> alreadyPresentTickets;
};

struct DeletionFailure {
    std::string ticketId;
    std::string error;
};

struct RemoveResult {
    std::vector<std::string> removed;
    std::vector<std::string> notFound;
    std::vector<DeletionFailure> failedDeletions;
    std::vector<std::string> notices;
};

// Sole owner of the workspace index. Every public operation is one read-modify-write
// of the store, serialized against the others. PersistenceError propagates to the caller.
class Reconciler {
public:
    static constexpr const auto* INDEX_KEY = "ticketData";

    // Deletes one ticket folder recursively; a missing folder is not an error.
    using FolderRemover = std::function<void(const std::filesystem::path&, std::error_code&)>;

    Reconciler(std::shared_ptr<Store> store, std::filesystem::path ticketsRoot,
               FolderRemover removeFolder = defaultRemover());

    static FolderRemover defaultRemover();

    // New ticket ids are inserted; existing ones are left untouched.
    AddResult add(const model::WorkspaceIndex& newEntries);

    RemoveResult remove(const std::vector<std::string>& ticketIds);
    RemoveResult remove(const std::string& ticketId) { return remove(std::vector<std::string>{ticketId}); }

    // Removes every ticket whose status is in closedStatuses (case-insensitive).
    RemoveResult scrubByStatus(const std::vector<ticketing::TicketStatus>& statuses,
                               const std::vector<std::string>& closedStatuses = {"solved", "closed"});

    void reset();

    [[nodiscard]] model::WorkspaceIndex snapshot() const;
    [[nodiscard]] std::unordered_set<std::string> knownHashes() const;

    [[nodiscard]] const std::filesystem::path& ticketsRoot() const { return ticketsRoot_; }

    // Usable as a single folder name below the tickets root.
    static bool isValidTicketId(const std::string& id);

private:
    std::shared_ptr<Store> store_;
    std::filesystem::path ticketsRoot_;
    FolderRemover removeFolder_;
    mutable std::mutex mutex_;

    [[nodiscard]] model::WorkspaceIndex load() const;
    void persist(const model::WorkspaceIndex& index);
};

}
