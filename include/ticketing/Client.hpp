#pragma once

#include "ticketing/Lookup.hpp"

#include <string>
#include <vector>

namespace ts::ticketing {

struct AttachmentMeta {
    std::string url;
    std::string createdAt;
    std::string fileName;
    std::string id;
};

struct TicketStatus {
    std::string id;
    std::string status;
};

class Client {
public:
    virtual ~Client() = default;

    virtual Lookup<std::string> searchAssigneeId(const std::string& email) = 0;

    // Service-side filter: solved and closed tickets are never returned.
    virtual Lookup<std::vector<std::string>> listOpenTicketIds(const std::string& assigneeId) = 0;

    // File names are unique within one result.
    virtual Lookup<std::vector<AttachmentMeta>> listAttachments(const std::string& ticketId) = 0;

    // Results in request order. Ids the service could not resolve are absent.
    virtual std::vector<TicketStatus> fetchTicketStatuses(const std::vector<std::string>& ticketIds) = 0;
};

}
