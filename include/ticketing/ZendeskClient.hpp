#pragma once

#include "ticketing/Client.hpp"
#include "http/Transport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::ticketing {

class ZendeskClient final : public Client {
public:
    ZendeskClient(std::shared_ptr<http::Transport> transport, const std::string& subdomain,
                  unsigned int statusBatchSize = 100);

    Lookup<std::string> searchAssigneeId(const std::string& email) override;
    Lookup<std::vector<std::string>> listOpenTicketIds(const std::string& assigneeId) override;
    Lookup<std::vector<AttachmentMeta>> listAttachments(const std::string& ticketId) override;
    std::vector<TicketStatus> fetchTicketStatuses(const std::vector<std::string>& ticketIds) override;

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

private:
    std::shared_ptr<http::Transport> transport_;
    std::string baseUrl_;
    unsigned int statusBatchSize_;

    Lookup<nlohmann::json> getJson(const std::string& url) const;

    // Walks next_page links, handing every page to onPage.
    template<typename OnPage>
    std::optional<Failed> forEachPage(std::string url, OnPage&& onPage) const;
};

}
