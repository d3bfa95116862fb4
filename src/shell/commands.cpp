#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "runtime/Deps.hpp"
#include "config/ConfigRegistry.hpp"
#include "index/Reconciler.hpp"
#include "sync/AttachmentSync.hpp"
#include "ticketing/Client.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <ranges>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace ts;
using namespace ts::shell;
using namespace ts::runtime;

namespace {

std::string joinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

std::optional<std::string> session(const std::string& key) {
    const auto v = Deps::get().store->get(key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

std::optional<CommandResult> requireRemote() {
    if (Deps::get().attachmentSync && Deps::get().client) return std::nullopt;
    return fail("Zendesk credentials are not configured (set ZENDESK_SUBDOMAIN, ZENDESK_EMAIL and ZENDESK_API_TOKEN "
                "or the zendesk section of the config file)");
}

std::string renderSync(const sync::SyncReport& r) {
    const auto& c = r.counters;
    std::string out = fmt::format("Downloaded {} attachment(s) for {} ticket(s)\n", c.saved, r.persisted.size());
    if (c.duplicates) out += fmt::format("Skipped {} duplicate(s)\n", c.duplicates);
    if (c.failed) out += fmt::format("Failed {} download(s)\n", c.failed);
    if (c.expanded || c.expandFailed)
        out += fmt::format("Expanded {} archive(s), {} could not be expanded\n", c.expanded, c.expandFailed);
    if (!r.added.addedTickets.empty()) out += fmt::format("Added: {}\n", joinIds(r.added.addedTickets));
    if (!r.added.alreadyPresentTickets.empty())
        out += fmt::format("Already indexed (not merged): {}\n", joinIds(r.added.alreadyPresentTickets));
    for (const auto& n : r.notices) out += fmt::format("  - {}\n", n);
    return out;
}

std::string renderRemove(const index::RemoveResult& r) {
    std::string out;
    if (!r.removed.empty()) out += fmt::format("Removed: {}\n", joinIds(r.removed));
    if (!r.notFound.empty()) out += fmt::format("Not found: {}\n", joinIds(r.notFound));
    for (const auto& f : r.failedDeletions) out += fmt::format("Folder for {} not deleted: {}\n", f.ticketId, f.error);
    for (const auto& n : r.notices) out += fmt::format("  - {}\n", n);
    return out;
}

CommandResult runSync(const std::vector<std::string>& ids) {
    const auto report = Deps::get().attachmentSync->sync(ids);
    return ok(renderSync(report));
}

CommandResult handleFetch(const CommandCall&) {
    if (auto err = requireRemote()) return *err;

    const auto assignee = session(LAST_ID_KEY);
    if (!assignee) return fail("No assignee stored; run 'ticketsync login <email>' first");

    const auto ids = Deps::get().client->listOpenTicketIds(*assignee);
    if (std::holds_alternative<ticketing::NotFound>(ids)) return ok("No open tickets assigned\n");
    if (const auto* f = std::get_if<ticketing::Failed>(&ids)) return fail(f->cause);

    return runSync(std::get<ticketing::Found<std::vector<std::string>>>(ids).value);
}

CommandResult handleLogin(const CommandCall& call) {
    if (call.positionals.size() != 1) return invalid("Usage: ticketsync login <email>");
    if (auto err = requireRemote()) return *err;

    const auto& email = call.positionals.front();
    const auto id = Deps::get().client->searchAssigneeId(email);
    if (std::holds_alternative<ticketing::NotFound>(id)) return fail(fmt::format("No user found for {}", email));
    if (const auto* f = std::get_if<ticketing::Failed>(&id)) return fail(f->cause);

    const auto& assignee = std::get<ticketing::Found<std::string>>(id).value;
    auto& store = *Deps::get().store;
    store.set(LAST_EMAIL_KEY, email);
    store.set(LAST_ID_KEY, assignee);

    std::filesystem::create_directories(Deps::get().reconciler->ticketsRoot());
    log::Registry::ticketsync()->info("[login] {} resolved to assignee {}", email, assignee);

    auto res = handleFetch(call);
    res.stdout_text = fmt::format("Logged in as {} (assignee {})\n", email, assignee) + res.stdout_text;
    return res;
}

CommandResult handleAttachments(const CommandCall& call) {
    if (call.positionals.empty()) return invalid("Usage: ticketsync attachments <ticketId>...");
    if (auto err = requireRemote()) return *err;
    return runSync(call.positionals);
}

CommandResult handleRemove(const CommandCall& call) {
    if (call.positionals.empty()) return invalid("Usage: ticketsync remove <ticketId>...");

    const auto res = Deps::get().reconciler->remove(call.positionals);
    auto out = ok(renderRemove(res));
    if (!res.failedDeletions.empty()) out.exit_code = 1;
    return out;
}

CommandResult handleScrub(const CommandCall&) {
    if (auto err = requireRemote()) return *err;

    std::vector<std::string> ids;
    for (const auto& id : Deps::get().reconciler->snapshot() | std::views::keys) ids.push_back(id);
    if (ids.empty()) return ok("Nothing indexed\n");

    const auto statuses = Deps::get().client->fetchTicketStatuses(ids);
    const auto res = Deps::get().reconciler->scrubByStatus(statuses, config::ConfigRegistry::get().sync.closed_statuses);
    auto out = ok(renderRemove(res));
    if (!res.failedDeletions.empty()) out.exit_code = 1;
    return out;
}

CommandResult handleList(const CommandCall&) {
    const auto snapshot = Deps::get().reconciler->snapshot();
    if (snapshot.empty()) return ok("No tickets indexed\n");

    std::string out;
    for (const auto& [id, entry] : snapshot)
        out += fmt::format("{}\t{} attachment(s)\n", id, entry.attachments.size());
    return ok(out);
}

CommandResult handleWhoami(const CommandCall&) {
    const auto email = session(LAST_EMAIL_KEY);
    const auto id = session(LAST_ID_KEY);
    if (!email || !id) return ok("Not logged in\n");
    return ok(fmt::format("{} (assignee {})\n", *email, *id));
}

CommandResult handleReset(const CommandCall& call) {
    if (!hasFlag(call, std::vector<std::string>{"yes", "y"}))
        return invalid("Refusing to clear the workspace index without --yes");
    Deps::get().reconciler->reset();
    return ok("Workspace index cleared\n");
}

CommandResult handleConfig(const CommandCall&) {
    return ok(nlohmann::json(config::ConfigRegistry::get()).dump(2) + "\n");
}

}

void ts::shell::registerAllCommands(Router& router) {
    router.registerCommand({"login", "login <email>", "Resolve the assignee for <email> and fetch their open tickets", {}},
                           handleLogin);
    router.registerCommand({"fetch", "fetch", "Sync attachments of every open ticket of the stored assignee", {"sync"}},
                           handleFetch);
    router.registerCommand({"attachments", "attachments <ticketId>...", "Sync attachments of the given tickets", {"get"}},
                           handleAttachments);
    router.registerCommand({"remove", "remove <ticketId>...", "Remove tickets from the index and delete their folders", {"rm"}},
                           handleRemove);
    router.registerCommand({"scrub", "scrub", "Remove every indexed ticket that is solved or closed", {}},
                           handleScrub);
    router.registerCommand({"list", "list", "List indexed tickets", {"ls"}}, handleList);
    router.registerCommand({"whoami", "whoami", "Show the stored email and assignee id", {}}, handleWhoami);
    router.registerCommand({"reset", "reset --yes", "Clear the workspace index (files are kept)", {}}, handleReset);
    router.registerCommand({"config", "config", "Print the effective configuration", {}}, handleConfig);
    router.registerCommand({"help", "help", "Show this help", {"--help", "-h"}},
                           [&router](const CommandCall&) { return ok(router.renderHelp()); });
}
