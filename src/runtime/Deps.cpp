#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "http/CurlTransport.hpp"
#include "index/JsonFileStore.hpp"
#include "index/Reconciler.hpp"
#include "archive/Expander.hpp"
#include "archive/ZipArchive.hpp"
#include "sync/Downloader.hpp"
#include "sync/AttachmentSync.hpp"
#include "ticketing/ZendeskClient.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ts::runtime;

Deps& Deps::get() {
    static Deps instance_;
    return instance_;
}

bool Deps::isInitialized() {
    return static_cast<bool>(get().reconciler);
}

void Deps::init(const config::Config& cfg) {
    std::shared_ptr<http::Transport> transport;
    std::shared_ptr<ticketing::Client> client;

    if (cfg.zendesk.hasCredentials()) {
        transport = std::make_shared<http::CurlTransport>(
            http::BasicCredentials{fmt::format("{}/token", cfg.zendesk.email), cfg.zendesk.api_token},
            static_cast<long>(cfg.zendesk.timeout_seconds));
        client = std::make_shared<ticketing::ZendeskClient>(transport, cfg.zendesk.subdomain, cfg.sync.status_batch_size);
    } else log::Registry::ticketsync()->debug("[Deps] Zendesk credentials not configured; remote commands disabled");

    init(cfg, std::make_shared<index::JsonFileStore>(cfg.storage.state_file), transport, client);
}

void Deps::init(const config::Config& cfg,
                std::shared_ptr<index::Store> store,
                std::shared_ptr<http::Transport> transport,
                std::shared_ptr<ticketing::Client> client) {
    if (isInitialized()) {
        log::Registry::ticketsync()->warn("[Deps] Already initialized, ignoring second init()");
        return;
    }

    log::Registry::ticketsync()->debug("[Deps] Initializing...");

    auto& ctx = get();
    ctx.store = std::move(store);
    ctx.reconciler = std::make_shared<index::Reconciler>(ctx.store, cfg.storage.ticketsRoot());
    ctx.expander = std::make_shared<archive::Expander>(archive::ZipArchive::open, cfg.sync.archive_extension);
    ctx.transport = std::move(transport);
    ctx.client = std::move(client);

    if (ctx.transport && ctx.client) {
        ctx.downloader = std::make_shared<sync::Downloader>(ctx.transport);
        ctx.attachmentSync = std::make_shared<sync::AttachmentSync>(ctx.client, ctx.downloader, ctx.expander, ctx.reconciler);
    }

    log::Registry::ticketsync()->debug("[Deps] Initialized.");
}

void Deps::reset() {
    auto& ctx = get();
    ctx.attachmentSync.reset();
    ctx.downloader.reset();
    ctx.expander.reset();
    ctx.client.reset();
    ctx.transport.reset();
    ctx.reconciler.reset();
    ctx.store.reset();
}
