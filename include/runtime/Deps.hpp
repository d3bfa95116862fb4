#pragma once

#include <memory>

namespace ts::config { struct Config; }
namespace ts::http { class Transport; }
namespace ts::index { class Store; class Reconciler; }
namespace ts::ticketing { class Client; }
namespace ts::archive { class Expander; }
namespace ts::sync { class Downloader; class AttachmentSync; }

namespace ts::runtime {

struct Deps {
    std::shared_ptr<index::Store> store;
    std::shared_ptr<index::Reconciler> reconciler;
    std::shared_ptr<http::Transport> transport;         // null without credentials
    std::shared_ptr<ticketing::Client> client;          // null without credentials
    std::shared_ptr<archive::Expander> expander;
    std::shared_ptr<sync::Downloader> downloader;       // null without credentials
    std::shared_ptr<sync::AttachmentSync> attachmentSync; // null without credentials

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;

    static Deps& get();

    // Builds the production graph: JSON state file, libcurl transport, Zendesk client.
    static void init(const config::Config& cfg);

    // Same graph around caller-supplied collaborators. transport/client may be null.
    static void init(const config::Config& cfg,
                     std::shared_ptr<index::Store> store,
                     std::shared_ptr<http::Transport> transport,
                     std::shared_ptr<ticketing::Client> client);

    [[nodiscard]] static bool isInitialized();

    static void reset();

private:
    Deps() = default;  // private ctor
};

}
