#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"
#include "runtime/Deps.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"

#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace ts;
using namespace ts::config;

namespace {

// Pulls the global --config option out of argv before command routing.
std::optional<std::string> takeConfigOption(std::vector<std::string>& args) {
    std::optional<std::string> path;

    for (auto it = args.begin(); it != args.end();) {
        if ((*it == "--config" || *it == "-c") && std::next(it) != args.end()) {
            path = *std::next(it);
            it = args.erase(it, std::next(it, 2));
        } else if (it->rfind("--config=", 0) == 0) {
            path = it->substr(9);
            it = args.erase(it);
        } else if (*it == "--") break;
        else ++it;
    }

    return path;
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        if (const auto cfgPath = takeConfigOption(args)) paths::setConfigPath(*cfgPath);
        ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        runtime::Deps::init(ConfigRegistry::get());

        shell::Router router;
        shell::registerAllCommands(router);

        const auto res = router.execute(args);
        if (!res.stdout_text.empty()) std::cout << res.stdout_text << std::flush;
        if (!res.stderr_text.empty()) std::cerr << res.stderr_text << std::endl;
        return res.exit_code;
    } catch (const std::exception& e) {
        log::Registry::ticketsync()->error("[main] {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
