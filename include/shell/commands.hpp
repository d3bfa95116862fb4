#pragma once

namespace ts::shell {

class Router;

// Session keys kept next to the workspace index
inline constexpr const auto* LAST_EMAIL_KEY = "lastEmailUsed";
inline constexpr const auto* LAST_ID_KEY = "lastIDUsed";

// Commands resolve their collaborators from runtime::Deps and settings from config::ConfigRegistry.
void registerAllCommands(Router& router);

}
