#pragma once

#include "cli/Router.hpp"

namespace hs::config { struct Config; }

namespace hs::cli {

void registerCommands(Router& router);

// Load the config named by --config (or the default path) and bring up logging
const config::Config& bootstrap(const CommandCall& call);

}
