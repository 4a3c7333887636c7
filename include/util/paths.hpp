#pragma once

#include <filesystem>

namespace hs::paths {

// Resolve the config file: explicit argument, $HARBORSYNC_CONFIG, $XDG_CONFIG_HOME, ~/.config
std::filesystem::path getConfigPath(const std::filesystem::path& override = {});

std::filesystem::path getStateDir();
std::filesystem::path getDefaultPidFile();
std::filesystem::path getDefaultActivityLog();

std::filesystem::path getHome();

// "~" and "~/x" expand to $HOME; everything else is returned untouched
std::filesystem::path expandHome(const std::filesystem::path& p);

// Path of the running executable, used to re-exec the daemon entry
std::filesystem::path getSelfExe();

}
