#pragma once

#include <string>

namespace ink
{
// Returns the base configuration directory used by inkpager.
//
// $XDG_CONFIG_HOME/inkpager, else $HOME/.config/inkpager, else ".".
std::string GetInkConfigDir();

// Default configuration file: "<config_dir>/config.json".
std::string GetDefaultConfigPath();

// Returns `full_path` with a leading "<root>/" removed. Paths outside `root` are returned unchanged.
// Used for short, root-relative display names in the status line.
std::string StripRootPrefix(const std::string& full_path, const std::string& root);
} // namespace ink
