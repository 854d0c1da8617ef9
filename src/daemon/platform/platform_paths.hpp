#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/voice-daemon, or ~/.config/voice-daemon. Empty if neither is set.
std::string config_dir();

// $XDG_DATA_HOME/voice-daemon, or ~/.local/share/voice-daemon. Empty if neither is set.
std::string data_dir();

// $TMPDIR, or /tmp.
std::string temp_dir();

} // namespace platform
