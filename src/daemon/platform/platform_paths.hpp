#pragma once

#include <string>

namespace platform {

// Per-user directories for voicescribe. Empty when no home can be determined.
std::string config_dir();
std::string data_dir();

// Directory for scratch artifacts (downloaded audio, rendered documents).
std::string scratch_dir();

} // namespace platform
