#pragma once
#include <string>

namespace msgstream {

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace msgstream
