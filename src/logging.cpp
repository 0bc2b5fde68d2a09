#include "logging.hpp"
#include <iostream>

namespace vadseg {
// Event JSON owns stdout in the replay tool, so every level goes to stderr.
void log_info(const std::string& msg) { std::cerr << "[INFO] " << msg << std::endl; }
void log_warn(const std::string& msg) { std::cerr << "[WARN] " << msg << std::endl; }
void log_error(const std::string& msg) { std::cerr << "[ERROR] " << msg << std::endl; }
}
