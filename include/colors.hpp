#pragma once

#include <string>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[31m";     // For errors and failed checks
    const std::string YELLOW = "\033[33m";  // For questions and warnings
    const std::string GREEN = "\033[32m";   // For feedback
    const std::string BLUE = "\033[34m";    // For commit hash
    const std::string CYAN = "\033[36m";    // For section headers
}
