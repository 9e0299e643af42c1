#include "cli_options.hpp"

#include <cerrno>
#include <cstdlib>

namespace bridge {

bool parse_int_in_range(const std::string& text, long min_value, long max_value, int& out) {
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    if (value < min_value || value > max_value) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace bridge
