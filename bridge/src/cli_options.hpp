#pragma once

#include <string>

namespace bridge {

/// Parse a base-10 integer in [min_value, max_value]. Rejects trailing text and overflow.
bool parse_int_in_range(const std::string& text, long min_value, long max_value, int& out);

} // namespace bridge
