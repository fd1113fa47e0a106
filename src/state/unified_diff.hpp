#pragma once
#include <string>

namespace tollgate {

// Render original -> proposed as a unified diff with `a/name` and
// `b/name` headers. Returns an empty string when the texts are equal.
std::string unified_diff(const std::string& original, const std::string& proposed,
                         const std::string& name, size_t context = 3);

} // namespace tollgate
