#pragma once

#include <string>

namespace mwetag {

// Map aliases ("pt", "PT", "Portuguese") to the registry key ("portuguese").
// Unknown identifiers are returned lowercased.
std::string canonical_language(const std::string& language);

bool is_portuguese(const std::string& language);

} // namespace mwetag
