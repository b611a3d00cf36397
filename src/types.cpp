#include "mwetag/types.h"
#include "mwetag/unicode_utils.h"

namespace mwetag {

std::string to_string(MweType type) {
    switch (type) {
        case MweType::Fixed: return "fixed";
        case MweType::Flat: return "flat";
        case MweType::Compound: return "compound";
        case MweType::Other: return "other";
    }
    return "other";
}

MweType parse_mwe_type(const std::string& label) {
    std::string lower = unicode::to_lower(label);
    if (lower.empty() || lower == "fixed") return MweType::Fixed;
    if (lower == "flat") return MweType::Flat;
    if (lower == "compound") return MweType::Compound;
    return MweType::Other;
}

} // namespace mwetag
