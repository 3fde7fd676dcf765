#include "pdf_outline/outline_types.h"

namespace pdf_outline {

const char* level_name(HeadingLevel level) {
    switch (level) {
        case HeadingLevel::H1: return "H1";
        case HeadingLevel::H2: return "H2";
        case HeadingLevel::H3: return "H3";
    }
    return "H3";
}

const char* tier_name(SourceTier tier) {
    switch (tier) {
        case SourceTier::NATIVE: return "native";
        case SourceTier::HEURISTIC: return "heuristic";
        case SourceTier::REGEX: return "regex";
    }
    return "regex";
}

HeadingLevel clamp_level(int depth) {
    if (depth <= 1) return HeadingLevel::H1;
    if (depth == 2) return HeadingLevel::H2;
    return HeadingLevel::H3;
}

} // namespace pdf_outline
