#pragma once

#include <string>
#include <vector>
#include <optional>

namespace pdf_outline {

enum class HeadingLevel {
    H1 = 1,
    H2 = 2,
    H3 = 3
};

// Which cascade tier produced a result
enum class SourceTier {
    NATIVE,
    HEURISTIC,
    REGEX
};

const char* level_name(HeadingLevel level);
const char* tier_name(SourceTier tier);

// Clamp a 1-based nesting depth (or component count) into H1..H3
HeadingLevel clamp_level(int depth);

struct HeadingCandidate {
    std::string text;
    int page = 1;               // 1-based
    HeadingLevel level = HeadingLevel::H1;
    SourceTier tier = SourceTier::REGEX;
    int rank = 0;               // lower is stronger
    float y = 0.0f;             // vertical position within the page
};

// Raw output of one tier attempt, before normalization
struct TierOutcome {
    SourceTier tier = SourceTier::REGEX;
    std::string title;
    std::vector<HeadingCandidate> candidates;
};

struct OutlineEntry {
    HeadingLevel level = HeadingLevel::H1;
    std::string text;
    int page = 1;

    bool operator==(const OutlineEntry& other) const {
        return level == other.level && text == other.text && page == other.page;
    }
    bool operator!=(const OutlineEntry& other) const { return !(*this == other); }
};

struct OutlineResult {
    std::string title;
    std::vector<OutlineEntry> outline;

    bool operator==(const OutlineResult& other) const {
        return title == other.title && outline == other.outline;
    }
    bool operator!=(const OutlineResult& other) const { return !(*this == other); }
};

} // namespace pdf_outline
