#pragma once

#include "pdf_outline/outline_types.h"
#include <optional>
#include <vector>

namespace pdf_outline {

// Turns the winning tier's raw outcome into the final OutlineResult. No PDF
// access happens here.
class OutlineAssembler {
public:
    // First engaged attempt wins. An empty result if none is engaged.
    static OutlineResult select(const std::vector<std::optional<TierOutcome>>& attempts);

    // Trims and collapses whitespace in title and headings, drops headings
    // left empty, and removes immediately repeated (level, text, page) entries
    static OutlineResult assemble(const TierOutcome& outcome);
};

} // namespace pdf_outline
