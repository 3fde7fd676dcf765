#include "pdf_outline/outline_assembler.h"
#include "pdf_outline/text_utils.h"

namespace pdf_outline {

OutlineResult OutlineAssembler::select(const std::vector<std::optional<TierOutcome>>& attempts) {
    for (const auto& attempt : attempts) {
        if (attempt) {
            return assemble(*attempt);
        }
    }
    return OutlineResult{};
}

OutlineResult OutlineAssembler::assemble(const TierOutcome& outcome) {
    OutlineResult result;
    result.title = collapse_whitespace(outcome.title);
    result.outline.reserve(outcome.candidates.size());

    for (const auto& candidate : outcome.candidates) {
        OutlineEntry entry;
        entry.level = candidate.level;
        entry.text = collapse_whitespace(candidate.text);
        entry.page = candidate.page;

        if (entry.text.empty()) {
            continue;
        }
        if (!result.outline.empty() && result.outline.back() == entry) {
            continue;
        }
        result.outline.push_back(std::move(entry));
    }

    return result;
}

} // namespace pdf_outline
