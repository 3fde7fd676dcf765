#pragma once

#include "pdf_outline/deadline.h"
#include "pdf_outline/document.h"
#include "pdf_outline/options.h"
#include "pdf_outline/outline_types.h"
#include <optional>
#include <string>

namespace pdf_outline {

// Tier 3: line-based classification of raw page text. Always produces an
// outcome, possibly with no candidates.
//
// Rules, first match wins:
//   1. "1." / "1.2" / "1.2.3 ..." numbering  -> one level per component
//   2. "Chapter 4", "Part II", "Section 3"    -> H1
//   3. short all-caps line                    -> H2
class RegexClassifier {
public:
    explicit RegexClassifier(const ExtractOptions& options = ExtractOptions{});

    TierOutcome run(const Document& doc, const Deadline& deadline) const;

    // Level for a single trimmed line, or nullopt when no rule matches
    std::optional<HeadingLevel> classify_line(const std::string& line) const;

    static bool is_leader_line(const std::string& line);

private:
    ExtractOptions options_;
};

} // namespace pdf_outline
