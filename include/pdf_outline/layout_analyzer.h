#pragma once

#include "pdf_outline/deadline.h"
#include "pdf_outline/document.h"
#include "pdf_outline/options.h"
#include "pdf_outline/outline_types.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pdf_outline {

// Clustering key for spans: rounded size plus weight
struct FontSignature {
    int size = 0;
    bool bold = false;

    bool operator<(const FontSignature& other) const {
        if (size != other.size) return size < other.size;
        return bold < other.bold;
    }
    bool operator==(const FontSignature& other) const {
        return size == other.size && bold == other.bold;
    }
};

FontSignature signature_of(const TextSpan& span);

using SignatureHistogram = std::map<FontSignature, size_t>;

// Result of ranking the signatures of a document
struct SignatureRanking {
    std::optional<FontSignature> body;      // most frequent signature
    std::vector<FontSignature> levels;      // levels[0] -> H1, at most three
};

// Tier 2: infers heading levels from font size and weight.
//
// The body text signature is the most frequent one. Of the remaining styles
// that stand out from it, the three largest become H1/H2/H3. Running headers
// and footers, bare page numbers and URLs never count as headings. This is a
// best-effort policy; near-uniform documents can misclassify.
class LayoutAnalyzer {
public:
    explicit LayoutAnalyzer(const ExtractOptions& options = ExtractOptions{});

    std::optional<TierOutcome> run(const Document& doc, const Deadline& deadline) const;

    // Title rule applied to page 1 alone, body size estimated from that page
    std::string title_from_first_page(const Document& doc) const;

    static SignatureRanking rank_signatures(const SignatureHistogram& histogram);

    // Indices of spans repeated at the same height on enough pages
    std::set<size_t> find_running_furniture(const std::vector<TextSpan>& spans) const;

    // Text longer than max_artifact_bytes is never reported as an artifact
    static bool is_layout_artifact(const std::string& text);

    static constexpr size_t max_artifact_bytes = 600;

private:
    // Short enough to be a title line and not page furniture text
    bool is_title_candidate(const TextSpan& span) const;

    // Picks the title among page-one spans (given in reading order) and
    // returns the indices it consumed through `used`
    std::string select_title(const std::vector<TextSpan>& spans,
                             const std::vector<size_t>& page_one,
                             const std::optional<FontSignature>& body,
                             std::set<size_t>& used) const;

    ExtractOptions options_;
};

} // namespace pdf_outline
