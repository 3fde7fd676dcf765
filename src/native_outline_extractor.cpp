#include "pdf_outline/native_outline_extractor.h"
#include "pdf_outline/layout_analyzer.h"
#include "pdf_outline/text_utils.h"
#include <iostream>
#include <utility>
#include <vector>

namespace pdf_outline {

NativeOutlineExtractor::NativeOutlineExtractor(const ExtractOptions& options)
    : options_(options) {}

std::optional<TierOutcome> NativeOutlineExtractor::run(const Document& doc,
                                                       const Deadline& deadline) const {
    if (deadline.expired()) {
        if (options_.verbose) {
            std::cout << "[NativeOutlineExtractor::run] Deadline expired, skipping" << std::endl;
        }
        return std::nullopt;
    }

    auto tree = doc.native_outline();
    if (tree.empty()) {
        return std::nullopt;
    }

    TierOutcome outcome;
    outcome.tier = SourceTier::NATIVE;

    // Pre-order walk with an explicit stack; deep bookmark trees are common in
    // generated PDFs and hostile ones can be arbitrarily deep.
    std::vector<std::pair<const NativeOutlineNode*, int>> stack;
    for (auto it = tree.rbegin(); it != tree.rend(); ++it) {
        stack.emplace_back(&*it, 1);
    }

    int dropped = 0;
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.emplace_back(&*it, depth + 1);
        }

        std::string text = strip_chars(collapse_whitespace(node->title), " .,;:");
        if (!node->page || text.empty() || utf8_length(text) > options_.max_heading_chars) {
            dropped++;
            continue;
        }

        HeadingCandidate candidate;
        candidate.text = std::move(text);
        candidate.page = *node->page;
        candidate.level = clamp_level(depth);
        candidate.tier = SourceTier::NATIVE;
        candidate.rank = depth;
        outcome.candidates.push_back(std::move(candidate));
    }

    if (options_.verbose && dropped > 0) {
        std::cout << "[NativeOutlineExtractor::run] Dropped " << dropped
                  << " bookmarks without a usable title or page" << std::endl;
    }

    if (outcome.candidates.empty()) {
        return std::nullopt;
    }

    outcome.title = trim(doc.metadata_title());
    if (outcome.title.empty() && !deadline.expired()) {
        // Heading analysis is not needed here, only the page-one title rule
        LayoutAnalyzer analyzer(options_);
        outcome.title = analyzer.title_from_first_page(doc);
    }

    return outcome;
}

} // namespace pdf_outline
