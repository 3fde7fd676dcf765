#pragma once

#include "pdf_outline/deadline.h"
#include "pdf_outline/document.h"
#include "pdf_outline/options.h"
#include "pdf_outline/outline_types.h"
#include <optional>

namespace pdf_outline {

// Tier 1: converts the embedded bookmark tree. Depth 1/2/>=3 map to H1/H2/H3,
// entries whose target does not resolve to a page are dropped.
class NativeOutlineExtractor {
public:
    explicit NativeOutlineExtractor(const ExtractOptions& options = ExtractOptions{});

    std::optional<TierOutcome> run(const Document& doc, const Deadline& deadline) const;

private:
    ExtractOptions options_;
};

} // namespace pdf_outline
