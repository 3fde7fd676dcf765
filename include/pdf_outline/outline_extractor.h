#pragma once

#include "pdf_outline/deadline.h"
#include "pdf_outline/document.h"
#include "pdf_outline/layout_analyzer.h"
#include "pdf_outline/native_outline_extractor.h"
#include "pdf_outline/options.h"
#include "pdf_outline/outline_types.h"
#include "pdf_outline/regex_classifier.h"
#include <chrono>

namespace pdf_outline {

struct ExtractionReport {
    OutlineResult result;
    SourceTier tier = SourceTier::REGEX;   // tier whose outcome was accepted
    double processing_time_ms = 0.0;
    bool deadline_expired = false;
};

// Runs the tier cascade: native outline, then layout heuristics, then the
// regex fallback, which always yields a result. Holds no per-call state, so
// one instance can serve any number of documents.
class OutlineExtractor {
public:
    explicit OutlineExtractor(const ExtractOptions& options = ExtractOptions{});

    // Uses options.budget
    OutlineResult extract(const Document& doc) const;
    OutlineResult extract(const Document& doc, std::chrono::milliseconds budget) const;

    ExtractionReport extract_with_report(const Document& doc, const Deadline& deadline) const;

    const ExtractOptions& options() const { return options_; }

private:
    ExtractOptions options_;
    NativeOutlineExtractor native_;
    LayoutAnalyzer layout_;
    RegexClassifier regex_;
};

// Single entry point: never fails, returns within `budget` plus one page of work
OutlineResult extract_outline(const Document& doc, std::chrono::milliseconds budget);

} // namespace pdf_outline
