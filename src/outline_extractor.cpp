#include "pdf_outline/outline_extractor.h"
#include "pdf_outline/outline_assembler.h"
#include <iostream>

namespace pdf_outline {

OutlineExtractor::OutlineExtractor(const ExtractOptions& options)
    : options_(options),
      native_(options),
      layout_(options),
      regex_(options) {}

OutlineResult OutlineExtractor::extract(const Document& doc) const {
    return extract(doc, options_.budget);
}

OutlineResult OutlineExtractor::extract(const Document& doc, std::chrono::milliseconds budget) const {
    auto deadline = Deadline::start(budget);
    return extract_with_report(doc, deadline).result;
}

ExtractionReport OutlineExtractor::extract_with_report(const Document& doc,
                                                       const Deadline& deadline) const {
    // Each tier only runs when every tier before it came back empty; the
    // regex tier always produces an outcome, so the last attempt is engaged.
    std::vector<std::optional<TierOutcome>> attempts;

    attempts.push_back(native_.run(doc, deadline));
    if (!attempts.back()) {
        attempts.push_back(layout_.run(doc, deadline));
    }
    if (!attempts.back()) {
        attempts.push_back(regex_.run(doc, deadline));
    }

    ExtractionReport report;
    report.tier = attempts.back()->tier;
    report.result = OutlineAssembler::select(attempts);
    report.deadline_expired = deadline.expired();
    report.processing_time_ms =
        std::chrono::duration<double, std::milli>(deadline.elapsed()).count();

    if (options_.verbose) {
        std::cout << "[OutlineExtractor::extract] " << tier_name(report.tier)
                  << " tier accepted with " << report.result.outline.size()
                  << " headings in " << report.processing_time_ms << " ms (budget "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(deadline.budget()).count()
                  << " ms)" << std::endl;
        if (report.deadline_expired) {
            std::cout << "[OutlineExtractor::extract] Time budget exhausted, result may be partial"
                      << std::endl;
        }
    }

    return report;
}

OutlineResult extract_outline(const Document& doc, std::chrono::milliseconds budget) {
    ExtractOptions options;
    options.budget = budget;
    return OutlineExtractor(options).extract(doc);
}

} // namespace pdf_outline
