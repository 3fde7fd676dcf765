#include "pdf_outline/layout_analyzer.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <regex>

namespace pdf_outline {

namespace {

bool worse_body_candidate(const std::pair<const FontSignature, size_t>& a,
                          const std::pair<const FontSignature, size_t>& b) {
    if (a.second != b.second) return a.second < b.second;
    if (a.first.size != b.first.size) return a.first.size > b.first.size;
    return a.first.bold && !b.first.bold;
}

std::vector<size_t> reading_order(const std::vector<TextSpan>& spans) {
    std::vector<size_t> order(spans.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&spans](size_t a, size_t b) {
        if (spans[a].page != spans[b].page) return spans[a].page < spans[b].page;
        return spans[a].y < spans[b].y;
    });
    return order;
}

// Normalizes span text in place and drops spans that end up empty
std::vector<TextSpan> clean_spans(std::vector<TextSpan> raw, int page) {
    std::vector<TextSpan> cleaned;
    cleaned.reserve(raw.size());
    for (auto& span : raw) {
        span.text = collapse_whitespace(span.text);
        if (span.text.empty()) continue;
        span.page = page;
        cleaned.push_back(std::move(span));
    }
    return cleaned;
}

} // namespace

FontSignature signature_of(const TextSpan& span) {
    FontSignature signature;
    signature.size = static_cast<int>(std::lround(span.font_size));
    signature.bold = span.bold;
    return signature;
}

LayoutAnalyzer::LayoutAnalyzer(const ExtractOptions& options) : options_(options) {}

std::optional<TierOutcome> LayoutAnalyzer::run(const Document& doc,
                                               const Deadline& deadline) const {
    if (deadline.expired()) {
        if (options_.verbose) {
            std::cout << "[LayoutAnalyzer::run] Deadline expired, skipping" << std::endl;
        }
        return std::nullopt;
    }

    int last_page = doc.page_count();
    if (options_.max_pages > 0) {
        last_page = std::min(last_page, options_.max_pages);
    }

    // Pass 1: gather spans and the signature histogram
    std::vector<TextSpan> spans;
    SignatureHistogram histogram;
    for (int page = 1; page <= last_page; ++page) {
        if (deadline.expired()) {
            if (options_.verbose) {
                std::cout << "[LayoutAnalyzer::run] Deadline expired, stopping scan at page "
                          << page << "/" << last_page << std::endl;
            }
            break;
        }
        for (auto& span : clean_spans(doc.spans(page), page)) {
            histogram[signature_of(span)]++;
            spans.push_back(std::move(span));
        }
    }

    if (histogram.size() < 2) {
        if (options_.verbose) {
            std::cout << "[LayoutAnalyzer::run] Fewer than two font signatures, no font signal" << std::endl;
        }
        return std::nullopt;
    }

    // Pass 2: rank signatures into levels
    auto ranking = rank_signatures(histogram);
    if (ranking.levels.empty()) {
        return std::nullopt;
    }

    // Pass 3: title and heading candidates in reading order
    auto furniture = find_running_furniture(spans);
    auto order = reading_order(spans);

    std::vector<size_t> page_one;
    for (size_t idx : order) {
        if (spans[idx].page == 1 && furniture.count(idx) == 0) {
            page_one.push_back(idx);
        }
    }

    TierOutcome outcome;
    outcome.tier = SourceTier::HEURISTIC;

    std::set<size_t> used;
    outcome.title = select_title(spans, page_one, ranking.body, used);

    // Index in `order` of the last span turned into a heading, for merging
    // headings that wrap onto a second line
    size_t last_heading_pos = order.size();

    for (size_t pos = 0; pos < order.size(); ++pos) {
        size_t idx = order[pos];
        if (furniture.count(idx) > 0 || used.count(idx) > 0) {
            continue;
        }

        const auto& span = spans[idx];
        auto signature = signature_of(span);
        auto level_it = std::find(ranking.levels.begin(), ranking.levels.end(), signature);
        if (level_it == ranking.levels.end()) {
            continue;
        }
        if (utf8_length(span.text) > options_.max_heading_chars || is_layout_artifact(span.text)) {
            continue;
        }

        int level_index = static_cast<int>(level_it - ranking.levels.begin());

        if (last_heading_pos + 1 == pos && !outcome.candidates.empty()) {
            auto& previous = outcome.candidates.back();
            bool same_block = previous.page == span.page &&
                              previous.rank == level_index &&
                              span.y - previous.y <= span.font_size * 1.5f;
            std::string joined = previous.text + " " + span.text;
            if (same_block && utf8_length(joined) <= options_.max_heading_chars) {
                previous.text = std::move(joined);
                previous.y = span.y;
                last_heading_pos = pos;
                continue;
            }
        }

        HeadingCandidate candidate;
        candidate.text = span.text;
        candidate.page = span.page;
        candidate.level = clamp_level(level_index + 1);
        candidate.tier = SourceTier::HEURISTIC;
        candidate.rank = level_index;
        candidate.y = span.y;
        outcome.candidates.push_back(std::move(candidate));
        last_heading_pos = pos;
    }

    if (outcome.candidates.empty()) {
        if (options_.verbose) {
            std::cout << "[LayoutAnalyzer::run] No span qualified as a heading" << std::endl;
        }
        return std::nullopt;
    }

    return outcome;
}

std::string LayoutAnalyzer::title_from_first_page(const Document& doc) const {
    if (doc.page_count() < 1) {
        return {};
    }

    auto spans = clean_spans(doc.spans(1), 1);
    SignatureHistogram histogram;
    for (const auto& span : spans) {
        histogram[signature_of(span)]++;
    }
    if (histogram.size() < 2) {
        return {};
    }

    auto ranking = rank_signatures(histogram);
    auto page_one = reading_order(spans);
    std::set<size_t> used;
    return select_title(spans, page_one, ranking.body, used);
}

SignatureRanking LayoutAnalyzer::rank_signatures(const SignatureHistogram& histogram) {
    SignatureRanking ranking;
    if (histogram.empty()) {
        return ranking;
    }

    auto body_it = std::max_element(histogram.begin(), histogram.end(), worse_body_candidate);
    const FontSignature body = body_it->first;
    ranking.body = body;

    std::vector<std::pair<FontSignature, size_t>> ranked;
    for (const auto& [signature, count] : histogram) {
        if (signature == body) continue;

        // Only styles that stand out from body text can carry headings
        bool larger = signature.size > body.size;
        bool emphasized = signature.size == body.size && signature.bold && !body.bold;
        if (larger || emphasized) {
            ranked.emplace_back(signature, count);
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first.size != b.first.size) return a.first.size > b.first.size;
        if (a.second != b.second) return a.second < b.second;
        return a.first.bold && !b.first.bold;
    });

    for (size_t i = 0; i < ranked.size() && i < 3; ++i) {
        ranking.levels.push_back(ranked[i].first);
    }

    return ranking;
}

std::set<size_t> LayoutAnalyzer::find_running_furniture(const std::vector<TextSpan>& spans) const {
    std::set<size_t> furniture;
    if (options_.furniture_min_pages < 2) {
        return furniture;
    }

    float tolerance = std::max(options_.furniture_y_tolerance, 0.5f);
    auto bucket_of = [tolerance](float y) { return std::lround(y / tolerance); };

    std::map<std::string, std::map<long, std::set<int>>> occurrences;
    for (const auto& span : spans) {
        occurrences[span.text][bucket_of(span.y)].insert(span.page);
    }

    for (size_t i = 0; i < spans.size(); ++i) {
        const auto& by_bucket = occurrences[spans[i].text];
        long bucket = bucket_of(spans[i].y);

        std::set<int> pages;
        for (long b = bucket - 1; b <= bucket + 1; ++b) {
            auto it = by_bucket.find(b);
            if (it != by_bucket.end()) {
                pages.insert(it->second.begin(), it->second.end());
            }
        }
        if (static_cast<int>(pages.size()) >= options_.furniture_min_pages) {
            furniture.insert(i);
        }
    }

    return furniture;
}

bool LayoutAnalyzer::is_layout_artifact(const std::string& text) {
    static const std::regex page_number("^[-\\s]*\\d+[-\\s]*$");
    static const std::regex roman_page_number("^[ivxlcdm]+$");
    static const std::regex page_label("^page\\s+\\d+(\\s+of\\s+\\d+)?$", std::regex::icase);
    static const std::regex link("(https?://|www\\.)", std::regex::icase);
    static const std::regex email("\\S+@\\S+\\.\\S+");
    static const std::regex legal("(copyright|all rights reserved)", std::regex::icase);

    // std::regex backtracks recursively; paragraph-sized input never reaches it
    if (text.size() > max_artifact_bytes) {
        return false;
    }

    if (std::regex_match(text, page_number) || std::regex_match(text, roman_page_number) ||
        std::regex_match(text, page_label)) {
        return true;
    }
    if (std::regex_search(text, link) || std::regex_search(text, legal)) {
        return true;
    }
    if (text.find('@') != std::string::npos && std::regex_search(text, email)) {
        return true;
    }
    return text.find("\xC2\xA9") != std::string::npos;  // (c) sign
}

bool LayoutAnalyzer::is_title_candidate(const TextSpan& span) const {
    return utf8_length(span.text) <= options_.max_heading_chars && !is_layout_artifact(span.text);
}

std::string LayoutAnalyzer::select_title(const std::vector<TextSpan>& spans,
                                         const std::vector<size_t>& page_one,
                                         const std::optional<FontSignature>& body,
                                         std::set<size_t>& used) const {
    int max_size = 0;
    bool found = false;
    for (size_t idx : page_one) {
        if (!is_title_candidate(spans[idx])) continue;
        max_size = std::max(max_size, signature_of(spans[idx]).size);
        found = true;
    }
    if (!found || (body && max_size <= body->size)) {
        return {};
    }

    size_t start = page_one.size();
    for (size_t pos = 0; pos < page_one.size(); ++pos) {
        const auto& span = spans[page_one[pos]];
        if (signature_of(span).size == max_size && is_title_candidate(span)) {
            start = pos;
            break;
        }
    }

    const FontSignature title_signature = signature_of(spans[page_one[start]]);
    std::string title = spans[page_one[start]].text;
    used.insert(page_one[start]);

    // A title set over several lines keeps the same style throughout
    for (size_t pos = start + 1; pos < page_one.size(); ++pos) {
        size_t idx = page_one[pos];
        if (!(signature_of(spans[idx]) == title_signature)) {
            break;
        }
        std::string joined = title + " " + spans[idx].text;
        if (utf8_length(joined) > options_.max_title_chars) {
            break;
        }
        title = std::move(joined);
        used.insert(idx);
    }

    return utf8_truncate(title, options_.max_title_chars);
}

} // namespace pdf_outline
