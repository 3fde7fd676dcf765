#include "pdf_outline/regex_classifier.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>
#include <iostream>
#include <regex>
#include <sstream>

namespace pdf_outline {

namespace {

struct RuleMatch {
    HeadingLevel level;
    int rule;
};

std::optional<RuleMatch> match_numbered(const std::string& line) {
    static const std::regex numbered("^(\\d{1,3}(?:\\.\\d{1,3})*)(\\.?)\\s+(\\S.*)$");

    std::smatch match;
    if (!std::regex_match(line, match, numbered)) {
        return std::nullopt;
    }

    std::string number = match[1].str();
    int components = static_cast<int>(std::count(number.begin(), number.end(), '.')) + 1;

    // A lone number needs its dot: "1 apple" is not a section
    if (components == 1 && match[2].length() == 0) {
        return std::nullopt;
    }
    // "3.5 10" is a table row, not a heading
    char first = match[3].str().front();
    if (first >= '0' && first <= '9') {
        return std::nullopt;
    }

    return RuleMatch{clamp_level(components), 1};
}

std::optional<RuleMatch> match_chapter(const std::string& line) {
    static const std::regex chapter(
        "^(chapter|part)\\s+(\\d+|[ivxlcdm]+|one|two|three|four|five|six|seven|eight|nine|ten|"
        "eleven|twelve|thirteen|fourteen|fifteen|sixteen|seventeen|eighteen|nineteen|twenty)\\b"
        "|^section\\s+\\d+",
        std::regex::icase);

    if (std::regex_search(line, chapter)) {
        return RuleMatch{HeadingLevel::H1, 2};
    }
    return std::nullopt;
}

std::optional<RuleMatch> match_caps(const std::string& line, size_t max_chars) {
    static const std::string trailing_punctuation = ".,;:!?";

    if (utf8_length(line) > max_chars || !is_upper_case_line(line)) {
        return std::nullopt;
    }
    if (trailing_punctuation.find(line.back()) != std::string::npos) {
        return std::nullopt;
    }
    return RuleMatch{HeadingLevel::H2, 3};
}

std::optional<RuleMatch> match_line(const std::string& line, const ExtractOptions& options) {
    if (line.empty() || utf8_length(line) > options.max_heading_chars) {
        return std::nullopt;
    }
    if (auto match = match_numbered(line)) return match;
    if (auto match = match_chapter(line)) return match;
    return match_caps(line, options.caps_max_chars);
}

} // namespace

RegexClassifier::RegexClassifier(const ExtractOptions& options) : options_(options) {}

bool RegexClassifier::is_leader_line(const std::string& line) {
    return line.find("....") != std::string::npos ||
           line.find(". . .") != std::string::npos ||
           line.find("\xE2\x80\xA6\xE2\x80\xA6") != std::string::npos;  // two ellipses
}

std::optional<HeadingLevel> RegexClassifier::classify_line(const std::string& line) const {
    if (auto match = match_line(line, options_)) {
        return match->level;
    }
    return std::nullopt;
}

TierOutcome RegexClassifier::run(const Document& doc, const Deadline& deadline) const {
    TierOutcome outcome;
    outcome.tier = SourceTier::REGEX;

    int last_page = doc.page_count();
    if (options_.max_pages > 0) {
        last_page = std::min(last_page, options_.max_pages);
    }

    bool title_found = false;

    for (int page = 1; page <= last_page; ++page) {
        if (deadline.expired()) {
            if (options_.verbose) {
                std::cout << "[RegexClassifier::run] Deadline expired, stopping at page "
                          << page << "/" << last_page << std::endl;
            }
            break;
        }

        std::istringstream stream(doc.plain_text(page));
        std::string raw_line;
        int line_number = 0;

        while (std::getline(stream, raw_line)) {
            std::string line = collapse_whitespace(raw_line);
            if (line.empty() || is_leader_line(line)) {
                continue;
            }
            line_number++;

            auto match = match_line(line, options_);
            if (!match) {
                if (page == 1 && !title_found) {
                    outcome.title = utf8_truncate(line, options_.max_title_chars);
                    title_found = true;
                }
                continue;
            }

            HeadingCandidate candidate;
            candidate.text = line;
            candidate.page = page;
            candidate.level = match->level;
            candidate.tier = SourceTier::REGEX;
            candidate.rank = match->rule;
            candidate.y = static_cast<float>(line_number);
            outcome.candidates.push_back(std::move(candidate));
        }
    }

    return outcome;
}

} // namespace pdf_outline
