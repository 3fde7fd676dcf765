#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace pdf_outline {

struct ExtractOptions {
    std::chrono::milliseconds budget{10000};
    int max_pages = 50;                 // pages scanned by tiers 2 and 3, 0 = all
    size_t max_heading_chars = 150;     // code points
    size_t max_title_chars = 100;
    size_t caps_max_chars = 60;
    int furniture_min_pages = 3;        // running header/footer threshold
    float furniture_y_tolerance = 2.0f; // points
    bool verbose = false;
};

struct BatchOptions {
    size_t thread_count = 0;            // 0 = hardware concurrency
    bool recursive = false;
    bool write_error_files = false;
    bool title_from_filename = true;
    ExtractOptions extract;
};

// Overlays the keys present in `config` onto `options`. Unknown keys are
// ignored, wrongly typed or out-of-range values throw std::invalid_argument.
void apply_config(const nlohmann::json& config, BatchOptions& options);

// Reads a JSON config file and overlays it onto `options`
void load_config_file(const std::string& path, BatchOptions& options);

} // namespace pdf_outline
