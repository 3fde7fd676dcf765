#include "pdf_outline/options.h"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace pdf_outline {

namespace {

template <typename T>
T read_value(const nlohmann::json& config, const char* key) {
    try {
        return config.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

int read_non_negative(const nlohmann::json& config, const char* key) {
    const auto& value = config.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be an integer");
    }
    if (!value.is_number_unsigned() && value.get<long long>() < 0) {
        throw std::invalid_argument(std::string("config key '") + key + "' cannot be negative");
    }
    auto number = value.get<unsigned long long>();
    if (number > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string("config key '") + key + "' is too large");
    }
    return static_cast<int>(number);
}

int read_positive(const nlohmann::json& config, const char* key) {
    int number = read_non_negative(config, key);
    if (number == 0) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be positive");
    }
    return number;
}

} // namespace

void apply_config(const nlohmann::json& config, BatchOptions& options) {
    if (!config.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    auto& extract = options.extract;

    if (config.contains("budget_ms")) {
        extract.budget = std::chrono::milliseconds(read_non_negative(config, "budget_ms"));
    }
    if (config.contains("max_pages")) {
        extract.max_pages = read_non_negative(config, "max_pages");
    }
    if (config.contains("max_heading_chars")) {
        extract.max_heading_chars = read_positive(config, "max_heading_chars");
    }
    if (config.contains("max_title_chars")) {
        extract.max_title_chars = read_positive(config, "max_title_chars");
    }
    if (config.contains("caps_max_chars")) {
        extract.caps_max_chars = read_positive(config, "caps_max_chars");
    }
    if (config.contains("furniture_min_pages")) {
        extract.furniture_min_pages = read_positive(config, "furniture_min_pages");
    }
    if (config.contains("furniture_y_tolerance")) {
        auto tolerance = read_value<float>(config, "furniture_y_tolerance");
        if (tolerance < 0.0f) {
            throw std::invalid_argument("config key 'furniture_y_tolerance' cannot be negative");
        }
        extract.furniture_y_tolerance = tolerance;
    }
    if (config.contains("verbose")) {
        extract.verbose = read_value<bool>(config, "verbose");
    }

    if (config.contains("threads")) {
        options.thread_count = read_non_negative(config, "threads");
    }
    if (config.contains("recursive")) {
        options.recursive = read_value<bool>(config, "recursive");
    }
    if (config.contains("write_error_files")) {
        options.write_error_files = read_value<bool>(config, "write_error_files");
    }
    if (config.contains("title_from_filename")) {
        options.title_from_filename = read_value<bool>(config, "title_from_filename");
    }
}

void load_config_file(const std::string& path, BatchOptions& options) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }

    nlohmann::json config;
    try {
        in >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Malformed config file " + path + ": " + e.what());
    }

    apply_config(config, options);
}

} // namespace pdf_outline
