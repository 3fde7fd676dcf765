#include "pdf_outline/batch_processor.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/json_writer.h"
#include "pdf_outline/mupdf_document.h"
#include "pdf_outline/outline_extractor.h"
#include "pdf_outline/thread_pool.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>

namespace pdf_outline {

namespace fs = std::filesystem;

class BatchProcessor::Impl {
public:
    Impl(const BatchOptions& options, DocumentOpener opener)
        : options_(options),
          opener_(std::move(opener)),
          extractor_(options.extract) {
        if (!opener_) {
            opener_ = [](const std::string& path) -> std::unique_ptr<Document> {
                return MupdfDocument::open(path);
            };
        }
        stats_["documents_processed"] = 0;
        stats_["documents_failed"] = 0;
        stats_["native"] = 0;
        stats_["heuristic"] = 0;
        stats_["regex"] = 0;
        stats_["total_processing_time_ms"] = 0.0;
    }

    DocumentReport process_file(const std::string& pdf_path) {
        DocumentReport report = run_file(pdf_path);
        record(report);
        return report;
    }

    // Extraction only; stats are recorded by the caller once the outcome is final
    DocumentReport run_file(const std::string& pdf_path) {
        DocumentReport report;
        report.pdf_path = pdf_path;

        auto start_time = std::chrono::steady_clock::now();

        try {
            auto doc = opener_(pdf_path);
            auto deadline = Deadline::start(options_.extract.budget);
            auto extraction = extractor_.extract_with_report(*doc, deadline);

            if (extraction.result.title.empty() && options_.title_from_filename) {
                extraction.result.title = fs::path(pdf_path).stem().string();
            }

            report.result = std::move(extraction.result);
            report.tier = extraction.tier;
            report.deadline_expired = extraction.deadline_expired;
        } catch (const UnreadablePdf& e) {
            report.error = e.what();
        } catch (const std::exception& e) {
            report.error = std::string("Extraction failed: ") + e.what();
        }

        auto end_time = std::chrono::steady_clock::now();
        report.processing_time_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();

        return report;
    }

    std::vector<DocumentReport> process_files(const std::vector<std::string>& pdf_paths,
                                              const std::string& output_dir,
                                              ProgressCallback progress) {
        fs::create_directories(output_dir);

        ThreadPool pool(options_.thread_count);
        std::vector<std::future<DocumentReport>> futures;
        futures.reserve(pdf_paths.size());

        for (const auto& path : pdf_paths) {
            futures.push_back(pool.enqueue([this, path]() {
                return run_file(path);
            }));
        }

        // Output files are written from this thread only
        std::vector<DocumentReport> reports;
        reports.reserve(pdf_paths.size());
        size_t completed = 0;

        for (auto& future : futures) {
            DocumentReport report = future.get();
            write_output(report, output_dir);
            record(report);
            reports.push_back(std::move(report));

            completed++;
            if (progress) {
                progress(completed, pdf_paths.size());
            }
        }

        return reports;
    }

    bool recursive() const {
        return options_.recursive;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        auto processed = stats["documents_processed"].get<int>();
        if (processed > 0) {
            stats["average_processing_time_ms"] =
                stats["total_processing_time_ms"].get<double>() / processed;
        }
        return stats;
    }

private:
    void record(const DocumentReport& report) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (report.success()) {
            stats_["documents_processed"] = stats_["documents_processed"].get<int>() + 1;
            const char* tier = tier_name(report.tier);
            stats_[tier] = stats_[tier].get<int>() + 1;
        } else {
            stats_["documents_failed"] = stats_["documents_failed"].get<int>() + 1;
        }
        stats_["total_processing_time_ms"] =
            stats_["total_processing_time_ms"].get<double>() + report.processing_time_ms;
    }

    void write_output(DocumentReport& report, const std::string& output_dir) {
        auto stem = fs::path(report.pdf_path).stem().string();

        if (report.success()) {
            auto output_path = (fs::path(output_dir) / (stem + ".json")).string();
            try {
                write_text_file(output_path, outline_to_json(*report.result));
                report.output_path = output_path;
                return;
            } catch (const std::runtime_error& e) {
                report.error = e.what();
                report.result.reset();
            }
        }

        std::cerr << "[BatchProcessor::process] Failed " << report.pdf_path << ": "
                  << report.error << std::endl;

        if (options_.write_error_files) {
            auto output_path = (fs::path(output_dir) / (stem + ".error.json")).string();
            try {
                write_text_file(output_path, error_to_json(report.pdf_path, report.error));
                report.output_path = output_path;
            } catch (const std::runtime_error& e) {
                std::cerr << "[BatchProcessor::process] " << e.what() << std::endl;
            }
        }
    }

    BatchOptions options_;
    DocumentOpener opener_;
    OutlineExtractor extractor_;

    mutable std::mutex stats_mutex_;
    nlohmann::json stats_;
};

BatchProcessor::BatchProcessor(const BatchOptions& options, DocumentOpener opener)
    : pImpl(std::make_unique<Impl>(options, std::move(opener))) {}

BatchProcessor::~BatchProcessor() = default;

std::vector<std::string> BatchProcessor::collect_pdfs(const std::string& input_dir, bool recursive) {
    std::vector<std::string> pdf_files;

    auto consider = [&pdf_files](const fs::directory_entry& entry) {
        if (!entry.is_regular_file()) return;
        auto ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        if (ext == ".pdf") {
            pdf_files.push_back(entry.path().string());
        }
    };

    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(input_dir)) {
            consider(entry);
        }
    } else {
        for (const auto& entry : fs::directory_iterator(input_dir)) {
            consider(entry);
        }
    }

    std::sort(pdf_files.begin(), pdf_files.end());
    return pdf_files;
}

DocumentReport BatchProcessor::process_file(const std::string& pdf_path) {
    return pImpl->process_file(pdf_path);
}

std::vector<DocumentReport> BatchProcessor::process_files(const std::vector<std::string>& pdf_paths,
                                                          const std::string& output_dir,
                                                          ProgressCallback progress) {
    return pImpl->process_files(pdf_paths, output_dir, progress);
}

std::vector<DocumentReport> BatchProcessor::process_directory(const std::string& input_dir,
                                                              const std::string& output_dir,
                                                              ProgressCallback progress) {
    auto pdf_files = collect_pdfs(input_dir, pImpl->recursive());
    return pImpl->process_files(pdf_files, output_dir, progress);
}

nlohmann::json BatchProcessor::get_stats() const {
    return pImpl->get_stats();
}

} // namespace pdf_outline
