#pragma once

#include "pdf_outline/document.h"
#include "pdf_outline/options.h"
#include "pdf_outline/outline_types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pdf_outline {

struct DocumentReport {
    std::string pdf_path;
    std::string output_path;            // empty when nothing was written
    std::optional<OutlineResult> result;
    std::string error;
    SourceTier tier = SourceTier::REGEX;
    double processing_time_ms = 0.0;
    bool deadline_expired = false;

    bool success() const { return result.has_value(); }
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Opens a document for a path, throwing UnreadablePdf on failure
using DocumentOpener = std::function<std::unique_ptr<Document>(const std::string& path)>;

// Runs the outline pipeline over many files in parallel and writes one JSON
// file per document. A document that cannot be opened or processed is
// reported in its DocumentReport and never stops the batch. A document whose
// JSON cannot be written counts as failed.
class BatchProcessor {
public:
    // A null opener uses MupdfDocument::open
    explicit BatchProcessor(const BatchOptions& options = BatchOptions{},
                            DocumentOpener opener = nullptr);
    ~BatchProcessor();

    // Sorted *.pdf files (extension compared case-insensitively)
    static std::vector<std::string> collect_pdfs(const std::string& input_dir, bool recursive);

    // Runs the pipeline on one file without writing anything
    DocumentReport process_file(const std::string& pdf_path);

    // Reports come back in the order of `pdf_paths`
    std::vector<DocumentReport> process_files(const std::vector<std::string>& pdf_paths,
                                              const std::string& output_dir,
                                              ProgressCallback progress = nullptr);

    std::vector<DocumentReport> process_directory(const std::string& input_dir,
                                                  const std::string& output_dir,
                                                  ProgressCallback progress = nullptr);

    nlohmann::json get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outline
