#include <gtest/gtest.h>
#include <pdf_outline/batch_processor.h>
#include <pdf_outline/errors.h>
#include <pdf_outline/memory_document.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace pdf_outline;

class BatchProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir_ = fs::temp_directory_path() /
                    ("pdf_outline_batch_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                     "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_ / "input" / "nested");
        output_dir_ = (work_dir_ / "output").string();
    }

    void TearDown() override {
        fs::remove_all(work_dir_);
    }

    void touch(const fs::path& path) {
        std::ofstream out(path);
        out << "%PDF-1.4\n";
    }

    // Paths containing "broken" fail to open, "exploding" fails with a
    // generic error, everything else gets a small text-only document
    static std::unique_ptr<Document> open_fake(const std::string& path) {
        if (path.find("broken") != std::string::npos) {
            throw UnreadablePdf(path, "not a PDF");
        }
        if (path.find("exploding") != std::string::npos) {
            throw std::runtime_error("decoder ran out of memory");
        }
        auto doc = std::make_unique<MemoryDocument>();
        doc->set_plain_text(1, "1. Introduction\n1.1 Background\n");
        return doc;
    }

    static nlohmann::json read_json(const std::string& path) {
        std::ifstream in(path);
        return nlohmann::json::parse(in);
    }

    fs::path work_dir_;
    std::string output_dir_;
};

TEST_F(BatchProcessorTest, CollectPdfsIsSortedAndCaseInsensitive) {
    touch(work_dir_ / "input" / "b.pdf");
    touch(work_dir_ / "input" / "a.PDF");
    touch(work_dir_ / "input" / "notes.txt");
    touch(work_dir_ / "input" / "nested" / "c.pdf");

    auto flat = BatchProcessor::collect_pdfs((work_dir_ / "input").string(), false);
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(fs::path(flat[0]).filename().string(), "a.PDF");
    EXPECT_EQ(fs::path(flat[1]).filename().string(), "b.pdf");

    auto deep = BatchProcessor::collect_pdfs((work_dir_ / "input").string(), true);
    EXPECT_EQ(deep.size(), 3u);
}

TEST_F(BatchProcessorTest, ProcessFileFillsTitleFromFilename) {
    BatchProcessor processor(BatchOptions{}, open_fake);

    auto report = processor.process_file("/data/annual_report.pdf");
    ASSERT_TRUE(report.success());
    EXPECT_EQ(report.tier, SourceTier::REGEX);
    EXPECT_EQ(report.result->title, "annual_report");
    EXPECT_EQ(report.result->outline.size(), 2u);
    EXPECT_TRUE(report.output_path.empty());
}

TEST_F(BatchProcessorTest, FilenameTitleCanBeDisabled) {
    BatchOptions options;
    options.title_from_filename = false;
    BatchProcessor processor(options, open_fake);

    auto report = processor.process_file("/data/annual_report.pdf");
    ASSERT_TRUE(report.success());
    EXPECT_EQ(report.result->title, "");
}

TEST_F(BatchProcessorTest, UnreadableDocumentDoesNotStopBatch) {
    BatchOptions options;
    options.thread_count = 2;
    BatchProcessor processor(options, open_fake);

    std::vector<std::string> paths = {"/in/first.pdf", "/in/broken.pdf", "/in/third.pdf"};
    auto reports = processor.process_files(paths, output_dir_);

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_TRUE(reports[0].success());
    EXPECT_FALSE(reports[1].success());
    EXPECT_TRUE(reports[2].success());
    EXPECT_NE(reports[1].error.find("not a PDF"), std::string::npos);

    EXPECT_TRUE(fs::exists(fs::path(output_dir_) / "first.json"));
    EXPECT_TRUE(fs::exists(fs::path(output_dir_) / "third.json"));
    EXPECT_FALSE(fs::exists(fs::path(output_dir_) / "broken.json"));
    EXPECT_FALSE(fs::exists(fs::path(output_dir_) / "broken.error.json"));

    auto json = read_json((fs::path(output_dir_) / "first.json").string());
    EXPECT_EQ(json["title"], "first");
    ASSERT_EQ(json["outline"].size(), 2u);
    EXPECT_EQ(json["outline"][0]["level"], "H1");
    EXPECT_EQ(json["outline"][0]["text"], "1. Introduction");
    EXPECT_EQ(json["outline"][0]["page"], 1);
}

TEST_F(BatchProcessorTest, UnexpectedErrorIsReportedPerDocument) {
    BatchOptions options;
    options.thread_count = 2;
    BatchProcessor processor(options, open_fake);

    std::vector<std::string> paths = {"/in/first.pdf", "/in/exploding.pdf", "/in/third.pdf"};
    auto reports = processor.process_files(paths, output_dir_);

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_TRUE(reports[0].success());
    EXPECT_FALSE(reports[1].success());
    EXPECT_TRUE(reports[2].success());
    EXPECT_NE(reports[1].error.find("decoder ran out of memory"), std::string::npos);

    EXPECT_TRUE(fs::exists(fs::path(output_dir_) / "first.json"));
    EXPECT_TRUE(fs::exists(fs::path(output_dir_) / "third.json"));
    EXPECT_FALSE(fs::exists(fs::path(output_dir_) / "exploding.json"));

    auto stats = processor.get_stats();
    EXPECT_EQ(stats["documents_processed"], 2);
    EXPECT_EQ(stats["documents_failed"], 1);

    auto single = processor.process_file("/in/exploding.pdf");
    EXPECT_FALSE(single.success());
}

TEST_F(BatchProcessorTest, FailedWriteCountsAsFailure) {
    // A directory squatting on the output name makes the write fail
    fs::create_directories(fs::path(output_dir_) / "first.json");

    BatchProcessor processor(BatchOptions{}, open_fake);
    auto reports = processor.process_files({"/in/first.pdf"}, output_dir_);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success());
    EXPECT_FALSE(reports[0].error.empty());
    EXPECT_TRUE(reports[0].output_path.empty());

    auto stats = processor.get_stats();
    EXPECT_EQ(stats["documents_processed"], 0);
    EXPECT_EQ(stats["documents_failed"], 1);
    EXPECT_EQ(stats["regex"], 0);
}

TEST_F(BatchProcessorTest, ErrorFilesOnRequest) {
    BatchOptions options;
    options.write_error_files = true;
    BatchProcessor processor(options, open_fake);

    auto reports = processor.process_files({"/in/broken.pdf"}, output_dir_);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success());

    auto error_path = fs::path(output_dir_) / "broken.error.json";
    ASSERT_TRUE(fs::exists(error_path));
    EXPECT_EQ(reports[0].output_path, error_path.string());

    auto json = read_json(error_path.string());
    EXPECT_EQ(json["file"], "/in/broken.pdf");
}

TEST_F(BatchProcessorTest, ProcessDirectoryAndStats) {
    touch(work_dir_ / "input" / "one.pdf");
    touch(work_dir_ / "input" / "two.pdf");
    touch(work_dir_ / "input" / "broken.pdf");

    BatchProcessor processor(BatchOptions{}, open_fake);
    std::vector<size_t> progress;
    auto reports = processor.process_directory((work_dir_ / "input").string(), output_dir_,
                                               [&progress](size_t current, size_t total) {
                                                   EXPECT_EQ(total, 3u);
                                                   progress.push_back(current);
                                               });

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(progress, (std::vector<size_t>{1, 2, 3}));

    auto stats = processor.get_stats();
    EXPECT_EQ(stats["documents_processed"], 2);
    EXPECT_EQ(stats["documents_failed"], 1);
    EXPECT_EQ(stats["regex"], 2);
    EXPECT_EQ(stats["native"], 0);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
}

TEST_F(BatchProcessorTest, RealOpenerReportsMissingFile) {
    BatchProcessor processor;
    auto report = processor.process_file((work_dir_ / "missing.pdf").string());
    EXPECT_FALSE(report.success());
    EXPECT_FALSE(report.error.empty());
}
