#include <benchmark/benchmark.h>
#include <pdf_outline/batch_processor.h>
#include <pdf_outline/json_writer.h>
#include <pdf_outline/layout_analyzer.h>
#include <pdf_outline/memory_document.h>
#include <pdf_outline/outline_extractor.h>
#include <pdf_outline/regex_classifier.h>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace pdf_outline;

// Optional real input, skipped when absent
const std::string TEST_PDF_MEDIUM = "test_data/medium.pdf"; // ~100 pages

// Synthetic document: a title, two heading styles and dense body text
static MemoryDocument make_layout_document(int pages) {
    MemoryDocument doc;
    doc.add_span(1, "Synthetic Benchmark Report", 26.0f, 30.0f, true);
    for (int page = 1; page <= pages; ++page) {
        doc.add_span(page, "Chapter heading " + std::to_string(page), 18.0f, 70.0f, true);
        for (int i = 0; i < 40; ++i) {
            if (i == 20) {
                doc.add_span(page, "Subsection " + std::to_string(page) + ".1", 14.0f, 340.0f, true);
            }
            doc.add_span(page, "Body text line " + std::to_string(i) + " on page " + std::to_string(page),
                         10.0f, 90.0f + i * 12.0f);
        }
    }
    return doc;
}

static MemoryDocument make_text_document(int pages) {
    MemoryDocument doc;
    for (int page = 1; page <= pages; ++page) {
        std::string text = std::to_string(page) + ". Part Heading\n";
        for (int i = 0; i < 40; ++i) {
            if (i % 10 == 0) {
                text += std::to_string(page) + "." + std::to_string(i / 10 + 1) + " Topic\n";
            }
            text += "Ordinary sentence number " + std::to_string(i) + " in running text.\n";
        }
        doc.set_plain_text(page, text);
    }
    return doc;
}

static void BM_RegexTier(benchmark::State& state) {
    auto doc = make_text_document(static_cast<int>(state.range(0)));
    ExtractOptions options;
    options.max_pages = 0;
    RegexClassifier classifier(options);

    for (auto _ : state) {
        auto outcome = classifier.run(doc, Deadline::start(std::chrono::seconds(60)));
        benchmark::DoNotOptimize(outcome);
    }

    state.counters["pages_per_second"] = benchmark::Counter(
        static_cast<double>(state.range(0)) * state.iterations(), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_RegexTier)->Range(1, 256);

static void BM_HeuristicTier(benchmark::State& state) {
    auto doc = make_layout_document(static_cast<int>(state.range(0)));
    ExtractOptions options;
    options.max_pages = 0;
    LayoutAnalyzer analyzer(options);

    for (auto _ : state) {
        auto outcome = analyzer.run(doc, Deadline::start(std::chrono::seconds(60)));
        benchmark::DoNotOptimize(outcome);
    }

    state.counters["pages_per_second"] = benchmark::Counter(
        static_cast<double>(state.range(0)) * state.iterations(), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_HeuristicTier)->Range(1, 256);

static void BM_FullCascade(benchmark::State& state) {
    auto doc = make_layout_document(static_cast<int>(state.range(0)));
    OutlineExtractor extractor;

    for (auto _ : state) {
        auto result = extractor.extract(doc);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_FullCascade)->Range(1, 256);

static void BM_BudgetBoundedScan(benchmark::State& state) {
    // Far more pages than the budget allows; time per iteration stays near the budget
    auto doc = make_text_document(5000);
    ExtractOptions options;
    options.max_pages = 0;
    OutlineExtractor extractor(options);

    for (auto _ : state) {
        auto result = extractor.extract(doc, std::chrono::milliseconds(state.range(0)));
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_BudgetBoundedScan)->Arg(5)->Arg(20)->Unit(benchmark::kMillisecond);

static void BM_JsonOutput(benchmark::State& state) {
    auto doc = make_layout_document(static_cast<int>(state.range(0)));
    auto result = OutlineExtractor().extract(doc);

    for (auto _ : state) {
        auto json = outline_to_json(result);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_JsonOutput)->Range(8, 256);

static void BM_RealDocument(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_MEDIUM)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    BatchProcessor processor;
    for (auto _ : state) {
        auto report = processor.process_file(TEST_PDF_MEDIUM);
        benchmark::DoNotOptimize(report);
    }

    auto stats = processor.get_stats();
    state.counters["avg_ms"] = stats.value("average_processing_time_ms", 0.0);
}
BENCHMARK(BM_RealDocument)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
