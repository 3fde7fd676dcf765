#include <pdf_outline/batch_processor.h>
#include <pdf_outline/options.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace pdf_outline;

struct CLIOptions {
    std::string input_path = "input";
    std::string output_dir = "output";
    std::string config_file;
    std::optional<int> budget_ms;
    std::optional<int> max_pages;
    std::optional<int> thread_count;
    bool recursive = false;
    bool error_files = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] [input.pdf|input_directory] [output_directory]\n";
    std::cout << "\nExtracts a title and H1/H2/H3 outline from each PDF into <name>.json\n";
    std::cout << "\nArguments:\n";
    std::cout << "  input                      PDF file or directory of PDFs (default: input)\n";
    std::cout << "  output_directory           Where JSON files are written (default: output)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -c, --config FILE          JSON configuration file\n";
    std::cout << "  --budget-ms N              Time budget per document in ms (default: 10000)\n";
    std::cout << "  --max-pages N              Pages scanned by the fallback tiers, 0 = all (default: 50)\n";
    std::cout << "  --threads N                Worker threads (default: auto-detect)\n";
    std::cout << "  --recursive                Search input directory recursively\n";
    std::cout << "  --error-files              Write <name>.error.json for unreadable PDFs\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " report.pdf out\n";
    std::cout << "  " << program_name << " --budget-ms 5000 --threads 4 /data/pdfs /data/json\n";
}

void print_version() {
    std::cout << "pdf-outline version 1.0.0\n";
    std::cout << "Built with C++17 and MuPDF\n";
}

int parse_int(const char* value, const char* name) {
    try {
        size_t consumed = 0;
        int number = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "c:vqh";
    const struct option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"budget-ms", required_argument, nullptr, 1001},
        {"max-pages", required_argument, nullptr, 1002},
        {"threads", required_argument, nullptr, 1003},
        {"recursive", no_argument, nullptr, 1004},
        {"error-files", no_argument, nullptr, 1005},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1006},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 1001:  // budget-ms
                options.budget_ms = parse_int(optarg, "budget-ms");
                if (*options.budget_ms < 0) {
                    throw std::invalid_argument("budget-ms cannot be negative");
                }
                break;
            case 1002:  // max-pages
                options.max_pages = parse_int(optarg, "max-pages");
                if (*options.max_pages < 0) {
                    throw std::invalid_argument("max-pages cannot be negative");
                }
                break;
            case 1003:  // threads
                options.thread_count = parse_int(optarg, "threads");
                if (*options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1004:
                options.recursive = true;
                break;
            case 1005:
                options.error_files = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1006:
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    std::vector<std::string> positional(argv + optind, argv + argc);
    if (positional.size() > 2) {
        throw std::invalid_argument("Too many arguments");
    }
    if (positional.size() >= 1) {
        options.input_path = positional[0];
    }
    if (positional.size() == 2) {
        options.output_dir = positional[1];
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

// Defaults, then the config file, then explicit flags
BatchOptions resolve_options(const CLIOptions& cli) {
    BatchOptions options;

    if (!cli.config_file.empty()) {
        load_config_file(cli.config_file, options);
    }

    if (cli.budget_ms) options.extract.budget = std::chrono::milliseconds(*cli.budget_ms);
    if (cli.max_pages) options.extract.max_pages = *cli.max_pages;
    if (cli.thread_count) options.thread_count = static_cast<size_t>(*cli.thread_count);
    if (cli.recursive) options.recursive = true;
    if (cli.error_files) options.write_error_files = true;
    if (cli.verbose) options.extract.verbose = true;

    return options;
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions cli = parse_arguments(argc, argv);

        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (cli.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(cli.input_path)) {
            throw std::invalid_argument("Input path does not exist: " + cli.input_path);
        }

        BatchOptions options = resolve_options(cli);
        BatchProcessor processor(options);

        std::vector<std::string> pdf_files;
        if (fs::is_regular_file(cli.input_path)) {
            pdf_files.push_back(cli.input_path);
        } else if (fs::is_directory(cli.input_path)) {
            pdf_files = BatchProcessor::collect_pdfs(cli.input_path, options.recursive);
        } else {
            throw std::invalid_argument("Input must be a PDF file or directory");
        }

        if (pdf_files.empty()) {
            if (!cli.quiet) {
                std::cout << "No PDF files found in " << cli.input_path << std::endl;
            }
            return 0;
        }

        if (!cli.quiet) {
            std::cout << "Found " << pdf_files.size() << " PDF files to process\n";
            std::cout << "Output: " << cli.output_dir << "\n";
            std::cout << "Budget per document: " << options.extract.budget.count() << " ms\n"
                      << std::endl;
        }

        auto start = std::chrono::steady_clock::now();

        ProgressCallback progress = nullptr;
        if (!cli.quiet) {
            progress = [](size_t current, size_t total) {
                std::cout << "\rProgress: " << current << "/" << total
                          << " (" << (100 * current / total) << "%)" << std::flush;
            };
        }

        auto reports = processor.process_files(pdf_files, cli.output_dir, progress);
        if (!cli.quiet) {
            std::cout << std::endl;
        }

        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        size_t success_count = 0;
        for (const auto& report : reports) {
            if (report.success()) {
                success_count++;
                if (cli.verbose) {
                    std::cout << "  " << report.pdf_path << " -> " << report.output_path
                              << " (" << tier_name(report.tier) << ", "
                              << report.result->outline.size() << " headings, "
                              << std::fixed << std::setprecision(1)
                              << report.processing_time_ms << " ms)\n";
                }
            }
        }

        if (!cli.quiet) {
            auto stats = processor.get_stats();
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Successfully processed: " << success_count << "/" << reports.size() << " files\n";
            std::cout << "Native outlines: " << stats["native"]
                      << ", heuristic: " << stats["heuristic"]
                      << ", regex: " << stats["regex"] << "\n";
            std::cout << "Total time: " << duration.count() << " ms\n";
        }

        return success_count == reports.size() ? 0 : 2;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
