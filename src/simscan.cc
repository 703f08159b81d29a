// simscan.cc - Pairwise document similarity reports
// Command-line front end: compare, against, list, add, remove

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "compare.h"
#include "extract.h"
#include "mmap.h"
#include "store.h"

using namespace simscan;

static void print_scores(const RunResult& result) {
    for (size_t r = 0; r < result.scores.size(); ++r) {
        for (size_t c = 0; c < result.scores[r].size(); ++c) {
            if (result.scores[r][c] < 0.0) continue;
            std::cout << "  " << result.row_names[r] << " vs " << result.col_names[c]
                      << ": " << format_score(result.scores[r][c]) << "\n";
        }
    }
}

static int finish(RunError err, const RunResult& result, const RunConfig& config) {
    if (!config.quiet && !result.scores.empty()) print_scores(result);
    if (err != RunError::NONE) {
        std::cerr << "Run failed: " << run_error_name(err) << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto usage = [&]() {
        std::cerr << "Usage:\n"
                  << "  " << argv[0] << " [options] compare <input_dir>\n"
                  << "  " << argv[0] << " [options] against <input_file> <input_dir>\n"
                  << "  " << argv[0] << " [options] list <store_dir>\n"
                  << "  " << argv[0] << " [options] add <store_dir> <file>\n"
                  << "  " << argv[0] << " [options] remove <store_dir> <serial> [serial...]\n"
                  << "\nOptions:\n"
                  << "  -o, --output <dir>      Results directory (default: results/<timestamp>)\n"
                  << "  -b, --block-size <n>    Tokens per highlighted chunk (default: 2)\n"
                  << "  -t, --threads <num>     Number of threads (default: auto-detect)\n"
                  << "  -m, --metric <name>     overlap or jaccard (default: overlap)\n"
                  << "  -w, --wait <seconds>    Wait for the summary file (default: 60)\n"
                  << "  -q, --quiet             Minimal output\n"
                  << "  -v, --verbose           Detailed output\n"
                  << "  -h, --help              Show this help message\n"
                  << "\nSupported formats: txt, pdf (pdftotext), docx, odt (unzip)\n";
        return 1;
    };

    static struct option long_options[] = {
        {"output",     required_argument, nullptr, 'o'},
        {"block-size", required_argument, nullptr, 'b'},
        {"threads",    required_argument, nullptr, 't'},
        {"metric",     required_argument, nullptr, 'm'},
        {"wait",       required_argument, nullptr, 'w'},
        {"quiet",      no_argument,       nullptr, 'q'},
        {"verbose",    no_argument,       nullptr, 'v'},
        {"help",       no_argument,       nullptr, 'h'},
        {nullptr,      0,                 nullptr, 0}
    };

    RunConfig config;

    int opt;
    while ((opt = getopt_long(argc, argv, "o:b:t:m:w:qvh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o': config.output_dir = optarg; break;
            case 'b': config.block_size = std::atoi(optarg); break;
            case 't': config.num_threads = std::atoi(optarg); break;
            case 'm':
                if (strcmp(optarg, "overlap") == 0) config.metric = Metric::OVERLAP;
                else if (strcmp(optarg, "jaccard") == 0) config.metric = Metric::JACCARD;
                else return usage();
                break;
            case 'w': config.persist.timeout = std::chrono::seconds(std::atol(optarg)); break;
            case 'q': config.quiet = true; break;
            case 'v': config.verbose = true; break;
            case 'h': return usage();
            default:  return usage();
        }
    }

    int remaining = argc - optind;
    if (remaining < 2) return usage();

    ExtractorRegistry registry = ExtractorRegistry::with_defaults();
    std::string cmd = argv[optind];
    RunResult result;

    if (cmd == "compare" && remaining == 2) {
        RunError err = compare_directory(argv[optind + 1], config, registry, result);
        return finish(err, result, config);
    } else if (cmd == "against" && remaining == 3) {
        RunError err = compare_against(argv[optind + 1], argv[optind + 2], config, registry, result);
        return finish(err, result, config);
    } else if (cmd == "list" && remaining == 2) {
        FileStore store(argv[optind + 1], registry);
        if (!store.ensure()) {
            std::cerr << "Error: cannot create " << store.dir() << "\n";
            return 1;
        }
        auto entries = store.list();
        if (entries.empty()) {
            std::cerr << "No files in " << store.dir() << "\n";
            return 1;
        }
        for (const auto& e : entries) {
            std::cout << e.id << "\t" << e.file_name << "\t" << e.extension << "\t"
                      << human_readable_size(e.size_bytes) << "\n";
        }
    } else if (cmd == "add" && remaining == 3) {
        FileStore store(argv[optind + 1], registry);
        std::string stored;
        RunError err = store.add(argv[optind + 2], stored);
        if (err != RunError::NONE) {
            std::cerr << "Error: cannot store " << argv[optind + 2]
                      << " (" << run_error_name(err) << ")\n";
            return 1;
        }
        if (!config.quiet) std::cout << "File saved to " << stored << "\n";
        err = compare_against(stored, store.dir(), config, registry, result);
        return finish(err, result, config);
    } else if (cmd == "remove" && remaining >= 3) {
        FileStore store(argv[optind + 1], registry);
        if (!is_directory(store.dir())) {
            std::cerr << "Error: store directory does not exist: " << store.dir() << "\n";
            return 1;
        }
        std::vector<long> serials;
        for (int i = optind + 2; i < argc; ++i) {
            char* end = nullptr;
            long serial = std::strtol(argv[i], &end, 10);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Error: invalid serial number: " << argv[i] << "\n";
                return 1;
            }
            serials.push_back(serial);
        }
        std::cout << describe(store.remove(serials)) << "\n";
    } else {
        return usage();
    }

    return 0;
}
