// compare.h - Comparison runs: all-pairs matrix and one-vs-many
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_COMPARE_H
#define SIMSCAN_COMPARE_H

#include "errors.h"
#include "extract.h"
#include "report.h"
#include "similarity.h"
#include "token.h"

#include <string>
#include <vector>

namespace simscan {

//=============================================================================
// Run Configuration
//=============================================================================

inline constexpr int DEFAULT_BLOCK_SIZE = 2;
inline constexpr const char* DEFAULT_RESULTS_DIR = "results";

struct RunConfig {
    // run_*_comparison: must exist. compare_*: falls back to a timestamped
    // directory under results_root when empty or missing.
    std::string output_dir;
    std::string results_root = DEFAULT_RESULTS_DIR;

    int block_size = DEFAULT_BLOCK_SIZE;
    unsigned num_threads = 0;  // 0 = auto
    Metric metric = Metric::OVERLAP;
    PersistWait persist;

    bool quiet = false;
    bool verbose = false;
};

//=============================================================================
// Run Result
//=============================================================================

struct PairFailure {
    std::string row;
    std::string col;
    RunError error;
};

struct RunResult {
    // Full mode: rows == cols == all documents. Targeted: one row (the target).
    std::vector<std::string> row_names;
    std::vector<std::string> col_names;
    ScoreMatrix scores;
    LinkMatrix reports;  // relative filenames, empty where nothing was rendered

    std::string output_dir;
    std::string summary_path;  // set once the summary has been written

    std::vector<std::string> warnings;
    std::vector<PairFailure> failures;
    size_t reports_written = 0;
};

//=============================================================================
// Entry Points
//=============================================================================

// All ordered pairs of documents, iterated in name order. Any render failure
// fails the run with IO once every pair has been processed.
RunError run_full_comparison(const std::vector<Document>& documents,
                             const RunConfig& config, RunResult& result);

// target against every candidate whose name differs from the target's.
// Render failures are recorded as warnings and that report is left unlinked.
RunError run_targeted_comparison(const Document& target,
                                 const std::vector<Document>& candidates,
                                 const RunConfig& config, RunResult& result);

// Every supported file in in_dir. Strict: one unextractable file aborts the
// run before scoring.
RunError compare_directory(const std::string& in_dir, const RunConfig& config,
                           const ExtractorRegistry& registry, RunResult& result);

// input_file against the supported files of in_dir. Lenient: candidates that
// cannot be extracted are skipped with a warning.
RunError compare_against(const std::string& input_file, const std::string& in_dir,
                         const RunConfig& config, const ExtractorRegistry& registry,
                         RunResult& result);

// Sorted names of the regular files in dir that the registry can extract
std::vector<std::string> list_supported_files(const std::string& dir,
                                              const ExtractorRegistry& registry);

// Existing config.output_dir, otherwise results_root/YYYYmmdd_HHMMSS (created).
// Empty string if the directory could not be created.
std::string resolve_output_dir(const RunConfig& config);

} // namespace simscan

#endif // SIMSCAN_COMPARE_H
