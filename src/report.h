// report.h - Pairwise diff pages and the linked summary table
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_REPORT_H
#define SIMSCAN_REPORT_H

#include "errors.h"
#include "similarity.h"
#include "token.h"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace simscan {

//=============================================================================
// Constants
//=============================================================================

inline constexpr const char* SUMMARY_FILENAME = "_results.html";
inline constexpr double SELF_PAIR_SCORE = -1.0;
inline constexpr size_t MATCH_PALETTE_SIZE = 8;

// rows x cols; SELF_PAIR_SCORE marks the full-mode diagonal
using ScoreMatrix = std::vector<std::vector<double>>;

// Relative report filename per cell; empty = no report to link
using LinkMatrix = std::vector<std::vector<std::string>>;

//=============================================================================
// Pairwise Reports
//=============================================================================

// One highlighted run of tokens on one side of the diff
struct Span {
    size_t begin;
    size_t end;
    long block;  // index into the block list, -1 for unmatched
};

// Matched and unmatched runs of one side, in token order. side_a selects the
// a offsets of each block, otherwise the b offsets.
std::vector<Span> side_spans(const BlockList& blocks, size_t len, bool side_a);

std::string html_escape(const std::string& s);

// Diff view of a against b into out. Each span is emitted as chunks of at
// most block_size tokens. CONFIGURATION for a non-positive block_size, with
// out left untouched.
RunError render_pair_fragment(const TokenSeq& a, const TokenSeq& b,
                              const BlockList& blocks,
                              const std::pair<std::string, std::string>& names,
                              int block_size, std::string& out);

// "<index>.html"
std::string pair_report_filename(size_t pair_index);

// Render and write output_dir/<pair_index>.html. CONFIGURATION for a
// non-positive block_size (nothing written), IO if the write fails.
RunError write_pair_report(const std::string& output_dir, size_t pair_index,
                           const TokenSeq& a, const TokenSeq& b,
                           const BlockList& blocks,
                           const std::pair<std::string, std::string>& names,
                           double score, int block_size,
                           std::string* written_path = nullptr);

//=============================================================================
// Summary Report
//=============================================================================

// "87.50%"; "-" for the self-pair sentinel
std::string format_score(double score);

std::string render_summary_table(const ScoreMatrix& scores,
                                 const std::vector<std::string>& row_names,
                                 const std::vector<std::string>& col_names);

// Wrap each linked cell of the written table in an anchor. Cells already
// linked are left alone, so running it twice changes nothing.
std::string patch_summary_links(const std::string& html, const LinkMatrix& links);

RunError patch_summary_file(const std::string& summary_path, const LinkMatrix& links);

struct PersistWait {
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds interval{100};
};

// Poll until path exists or the deadline passes. Returns false on timeout.
bool wait_for_file(const std::string& path, const PersistWait& wait);

// Write output_dir/_results.html, wait for it to appear, then patch links.
RunError assemble_summary(const ScoreMatrix& scores,
                          const std::vector<std::string>& row_names,
                          const std::vector<std::string>& col_names,
                          const LinkMatrix& links,
                          const std::string& output_dir,
                          const PersistWait& wait,
                          std::string& summary_path);

} // namespace simscan

#endif // SIMSCAN_REPORT_H
