// report.cc - HTML rendering for pairwise diffs and the summary matrix
// Files are written through MappedFile from mmap.h

#include "report.h"
#include "mmap.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace simscan {

//=============================================================================
// Page Chrome
//=============================================================================

static const char* PAGE_STYLE =
    "body{font-family:sans-serif;margin:1em 2em;}\n"
    ".pair{display:flex;gap:2em;}\n"
    ".side{flex:1;line-height:1.6;}\n"
    ".diff{color:#b00020;}\n"
    ".match{color:#111;}\n"
    ".m0{background:#ffe08a;}.m1{background:#a8e6cf;}.m2{background:#aecbfa;}\n"
    ".m3{background:#f8bbd0;}.m4{background:#d1c4e9;}.m5{background:#ffccbc;}\n"
    ".m6{background:#c5e1a5;}.m7{background:#b2ebf2;}\n"
    "table.results{border-collapse:collapse;}\n"
    "table.results th,table.results td{border:1px solid #999;padding:4px 8px;text-align:center;}\n";

static std::string page(const std::string& title, const std::string& body) {
    std::string out;
    out.reserve(body.size() + 1024);
    out += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n<title>";
    out += html_escape(title);
    out += "</title>\n<style>\n";
    out += PAGE_STYLE;
    out += "</style>\n</head>\n<body>\n";
    out += body;
    out += "</body>\n</html>\n";
    return out;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

//=============================================================================
// Pairwise Reports
//=============================================================================

std::vector<Span> side_spans(const BlockList& blocks, size_t len, bool side_a) {
    std::vector<Span> spans;
    size_t pos = 0;
    for (size_t k = 0; k < blocks.size(); ++k) {
        const auto& blk = blocks[k];
        if (blk.size == 0) continue;
        size_t start = side_a ? blk.a : blk.b;
        if (pos < start) spans.push_back({pos, start, -1});
        spans.push_back({start, start + blk.size, static_cast<long>(k)});
        pos = start + blk.size;
    }
    if (pos < len) spans.push_back({pos, len, -1});
    return spans;
}

static void render_side(std::string& out, const TokenSeq& tokens,
                        const std::vector<Span>& spans,
                        const std::string& name, size_t block_size) {
    out += "<div class=\"side\">\n<h2>";
    out += html_escape(name);
    out += "</h2>\n<p>\n";

    for (const auto& span : spans) {
        for (size_t c = span.begin; c < span.end; c += block_size) {
            size_t chunk_end = std::min(span.end, c + block_size);
            if (span.block < 0) {
                out += "<span class=\"diff\">";
            } else {
                out += "<span class=\"match m";
                out += std::to_string(static_cast<size_t>(span.block) % MATCH_PALETTE_SIZE);
                out += "\" data-block=\"";
                out += std::to_string(span.block);
                out += "\">";
            }
            for (size_t t = c; t < chunk_end; ++t) {
                if (t > c) out += ' ';
                out += html_escape(tokens[t]);
            }
            out += "</span>\n";
        }
    }

    out += "</p>\n</div>\n";
}

RunError render_pair_fragment(const TokenSeq& a, const TokenSeq& b,
                              const BlockList& blocks,
                              const std::pair<std::string, std::string>& names,
                              int block_size, std::string& out) {
    if (block_size <= 0) return RunError::CONFIGURATION;
    size_t chunk = static_cast<size_t>(block_size);

    std::string html;
    html.reserve((a.size() + b.size()) * 8 + 256);
    html += "<div class=\"pair\">\n";
    render_side(html, a, side_spans(blocks, a.size(), true), names.first, chunk);
    render_side(html, b, side_spans(blocks, b.size(), false), names.second, chunk);
    html += "</div>\n";
    out = std::move(html);
    return RunError::NONE;
}

std::string pair_report_filename(size_t pair_index) {
    return std::to_string(pair_index) + ".html";
}

RunError write_pair_report(const std::string& output_dir, size_t pair_index,
                           const TokenSeq& a, const TokenSeq& b,
                           const BlockList& blocks,
                           const std::pair<std::string, std::string>& names,
                           double score, int block_size,
                           std::string* written_path) {
    std::string fragment;
    RunError err = render_pair_fragment(a, b, blocks, names, block_size, fragment);
    if (err != RunError::NONE) return err;

    std::string title = names.first + " vs " + names.second;
    std::string body = "<h1>" + html_escape(title) + ": " + format_score(score) + "</h1>\n";
    body += fragment;

    std::string path = join_path(output_dir, pair_report_filename(pair_index));
    if (!write_whole_file(path, page(title, body))) return RunError::IO;
    if (written_path) *written_path = path;
    return RunError::NONE;
}

//=============================================================================
// Summary Report
//=============================================================================

std::string format_score(double score) {
    if (score < 0.0) return "-";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << (score * 100.0) << "%";
    return ss.str();
}

static std::string cell_key(size_t r, size_t c) {
    return "data-cell=\"" + std::to_string(r) + "-" + std::to_string(c) + "\">";
}

std::string render_summary_table(const ScoreMatrix& scores,
                                 const std::vector<std::string>& row_names,
                                 const std::vector<std::string>& col_names) {
    std::string body = "<h1>Similarity results</h1>\n<table class=\"results\">\n<tr><th></th>";
    for (const auto& name : col_names) {
        body += "<th>" + html_escape(name) + "</th>";
    }
    body += "</tr>\n";

    for (size_t r = 0; r < scores.size(); ++r) {
        body += "<tr><th>";
        body += r < row_names.size() ? html_escape(row_names[r]) : std::string();
        body += "</th>";
        for (size_t c = 0; c < scores[r].size(); ++c) {
            body += "<td " + cell_key(r, c) + format_score(scores[r][c]) + "</td>";
        }
        body += "</tr>\n";
    }
    body += "</table>\n";
    return page("Similarity results", body);
}

std::string patch_summary_links(const std::string& html, const LinkMatrix& links) {
    std::string out = html;
    for (size_t r = 0; r < links.size(); ++r) {
        for (size_t c = 0; c < links[r].size(); ++c) {
            const std::string& target = links[r][c];
            if (target.empty()) continue;

            std::string key = cell_key(r, c);
            size_t pos = out.find(key);
            if (pos == std::string::npos) continue;
            size_t content = pos + key.size();
            if (out.compare(content, 3, "<a ") == 0) continue;  // Already linked
            size_t close = out.find("</td>", content);
            if (close == std::string::npos) continue;

            out.insert(close, "</a>");
            out.insert(content, "<a href=\"" + html_escape(target) + "\">");
        }
    }
    return out;
}

RunError patch_summary_file(const std::string& summary_path, const LinkMatrix& links) {
    std::string html;
    if (!read_whole_file(summary_path, html)) return RunError::IO;
    std::string patched = patch_summary_links(html, links);
    if (patched == html) return RunError::NONE;
    if (!write_whole_file(summary_path, patched)) return RunError::IO;
    return RunError::NONE;
}

bool wait_for_file(const std::string& path, const PersistWait& wait) {
    auto deadline = std::chrono::steady_clock::now() + wait.timeout;
    for (;;) {
        if (path_exists(path)) return true;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(wait.interval, remaining));
    }
}

RunError assemble_summary(const ScoreMatrix& scores,
                          const std::vector<std::string>& row_names,
                          const std::vector<std::string>& col_names,
                          const LinkMatrix& links,
                          const std::string& output_dir,
                          const PersistWait& wait,
                          std::string& summary_path) {
    summary_path = join_path(output_dir, SUMMARY_FILENAME);

    if (!write_whole_file(summary_path, render_summary_table(scores, row_names, col_names))) {
        std::cerr << "Error: failed to write " << summary_path << "\n";
        return RunError::IO;
    }

    if (!wait_for_file(summary_path, wait)) {
        std::cerr << "Error: results file was not created: " << summary_path << "\n";
        return RunError::REPORT_NOT_PERSISTED;
    }

    RunError err = patch_summary_file(summary_path, links);
    if (err != RunError::NONE) {
        std::cerr << "Error: failed to add links to " << summary_path << "\n";
    }
    return err;
}

} // namespace simscan
