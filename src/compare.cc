// compare.cc - Comparison matrix builder
// Pairs are scored and rendered on a worker pool; each worker fills its own
// outcome slot and the builder merges the slots once after join.

#include "compare.h"
#include "mmap.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <dirent.h>
#include <iostream>
#include <thread>
#include <utility>

namespace simscan {

//=============================================================================
// Worker Pool
//=============================================================================

static unsigned get_thread_count(unsigned requested, size_t units) {
    unsigned num_threads = requested;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }
    if (units < num_threads) num_threads = static_cast<unsigned>(std::max<size_t>(units, 1));
    return num_threads;
}

// Run fn(unit) for every unit in [0, units), pulling units from a shared counter
template <typename Fn>
static void parallel_for(size_t units, unsigned num_threads, Fn fn) {
    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (;;) {
            size_t u = next.fetch_add(1, std::memory_order_relaxed);
            if (u >= units) return;
            fn(u);
        }
    };

    if (num_threads <= 1) {
        work();
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(num_threads);
    for (unsigned t = 0; t < num_threads; ++t) workers.emplace_back(work);
    for (auto& w : workers) w.join();
}

//=============================================================================
// Per-pair work
//=============================================================================

struct PairOutcome {
    double score = 0.0;
    RunError error = RunError::NONE;
    std::string report;
};

static PairOutcome score_and_render(const Document& a, const IdSeq& a_ids,
                             const Document& b, const IdSeq& b_ids,
                             size_t pair_index, const RunConfig& config) {
    PairOutcome out;
    Score s = score_interned(a.tokens, a_ids, b.tokens, b_ids);
    out.score = config.metric == Metric::JACCARD ? jaccard_similarity(a_ids, b_ids) : s.overlap;
    out.error = write_pair_report(config.output_dir, pair_index, a.tokens, b.tokens,
                                  s.blocks, {a.name, b.name}, out.score, config.block_size);
    if (out.error == RunError::NONE) out.report = pair_report_filename(pair_index);
    return out;
}

static bool intern_all(const std::vector<const Document*>& docs, unsigned num_threads,
                TokenMap& tokens, std::vector<IdSeq>& ids) {
    std::atomic<uint32_t> next_id{0};
    std::atomic<bool> overflow{false};
    ids.resize(docs.size());
    parallel_for(docs.size(), num_threads, [&](size_t d) {
        if (!tokens.intern(docs[d]->tokens, ids[d], next_id)) {
            overflow.store(true, std::memory_order_relaxed);
        }
    });
    return !overflow.load();
}

static size_t total_tokens(const std::vector<const Document*>& docs) {
    size_t n = 0;
    for (const auto* d : docs) n += d->tokens.size();
    return n;
}

static std::vector<const Document*> sorted_by_name(const std::vector<Document>& docs) {
    std::vector<const Document*> order;
    order.reserve(docs.size());
    for (const auto& d : docs) order.push_back(&d);
    std::stable_sort(order.begin(), order.end(),
        [](const Document* x, const Document* y) { return x->name < y->name; });
    return order;
}

static RunError check_block_size(const RunConfig& config) {
    if (config.block_size <= 0) {
        std::cerr << "Error: block size must be positive (got " << config.block_size << ")\n";
        return RunError::CONFIGURATION;
    }
    return RunError::NONE;
}

static RunError check_output_dir(const RunConfig& config) {
    if (!is_directory(config.output_dir)) {
        std::cerr << "Error: output directory does not exist: " << config.output_dir << "\n";
        return RunError::PATH_NOT_FOUND;
    }
    return RunError::NONE;
}

static void warn(const RunConfig& config, RunResult& result, const std::string& msg) {
    result.warnings.push_back(msg);
    if (!config.quiet) std::cerr << "Warning: " << msg << "\n";
}

static double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

//=============================================================================
// Full Mode
//=============================================================================

RunError run_full_comparison(const std::vector<Document>& documents,
                             const RunConfig& config, RunResult& result) {
    result = RunResult{};

    if (RunError err = check_block_size(config); err != RunError::NONE) return err;
    if (documents.size() < 2) {
        std::cerr << "Error: at least two documents are needed for comparison (got "
                  << documents.size() << ")\n";
        return RunError::MINIMUM_DOCUMENTS;
    }
    if (RunError err = check_output_dir(config); err != RunError::NONE) return err;

    auto start = std::chrono::high_resolution_clock::now();
    result.output_dir = config.output_dir;

    std::vector<const Document*> order = sorted_by_name(documents);
    const size_t n = order.size();
    for (const auto* d : order) result.row_names.push_back(d->name);
    result.col_names = result.row_names;

    const size_t units = n * (n - 1);
    unsigned num_threads = get_thread_count(config.num_threads, units);

    TokenMap tokens(total_tokens(order) * 2);
    std::vector<IdSeq> ids;
    if (!intern_all(order, num_threads, tokens, ids)) {
        std::cerr << "Error: token table overflow\n";
        return RunError::TOKEN_OVERFLOW;
    }

    // Unit u is the u-th off-diagonal cell in row-major order; u also names
    // its report file.
    std::vector<PairOutcome> outcomes(units);
    parallel_for(units, num_threads, [&](size_t u) {
        size_t i = u / (n - 1);
        size_t k = u % (n - 1);
        size_t j = k < i ? k : k + 1;
        outcomes[u] = score_and_render(*order[i], ids[i], *order[j], ids[j], u, config);
    });

    result.scores.assign(n, std::vector<double>(n, SELF_PAIR_SCORE));
    result.reports.assign(n, std::vector<std::string>(n));
    for (size_t u = 0; u < units; ++u) {
        size_t i = u / (n - 1);
        size_t k = u % (n - 1);
        size_t j = k < i ? k : k + 1;
        const PairOutcome& o = outcomes[u];
        result.scores[i][j] = o.score;
        if (o.error != RunError::NONE) {
            result.failures.push_back({order[i]->name, order[j]->name, o.error});
            std::cerr << "Error: failed to write report " << pair_report_filename(u)
                      << " for " << order[i]->name << " vs " << order[j]->name
                      << " (" << run_error_name(o.error) << ")\n";
        } else {
            result.reports[i][j] = o.report;
            ++result.reports_written;
        }
    }

    if (!result.failures.empty()) return RunError::IO;

    if (config.verbose) {
        std::cout << "Compared " << n << " documents (" << units << " pairs, "
                  << num_threads << " threads) in " << elapsed_ms(start) << " ms\n";
    }

    RunError err = assemble_summary(result.scores, result.row_names, result.col_names,
                                    result.reports, config.output_dir, config.persist,
                                    result.summary_path);
    if (err != RunError::NONE) return err;

    if (!config.quiet) std::cout << "Results saved at: " << result.summary_path << "\n";
    return RunError::NONE;
}

//=============================================================================
// Targeted Mode
//=============================================================================

RunError run_targeted_comparison(const Document& target,
                                 const std::vector<Document>& candidates,
                                 const RunConfig& config, RunResult& result) {
    result = RunResult{};

    if (RunError err = check_block_size(config); err != RunError::NONE) return err;

    std::vector<Document> kept;
    for (const auto& c : candidates) {
        if (c.name == target.name) {
            if (config.verbose) std::cerr << "Skipping self-comparison: " << c.name << "\n";
            continue;
        }
        kept.push_back(c);
    }
    if (kept.empty()) {
        std::cerr << "Error: no candidates to compare " << target.name << " against\n";
        return RunError::NO_CANDIDATES;
    }
    if (RunError err = check_output_dir(config); err != RunError::NONE) return err;

    auto start = std::chrono::high_resolution_clock::now();
    result.output_dir = config.output_dir;

    std::vector<const Document*> pool = sorted_by_name(kept);
    const size_t m = pool.size();

    // Slot 0 is the target, candidates follow
    std::vector<const Document*> all;
    all.reserve(m + 1);
    all.push_back(&target);
    all.insert(all.end(), pool.begin(), pool.end());

    unsigned num_threads = get_thread_count(config.num_threads, m);

    TokenMap tokens(total_tokens(all) * 2);
    std::vector<IdSeq> ids;
    if (!intern_all(all, num_threads, tokens, ids)) {
        std::cerr << "Error: token table overflow\n";
        return RunError::TOKEN_OVERFLOW;
    }

    std::vector<PairOutcome> outcomes(m);
    parallel_for(m, num_threads, [&](size_t u) {
        outcomes[u] = score_and_render(target, ids[0], *pool[u], ids[u + 1], u, config);
    });

    result.row_names.push_back(target.name);
    result.scores.assign(1, std::vector<double>(m, 0.0));
    result.reports.assign(1, std::vector<std::string>(m));
    for (size_t u = 0; u < m; ++u) {
        const PairOutcome& o = outcomes[u];
        result.col_names.push_back(pool[u]->name);
        result.scores[0][u] = o.score;
        if (o.error != RunError::NONE) {
            result.failures.push_back({target.name, pool[u]->name, o.error});
            warn(config, result, "report for " + target.name + " vs " + pool[u]->name +
                 " not written (" + run_error_name(o.error) + ")");
        } else {
            result.reports[0][u] = o.report;
            ++result.reports_written;
        }
    }

    if (config.verbose) {
        std::cout << "Compared " << target.name << " against " << m << " documents ("
                  << num_threads << " threads) in " << elapsed_ms(start) << " ms\n";
    }

    RunError err = assemble_summary(result.scores, result.row_names, result.col_names,
                                    result.reports, config.output_dir, config.persist,
                                    result.summary_path);
    if (err != RunError::NONE) return err;

    if (!config.quiet) std::cout << "Results saved at: " << result.summary_path << "\n";
    return RunError::NONE;
}

//=============================================================================
// Directory Entry Points
//=============================================================================

std::vector<std::string> list_supported_files(const std::string& dir,
                                              const ExtractorRegistry& registry) {
    std::vector<std::string> files;
    DIR* d = opendir(dir.c_str());
    if (!d) return files;
    while (struct dirent* ent = readdir(d)) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        if (!is_regular_file(join_path(dir, name))) continue;
        if (registry.supports(name)) files.push_back(name);
    }
    closedir(d);
    std::sort(files.begin(), files.end());
    return files;
}

std::string resolve_output_dir(const RunConfig& config) {
    if (!config.output_dir.empty() && is_directory(config.output_dir)) {
        return config.output_dir;
    }

    char stamp[32];
    std::time_t now = std::time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    std::string dir = join_path(config.results_root, stamp);
    if (!make_directories(dir)) return "";
    return dir;
}

RunError compare_directory(const std::string& in_dir, const RunConfig& config,
                           const ExtractorRegistry& registry, RunResult& result) {
    result = RunResult{};

    if (!is_directory(in_dir)) {
        std::cerr << "Error: the specified path does not exist: " << in_dir << "\n";
        return RunError::PATH_NOT_FOUND;
    }
    if (RunError err = check_block_size(config); err != RunError::NONE) return err;

    std::vector<std::string> files = list_supported_files(in_dir, registry);
    if (files.size() < 2) {
        std::cerr << "Error: at least two supported files are needed in " << in_dir << "\n";
        return RunError::MINIMUM_DOCUMENTS;
    }

    std::vector<Document> docs(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        std::string error;
        if (registry.extract(join_path(in_dir, files[i]), docs[i], error) != RunError::NONE) {
            std::cerr << "Error: cannot extract " << files[i] << ": " << error << "\n";
            return RunError::UNSUPPORTED_FORMAT;
        }
        if (config.verbose) {
            std::cerr << "Extracted " << files[i] << " (" << docs[i].tokens.size() << " words)\n";
        }
    }

    RunConfig run = config;
    run.output_dir = resolve_output_dir(config);
    if (run.output_dir.empty()) {
        std::cerr << "Error: cannot create results directory under " << config.results_root << "\n";
        return RunError::IO;
    }
    return run_full_comparison(docs, run, result);
}

RunError compare_against(const std::string& input_file, const std::string& in_dir,
                         const RunConfig& config, const ExtractorRegistry& registry,
                         RunResult& result) {
    result = RunResult{};

    if (!is_regular_file(input_file)) {
        std::cerr << "Error: the specified input file does not exist: " << input_file << "\n";
        return RunError::PATH_NOT_FOUND;
    }
    if (!registry.supports(input_file)) {
        std::cerr << "Error: unsupported input file format: " << input_file << "\n";
        return RunError::UNSUPPORTED_FORMAT;
    }
    if (!is_directory(in_dir)) {
        std::cerr << "Error: the specified directory does not exist: " << in_dir << "\n";
        return RunError::PATH_NOT_FOUND;
    }
    if (RunError err = check_block_size(config); err != RunError::NONE) return err;

    Document target;
    std::string error;
    if (registry.extract(input_file, target, error) != RunError::NONE) {
        std::cerr << "Error: cannot extract " << input_file << ": " << error << "\n";
        return RunError::UNSUPPORTED_FORMAT;
    }

    std::vector<std::string> skipped;
    std::vector<Document> candidates;
    const std::string input_base = base_name(input_file);
    for (const auto& file : list_supported_files(in_dir, registry)) {
        if (file == input_base) continue;
        Document doc;
        if (registry.extract(join_path(in_dir, file), doc, error) != RunError::NONE) {
            skipped.push_back("skipping " + file + ": " + error);
            if (!config.quiet) std::cerr << "Warning: " << skipped.back() << "\n";
            continue;
        }
        candidates.push_back(std::move(doc));
    }

    if (candidates.empty()) {
        std::cerr << "Error: no valid files to compare against in " << in_dir << "\n";
        result.warnings = skipped;
        return RunError::NO_CANDIDATES;
    }

    RunConfig run = config;
    run.output_dir = resolve_output_dir(config);
    if (run.output_dir.empty()) {
        std::cerr << "Error: cannot create results directory under " << config.results_root << "\n";
        result.warnings = skipped;
        return RunError::IO;
    }

    RunError err = run_targeted_comparison(target, candidates, run, result);
    result.warnings.insert(result.warnings.begin(), skipped.begin(), skipped.end());
    return err;
}

} // namespace simscan
