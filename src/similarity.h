// similarity.h - Overlap scoring and matching-block decomposition
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_SIMILARITY_H
#define SIMSCAN_SIMILARITY_H

#include "token.h"

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

namespace simscan {

//=============================================================================
// Matching Blocks
//=============================================================================

// tokens_a[a, a+size) == tokens_b[b, b+size)
struct MatchingBlock {
    size_t a;
    size_t b;
    size_t size;

    bool operator==(const MatchingBlock& o) const {
        return a == o.a && b == o.b && size == o.size;
    }
};

// Sorted, non-overlapping, adjacent runs merged, terminated by (len_a, len_b, 0)
using BlockList = std::vector<MatchingBlock>;

enum class Metric : uint8_t {
    OVERLAP,  // 2*M/T over matching blocks
    JACCARD,  // |A & B| / |A | B| over token sets
};

inline const char* metric_name(Metric m) {
    switch (m) {
        case Metric::OVERLAP: return "overlap";
        case Metric::JACCARD: return "jaccard";
    }
    return "?";
}

struct Score {
    double overlap = 0.0;
    BlockList blocks;
};

//=============================================================================
// Block Matcher
//=============================================================================

// Longest block in a[alo, ahi) x b[blo, bhi). Ties go to the smallest a offset,
// then the smallest b offset. size == 0 when nothing matches.
MatchingBlock find_longest_match(const IdSeq& a, const IdSeq& b,
                                 size_t alo, size_t ahi, size_t blo, size_t bhi);

// Full decomposition, including the sentinel. Uses an explicit worklist, so
// stack depth does not grow with document length.
BlockList find_matching_blocks(const IdSeq& a, const IdSeq& b);

// Swap the a and b offsets; the result is still ordered since blocks never cross.
BlockList mirror_blocks(const BlockList& blocks);

inline size_t matched_tokens(const BlockList& blocks) {
    size_t m = 0;
    for (const auto& blk : blocks) m += blk.size;
    return m;
}

inline double overlap_ratio(const BlockList& blocks, size_t len_a, size_t len_b) {
    size_t total = len_a + len_b;
    if (total == 0) return 0.0;
    return 2.0 * static_cast<double>(matched_tokens(blocks)) / static_cast<double>(total);
}

//=============================================================================
// Scoring
//=============================================================================

// True if (a, b) is already the canonical matching order. Matching always runs
// in canonical order and mirrors back, which makes score(a, b) == score(b, a).
bool canonical_order(const TokenSeq& a, const TokenSeq& b);

// Score sequences already interned into the same TokenMap. Blocks are found
// with the pair in canonical order, so equal-length ties go to the earliest
// offset in the canonical first sequence, which need not be a: for a = "y x"
// and b = "x y" the first block is (1, 0, 1).
Score score_interned(const TokenSeq& a, const IdSeq& a_ids,
                     const TokenSeq& b, const IdSeq& b_ids);

// Standalone scoring; interns into a private TokenMap. Same tie rule as
// score_interned.
Score score(const TokenSeq& a, const TokenSeq& b);

//=============================================================================
// Jaccard Similarity
//=============================================================================

inline double jaccard_similarity(const std::unordered_set<uint32_t>& a,
                                 const std::unordered_set<uint32_t>& b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t intersection = 0;
    for (uint32_t x : a) {
        if (b.count(x)) intersection++;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return union_size > 0 ? static_cast<double>(intersection) / union_size : 0.0;
}

inline double jaccard_similarity(const IdSeq& a, const IdSeq& b) {
    std::unordered_set<uint32_t> sa(a.begin(), a.end());
    std::unordered_set<uint32_t> sb(b.begin(), b.end());
    return jaccard_similarity(sa, sb);
}

} // namespace simscan

#endif // SIMSCAN_SIMILARITY_H
