// similarity.cc - Longest-match block decomposition and overlap scoring
// Divide-and-conquer over (a range, b range) intervals driven by a worklist

#include "similarity.h"

#include <algorithm>
#include <atomic>
#include <unordered_map>
#include <utility>

namespace simscan {

// Token id -> ascending positions in b
using PositionIndex = std::unordered_map<uint32_t, std::vector<size_t>>;

static PositionIndex index_positions(const IdSeq& b) {
    PositionIndex b2j;
    b2j.reserve(b.size());
    for (size_t j = 0; j < b.size(); ++j) {
        b2j[b[j]].push_back(j);
    }
    return b2j;
}

static MatchingBlock longest_match(const IdSeq& a, const PositionIndex& b2j,
                            size_t alo, size_t ahi, size_t blo, size_t bhi) {
    MatchingBlock best{alo, blo, 0};

    // j2len[j] = length of the match ending at a[i-1], b[j]
    std::unordered_map<size_t, size_t> j2len;
    std::unordered_map<size_t, size_t> newj2len;

    for (size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto it = b2j.find(a[i]);
        if (it != b2j.end()) {
            const auto& positions = it->second;
            auto first = std::lower_bound(positions.begin(), positions.end(), blo);
            for (auto p = first; p != positions.end() && *p < bhi; ++p) {
                size_t j = *p;
                size_t k = 1;
                if (j > blo) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end()) k = prev->second + 1;
                }
                newj2len[j] = k;
                // Strict '>' keeps the earliest a, then earliest b, on ties
                if (k > best.size) {
                    best = {i + 1 - k, j + 1 - k, k};
                }
            }
        }
        std::swap(j2len, newj2len);
    }

    return best;
}

MatchingBlock find_longest_match(const IdSeq& a, const IdSeq& b,
                                 size_t alo, size_t ahi, size_t blo, size_t bhi) {
    return longest_match(a, index_positions(b), alo, ahi, blo, bhi);
}

BlockList find_matching_blocks(const IdSeq& a, const IdSeq& b) {
    const size_t la = a.size();
    const size_t lb = b.size();
    const PositionIndex b2j = index_positions(b);

    struct Range { size_t alo, ahi, blo, bhi; };
    std::vector<Range> work;
    work.push_back({0, la, 0, lb});

    BlockList raw;
    while (!work.empty()) {
        Range r = work.back();
        work.pop_back();
        if (r.alo >= r.ahi || r.blo >= r.bhi) continue;

        MatchingBlock m = longest_match(a, b2j, r.alo, r.ahi, r.blo, r.bhi);
        if (m.size == 0) continue;

        raw.push_back(m);
        if (r.alo < m.a && r.blo < m.b) {
            work.push_back({r.alo, m.a, r.blo, m.b});
        }
        if (m.a + m.size < r.ahi && m.b + m.size < r.bhi) {
            work.push_back({m.a + m.size, r.ahi, m.b + m.size, r.bhi});
        }
    }

    std::sort(raw.begin(), raw.end(), [](const MatchingBlock& x, const MatchingBlock& y) {
        return x.a != y.a ? x.a < y.a : x.b < y.b;
    });

    // Merge blocks that continue each other
    BlockList blocks;
    blocks.reserve(raw.size() + 1);
    for (const auto& m : raw) {
        if (!blocks.empty()) {
            MatchingBlock& last = blocks.back();
            if (last.a + last.size == m.a && last.b + last.size == m.b) {
                last.size += m.size;
                continue;
            }
        }
        blocks.push_back(m);
    }

    blocks.push_back({la, lb, 0});
    return blocks;
}

BlockList mirror_blocks(const BlockList& blocks) {
    BlockList out;
    out.reserve(blocks.size());
    for (const auto& blk : blocks) {
        out.push_back({blk.b, blk.a, blk.size});
    }
    return out;
}

bool canonical_order(const TokenSeq& a, const TokenSeq& b) {
    if (a.size() != b.size()) return a.size() < b.size();
    return !std::lexicographical_compare(b.begin(), b.end(), a.begin(), a.end());
}

Score score_interned(const TokenSeq& a, const IdSeq& a_ids,
                     const TokenSeq& b, const IdSeq& b_ids) {
    Score s;
    if (a_ids.empty() && b_ids.empty()) return s;

    if (canonical_order(a, b)) {
        s.blocks = find_matching_blocks(a_ids, b_ids);
    } else {
        s.blocks = mirror_blocks(find_matching_blocks(b_ids, a_ids));
    }
    s.overlap = overlap_ratio(s.blocks, a_ids.size(), b_ids.size());
    return s;
}

Score score(const TokenSeq& a, const TokenSeq& b) {
    TokenMap tokens((a.size() + b.size()) * 2);
    std::atomic<uint32_t> next_id{0};
    IdSeq a_ids, b_ids;
    // Capacity covers every distinct token, so interning cannot overflow here
    if (!tokens.intern(a, a_ids, next_id) || !tokens.intern(b, b_ids, next_id)) {
        return Score{};
    }
    return score_interned(a, a_ids, b, b_ids);
}

} // namespace simscan
