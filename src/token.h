// token.h - Documents, word tokenization and token interning
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_TOKEN_H
#define SIMSCAN_TOKEN_H

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#ifdef __x86_64__
#include <emmintrin.h>
#else
#define _mm_pause() ((void)0)
#endif

namespace simscan {

using TokenSeq = std::vector<std::string>;
using IdSeq = std::vector<uint32_t>;

// A unit under comparison. name is the source filename without extension.
struct Document {
    std::string name;
    TokenSeq tokens;
};

//=============================================================================
// Word Tokenization
//=============================================================================

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Split on ASCII whitespace, appending to out. Returns number of tokens added.
inline size_t tokenize_words(const char* data, size_t size, TokenSeq& out) {
    size_t added = 0;
    const char* p = data;
    const char* end = data + size;
    while (p < end) {
        while (p < end && is_space(*p)) ++p;
        if (p >= end) break;
        const char* tok = p;
        while (p < end && !is_space(*p)) ++p;
        out.emplace_back(tok, p - tok);
        ++added;
    }
    return added;
}

inline TokenSeq tokenize_words(std::string_view text) {
    TokenSeq out;
    tokenize_words(text.data(), text.size(), out);
    return out;
}

//=============================================================================
// FNV-1a Hash Function
//=============================================================================

inline uint64_t fnv1a_hash(const char* data, size_t len) {
    uint64_t h = 14695981039346656037ULL;
    while (len >= 8) {
        uint64_t k;
        memcpy(&k, data, 8);
        h ^= k;
        h *= 1099511628211ULL;
        data += 8;
        len -= 8;
    }
    while (len--) {
        h ^= static_cast<uint8_t>(*data++);
        h *= 1099511628211ULL;
    }
    return h;
}

//=============================================================================
// TokenMap - Lock-free concurrent string interning
//=============================================================================
//
// Maps word tokens to dense 32-bit IDs so the block matcher compares integers
// instead of strings. Several documents can be interned concurrently.
//
// Stores pointers into the callers' token strings, which must outlive the map.
// Size the map at twice the number of distinct tokens; get_or_insert returns
// UINT32_MAX once the probe budget is exhausted.

class TokenMap {
public:
    struct Slot {
        uint64_t hash;
        uint32_t id;
        const char* ptr;
        uint32_t len;
    };

    explicit TokenMap(size_t capacity) {
        capacity_ = 16;
        while (capacity_ < capacity) capacity_ *= 2;
        mask_ = capacity_ - 1;
        slots_ = static_cast<Slot*>(calloc(capacity_, sizeof(Slot)));
    }

    ~TokenMap() { free(slots_); }

    // Non-copyable
    TokenMap(const TokenMap&) = delete;
    TokenMap& operator=(const TokenMap&) = delete;

    uint32_t get_or_insert(const char* ptr, size_t len, std::atomic<uint32_t>& next_id) {
        uint64_t h = fnv1a_hash(ptr, len);
        if (h == 0) h = 1;

        size_t idx = h & mask_;
        size_t max_probes = capacity_ * 7 / 10;

        for (size_t probe = 0; probe < max_probes; ++probe) {
            Slot& s = slots_[idx];
            uint64_t current = __atomic_load_n(&s.hash, __ATOMIC_RELAXED);

            if (current == 0) {
                uint64_t expected = 0;
                if (__atomic_compare_exchange_n(&s.hash, &expected, h,
                        false, __ATOMIC_ACQ_REL, __ATOMIC_ACQUIRE)) {
                    uint32_t new_id = next_id.fetch_add(1, std::memory_order_relaxed);
                    s.len = static_cast<uint32_t>(len);
                    __atomic_store_n(&s.id, new_id, __ATOMIC_RELEASE);
                    __atomic_store_n(&s.ptr, ptr, __ATOMIC_RELEASE);
                    return new_id;
                }
                current = __atomic_load_n(&s.hash, __ATOMIC_ACQUIRE);
            }

            if (current == h) {
                // Empty strings still publish a non-null ptr (std::string data)
                const char* slot_ptr;
                while ((slot_ptr = __atomic_load_n(&s.ptr, __ATOMIC_ACQUIRE)) == nullptr) {
                    _mm_pause();
                }
                if (s.len == len && memcmp(slot_ptr, ptr, len) == 0) {
                    return __atomic_load_n(&s.id, __ATOMIC_ACQUIRE);
                }
            }

            idx = (idx + 1) & mask_;
        }

        return UINT32_MAX;
    }

    // Intern a whole sequence. Returns false on overflow.
    bool intern(const TokenSeq& tokens, IdSeq& ids, std::atomic<uint32_t>& next_id) {
        ids.clear();
        ids.reserve(tokens.size());
        for (const auto& tok : tokens) {
            uint32_t id = get_or_insert(tok.data(), tok.size(), next_id);
            if (id == UINT32_MAX) return false;
            ids.push_back(id);
        }
        return true;
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    size_t mask_;
    Slot* slots_;
};

} // namespace simscan

#endif // SIMSCAN_TOKEN_H
