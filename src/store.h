// store.h - Directory of source documents addressed by serial number
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_STORE_H
#define SIMSCAN_STORE_H

#include "errors.h"
#include "extract.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace simscan {

struct StoreEntry {
    size_t id;              // 1-based position in the sorted listing
    std::string file_name;
    std::string extension;  // upper-case, e.g. "PDF"
    uint64_t size_bytes;
};

struct RemoveSummary {
    size_t deleted = 0;
    size_t not_found = 0;
};

// "2 files successfully deleted, 1 file not found"
std::string describe(const RemoveSummary& summary);

// 1536 -> "1.50 KB"
std::string human_readable_size(uint64_t bytes);

class FileStore {
public:
    FileStore(std::string dir, const ExtractorRegistry& registry)
        : dir_(std::move(dir)), registry_(registry) {}

    const std::string& dir() const { return dir_; }

    // Create the store directory if missing
    bool ensure() const;

    // Sorted by file name; serials are stable until the next add/remove
    std::vector<StoreEntry> list() const;

    // Copy source into the store under its base name. UNSUPPORTED_FORMAT for an
    // extension no extractor handles, IO if the copy fails.
    RunError add(const std::string& source, std::string& stored_path) const;

    // Delete by serial. Serials refer to the listing taken before any deletion.
    RemoveSummary remove(const std::vector<long>& serials) const;

private:
    std::string dir_;
    const ExtractorRegistry& registry_;
};

} // namespace simscan

#endif // SIMSCAN_STORE_H
