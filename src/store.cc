// store.cc - Source document store: list, add, remove by serial

#include "store.h"
#include "mmap.h"

#include <algorithm>
#include <dirent.h>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace simscan {

std::string describe(const RemoveSummary& summary) {
    std::vector<std::string> parts;
    if (summary.deleted > 0) {
        parts.push_back(std::to_string(summary.deleted) +
                        (summary.deleted == 1 ? " file" : " files") + " successfully deleted");
    }
    if (summary.not_found > 0) {
        parts.push_back(std::to_string(summary.not_found) +
                        (summary.not_found == 1 ? " file" : " files") + " not found");
    }
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

std::string human_readable_size(uint64_t bytes) {
    static const char* const UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << UNITS[unit];
    return ss.str();
}

bool FileStore::ensure() const {
    return is_directory(dir_) || make_directories(dir_);
}

std::vector<StoreEntry> FileStore::list() const {
    std::vector<std::string> names;
    if (DIR* d = opendir(dir_.c_str())) {
        while (struct dirent* ent = readdir(d)) {
            std::string name = ent->d_name;
            if (name == "." || name == "..") continue;
            if (is_regular_file(join_path(dir_, name))) names.push_back(name);
        }
        closedir(d);
    }
    std::sort(names.begin(), names.end());

    std::vector<StoreEntry> entries;
    entries.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        struct stat st;
        uint64_t size = 0;
        if (stat(join_path(dir_, names[i]).c_str(), &st) == 0) size = st.st_size;

        std::string ext = extension(names[i]);
        for (auto& c : ext) {
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        }
        entries.push_back({i + 1, names[i], ext, size});
    }
    return entries;
}

RunError FileStore::add(const std::string& source, std::string& stored_path) const {
    if (!registry_.supports(source)) return RunError::UNSUPPORTED_FORMAT;
    if (!is_regular_file(source)) return RunError::PATH_NOT_FOUND;
    if (!ensure()) return RunError::IO;

    std::string content;
    if (!read_whole_file(source, content)) return RunError::IO;

    stored_path = join_path(dir_, base_name(source));
    if (!write_whole_file(stored_path, content)) return RunError::IO;
    return RunError::NONE;
}

RemoveSummary FileStore::remove(const std::vector<long>& serials) const {
    RemoveSummary summary;
    std::vector<StoreEntry> entries = list();

    for (long serial : serials) {
        if (serial < 1 || static_cast<size_t>(serial) > entries.size()) {
            summary.not_found++;
            continue;
        }
        std::string path = join_path(dir_, entries[serial - 1].file_name);
        if (::unlink(path.c_str()) == 0) {
            summary.deleted++;
        } else {
            summary.not_found++;
        }
    }
    return summary;
}

} // namespace simscan
