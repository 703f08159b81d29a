// mmap.h - Memory-mapped file I/O and small filesystem helpers
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_MMAP_H
#define SIMSCAN_MMAP_H

#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace simscan {

//=============================================================================
// MappedFile - Memory-mapped file I/O
//=============================================================================

struct MappedFile {
    int fd = -1;
    char* data = nullptr;
    size_t size = 0;
    std::string path;

    bool open_read(const char* p) {
        path = p;
        fd = ::open(p, O_RDONLY);
        if (fd < 0) return false;

        struct stat st;
        if (fstat(fd, &st) < 0) { close(); return false; }
        if (!S_ISREG(st.st_mode)) { close(); return false; }
        size = st.st_size;

        if (size == 0) {
            data = nullptr;
            return true;
        }

        data = static_cast<char*>(mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0));
        if (data == MAP_FAILED) { data = nullptr; close(); return false; }

        madvise(data, size, MADV_SEQUENTIAL);
        return true;
    }

    bool open_write(const char* p, size_t max_size) {
        path = p;
        fd = ::open(p, O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (fd < 0) return false;

        size = max_size;

        if (size == 0) {
            data = nullptr;
            return true;
        }

        if (ftruncate(fd, size) < 0) { close(); return false; }

        data = static_cast<char*>(mmap(nullptr, size, PROT_READ | PROT_WRITE,
                                        MAP_SHARED, fd, 0));
        if (data == MAP_FAILED) { data = nullptr; close(); return false; }
        return true;
    }

    bool finalize(size_t actual_size) {
        bool ok = true;
        if (data) { munmap(data, size); data = nullptr; }
        if (fd >= 0) {
            if (ftruncate(fd, actual_size) < 0) ok = false;
            if (::close(fd) < 0) ok = false;
            fd = -1;
        }
        return ok;
    }

    void close() {
        if (data) { munmap(data, size); data = nullptr; }
        if (fd >= 0) { ::close(fd); fd = -1; }
    }

    ~MappedFile() { close(); }

    // Non-copyable, moveable
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept
        : fd(other.fd), data(other.data), size(other.size), path(std::move(other.path)) {
        other.fd = -1;
        other.data = nullptr;
        other.size = 0;
    }
};

//=============================================================================
// Whole-file helpers
//=============================================================================

inline bool read_whole_file(const std::string& path, std::string& out) {
    MappedFile mf;
    if (!mf.open_read(path.c_str())) return false;
    out.assign(mf.data ? mf.data : "", mf.size);
    return true;
}

inline bool write_whole_file(const std::string& path, const std::string& content) {
    MappedFile mf;
    if (!mf.open_write(path.c_str(), content.size())) return false;
    if (!content.empty()) memcpy(mf.data, content.data(), content.size());
    return mf.finalize(content.size());
}

inline bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

inline bool is_regular_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

inline std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

// "dir/report.v2.pdf" -> "report.v2.pdf"
inline std::string base_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// "report.v2.pdf" -> "report.v2"
inline std::string stem(const std::string& path) {
    std::string base = base_name(path);
    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return base;
    return base.substr(0, dot);
}

// "report.v2.PDF" -> "pdf" (lower-cased, no dot)
inline std::string extension(const std::string& path) {
    std::string base = base_name(path);
    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return "";
    std::string ext = base.substr(dot + 1);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return ext;
}

// mkdir -p
inline bool make_directories(const std::string& path) {
    if (path.empty()) return false;
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        partial = path.substr(0, pos);
        if (partial.empty() || is_directory(partial)) continue;
        if (::mkdir(partial.c_str(), 0755) < 0 && !is_directory(partial)) return false;
    }
    return is_directory(path);
}

} // namespace simscan

#endif // SIMSCAN_MMAP_H
