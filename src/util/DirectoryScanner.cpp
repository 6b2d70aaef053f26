#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace reprise::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

// File type constants from dirent.h
constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_DIR = 4;
constexpr uint8_t TYPE_REG = 8;
constexpr uint8_t TYPE_LNK = 10;

DirectoryScanner::Listing DirectoryScanner::list_directory(const std::string& dir_path) {
    Listing listing;

    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            listing.status = OpenStatus::NotFound;
        } else if (err == ENOTDIR) {
            listing.status = OpenStatus::NotDirectory;
        } else {
            listing.status = OpenStatus::Unreadable;
        }
        Logger::debug("DirectoryScanner: Failed to open directory: " + dir_path +
                      " (" + std::string(strerror(err)) + ")");
        return listing;
    }

    std::vector<char> buffer(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), BUFFER_SIZE);

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            listing.status = OpenStatus::Unreadable;
            listing.entries.clear();
            break;
        }

        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            Entry entry;
            entry.name = d->d_name;

            if (d->d_type == TYPE_REG) {
                entry.is_regular = true;
            } else if (d->d_type == TYPE_DIR) {
                entry.is_directory = true;
            } else if (d->d_type == TYPE_UNKNOWN || d->d_type == TYPE_LNK) {
                // Filesystem doesn't support d_type, or a symlink: follow with stat
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) == 0) {
                    entry.is_regular = S_ISREG(entry_stat.st_mode);
                    entry.is_directory = S_ISDIR(entry_stat.st_mode);
                }
            }

            if (entry.is_regular || entry.is_directory) {
                listing.entries.push_back(std::move(entry));
            }
        }
    }

    close(fd);
    return listing;
}

bool DirectoryScanner::exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool DirectoryScanner::is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool DirectoryScanner::is_readable(const std::string& path) {
    return access(path.c_str(), R_OK) == 0;
}

std::string DirectoryScanner::normalize(std::string path) {
    while (path.length() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string DirectoryScanner::join(const std::string& dir_path, const std::string& name) {
    if (dir_path.empty()) return name;
    if (dir_path.back() == '/') return dir_path + name;
    return dir_path + "/" + name;
}

}  // namespace reprise::util
