#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace reprise::util {

/**
 * DirectoryScanner: one-level directory listing using the getdents64 syscall.
 *
 * Uses a 256KB buffer to batch syscalls and the d_type field to avoid
 * stat() calls. Recursion and ordering are left to the caller, which needs
 * different walks for queue building, diagnostics and browsing.
 */
class DirectoryScanner {
public:
    enum class OpenStatus {
        Ok,
        NotFound,
        Unreadable,
        NotDirectory
    };

    struct Entry {
        std::string name;
        bool is_directory = false;
        bool is_regular = false;
    };

    struct Listing {
        OpenStatus status = OpenStatus::Ok;
        std::vector<Entry> entries;  // Kernel order, "." and ".." removed
    };

    /**
     * Lists the immediate children of a directory.
     *
     * @param dir_path Directory to list
     * @return Listing with status Ok, or the reason the directory could not be opened
     */
    [[nodiscard]] static Listing list_directory(const std::string& dir_path);

    [[nodiscard]] static bool exists(const std::string& path);
    [[nodiscard]] static bool is_directory(const std::string& path);
    [[nodiscard]] static bool is_readable(const std::string& path);

    // Strips trailing slashes so joined paths never contain "//"
    [[nodiscard]] static std::string normalize(std::string path);

    [[nodiscard]] static std::string join(const std::string& dir_path, const std::string& name);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64
};

}  // namespace reprise::util
