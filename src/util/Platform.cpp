#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>

namespace reprise::util {

std::filesystem::path Platform::get_music_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / "Music";
        Logger::debug("Platform: Music directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: ./Music");
    return "./Music";
}

std::filesystem::path Platform::get_config_directory() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) {
        return std::filesystem::path(xdg_config) / "reprise";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "reprise";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/reprise");
    return ".config/reprise";
}

std::filesystem::path Platform::get_data_directory() {
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "reprise";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / "reprise";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .local/share/reprise");
    return ".local/share/reprise";
}

bool Platform::is_media_extension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    std::string ext(extension);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& e : MEDIA_EXTENSIONS) {
        if (e == ext) return true;
    }
    return false;
}

std::string Platform::extension_of(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= file_name.size()) {
        return "";
    }
    std::string ext(file_name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string Platform::stem_of(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string(file_name);
    }
    return std::string(file_name.substr(0, dot));
}

std::optional<std::string> Platform::local_path_from_uri(const std::string& uri) {
    constexpr std::string_view scheme = "file://";
    if (!uri.starts_with(scheme)) {
        return std::nullopt;
    }

    // Percent-decode the path part
    std::string path;
    path.reserve(uri.size() - scheme.size());
    for (size_t i = scheme.size(); i < uri.size(); ++i) {
        if (uri[i] == '%' && i + 2 < uri.size() &&
            std::isxdigit(static_cast<unsigned char>(uri[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(uri[i + 2]))) {
            path.push_back(static_cast<char>(std::stoi(uri.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            path.push_back(uri[i]);
        }
    }
    return path;
}

int64_t Platform::now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace reprise::util
