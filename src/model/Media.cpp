#include "model/Media.hpp"
#include "util/Platform.hpp"

namespace reprise::model {

namespace {

std::string base_name(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.length() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    size_t slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

} // namespace

MediaRef::MediaRef(RefKind kind, std::string identity, const std::string& file_name)
    : kind_(kind),
      identity_(std::move(identity)),
      file_name_(file_name),
      display_name_(util::Platform::stem_of(file_name)),
      extension_(util::Platform::extension_of(file_name)) {}

MediaRef MediaRef::from_path(const std::string& absolute_path) {
    return MediaRef(RefKind::Path, absolute_path, base_name(absolute_path));
}

MediaRef MediaRef::from_uri(const std::string& uri, const std::string& file_name) {
    return MediaRef(RefKind::ProviderUri, uri, file_name);
}

std::string to_string(ScanStatus status) {
    switch (status) {
        case ScanStatus::Done: return "done";
        case ScanStatus::Pass: return "pass";
        case ScanStatus::Err: return "err";
    }
    return "err";
}

std::string describe(const ScanResultItem& item) {
    std::string line = "[" + to_string(item.status) + "] " + item.name;
    if (item.status == ScanStatus::Err && item.reason) {
        line += ": " + *item.reason;
    }
    return line;
}

} // namespace reprise::model
