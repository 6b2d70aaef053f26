#include "backend/MetadataParser.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

/*
 * Tag and duration extraction, one native library per family:
 *   mpg123      MP3 (ID3v2, then ID3v1)
 *   libsndfile  FLAC, OGG/Vorbis, WAV
 *   libavformat everything carried in a container (MP4 family, Matroska/WebM,
 *               AVI, MOV, TS, 3GP, WMA, APE, Opus, AAC)
 */

namespace reprise::backend {

namespace {
    std::string trim(const std::string& str) {
        if (str.empty()) return "";
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    }

    // Strips a leading "01." / "01 " / "01_" track number
    std::string strip_track_number(std::string name) {
        if (name.length() > 3 && std::isdigit(static_cast<unsigned char>(name[0])) &&
            std::isdigit(static_cast<unsigned char>(name[1]))) {
            if (name[2] == '.' || name[2] == ' ' || name[2] == '_') {
                name = trim(name.substr(3));
            }
        }
        return name;
    }
}

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

model::TrackMetadata MetadataParser::parse(const model::MediaRef& ref) {
    if (ref.kind() == model::RefKind::Path) {
        return parse_file(ref.identity());
    }

    if (auto local = util::Platform::local_path_from_uri(ref.identity())) {
        return parse_file(*local);
    }

    util::Logger::debug("MetadataParser: No local path for " + ref.identity() + ", using file name");
    model::TrackMetadata meta;
    meta.title = extract_title_from_filename(ref.display_name());
    meta.artist = extract_artist_from_filename(ref.display_name());
    return meta;
}

model::TrackMetadata MetadataParser::parse_file(const std::string& path) {
    model::TrackMetadata meta;
    std::string stem = std::filesystem::path(path).stem().string();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        meta.is_valid = false;
        meta.error = "File not found";
        meta.title = extract_title_from_filename(stem);
        return meta;
    }

    std::string ext = util::Platform::extension_of(path);

    bool parsed = false;
    if (ext == "mp3") {
        parsed = parse_mp3(path, meta);
    } else if (ext == "flac" || ext == "wav" || ext == "ogg") {
        parsed = parse_sndfile(path, meta);
        if (!parsed) {
            parsed = parse_container(path, meta);
        }
    } else {
        parsed = parse_container(path, meta);
    }

    // Post-process metadata
    if (meta.title.empty()) {
        meta.title = extract_title_from_filename(stem);
    }
    if (meta.artist.empty()) {
        meta.artist = extract_artist_from_filename(stem);
    }
    if (meta.album.empty()) {
        auto parent = std::filesystem::path(path).parent_path();
        meta.album = parent.empty() ? "Unknown Album" : parent.filename().string();
    }

    if (!parsed) {
        util::Logger::warn("MetadataParser: Failed to parse " + path);
        meta.is_valid = false;
        meta.error = "Failed to parse media file";
        return meta;
    }

    meta.is_valid = true;
    return meta;
}

bool MetadataParser::parse_mp3(const std::string& path, model::TrackMetadata& meta) {
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return false;

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        mpg123_delete(mh);
        return false;
    }

    // Scan to get accurate length and parse ID3 tags
    mpg123_scan(mh);

    long rate = 0;
    int channels, encoding;
    mpg123_getformat(mh, &rate, &channels, &encoding);

    off_t length = mpg123_length(mh);
    if (length > 0 && rate > 0) {
        meta.duration_ms = static_cast<int64_t>(length) * 1000 / rate;
    }

    mpg123_id3v1* v1;
    mpg123_id3v2* v2;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (v2->title && v2->title->p) meta.title = trim(v2->title->p);
            if (v2->artist && v2->artist->p) meta.artist = trim(v2->artist->p);
            if (v2->album && v2->album->p) meta.album = trim(v2->album->p);
        }
        else if (v1) {
            meta.title = trim(std::string(v1->title, strnlen(v1->title, sizeof(v1->title))));
            meta.artist = trim(std::string(v1->artist, strnlen(v1->artist, sizeof(v1->artist))));
            meta.album = trim(std::string(v1->album, strnlen(v1->album, sizeof(v1->album))));
        }
    }
    mpg123_close(mh);
    mpg123_delete(mh);
    return true;
}

bool MetadataParser::parse_sndfile(const std::string& path, model::TrackMetadata& meta) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) return false;

    if (sfinfo.samplerate > 0) {
        meta.duration_ms = static_cast<int64_t>(sfinfo.frames) * 1000 / sfinfo.samplerate;
    }

    auto get_tag = [&](int tag_id) -> std::string {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? trim(val) : "";
    };

    meta.title = get_tag(SF_STR_TITLE);
    meta.artist = get_tag(SF_STR_ARTIST);
    meta.album = get_tag(SF_STR_ALBUM);

    sf_close(sndfile);
    return true;
}

bool MetadataParser::parse_container(const std::string& path, model::TrackMetadata& meta) {
    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(ret, errbuf, sizeof(errbuf));
        util::Logger::debug("MetadataParser: avformat_open_input failed for " + path + ": " + errbuf);
        return false;
    }

    ret = avformat_find_stream_info(format_ctx, nullptr);
    if (ret < 0) {
        util::Logger::debug("MetadataParser: No stream info for " + path);
    }

    if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
        meta.duration_ms = format_ctx->duration * 1000 / AV_TIME_BASE;
    }

    auto get_tag = [&](const char* key) -> std::string {
        const AVDictionaryEntry* entry = av_dict_get(format_ctx->metadata, key, nullptr, 0);
        return entry && entry->value ? trim(entry->value) : "";
    };

    meta.title = get_tag("title");
    meta.artist = get_tag("artist");
    meta.album = get_tag("album");

    avformat_close_input(&format_ctx);
    return true;
}

std::string MetadataParser::extract_title_from_filename(const std::string& stem) {
    std::string filename = stem;

    size_t dash_pos = filename.rfind(" - ");
    if (dash_pos != std::string::npos && dash_pos + 3 < filename.length()) {
        return filename.substr(dash_pos + 3);
    }

    filename = strip_track_number(filename);
    std::replace(filename.begin(), filename.end(), '_', ' ');
    return filename;
}

std::string MetadataParser::extract_artist_from_filename(const std::string& stem) {
    std::string rest = stem;

    // "01 - Artist - Title": drop the numeric prefix first
    size_t dash_pos = rest.find(" - ");
    if (dash_pos != std::string::npos && dash_pos > 0 &&
        std::all_of(rest.begin(), rest.begin() + static_cast<long>(dash_pos),
                    [](unsigned char c) { return std::isdigit(c); })) {
        rest = rest.substr(dash_pos + 3);
        dash_pos = rest.find(" - ");
    }

    if (dash_pos != std::string::npos) {
        std::string artist = strip_track_number(rest.substr(0, dash_pos));
        if (!artist.empty()) return artist;
    }
    return "Unknown Artist";
}

}  // namespace reprise::backend
