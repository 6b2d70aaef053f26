#pragma once

#include "model/Media.hpp"
#include "model/Records.hpp"
#include <string>

namespace reprise::backend {

class MetadataParser {
public:
    // Provider URIs are parsed only when they map to a local file:// path;
    // otherwise the result carries filename-derived title and artist only.
    static model::TrackMetadata parse(const model::MediaRef& ref);

    // Parse a local file and return complete metadata
    static model::TrackMetadata parse_file(const std::string& path);

private:
    // Helper parsers using native libraries
    static bool parse_mp3(const std::string& path, model::TrackMetadata& meta);
    static bool parse_sndfile(const std::string& path, model::TrackMetadata& meta);
    static bool parse_container(const std::string& path, model::TrackMetadata& meta);

    // Filename parsing fallbacks ("01 - Artist - Title.mp3")
    static std::string extract_title_from_filename(const std::string& stem);
    static std::string extract_artist_from_filename(const std::string& stem);
};

}  // namespace reprise::backend
