#include "backend/Config.hpp"
#include "backend/FilesystemDocumentProvider.hpp"
#include "backend/MemoryDatabase.hpp"
#include "backend/SnapshotFile.hpp"
#include "player/PlaybackController.hpp"
#include "util/Formatting.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using reprise::util::Logger;
using reprise::util::format_time;
using reprise::util::trunc_pad;

namespace {

void print_usage() {
    std::cerr << "usage: reprise <command> [args]\n"
                 "\n"
                 "  scan <dir> [--uri]       list playable files in queue order\n"
                 "  diag <dir> [--uri]       per-file scan report\n"
                 "  browse <dir> [--uri]     one level: folders, then files\n"
                 "  memories [dir]           saved positions, newest first\n"
                 "  bookmarks [file]         bookmarks for one file, or all\n"
                 "  last                     most recent saved position\n"
                 "  forget <file> | --all    delete saved positions\n"
                 "  playlists                imported playlists\n"
                 "  import <dir> [name]      register a folder as a playlist\n";
}

// Folders given on the command line become absolute paths, or file:// URIs with --uri
reprise::model::FolderRef folder_arg(const std::string& arg, bool as_uri) {
    std::error_code ec;
    std::string dir = std::filesystem::absolute(arg, ec).lexically_normal().string();
    if (ec) dir = arg;
    while (dir.length() > 1 && dir.back() == '/') dir.pop_back();
    if (as_uri) {
        return reprise::model::FolderRef::uri(reprise::backend::FilesystemDocumentProvider::to_uri(dir));
    }
    return reprise::model::FolderRef::path(dir);
}

std::string file_arg(const std::string& arg) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(arg, ec);
    return ec ? arg : abs.lexically_normal().string();
}

void print_memory(const reprise::model::PlaybackMemory& m) {
    std::cout << trunc_pad(m.display_name, 40) << "  "
              << format_time(m.position_ms) << " / " << format_time(m.duration_ms) << "  "
              << m.file_identity << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    bool as_uri = false;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--uri") {
            as_uri = true;
        } else {
            positional.push_back(arg);
        }
    }
    const std::string command = positional.front();
    auto arg_at = [&](size_t i) -> std::string { return i < positional.size() ? positional[i] : ""; };

    try {
        Logger::init();
        Logger::info("reprise " + command);

        auto config = reprise::backend::ConfigLoader::load_config();
        auto store = std::make_shared<reprise::backend::MemoryDatabase>(config.database_path);
        auto snapshots = std::make_shared<reprise::backend::SnapshotFile>(config.snapshot_path);
        auto provider = std::make_shared<reprise::backend::FilesystemDocumentProvider>();

        // No audio output in the CLI; loading a playlist is refused
        reprise::player::PlaybackController controller(
            nullptr, store, snapshots, provider, reprise::player::ControllerOptions::from_config(config));

        if (command == "scan" || command == "diag" || command == "browse") {
            std::string dir = arg_at(1);
            if (dir.empty()) dir = config.music_directory.string();
            auto folder = folder_arg(dir, as_uri);

            if (command == "scan") {
                auto refs = controller.scan(folder);
                for (size_t i = 0; i < refs.size(); ++i) {
                    std::cout << i << "\t" << refs[i].display_name() << "\t" << refs[i].identity() << "\n";
                }
                std::cout << refs.size() << " playable\n";
            } else if (command == "diag") {
                auto result = controller.scan_diagnostic(folder);
                for (const auto& item : result.items) {
                    std::cout << reprise::model::describe(item) << "\n";
                }
                std::cout << "total " << result.total() << ", done " << result.done_count()
                          << ", pass " << result.pass_count() << ", err " << result.err_count() << "\n";
            } else {
                auto listing = controller.list_folder(folder);
                for (const auto& sub : listing.folders) {
                    std::cout << sub.identity << "/\n";
                }
                for (const auto& ref : listing.files) {
                    std::cout << ref.file_name() << "\n";
                }
            }
            return 0;
        }

        if (command == "memories") {
            auto memories = positional.size() > 1
                ? controller.resolver().memories_in_folder(folder_arg(arg_at(1), as_uri).identity)
                : controller.resolver().all_memories();
            for (const auto& m : memories) print_memory(m);
            return 0;
        }

        if (command == "bookmarks") {
            auto bookmarks = positional.size() > 1
                ? controller.resolver().bookmarks_for(file_arg(arg_at(1)))
                : controller.resolver().all_bookmarks();
            for (const auto& b : bookmarks) {
                std::cout << b.id << "\t" << trunc_pad(b.label, 24) << "  " << format_time(b.position_ms)
                          << "  " << b.display_name << "\n";
            }
            return 0;
        }

        if (command == "last") {
            auto last = controller.last_session();
            if (!last) {
                std::cout << "nothing saved yet\n";
                return 0;
            }
            print_memory(*last);
            return 0;
        }

        if (command == "forget") {
            if (positional.size() < 2) {
                print_usage();
                return 1;
            }
            if (arg_at(1) == "--all") {
                controller.resolver().clear_all();
            } else {
                controller.resolver().delete_memory(file_arg(arg_at(1)));
            }
            return 0;
        }

        if (command == "playlists") {
            for (const auto& p : controller.playlists()) {
                std::cout << p.id << "\t" << trunc_pad(p.name, 30) << "  " << p.track_count << " tracks  "
                          << p.folder_identity << "\n";
            }
            return 0;
        }

        if (command == "import") {
            if (positional.size() < 2) {
                print_usage();
                return 1;
            }
            auto record = controller.import_playlist(folder_arg(arg_at(1), as_uri), arg_at(2));
            if (!record) {
                std::cerr << "no playable files in " << arg_at(1) << "\n";
                return 1;
            }
            std::cout << record->id << "\t" << record->name << "  " << record->track_count << " tracks\n";
            return 0;
        }

        print_usage();
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "reprise: " << e.what() << "\n";
        return 1;
    }
}
