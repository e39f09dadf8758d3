// playlist — a looping playlist driven by a rotating cursor
//
// Demonstrates: rotation, plain moves with structured errors, editing the
//               track list through modify() while a track is playing

#include <cursorvec-cpp/cursorvec.hpp>

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace cv = cursorvec_cpp;

struct Track {
    std::string title;
    int seconds;
};

static void now_playing(const cv::CursorVec<Track>& playlist) {
    const auto state = playlist.get_current();
    if (const auto* track = state.value()) {
        std::printf("  [%zu/%zu] %s (%d:%02d)\n", *playlist.get_cursor() + 1,
                    playlist.size(), track->title.c_str(),
                    track->seconds / 60, track->seconds % 60);
    } else {
        const auto status = cv::to_string_view(state.status());
        std::printf("  nothing playing (%.*s)\n", static_cast<int>(status.size()), status.data());
    }
}

int main() {
    auto playlist = cv::CursorVec<Track>{}
        .rotatable(true)
        .with_container({
            {"Intro", 95},
            {"Long Drive", 312},
            {"Interlude", 48},
            {"Night Shift", 274},
            {"Outro", 130},
        });

    std::printf("Start:\n");
    now_playing(playlist);

    // -- Skip forward past the end: the playlist loops ------------------------
    std::printf("Skip x6:\n");
    for (int i = 0; i < 6; ++i) {
        playlist.move_next();
    }
    now_playing(playlist);

    // -- Previous from the first track wraps to the last ----------------------
    if (auto r = playlist.set_cursor(0); !cv::is_ok(r)) return 1;
    std::printf("Previous from first:\n");
    if (const auto* track = playlist.move_prev_and_get().value()) {
        std::printf("  back to %s\n", track->title.c_str());
    }

    // -- Drop short tracks while one is playing -------------------------------
    std::printf("Remove tracks under a minute:\n");
    const auto removed = playlist.modify([](std::vector<Track>& tracks) {
        return std::erase_if(tracks, [](const Track& t) { return t.seconds < 60; });
    });
    std::printf("  removed %zu\n", static_cast<std::size_t>(removed));
    now_playing(playlist);

    // -- Turn looping off and run off the end ---------------------------------
    playlist.set_rotatable(false);
    std::printf("Next until the end:\n");
    while (true) {
        const auto r = playlist.move_next();
        if (cv::is_ok(r)) {
            now_playing(playlist);
            continue;
        }
        if (auto err = cv::error_of(r)) {
            std::printf("  stopped: %s\n", err->message.c_str());
        } else {
            std::printf("  stopped\n");
        }
        break;
    }

    // -- Clear the playlist ---------------------------------------------------
    playlist.modify([](auto& tracks) { tracks.clear(); });
    std::printf("Cleared:\n");
    now_playing(playlist);

    return 0;
}
