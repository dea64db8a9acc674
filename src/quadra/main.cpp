//=============================================================================
// quadra - 2D canvas renderer
//
// Main entry point. Creates and runs the scene viewer.
//=============================================================================

#include <quadra/viewer.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

static bool helpRequested(const quadra::Error& error) {
    for (const quadra::Error* e = &error; e; e = e->cause()) {
        if (e->message() == "Help requested") return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto result = quadra::Viewer::create(argc, argv);
    if (!result) {
        if (helpRequested(result.error())) {
            return 0;
        }
        yerror("Failed to initialize quadra: {}", quadra::error_msg(result));
        return 1;
    }
    auto viewer = *result;
    auto runResult = viewer->run();
    viewer->shutdown();
    if (!runResult) {
        yerror("quadra failed: {}", quadra::error_msg(runResult));
        return 1;
    }
    return 0;
}
