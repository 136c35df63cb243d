#include <stylemotion/animation/AnimationEngine.hpp>
#include <stylemotion/config/StyleSheet.hpp>
#include <stylemotion/style/ElementStyle.hpp>

#include "utils/TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kSampleSheet = R"({
  "variables": { "accent": "#2F80ED" },
  "styles": {
    ".button": {
      "backgroundColor": "$accent",
      "radius": 6,
      "animation": {
        "transition": { "duration": 0.25, "ease": "OutQuad" },
        "enter": { "opacity": 0, "scale": [0.8, 0.8] },
        "exit": { "opacity": 0, "scale": [0.9, 0.9], "transition": { "duration": 0.2, "ease": "InQuad" } },
        "hover": { "scale": [1.08, 1.08], "transition": { "duration": 0.15, "ease": "OutBack" } }
      }
    }
  }
})";

constexpr float kFrame = 1.0f / 60.0f;

struct DemoOptions {
    std::optional<std::filesystem::path> sheet;
    std::string                          selector = ".button";
    bool                                 log      = false;
};

auto print_usage(char const* program) -> void {
    std::cerr << "Usage: " << program << " [--sheet <file.json>] [--selector <.class|#id>] [--log]\n";
}

auto split_selector(std::string const& selector, std::string& id, std::vector<std::string>& classes) -> bool {
    if (selector.size() < 2) {
        return false;
    }
    if (selector.front() == '#') {
        id = selector.substr(1);
        return true;
    }
    if (selector.front() == '.') {
        classes.push_back(selector.substr(1));
        return true;
    }
    return false;
}

auto print_frame(std::string_view phase, int frame, SM::Style::StyleRecord const& record) -> void {
    std::cout << std::setw(6) << phase << " frame " << std::setw(3) << frame << "  opacity " << std::fixed
              << std::setprecision(3) << record.opacity << "  scale " << record.scale.x << ", " << record.scale.y
              << '\n';
}

// Ticks until the completion settles, capped so a looping show still returns.
auto run_until(SM::Animation::AnimationEngine& engine,
               SM::Animation::Completion const& done,
               std::string_view phase,
               int max_frames) -> void {
    for (int frame = 0; frame < max_frames && !done.ready(); ++frame) {
        engine.update(kFrame);
        print_frame(phase, frame, engine.element().current());
    }
}

auto run_frames(SM::Animation::AnimationEngine& engine, std::string_view phase, int frames) -> void {
    for (int frame = 0; frame < frames; ++frame) {
        engine.update(kFrame);
        print_frame(phase, frame, engine.element().current());
    }
}

} // namespace

int main(int argc, char** argv) {
    DemoOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--sheet" && i + 1 < argc) {
            options.sheet = std::filesystem::path{argv[++i]};
        } else if (arg == "--selector" && i + 1 < argc) {
            options.selector = argv[++i];
        } else if (arg == "--log") {
            options.log = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            print_usage(argv[0]);
            return 1;
        }
    }

#ifdef SM_LOG_DEBUG
    SM::set_thread_name("Demo");
    bool const env_logging = SM::configure_logging_from_env();
    SM::set_logging_enabled(options.log || env_logging);
#else
    if (options.log) {
        std::cerr << "Logging is not compiled in; configure with SM_ENABLE_LOG_DEBUG=ON\n";
    }
#endif

    auto sheet = options.sheet ? SM::Config::LoadStyleSheet(*options.sheet) : SM::Config::ParseStyleSheet(kSampleSheet);
    if (!sheet) {
        std::cerr << "Loading stylesheet failed: " << SM::describeError(sheet.error()) << '\n';
        return 1;
    }

    std::string              id;
    std::vector<std::string> classes;
    if (!split_selector(options.selector, id, classes)) {
        std::cerr << "Selector must look like .class or #id: " << options.selector << '\n';
        return 1;
    }
    auto const* definition = sheet->Resolve(id, classes);
    if (definition == nullptr) {
        std::cerr << "No style matches " << options.selector << '\n';
        return 1;
    }

    SM::Style::ElementStyle element;
    element.applyDefinition(definition->base);

    SM::Animation::AnimationEngine engine{element};
    engine.setup(definition->animation);

    auto show = engine.playShow();
    run_until(engine, show, "show", 120);

    engine.playState("hover");
    run_frames(engine, "hover", 20);
    engine.playState("normal");
    run_frames(engine, "normal", 20);

    auto hide = engine.playHide();
    run_until(engine, hide, "hide", 120);

    std::cout << "applied " << element.applyCount() << " style records\n";
#ifdef SM_LOG_DEBUG
    SM::logger().flush();
#endif
    return 0;
}
