#include "config.hpp"

#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

namespace app {

template <typename T>
static void read(const YAML::Node& in, const char* key, T& dst) {
    const YAML::Node node = in[key];
    if (!node || node.IsNull())
        return;

    try {
        dst = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError{fmt::format("config key '{}' is malformed: {}", key, e.what())};
    }
}

ExportConfig parse_config(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{text});
    } catch (const YAML::Exception& e) {
        throw ConfigError{fmt::format("config is not valid yaml: {}", e.what())};
    }

    ExportConfig cfg;
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError{"config must be a map"};
    }

    std::string kind = "random";
    read(root, "kind", kind);
    if (kind != "random") {
        cfg.kind = plant::parse_kind(kind);
        if (!cfg.kind) {
            throw ConfigError{fmt::format("unknown plant kind '{}'", kind)};
        }
    }

    if (root["seed"] && !root["seed"].IsNull()) {
        uint64_t seed = 0;
        read(root, "seed", seed);
        cfg.seed = seed;
    }

    read(root, "age", cfg.age);
    read(root, "width", cfg.width);
    read(root, "height", cfg.height);
    read(root, "output", cfg.output);
    read(root, "frames", cfg.frames);
    read(root, "duration", cfg.duration);
    read(root, "history", cfg.history);

    if (cfg.width <= 0.0 || cfg.height <= 0.0) {
        throw ConfigError{fmt::format("canvas size {}x{} must be positive", cfg.width, cfg.height)};
    }
    if (cfg.age < 0.0 || cfg.duration < 0.0) {
        throw ConfigError{"age and duration can't be negative"};
    }
    if (cfg.frames == 0) {
        throw ConfigError{"at least one frame is needed"};
    }
    if (cfg.output.empty()) {
        throw ConfigError{"output path is empty"};
    }

    return cfg;
}

ExportConfig load_config(std::string_view file) {
    std::ifstream f{std::string{file}};
    if (!f) {
        throw ConfigError{fmt::format("can't open config file {}", file)};
    }

    const std::string text{std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
    spdlog::debug("loaded config from {}", file);
    return parse_config(text);
}

} // namespace app
