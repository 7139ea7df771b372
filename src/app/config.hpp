#pragma once

#include "plant/plant.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace app {

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct ExportConfig final {
    // empty means a random decorated variant
    std::optional<plant::PlantKind> kind;
    // drawn from std::random_device when empty
    std::optional<uint64_t> seed;

    double age = 90.0;
    double width = 1000.0;
    double height = 1000.0;
    std::string output = "plant.svg";

    // more than one frame exports a time-lapse of a `duration` minute session
    uint32_t frames = 1;
    double duration = 45.0;

    // history file to record the session in, if any
    std::string history;
};

ExportConfig parse_config(std::string_view text);
ExportConfig load_config(std::string_view file);

} // namespace app
