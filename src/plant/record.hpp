#pragma once

#include "plant.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace YAML {
class Emitter;
class Node;
} // namespace YAML

namespace plant {

static constexpr inline int RECORD_VERSION = 1;

class RecordError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Variant tag plus every random parameter as plain fields, emitted as a YAML map.
void serialize(YAML::Emitter& out, const Plant& plant);
// Throws RecordError on an unknown version or kind, or a missing or malformed field.
Plant deserialize(const YAML::Node& in);

std::string to_yaml(const Plant& plant);
Plant from_yaml(std::string_view text);

} // namespace plant
