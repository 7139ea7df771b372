#pragma once

#include "draw/color.hpp"
#include "growth.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <variant>
#include <vector>

namespace plant {

// Order matches the alternatives of PlantTraits.
enum class PlantKind : uint8_t {
    tree,
    orange_tree,
    green_tree,
    double_green_tree,
    flower,
    circular_flower
};

enum class PetalShape : uint8_t {
    circular,
    triangle,
    dip,
    round
};

std::string_view kind_name(PlantKind kind);
std::optional<PlantKind> parse_kind(std::string_view name);
std::string_view shape_name(PetalShape shape);
std::optional<PetalShape> parse_shape(std::string_view name);

struct Branch final {
    // fraction of the trunk height the branch grows from
    double height;
    // radians, positive leans left once the canvas is flipped upright
    double rotation;

    bool operator==(const Branch&) const = default;
};

struct BranchCircle final {
    double size;
    // fraction of the branch length
    double position;

    bool operator==(const BranchCircle&) const = default;
};

struct Leaf final {
    // fraction of the stem length
    double position;
    double size;
    // -1 or +1, also used as the leaf rotation in radians
    double side;

    bool operator==(const Leaf&) const = default;
};

struct TreeTraits final {
    std::vector<Branch> branches;

    bool operator==(const TreeTraits&) const = default;
};

struct OrangeTreeTraits final {
    TreeTraits tree;
    // one per branch, the last one sits on the trunk
    std::vector<BranchCircle> circles;

    bool operator==(const OrangeTreeTraits&) const = default;
};

struct GreenTreeTraits final {
    TreeTraits tree;

    bool operator==(const GreenTreeTraits&) const = default;
};

struct DoubleGreenTreeTraits final {
    TreeTraits tree;

    bool operator==(const DoubleGreenTreeTraits&) const = default;
};

struct FlowerTraits final {
    // signed, decides which way the stem bends
    double lean;
    double stem_width;
    std::vector<Leaf> leaves;

    bool operator==(const FlowerTraits&) const = default;
};

struct CircularFlowerTraits final {
    FlowerTraits flower;
    draw::Color color;
    uint32_t petal_count;
    double center_ratio;
    PetalShape shape;

    bool operator==(const CircularFlowerTraits&) const = default;
};

using PlantTraits = std::variant<TreeTraits, OrangeTreeTraits, GreenTreeTraits, DoubleGreenTreeTraits, FlowerTraits, CircularFlowerTraits>;

class Plant final {
  public:
    using Rng = std::mt19937_64;

    Plant(double deficit, PlantTraits traits);

    // Draws every random parameter of the variant from rng; nothing random happens afterwards.
    static Plant generate(PlantKind kind, Rng& rng);
    // One of the decorated variants (orange, green and double green trees, circular flower).
    static Plant generate_random(Rng& rng);

    void set_age(double minutes) noexcept {
        current_age = minutes;
    }

    double age() const noexcept {
        return current_age;
    }

    PlantKind kind() const noexcept {
        return static_cast<PlantKind>(plant_traits.index());
    }

    double deficit() const noexcept {
        return deficit_coefficient;
    }

    const PlantTraits& traits() const noexcept {
        return plant_traits;
    }

    double growth() const;
    // lags behind growth(), used for foliage and fruit
    double slow_growth() const;

    double growth_at(double minutes) const;
    double inverse_growth(double coefficient) const;

    // Age at which a session of `duration` minutes looks like it did at `progress` (0..1) of the way through.
    double age_at_progress(double duration, double progress) const;

    bool operator==(const Plant&) const = default;

    static constexpr double age_scale = AGE_SCALE;
    static constexpr double age_exponent = AGE_EXPONENT;

  private:
    double current_age = 0.0;
    double deficit_coefficient;
    PlantTraits plant_traits;
};

std::vector<Branch> generate_branches(Plant::Rng& rng, double deficit, uint32_t count);
std::vector<Leaf> generate_leaves(Plant::Rng& rng, double deficit, uint32_t count);

} // namespace plant
