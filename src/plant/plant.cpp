#include "plant.hpp"

#include "helpers.hpp"
#include "palette.hpp"

#include <array>
#include <cmath>
#include <utility>
#include <spdlog/spdlog.h>

namespace plant {

static constexpr std::array<std::string_view, 6> KIND_NAMES = {
    "tree", "orange_tree", "green_tree", "double_green_tree", "flower", "circular_flower"};

static constexpr std::array<std::string_view, 4> SHAPE_NAMES = {"circular", "triangle", "dip", "round"};

std::string_view kind_name(PlantKind kind) {
    return KIND_NAMES.at(static_cast<std::size_t>(kind));
}

std::optional<PlantKind> parse_kind(std::string_view name) {
    for (std::size_t i = 0; i < KIND_NAMES.size(); ++i) {
        if (KIND_NAMES[i] == name)
            return static_cast<PlantKind>(i);
    }
    return std::nullopt;
}

std::string_view shape_name(PetalShape shape) {
    return SHAPE_NAMES.at(static_cast<std::size_t>(shape));
}

std::optional<PetalShape> parse_shape(std::string_view name) {
    for (std::size_t i = 0; i < SHAPE_NAMES.size(); ++i) {
        if (SHAPE_NAMES[i] == name)
            return static_cast<PetalShape>(i);
    }
    return std::nullopt;
}

std::vector<Branch> generate_branches(Plant::Rng& rng, double deficit, uint32_t count) {
    std::vector<Branch> branches;
    branches.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        const double height = uniform(rng, deficit * 0.45, deficit * 0.55);
        // a pair of branches always points away from each other
        const double side = count == 2 ? (i - 0.5) * 2.0 : random_sign(rng);
        branches.push_back(Branch{height, side * std::acos(uniform(rng, 0.4, 0.6))});
    }

    return branches;
}

std::vector<Leaf> generate_leaves(Plant::Rng& rng, double deficit, uint32_t count) {
    std::vector<Leaf> leaves;
    leaves.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        const double position = uniform(rng, deficit * 0.25, deficit * 0.40);
        const double size = uniform(rng, 0.9, 1.1);
        const double side = count == 2 ? (i - 0.5) * 2.0 : random_sign(rng);
        leaves.push_back(Leaf{position, size, side});
    }

    return leaves;
}

static TreeTraits generate_tree(Plant::Rng& rng, double deficit, uint32_t count) {
    return TreeTraits{generate_branches(rng, deficit, count)};
}

static FlowerTraits generate_flower(Plant::Rng& rng, double deficit) {
    FlowerTraits flower;
    const double lean = uniform(rng, 0.4, 1.0);
    flower.lean = lean * random_sign(rng);
    flower.leaves = generate_leaves(rng, deficit, 2);
    flower.stem_width = uniform(rng, 3.5, 4.0);
    return flower;
}

static PlantTraits generate_traits(PlantKind kind, Plant::Rng& rng, double deficit) {
    switch (kind) {
    case PlantKind::tree:
        return generate_tree(rng, deficit, static_cast<uint32_t>(std::lround(uniform(rng, 1.0, 2.0))));
    case PlantKind::orange_tree: {
        // two branches look best with the round fruit
        OrangeTreeTraits orange{generate_tree(rng, deficit, 2), {}};
        for (std::size_t i = 0; i < orange.tree.branches.size() + 1; ++i) {
            const double size = uniform(rng, deficit * 0.30, deficit * 0.37);
            const double position = uniform(rng, deficit * 0.9, deficit);
            orange.circles.push_back(BranchCircle{size, position});
        }
        return orange;
    }
    case PlantKind::green_tree:
        return GreenTreeTraits{generate_tree(rng, deficit, static_cast<uint32_t>(std::lround(uniform(rng, 1.0, 2.0))))};
    case PlantKind::double_green_tree:
        return DoubleGreenTreeTraits{generate_tree(rng, deficit, static_cast<uint32_t>(std::lround(uniform(rng, 1.0, 2.0))))};
    case PlantKind::flower:
        return generate_flower(rng, deficit);
    case PlantKind::circular_flower: {
        CircularFlowerTraits circular;
        circular.flower = generate_flower(rng, deficit);

        std::uniform_int_distribution<std::size_t> color_dist{0, palette::PETALS.size() - 1};
        circular.color = palette::PETALS[color_dist(rng)];

        std::uniform_int_distribution<uint32_t> count_dist{5, 7};
        circular.petal_count = count_dist(rng);

        // the center is a bit smaller than the petals
        circular.center_ratio = uniform(rng, 0.75, 0.85);

        std::uniform_int_distribution<uint32_t> shape_dist{0, 3};
        circular.shape = static_cast<PetalShape>(shape_dist(rng));

        // dip and round petals only look right in fives
        if (circular.shape == PetalShape::dip || circular.shape == PetalShape::round) {
            circular.petal_count = 5;
        }
        return circular;
    }
    }

    return TreeTraits{};
}

Plant::Plant(double deficit, PlantTraits traits) : deficit_coefficient{deficit}, plant_traits{std::move(traits)} {
}

Plant Plant::generate(PlantKind kind, Rng& rng) {
    const double deficit = uniform(rng, 0.9, 1.0);
    Plant p{deficit, generate_traits(kind, rng, deficit)};

    spdlog::debug("generated {} (deficit {:.3f})", kind_name(kind), deficit);
    return p;
}

Plant Plant::generate_random(Rng& rng) {
    static constexpr std::array<PlantKind, 4> DECORATED = {
        PlantKind::orange_tree, PlantKind::green_tree, PlantKind::double_green_tree, PlantKind::circular_flower};

    std::uniform_int_distribution<std::size_t> dist{0, DECORATED.size() - 1};
    return generate(DECORATED[dist(rng)], rng);
}

double Plant::growth() const {
    return growth_at(current_age);
}

double Plant::slow_growth() const {
    return std::pow(growth(), 3.0);
}

double Plant::growth_at(double minutes) const {
    return age_coefficient(minutes, age_scale, age_exponent);
}

double Plant::inverse_growth(double coefficient) const {
    return inverse_age_coefficient(coefficient, age_scale, age_exponent);
}

double Plant::age_at_progress(double duration, double progress) const {
    return inverse_growth(progress * growth_at(duration));
}

} // namespace plant
