#include "record.hpp"

#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

namespace plant {

template <typename T>
static T field(const YAML::Node& in, const char* key) {
    // subscripting a scalar or a list throws a plain YAML::Exception
    if (!in.IsMap()) {
        throw RecordError{fmt::format("plant record entry holding '{}' is not a map", key)};
    }

    const YAML::Node node = in[key];
    if (!node) {
        throw RecordError{fmt::format("plant record is missing '{}'", key)};
    }

    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw RecordError{fmt::format("plant record field '{}' is malformed: {}", key, e.what())};
    }
}

static YAML::Node sequence(const YAML::Node& in, const char* key) {
    if (!in.IsMap()) {
        throw RecordError{fmt::format("plant record entry holding '{}' is not a map", key)};
    }

    const YAML::Node node = in[key];
    if (!node || !node.IsSequence()) {
        throw RecordError{fmt::format("plant record field '{}' is not a list", key)};
    }
    return node;
}

static void save_branches(YAML::Emitter& out, const TreeTraits& tree) {
    out << YAML::Key << "branches" << YAML::Value << YAML::BeginSeq;
    for (const Branch& b : tree.branches) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "height" << YAML::Value << b.height;
        out << YAML::Key << "rotation" << YAML::Value << b.rotation;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

static TreeTraits load_branches(const YAML::Node& in) {
    TreeTraits tree;
    for (const YAML::Node& b : sequence(in, "branches")) {
        tree.branches.push_back(Branch{field<double>(b, "height"), field<double>(b, "rotation")});
    }
    return tree;
}

static void save_flower(YAML::Emitter& out, const FlowerTraits& flower) {
    out << YAML::Key << "lean" << YAML::Value << flower.lean;
    out << YAML::Key << "stem_width" << YAML::Value << flower.stem_width;
    out << YAML::Key << "leaves" << YAML::Value << YAML::BeginSeq;
    for (const Leaf& l : flower.leaves) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "position" << YAML::Value << l.position;
        out << YAML::Key << "size" << YAML::Value << l.size;
        out << YAML::Key << "side" << YAML::Value << l.side;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

static FlowerTraits load_flower(const YAML::Node& in) {
    FlowerTraits flower;
    flower.lean = field<double>(in, "lean");
    flower.stem_width = field<double>(in, "stem_width");
    for (const YAML::Node& l : sequence(in, "leaves")) {
        flower.leaves.push_back(Leaf{field<double>(l, "position"), field<double>(l, "size"), field<double>(l, "side")});
    }
    return flower;
}

static draw::Color load_color(const YAML::Node& in) {
    const YAML::Node c = sequence(in, "color");
    if (c.size() != 3) {
        throw RecordError{"petal color must have 3 components"};
    }

    draw::Color color;
    uint8_t* channels[] = {&color.r, &color.g, &color.b};
    for (std::size_t i = 0; i < 3; ++i) {
        int v = 0;
        try {
            v = c[i].as<int>();
        } catch (const YAML::Exception& e) {
            throw RecordError{fmt::format("petal color is malformed: {}", e.what())};
        }
        if (v < 0 || v > 255) {
            throw RecordError{fmt::format("petal color component {} out of range", v)};
        }
        *channels[i] = static_cast<uint8_t>(v);
    }
    return color;
}

void serialize(YAML::Emitter& out, const Plant& plant) {
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << RECORD_VERSION;
    out << YAML::Key << "kind" << YAML::Value << std::string{kind_name(plant.kind())};
    out << YAML::Key << "deficit" << YAML::Value << plant.deficit();
    out << YAML::Key << "age" << YAML::Value << plant.age();

    std::visit(
        [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, TreeTraits>) {
                save_branches(out, t);
            } else if constexpr (std::is_same_v<T, OrangeTreeTraits>) {
                save_branches(out, t.tree);
                out << YAML::Key << "circles" << YAML::Value << YAML::BeginSeq;
                for (const BranchCircle& c : t.circles) {
                    out << YAML::Flow << YAML::BeginMap;
                    out << YAML::Key << "size" << YAML::Value << c.size;
                    out << YAML::Key << "position" << YAML::Value << c.position;
                    out << YAML::EndMap;
                }
                out << YAML::EndSeq;
            } else if constexpr (std::is_same_v<T, GreenTreeTraits> || std::is_same_v<T, DoubleGreenTreeTraits>) {
                save_branches(out, t.tree);
            } else if constexpr (std::is_same_v<T, FlowerTraits>) {
                save_flower(out, t);
            } else if constexpr (std::is_same_v<T, CircularFlowerTraits>) {
                save_flower(out, t.flower);
                out << YAML::Key << "petals" << YAML::Value << YAML::BeginMap;
                out << YAML::Key << "color" << YAML::Value << YAML::Flow << YAML::BeginSeq << static_cast<int>(t.color.r)
                    << static_cast<int>(t.color.g) << static_cast<int>(t.color.b) << YAML::EndSeq;
                out << YAML::Key << "count" << YAML::Value << t.petal_count;
                out << YAML::Key << "center_ratio" << YAML::Value << t.center_ratio;
                out << YAML::Key << "shape" << YAML::Value << std::string{shape_name(t.shape)};
                out << YAML::EndMap;
            }
        },
        plant.traits());

    out << YAML::EndMap;
}

Plant deserialize(const YAML::Node& in) {
    if (!in || !in.IsMap()) {
        throw RecordError{"plant record is not a map"};
    }

    const int version = field<int>(in, "version");
    if (version != RECORD_VERSION) {
        throw RecordError{fmt::format("unsupported plant record version {}", version)};
    }

    const std::string name = field<std::string>(in, "kind");
    const std::optional<PlantKind> kind = parse_kind(name);
    if (!kind) {
        throw RecordError{fmt::format("unknown plant kind '{}'", name)};
    }

    const double deficit = field<double>(in, "deficit");

    PlantTraits traits;
    switch (*kind) {
    case PlantKind::tree:
        traits = load_branches(in);
        break;
    case PlantKind::orange_tree: {
        OrangeTreeTraits orange{load_branches(in), {}};
        for (const YAML::Node& c : sequence(in, "circles")) {
            orange.circles.push_back(BranchCircle{field<double>(c, "size"), field<double>(c, "position")});
        }
        if (orange.circles.size() != orange.tree.branches.size() + 1) {
            throw RecordError{"orange tree needs one circle per branch plus one for the trunk"};
        }
        traits = std::move(orange);
        break;
    }
    case PlantKind::green_tree:
        traits = GreenTreeTraits{load_branches(in)};
        break;
    case PlantKind::double_green_tree:
        traits = DoubleGreenTreeTraits{load_branches(in)};
        break;
    case PlantKind::flower:
        traits = load_flower(in);
        break;
    case PlantKind::circular_flower: {
        const YAML::Node petals = in["petals"];
        if (!petals || !petals.IsMap()) {
            throw RecordError{"circular flower record is missing 'petals'"};
        }

        CircularFlowerTraits circular;
        circular.flower = load_flower(in);
        circular.color = load_color(petals);
        circular.petal_count = field<uint32_t>(petals, "count");
        circular.center_ratio = field<double>(petals, "center_ratio");

        const std::string shape = field<std::string>(petals, "shape");
        const std::optional<PetalShape> parsed = parse_shape(shape);
        if (!parsed) {
            throw RecordError{fmt::format("unknown petal shape '{}'", shape)};
        }
        circular.shape = *parsed;

        if (circular.petal_count == 0) {
            throw RecordError{"circular flower needs at least one petal"};
        }
        traits = std::move(circular);
        break;
    }
    }

    Plant plant{deficit, std::move(traits)};
    if (in["age"]) {
        plant.set_age(field<double>(in, "age"));
    }
    return plant;
}

std::string to_yaml(const Plant& plant) {
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);
    serialize(out, plant);
    return out.c_str();
}

Plant from_yaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{text});
    } catch (const YAML::Exception& e) {
        throw RecordError{fmt::format("plant record is not valid yaml: {}", e.what())};
    }
    return deserialize(root);
}

} // namespace plant
