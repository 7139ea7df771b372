#include <gtest/gtest.h>

#include "draw/recording_surface.hpp"
#include "plant/plant.hpp"
#include "plant/record.hpp"
#include "plant/render.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

using namespace plant;

static constexpr PlantKind KINDS[] = {PlantKind::tree, PlantKind::orange_tree, PlantKind::green_tree,
                                      PlantKind::double_green_tree, PlantKind::flower, PlantKind::circular_flower};

TEST(RecordTest, EveryKindReplaysIdentically) {
    for (PlantKind kind : KINDS) {
        for (uint64_t seed = 0; seed < 5; ++seed) {
            Plant::Rng rng{seed};
            Plant p = Plant::generate(kind, rng);
            p.set_age(33.0);

            const Plant loaded = from_yaml(to_yaml(p));
            ASSERT_EQ(loaded, p) << kind_name(kind) << " seed " << seed;

            draw::RecordingSurface a, b;
            draw_plant(p, a, 500.0, 500.0);
            draw_plant(loaded, b, 500.0, 500.0);
            EXPECT_EQ(a.commands(), b.commands()) << kind_name(kind);
        }
    }
}

TEST(RecordTest, WritesReadableFields) {
    CircularFlowerTraits traits{FlowerTraits{-0.5, 3.6, {Leaf{0.3, 1.0, -1.0}, Leaf{0.31, 0.95, 1.0}}},
                                draw::Color{255, 85, 85}, 6, 0.8, PetalShape::triangle};
    const Plant p{0.92, traits};

    const YAML::Node root = YAML::Load(to_yaml(p));
    EXPECT_EQ(root["version"].as<int>(), RECORD_VERSION);
    EXPECT_EQ(root["kind"].as<std::string>(), "circular_flower");
    EXPECT_EQ(root["leaves"].size(), 2u);
    EXPECT_EQ(root["petals"]["shape"].as<std::string>(), "triangle");
    EXPECT_EQ(root["petals"]["count"].as<int>(), 6);
    EXPECT_EQ(root["petals"]["color"][1].as<int>(), 85);
}

TEST(RecordTest, AgeIsOptional) {
    const Plant p = from_yaml(R"(
version: 1
kind: tree
deficit: 0.95
branches:
  - {height: 0.5, rotation: 0.9}
)");

    EXPECT_EQ(p.kind(), PlantKind::tree);
    EXPECT_EQ(p.age(), 0.0);
    EXPECT_DOUBLE_EQ(p.deficit(), 0.95);
    ASSERT_EQ(std::get<TreeTraits>(p.traits()).branches.size(), 1u);
}

TEST(RecordTest, RejectsUnknownVersion) {
    EXPECT_THROW(from_yaml("{version: 2, kind: tree, deficit: 1, branches: []}"), RecordError);
}

TEST(RecordTest, RejectsUnknownKind) {
    EXPECT_THROW(from_yaml("{version: 1, kind: cactus, deficit: 1}"), RecordError);
}

TEST(RecordTest, RejectsUnknownPetalShape) {
    EXPECT_THROW(from_yaml(R"(
version: 1
kind: circular_flower
deficit: 1
lean: 0.5
stem_width: 3.5
leaves: []
petals: {color: [1, 2, 3], count: 5, center_ratio: 0.8, shape: star}
)"),
                 RecordError);
}

TEST(RecordTest, RejectsMissingAndMalformedFields) {
    EXPECT_THROW(from_yaml("{version: 1, kind: tree, branches: []}"), RecordError);
    EXPECT_THROW(from_yaml("{version: 1, kind: tree, deficit: tall, branches: []}"), RecordError);
    EXPECT_THROW(from_yaml("{version: 1, kind: tree, deficit: 1, branches: [{height: 0.5}]}"), RecordError);
    EXPECT_THROW(from_yaml("{version: 1, kind: orange_tree, deficit: 1, branches: [], circles: []}"), RecordError);
    EXPECT_THROW(from_yaml(R"(
version: 1
kind: circular_flower
deficit: 1
lean: 0.5
stem_width: 3.5
leaves: []
petals: {color: [1, 2, 300], count: 5, center_ratio: 0.8, shape: dip}
)"),
                 RecordError);
}

TEST(RecordTest, RejectsEntriesThatAreNotMaps) {
    EXPECT_THROW(from_yaml("version: 1\nkind: tree\ndeficit: 0.95\nbranches: [3]\n"), RecordError);
    EXPECT_THROW(from_yaml("{version: 1, kind: flower, deficit: 1, lean: 0.5, stem_width: 3.5, leaves: [[1, 2]]}"), RecordError);
    EXPECT_THROW(from_yaml("{version: 1, kind: orange_tree, deficit: 1, branches: [], circles: [x]}"), RecordError);
}

TEST(RecordTest, RejectsInvalidYaml) {
    EXPECT_THROW(from_yaml("{version: [1"), RecordError);
    EXPECT_THROW(from_yaml("- just\n- a list\n"), RecordError);
    EXPECT_THROW(from_yaml(""), RecordError);
}
