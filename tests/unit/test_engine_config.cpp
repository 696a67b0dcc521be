#include <gtest/gtest.h>
#include "kgviz/config/engine_config.hpp"
#include <cstdio>
#include <fstream>
#include <limits>

using namespace kgviz;

class EngineConfigTest : public ::testing::Test {
protected:
    EngineConfig config;
    std::string error;
};

// ==========================================
// Enum Tests
// ==========================================

TEST(EngineEnumTest, ParseNames) {
    EXPECT_EQ(view_mode_from_string("3d"), ViewMode::Graph3D);
    EXPECT_EQ(view_mode_from_string("topic"), ViewMode::Topic2D);
    EXPECT_EQ(label_visibility_from_string("none"), LabelVisibility::Hidden);
    EXPECT_EQ(label_visibility_from_string("hidden"), LabelVisibility::Hidden);
    EXPECT_EQ(detail_level_from_string("hub"), DetailLevel::Hub);

    EXPECT_THROW(view_mode_from_string("4d"), std::invalid_argument);
    EXPECT_THROW(label_visibility_from_string("some"), std::invalid_argument);
    EXPECT_THROW(detail_level_from_string(""), std::invalid_argument);
}

TEST(EngineEnumTest, NamesRoundTrip) {
    for (auto mode : {ViewMode::Graph3D, ViewMode::Topic2D}) {
        EXPECT_EQ(view_mode_from_string(to_string(mode)), mode);
    }
    for (auto level : {DetailLevel::All, DetailLevel::Important, DetailLevel::Key, DetailLevel::Hub}) {
        EXPECT_EQ(detail_level_from_string(to_string(level)), level);
    }
}

TEST(EngineEnumTest, LabelCycle) {
    EXPECT_EQ(next_label_visibility(LabelVisibility::Hidden), LabelVisibility::Important);
    EXPECT_EQ(next_label_visibility(LabelVisibility::Important), LabelVisibility::All);
    EXPECT_EQ(next_label_visibility(LabelVisibility::All), LabelVisibility::Hidden);
}

TEST(BloomConfigTest, Clamped) {
    BloomConfig bloom;
    bloom.intensity = 3.0;
    bloom.glow_size = 0.2;
    BloomConfig c = bloom.clamped();
    EXPECT_DOUBLE_EQ(c.intensity, 1.0);
    EXPECT_DOUBLE_EQ(c.glow_size, 1.0);

    bloom.intensity = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(bloom.clamped().intensity, 0.5);
}

// ==========================================
// Validation Tests
// ==========================================

TEST_F(EngineConfigTest, DefaultsValidate) {
    EXPECT_TRUE(config.validate(error)) << error;
}

TEST_F(EngineConfigTest, RejectsOutOfRangeFraction) {
    config.render.lod.visible_fraction = 1.5;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("LOD"), std::string::npos);

    config.render.lod.visible_fraction = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(config.validate(error));
}

TEST_F(EngineConfigTest, RejectsBadBloom) {
    config.render.bloom.glow_size = 2.5;
    EXPECT_FALSE(config.validate(error));
}

TEST_F(EngineConfigTest, RejectsBadSimulationSettings) {
    EngineConfig c = config;
    c.layout.cooldown_ticks = 0;
    EXPECT_FALSE(c.validate(error));

    c = config;
    c.topic.alpha_decay = 1.0;
    EXPECT_FALSE(c.validate(error));

    c = config;
    c.topic.width = 60.0;
    EXPECT_FALSE(c.validate(error));

    c = config;
    c.topic.min_link_distance = 500.0;
    EXPECT_FALSE(c.validate(error));

    c = config;
    c.camera.transition_ms = -1.0;
    EXPECT_FALSE(c.validate(error));
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(EngineConfigTest, JsonRoundTrip) {
    config.view_mode = ViewMode::Topic2D;
    config.render.lod = LodConfig::from_detail_level(DetailLevel::Key);
    config.render.label_visibility = LabelVisibility::All;
    config.render.show_ghost_edges = true;
    config.render.visible_entity_types = {"Concept", "Method"};
    config.camera.gap_standoff = 275.0;
    config.topic.seed = 99;

    EngineConfig loaded = EngineConfig::from_json(config.to_json());
    EXPECT_EQ(loaded.view_mode, ViewMode::Topic2D);
    EXPECT_DOUBLE_EQ(loaded.render.lod.visible_fraction, 0.5);
    EXPECT_EQ(loaded.render.label_visibility, LabelVisibility::All);
    EXPECT_TRUE(loaded.render.show_ghost_edges);
    EXPECT_EQ(loaded.render.visible_entity_types, config.render.visible_entity_types);
    EXPECT_DOUBLE_EQ(loaded.camera.gap_standoff, 275.0);
    EXPECT_EQ(loaded.topic.seed, 99u);
}

TEST_F(EngineConfigTest, PartialJsonKeepsDefaults) {
    auto j = nlohmann::json::parse(R"({"render": {"detail_level": "hub"}, "verbose": true})");
    EngineConfig loaded = EngineConfig::from_json(j);

    EXPECT_DOUBLE_EQ(loaded.render.lod.visible_fraction, 0.25);
    EXPECT_EQ(loaded.view_mode, ViewMode::Graph3D);
    EXPECT_TRUE(loaded.layout.verbose);
    EXPECT_TRUE(loaded.topic.verbose);
    EXPECT_DOUBLE_EQ(loaded.camera.transition_ms, 1000.0);
}

TEST_F(EngineConfigTest, SetVerboseReachesLayouts) {
    config.set_verbose(true);
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.layout.verbose);
    EXPECT_TRUE(config.topic.verbose);

    // A file that leaves verbose off still honours a later override
    EngineConfig loaded = EngineConfig::from_json(nlohmann::json::object());
    EXPECT_FALSE(loaded.topic.verbose);
    loaded.set_verbose(true);
    EXPECT_TRUE(loaded.layout.verbose);
    EXPECT_TRUE(loaded.topic.verbose);

    loaded.set_verbose(false);
    EXPECT_FALSE(loaded.layout.verbose);
    EXPECT_FALSE(loaded.topic.verbose);
}

TEST_F(EngineConfigTest, FileRoundTrip) {
    const std::string path = "/tmp/kgviz_test_config.json";
    config.render.bloom.enabled = true;
    config.to_json_file(path);

    EngineConfig loaded = EngineConfig::from_json_file(path);
    EXPECT_TRUE(loaded.render.bloom.enabled);
    std::remove(path.c_str());
}

TEST_F(EngineConfigTest, FileErrors) {
    EXPECT_THROW(EngineConfig::from_json_file("/nonexistent/kgviz.json"), std::runtime_error);

    const std::string path = "/tmp/kgviz_test_bad_config.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(EngineConfig::from_json_file(path), std::runtime_error);
    std::remove(path.c_str());
}
