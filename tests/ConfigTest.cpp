#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "Config.hpp"

TEST(ConfigTest, EmptyDocumentUsesDefaults) {
    auto res = AppConfig::parse("");
    ASSERT_TRUE(res.has_value()) << res.error();
    const auto& c = *res;
    EXPECT_EQ(c.camera.index, 0);
    EXPECT_DOUBLE_EQ(c.camera.fps, 30.0);
    EXPECT_EQ(c.camera.roi_width, 150);
    EXPECT_EQ(c.camera.roi_height, 150);
    EXPECT_DOUBLE_EQ(c.analysis.min_hz, 0.7);
    EXPECT_DOUBLE_EQ(c.analysis.max_hz, 3.5);
    EXPECT_EQ(c.analysis.buffer_size, 256);
    EXPECT_EQ(c.analysis.smoothing_window, 5);
    EXPECT_DOUBLE_EQ(c.display.signal_scale, 50.0);
    EXPECT_DOUBLE_EQ(c.display.signal_smoothing, 0.7);
    EXPECT_EQ(c.logging.level, spdlog::level::info);
}

TEST(ConfigTest, OverridesPartialSections) {
    auto res = AppConfig::parse(R"(
camera:
  fps: 60
analysis:
  buffer_size: 512
  max_hz: 3.0
display:
  color: [255, 0, 0]
  key_start: space
logging:
  level: debug
)");
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_DOUBLE_EQ(res->camera.fps, 60.0);
    EXPECT_EQ(res->camera.roi_width, 150);
    EXPECT_EQ(res->analysis.buffer_size, 512);
    EXPECT_DOUBLE_EQ(res->analysis.max_hz, 3.0);
    EXPECT_DOUBLE_EQ(res->analysis.min_hz, 0.7);
    EXPECT_EQ(res->display.color, (std::array<int, 3>{255, 0, 0}));
    EXPECT_EQ(res->display.key_start, "space");
    EXPECT_EQ(res->logging.level, spdlog::level::debug);
}

TEST(ConfigTest, RejectsInvalidValues) {
    const char* bad[] = {
        "analysis: {buffer_size: 1}",
        "analysis: {min_hz: 3.5, max_hz: 0.7}",
        "analysis: {smoothing_window: 0}",
        "camera: {fps: 0}",
        "camera: {roi_width: -5}",
        "display: {signal_smoothing: 1.0}",
        "display: {signal_scale: 0}",
        "display: {signal_scale: -5}",
        "display: {color: [1, 2]}",
        "display: {color: [0, 300, 0]}",
        "display: {key_quit: F13}",
        "display: {key_start: X}",
        "logging: {level: loud}",
        "camera: {fps: fast}",
        "camera: [",
    };
    for (const char* yaml : bad) {
        auto res = AppConfig::parse(yaml);
        EXPECT_FALSE(res.has_value()) << yaml;
        if (!res) {
            EXPECT_FALSE(res.error().empty()) << yaml;
        }
    }
}

TEST(ConfigTest, LoadReportsMissingFile) {
    auto res = AppConfig::load("/nonexistent/pulse_monitor/config.yaml");
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("Config missing"), std::string::npos);
}

TEST(ConfigTest, LoadReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "pulse_monitor_config_test.yaml";
    {
        std::ofstream out(path);
        out << "camera:\n  roi_width: 80\n  roi_height: 60\n";
    }
    auto res = AppConfig::load(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->camera.roi_width, 80);
    EXPECT_EQ(res->camera.roi_height, 60);
}
