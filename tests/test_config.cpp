#include <gtest/gtest.h>

#include "core/config.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {
// Ideiglenes config fájl a megadott tartalommal
struct ConfigFile {
    fs::path path;
    ConfigFile(const std::string& name, const std::string& body)
        : path(fs::temp_directory_path() / name) {
        std::ofstream(path) << body;
    }
    ~ConfigFile() { std::error_code ec; fs::remove(path, ec); }
};
}

TEST(PipelineConfig, MissingFileGivesDefaults) {
    const auto cfg = load_pipeline_config((fs::temp_directory_path() / "nextday_no_such_config.json").string());
    EXPECT_EQ(cfg.indicators.sma_window, 10u);
    EXPECT_EQ(cfg.assembly.buffer_days, 10);
    EXPECT_EQ(cfg.assembly.write_retries, 2);
    EXPECT_EQ(cfg.ensemble.window_size, 5u);
}

TEST(PipelineConfig, ValuesAreRead) {
    ConfigFile f("nextday_config_ok.json", R"({
        "store_dir": "/tmp/x",
        "indicators": {"sma_window": 7, "bb_window": 14, "corr_window": 3, "beta_window": 4},
        "sentiment": {"quantile_window": 30, "quantile_buckets": 4},
        "assembly": {"buffer_days": 0, "history_days": 45, "write_retries": 0},
        "ensemble": {"threshold": 0.6, "window_size": 1}})");
    const auto cfg = load_pipeline_config(f.path.string());
    EXPECT_EQ(cfg.store_dir, "/tmp/x");
    EXPECT_EQ(cfg.indicators.sma_window, 7u);
    EXPECT_EQ(cfg.indicators.beta_window, 4u);
    EXPECT_EQ(cfg.sentiment.quantile_buckets, 4u);
    EXPECT_EQ(cfg.assembly.buffer_days, 0);
    EXPECT_EQ(cfg.assembly.history_days, 45);
    EXPECT_EQ(cfg.assembly.write_retries, 0);
    EXPECT_DOUBLE_EQ(cfg.ensemble.threshold, 0.6);
    EXPECT_EQ(cfg.ensemble.window_size, 1u);
}

TEST(PipelineConfig, NegativeCountsAreRejected) {
    const char* bodies[] = {
        R"({"indicators": {"sma_window": -1}})",
        R"({"indicators": {"bb_window": -20}})",
        R"({"indicators": {"corr_window": -5}})",
        R"({"indicators": {"beta_window": -10}})",
        R"({"sentiment": {"quantile_window": -60}})",
        R"({"sentiment": {"quantile_buckets": -5}})",
        R"({"assembly": {"buffer_days": -1}})",
        R"({"assembly": {"history_days": -90}})",
        R"({"assembly": {"write_retries": -2}})",
        R"({"ensemble": {"window_size": -1}})",
    };
    for (const char* body : bodies) {
        ConfigFile f("nextday_config_negative.json", body);
        EXPECT_THROW(load_pipeline_config(f.path.string()), PipelineError) << body;
    }
}

TEST(PipelineConfig, WindowsBelowMinimumOrNotIntegerAreRejected) {
    const char* bodies[] = {
        R"({"indicators": {"sma_window": 0}})",
        R"({"indicators": {"bb_window": 1}})",
        R"({"ensemble": {"window_size": 0}})",
        R"({"indicators": {"bb_window": 20.5}})",
        R"({"assembly": {"buffer_days": "10"}})",
    };
    for (const char* body : bodies) {
        ConfigFile f("nextday_config_bad.json", body);
        EXPECT_THROW(load_pipeline_config(f.path.string()), PipelineError) << body;
    }
}

TEST(PipelineConfig, MalformedJsonIsReported) {
    ConfigFile f("nextday_config_broken.json", "{ \"indicators\": ");
    EXPECT_THROW(load_pipeline_config(f.path.string()), PipelineError);
}
