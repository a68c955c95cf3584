#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "api/merge_config.hpp"

TEST(MergeConfig, ParsesPacketIds) {
    EXPECT_EQ(api::parse_packet_id("2b"), std::uint8_t{0x2B});
    EXPECT_EQ(api::parse_packet_id("0x2B"), std::uint8_t{0x2B});
    EXPECT_EQ(api::parse_packet_id("0XfF"), std::uint8_t{0xFF});
    EXPECT_EQ(api::parse_packet_id("0"), std::uint8_t{0});
    EXPECT_FALSE(api::parse_packet_id("").has_value());
    EXPECT_FALSE(api::parse_packet_id("0x").has_value());
    EXPECT_FALSE(api::parse_packet_id("100").has_value());
    EXPECT_FALSE(api::parse_packet_id("zz").has_value());
    EXPECT_FALSE(api::parse_packet_id("2b ").has_value());
}

TEST(MergeConfig, Validation) {
    api::MergeConfig cfg;
    std::string error;
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
    EXPECT_NE(error.find("input"), std::string::npos);

    cfg.inputs = {"a.mcpr", "b.mcpr"};
    cfg.output = "merged.mcpr";
    EXPECT_TRUE(api::validate_merge_config(cfg, error)) << error;

    cfg.compression_level = 10;
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
    cfg.compression_level = -1;
    EXPECT_TRUE(api::validate_merge_config(cfg, error));

    cfg.quiet = true;
    cfg.verbose = true;
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
    cfg.verbose = false;

    cfg.output = "b.mcpr";
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
    EXPECT_NE(error.find("b.mcpr"), std::string::npos);
}

TEST(MergeConfig, DumpModeTakesOneInputAndNoOutput) {
    api::MergeConfig cfg;
    std::string error;
    cfg.inputs = {"a.mcpr"};
    cfg.dump = true;
    EXPECT_TRUE(api::validate_merge_config(cfg, error)) << error;
    cfg.output = "x";
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
    cfg.output.clear();
    cfg.inputs.push_back("b.mcpr");
    EXPECT_FALSE(api::validate_merge_config(cfg, error));

    cfg.dump = false;
    cfg.dump_chunk = "c0.flashback";
    EXPECT_FALSE(api::validate_merge_config(cfg, error));
}

TEST(MergeConfig, JobFileOverridesPresentKeys) {
    api::MergeConfig cfg;
    cfg.interval = 5;
    cfg.compression_level = 3;
    std::string error;
    const std::string job = R"({
        "inputs": ["one.mcpr", "two"],
        "output": "out.mcpr",
        "include": [43, "0x2c"],
        "exclude": ["ff"],
        "unknown_packets": false,
        "reset_id": "0x41",
        "interval": 250
    })";
    ASSERT_TRUE(api::parse_merge_job(job, cfg, error)) << error;
    ASSERT_EQ(cfg.inputs.size(), 2u);
    EXPECT_EQ(cfg.inputs[1], std::filesystem::path("two"));
    EXPECT_EQ(cfg.output, std::filesystem::path("out.mcpr"));
    EXPECT_EQ(cfg.include_ids, (std::vector<std::uint8_t>{0x2B, 0x2C}));
    EXPECT_EQ(cfg.exclude_ids, (std::vector<std::uint8_t>{0xFF}));
    EXPECT_FALSE(cfg.admit_unknown);
    EXPECT_EQ(cfg.reset_id, 0x41);
    EXPECT_EQ(cfg.interval, 250u);
    EXPECT_EQ(cfg.compression_level, 3);
}

TEST(MergeConfig, JobFileRejectsBadInput) {
    api::MergeConfig cfg;
    cfg.interval = 7;
    std::string error;
    EXPECT_FALSE(api::parse_merge_job(R"({"interval": 1, "speed": 2})", cfg, error));
    EXPECT_NE(error.find("speed"), std::string::npos);
    // a rejected job leaves the configuration untouched
    EXPECT_EQ(cfg.interval, 7u);

    EXPECT_FALSE(api::parse_merge_job(R"({"include": [256]})", cfg, error));
    EXPECT_FALSE(api::parse_merge_job(R"({"include": ["0xg1"]})", cfg, error));
    EXPECT_FALSE(api::parse_merge_job(R"({"compression_level": 12})", cfg, error));
    EXPECT_FALSE(api::parse_merge_job(R"({"interval": -1})", cfg, error));
    EXPECT_FALSE(api::parse_merge_job(R"({"output": "x"} {})", cfg, error));
    EXPECT_FALSE(api::parse_merge_job("[]", cfg, error));
}

TEST(MergeConfig, LoadsJobFromDisk) {
    const auto dir = std::filesystem::temp_directory_path() / "merge_config_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / "job.json";
    std::ofstream(path) << R"({"inputs": ["a", "b"], "compression_level": -1})";

    api::MergeConfig cfg;
    std::string error;
    ASSERT_TRUE(api::load_merge_job(path, cfg, error)) << error;
    EXPECT_EQ(cfg.inputs.size(), 2u);
    EXPECT_EQ(cfg.compression_level, -1);

    EXPECT_FALSE(api::load_merge_job(dir / "absent.json", cfg, error));
    EXPECT_FALSE(error.empty());
}
