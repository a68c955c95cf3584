#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "api/merge_runner.hpp"
#include "persist/action_log_format.hpp"
#include "persist/directory_archive.hpp"
#include "persist/metadata_codec.hpp"
#include "persist/packet_stream.hpp"
#include "util/log.hpp"

namespace {

std::filesystem::path make_tmp_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "merge_runner_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_session(const std::filesystem::path& dir, std::uint64_t duration) {
    std::filesystem::create_directories(dir);
    persist::DirectoryArchive archive(dir);
    {
        persist::PacketStreamWriter writer;
        ASSERT_TRUE(writer.open(archive, 9).ok());
        const std::vector<core::Packet> packets{
            core::Packet(0, 0x02, {}),
            core::Packet(0, 0x03, {}),
            core::Packet(10, 0x2B, std::vector<std::byte>(4)),
            core::Packet(20, 0x2B, std::vector<std::byte>(4)),
        };
        for (const auto& p : packets) {
            ASSERT_EQ(writer.write(p).status, persist::ReplayStatus::Ok);
        }
        ASSERT_TRUE(writer.close().ok);
    }
    core::SessionMetadata meta;
    meta.duration = duration;
    ASSERT_TRUE(persist::write_metadata(archive, meta).ok());
}

// run_merge adjusts the process-wide log level; put it back after each test.
class MergeRunnerTest : public ::testing::Test {
private:
    util::ScopedLogLevel level_{util::log_level()};
};

} // namespace

TEST_F(MergeRunnerTest, InvalidConfigIsExitCodeOne) {
    api::MergeConfig cfg;
    std::ostringstream out;
    EXPECT_EQ(api::run_merge(cfg, out), api::exit_config_error);
    EXPECT_EQ(api::run_dump(cfg, out), api::exit_config_error);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(MergeRunnerTest, MissingInputIsMergeFailure) {
    const auto root = make_tmp_dir("missing");
    api::MergeConfig cfg;
    cfg.inputs = {root / "absent.mcpr"};
    cfg.quiet = true;
    std::ostringstream out;
    EXPECT_EQ(api::run_merge(cfg, out), api::exit_merge_failure);
}

TEST_F(MergeRunnerTest, MergesIntoArchiveAndReportsSummary) {
    const auto root = make_tmp_dir("merge");
    write_session(root / "a", 100);
    write_session(root / "b", 100);

    api::MergeConfig cfg;
    cfg.inputs = {root / "a", root / "b"};
    cfg.output = root / "merged.mcpr";
    cfg.interval = 10;
    cfg.details = true;
    cfg.quiet = true;
    std::ostringstream out;
    ASSERT_EQ(api::run_merge(cfg, out), api::exit_ok);
    EXPECT_TRUE(std::filesystem::is_regular_file(cfg.output));

    const std::string text = out.str();
    EXPECT_NE(text.find("inputs: 2/2"), std::string::npos);
    EXPECT_NE(text.find("packets written: 6"), std::string::npos);
    EXPECT_NE(text.find("suppressed (later inputs): 2"), std::string::npos);
    EXPECT_NE(text.find("duration: 210 ms"), std::string::npos);
    EXPECT_NE(text.find("0x2b"), std::string::npos);
}

TEST_F(MergeRunnerTest, MaxPacketsStopsEarly) {
    const auto root = make_tmp_dir("max_packets");
    write_session(root / "a", 100);

    api::MergeConfig cfg;
    cfg.inputs = {root / "a"};
    cfg.max_packets = 3;
    cfg.quiet = true;
    std::ostringstream out;
    ASSERT_EQ(api::run_merge(cfg, out), api::exit_ok);
    EXPECT_NE(out.str().find("stopped after 3 packets"), std::string::npos);
}

TEST_F(MergeRunnerTest, DumpListsPacketsWithPhase) {
    const auto root = make_tmp_dir("dump");
    write_session(root / "a", 100);

    api::MergeConfig cfg;
    cfg.inputs = {root / "a"};
    cfg.dump = true;
    cfg.quiet = true;
    std::ostringstream out;
    ASSERT_EQ(api::run_dump(cfg, out), api::exit_ok);
    const std::string text = out.str();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 4);
    EXPECT_NE(text.find("configuration 0x03"), std::string::npos);
    EXPECT_NE(text.find("play          0x2b 4"), std::string::npos);
}

TEST_F(MergeRunnerTest, DumpChunkListsActions) {
    const auto root = make_tmp_dir("dump_chunk");
    {
        persist::DirectoryArchive archive(root);
        std::unique_ptr<persist::IEntrySink> sink;
        ASSERT_TRUE(archive.open_entry_for_write("c0.flashback", -1, sink).ok());
        const std::vector<std::string> names{"flashback:action/next_tick", "flashback:action/game_packet"};
        ASSERT_TRUE(persist::write_chunk_header(*sink, names, {}).ok);
        const std::vector<std::byte> payload(12);
        ASSERT_TRUE(persist::write_action(*sink, 0, {}).ok);
        ASSERT_TRUE(persist::write_action(*sink, 1, payload).ok);
        ASSERT_TRUE(persist::write_action(*sink, 0, {}).ok);
        ASSERT_TRUE(sink->close().ok);
    }

    api::MergeConfig cfg;
    cfg.inputs = {root};
    cfg.dump_chunk = "c0.flashback";
    cfg.quiet = true;
    std::ostringstream out;
    ASSERT_EQ(api::run_dump(cfg, out), api::exit_ok);
    const std::string text = out.str();
    EXPECT_NE(text.find("game_packet"), std::string::npos);
    EXPECT_NE(text.find("ticks: 2"), std::string::npos);

    cfg.dump_chunk = "c9.flashback";
    EXPECT_EQ(api::run_dump(cfg, out), api::exit_merge_failure);
}
