#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "persist/action_log_format.hpp"
#include "persist/directory_archive.hpp"

namespace {

const std::vector<std::string> kNames{
    "flashback:action/next_tick",
    "flashback:action/game_packet",
    "mod:action/custom_marker",
};

std::vector<std::byte> bytes(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

// Two ticks; the second carries one game packet and one unrecognized action.
std::vector<std::byte> sample_chunk() {
    persist::MemoryEntrySink sink;
    const auto snapshot = bytes({0xAA, 0xBB, 0xCC});
    EXPECT_TRUE(persist::write_chunk_header(sink, kNames, snapshot).ok);
    EXPECT_TRUE(persist::write_action(sink, 0, {}).ok);
    EXPECT_TRUE(persist::write_action(sink, 0, {}).ok);
    const auto packet = bytes({0x2B, 1, 2, 3});
    EXPECT_TRUE(persist::write_action(sink, 1, packet).ok);
    const auto marker = bytes({9});
    EXPECT_TRUE(persist::write_action(sink, 2, marker).ok);
    return sink.data();
}

} // namespace

TEST(ActionLogFormat, NamesMapToKinds) {
    EXPECT_EQ(persist::action_kind_from_name("flashback:action/next_tick"), persist::ActionKind::NextTick);
    EXPECT_EQ(persist::action_kind_from_name("flashback:action/level_chunk_cached"),
              persist::ActionKind::LevelChunkCached);
    EXPECT_EQ(persist::action_kind_from_name("next_tick"), persist::ActionKind::Unknown);
    EXPECT_STREQ(persist::action_kind_name(persist::ActionKind::GamePacket), "game_packet");
}

TEST(ActionLogFormat, HeaderAndRecordsReadBack) {
    persist::MemoryEntrySource src(sample_chunk());
    persist::ActionLogChunkHeader header;
    ASSERT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(header.action_names, kNames);
    ASSERT_EQ(header.actions.size(), 3u);
    EXPECT_EQ(header.actions[2], persist::ActionKind::Unknown);
    EXPECT_EQ(header.snapshot, bytes({0xAA, 0xBB, 0xCC}));

    persist::ActionRecord rec;
    ASSERT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(rec.kind, persist::ActionKind::NextTick);
    EXPECT_TRUE(rec.payload.empty());
    ASSERT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::Ok);
    ASSERT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(rec.kind, persist::ActionKind::GamePacket);
    EXPECT_EQ(rec.payload, bytes({0x2B, 1, 2, 3}));
    ASSERT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(rec.action_index, 2);
    EXPECT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::EndOfStream);
}

TEST(ActionLogFormat, BadMagicIsMalformed) {
    auto data = sample_chunk();
    data[0] = std::byte{0x00};
    persist::MemoryEntrySource src(std::move(data));
    persist::ActionLogChunkHeader header;
    EXPECT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::MalformedRecord);
}

TEST(ActionLogFormat, EmptyEntryIsTruncatedHeader) {
    persist::MemoryEntrySource src(std::vector<std::byte>{});
    persist::ActionLogChunkHeader header;
    EXPECT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::TruncatedInput);
}

TEST(ActionLogFormat, CutRecordIsTruncated) {
    auto data = sample_chunk();
    data.pop_back();
    persist::MemoryEntrySource src(std::move(data));
    persist::ActionLogChunkHeader header;
    ASSERT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::Ok);
    persist::ActionRecord rec;
    persist::ActionLogReadResult r{};
    for (int i = 0; i < 4; ++i) {
        r = persist::read_action(src, header, rec);
        if (r.status != persist::ReplayStatus::Ok) {
            break;
        }
    }
    EXPECT_EQ(r.status, persist::ReplayStatus::TruncatedInput);
}

TEST(ActionLogFormat, OversizedSnapshotIsMalformed) {
    // Magic, empty action table, then a snapshot size of 0x7FFFFFFF.
    persist::MemoryEntrySink sink;
    ASSERT_TRUE(persist::write_chunk_header(sink, std::vector<std::string>{}, {}).ok);
    auto data = sink.data();
    ASSERT_EQ(data.size(), 9u);
    const auto size = bytes({0x7F, 0xFF, 0xFF, 0xFF});
    std::copy(size.begin(), size.end(), data.end() - 4);

    persist::MemoryEntrySource src(data);
    persist::ActionLogChunkHeader header;
    EXPECT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::MalformedRecord);

    persist::ActionLogChunkReader reader;
    EXPECT_EQ(reader.open(std::make_unique<persist::MemoryEntrySource>(std::move(data))).status,
              persist::ReplayStatus::MalformedRecord);
}

TEST(ActionLogFormat, IndexOutsideTableIsMalformed) {
    persist::MemoryEntrySink sink;
    const std::vector<std::string> names{"flashback:action/next_tick"};
    ASSERT_TRUE(persist::write_chunk_header(sink, names, {}).ok);
    ASSERT_TRUE(persist::write_action(sink, 5, {}).ok);

    persist::MemoryEntrySource src(sink.data());
    persist::ActionLogChunkHeader header;
    ASSERT_EQ(persist::read_chunk_header(src, header).status, persist::ReplayStatus::Ok);
    persist::ActionRecord rec;
    EXPECT_EQ(persist::read_action(src, header, rec).status, persist::ReplayStatus::MalformedRecord);
}

TEST(ActionLogChunkReader, CountsTicksAndKinds) {
    persist::ActionLogChunkReader reader;
    ASSERT_EQ(reader.open(std::make_unique<persist::MemoryEntrySource>(sample_chunk())).status,
              persist::ReplayStatus::Ok);
    EXPECT_EQ(reader.header().action_names.size(), 3u);

    persist::ActionRecord rec;
    std::vector<std::uint64_t> ticks;
    while (reader.next(rec).status == persist::ReplayStatus::Ok) {
        ticks.push_back(reader.tick());
    }
    EXPECT_EQ(ticks, (std::vector<std::uint64_t>{1, 2, 2, 2}));
    EXPECT_EQ(reader.stats().actions_read, 4u);
    EXPECT_EQ(reader.stats().ticks, 2u);
    EXPECT_EQ(reader.stats().game_packets, 1u);
    EXPECT_EQ(reader.stats().unknown_actions, 1u);
    // exhausted readers keep reporting the end
    EXPECT_EQ(reader.next(rec).status, persist::ReplayStatus::EndOfStream);
}

TEST(ActionLogChunkReader, OpensNamedEntryOfBackend) {
    const auto dir = std::filesystem::temp_directory_path() / "action_log_format_tests" / "backend";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    persist::DirectoryArchive archive(dir);
    {
        std::unique_ptr<persist::IEntrySink> sink;
        ASSERT_TRUE(archive.open_entry_for_write("c0.flashback", -1, sink).ok());
        const auto data = sample_chunk();
        ASSERT_TRUE(persist::write_all(*sink, data.data(), data.size()).ok);
        ASSERT_TRUE(sink->close().ok);
    }

    persist::ActionLogChunkReader reader;
    EXPECT_EQ(reader.open(archive, "c0.flashback").status, persist::ReplayStatus::Ok);
    persist::ActionLogChunkReader missing;
    EXPECT_EQ(missing.open(archive, "c1.flashback").status, persist::ReplayStatus::EntryNotFound);
    persist::ActionRecord rec;
    EXPECT_EQ(missing.next(rec).status, persist::ReplayStatus::EntryNotFound);
}
