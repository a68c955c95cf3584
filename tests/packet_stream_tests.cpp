#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "persist/directory_archive.hpp"
#include "persist/packet_stream.hpp"
#include "persist/zip_archive.hpp"

namespace {

std::filesystem::path make_tmp_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "packet_stream_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

core::Packet pkt(std::uint32_t time, std::int32_t id) {
    return core::Packet(time, id, std::vector<std::byte>{std::byte{0x42}});
}

void write_packets(persist::IArchiveWriter& archive, const std::vector<core::Packet>& packets) {
    persist::PacketStreamWriter writer;
    ASSERT_TRUE(writer.open(archive, 6).ok());
    for (const auto& p : packets) {
        ASSERT_EQ(writer.write(p).status, persist::ReplayStatus::Ok);
    }
    EXPECT_EQ(writer.stats().packets_written, packets.size());
    ASSERT_TRUE(writer.close().ok);
    EXPECT_FALSE(writer.is_open());
}

} // namespace

TEST(PacketStreamReader, TagsEachPacketWithItsPhase) {
    const auto dir = make_tmp_dir("phases");
    persist::DirectoryArchive archive(dir);
    // 0x03 before the login is finished does not count as a transition
    write_packets(archive, {pkt(0, 0x03), pkt(1, 0x02), pkt(2, 0x02), pkt(3, 0x03), pkt(4, 0x02), pkt(5, 0x03)});

    persist::PacketStreamReader reader;
    ASSERT_TRUE(reader.open(archive).ok());
    EXPECT_EQ(reader.phase(), core::ProtocolPhase::Login);

    std::vector<core::ProtocolPhase> phases;
    core::Packet p;
    core::ProtocolPhase phase{};
    while (reader.next(p, phase).status == persist::ReplayStatus::Ok) {
        phases.push_back(phase);
    }
    const std::vector<core::ProtocolPhase> expected{
        core::ProtocolPhase::Login,         core::ProtocolPhase::Login,
        core::ProtocolPhase::Configuration, core::ProtocolPhase::Configuration,
        core::ProtocolPhase::Play,          core::ProtocolPhase::Play,
    };
    EXPECT_EQ(phases, expected);
    EXPECT_EQ(reader.phase(), core::ProtocolPhase::Play);
    EXPECT_EQ(reader.stats().packets_read, 6u);
    EXPECT_EQ(reader.stats().phase_transitions, 2u);
    EXPECT_EQ(reader.stats().bytes_read, 6u * (8u + 1u + 1u));
}

TEST(PacketStreamReader, FailureIsSticky) {
    const auto dir = make_tmp_dir("sticky");
    persist::DirectoryArchive archive(dir);
    write_packets(archive, {pkt(0, 0x10), pkt(1, 0x11)});
    const auto rec = dir / "recording.tmcpr";
    std::filesystem::resize_file(rec, std::filesystem::file_size(rec) - 1);

    persist::PacketStreamReader reader;
    ASSERT_TRUE(reader.open(archive).ok());
    core::Packet p;
    core::ProtocolPhase phase{};
    ASSERT_EQ(reader.next(p, phase).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(reader.next(p, phase).status, persist::ReplayStatus::TruncatedInput);
    EXPECT_EQ(reader.next(p, phase).status, persist::ReplayStatus::TruncatedInput);
    EXPECT_EQ(reader.stats().packets_read, 1u);
}

TEST(PacketStreamReader, MissingRecordingAndUnopenedReader) {
    const auto dir = make_tmp_dir("missing");
    persist::DirectoryArchive archive(dir);
    persist::PacketStreamReader reader;
    EXPECT_FALSE(reader.is_open());
    core::Packet p;
    core::ProtocolPhase phase{};
    EXPECT_EQ(reader.next(p, phase).status, persist::ReplayStatus::InvalidArgument);
    EXPECT_EQ(reader.open(archive).status, persist::ReplayStatus::EntryNotFound);
}

TEST(PacketStreamWriter, RespectsArchiveWriteSessions) {
    const auto path = make_tmp_dir("zip") / "out.mcpr";
    persist::ZipArchiveWriter archive;
    ASSERT_TRUE(archive.open(path.string()).ok());

    persist::PacketStreamWriter writer;
    ASSERT_TRUE(writer.open(archive, 9).ok());
    EXPECT_EQ(writer.open(archive, 9).status, persist::ReplayStatus::WriteSessionActive);
    ASSERT_EQ(writer.write(pkt(7, 0x2B)).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(writer.stats().bytes_written, 10u);

    std::unique_ptr<persist::IEntrySink> meta;
    EXPECT_EQ(archive.open_entry_for_write("metaData.json", -1, meta).status,
              persist::ReplayStatus::WriteSessionActive);
    ASSERT_TRUE(writer.close().ok);
    EXPECT_EQ(writer.write(pkt(8, 0x2B)).status, persist::ReplayStatus::InvalidArgument);
    EXPECT_TRUE(archive.open_entry_for_write("metaData.json", -1, meta).ok());
    ASSERT_TRUE(meta->close().ok);
    ASSERT_TRUE(archive.finish().ok());

    persist::ZipArchiveReader back;
    ASSERT_TRUE(back.open(path.string()).ok());
    persist::PacketStreamReader reader;
    ASSERT_TRUE(reader.open(back).ok());
    core::Packet p;
    core::ProtocolPhase phase{};
    ASSERT_EQ(reader.next(p, phase).status, persist::ReplayStatus::Ok);
    EXPECT_EQ(p, pkt(7, 0x2B));
    EXPECT_EQ(reader.next(p, phase).status, persist::ReplayStatus::EndOfStream);
}
