#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "persist/zip_archive.hpp"

namespace {

std::filesystem::path make_tmp_zip(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "zip_archive_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

void write_entry(persist::ZipArchiveWriter& writer, std::string_view name, const std::string& body, int level) {
    std::unique_ptr<persist::IEntrySink> sink;
    ASSERT_TRUE(writer.open_entry_for_write(name, level, sink).ok());
    ASSERT_TRUE(persist::write_all(*sink, body.data(), body.size()).ok);
    ASSERT_TRUE(sink->close().ok);
}

persist::IoResult read_entry(persist::IArchiveReader& reader, std::string_view name, std::string& out) {
    std::unique_ptr<persist::IEntrySource> src;
    const auto opened = reader.open_entry_for_read(name, src);
    if (!opened.ok()) {
        return {false, opened.error_code};
    }
    out.clear();
    std::vector<std::byte> buf(777);
    while (true) {
        std::size_t got = 0;
        const persist::IoResult r = src->read(buf.data(), buf.size(), got);
        if (!r.ok) {
            return r;
        }
        if (got == 0) {
            return {true, 0};
        }
        out.append(reinterpret_cast<const char*>(buf.data()), got);
    }
}

std::string sample_body(std::size_t n) {
    std::string s;
    s.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        s.push_back(static_cast<char>('a' + (i * 7 + i / 13) % 26));
    }
    return s;
}

} // namespace

TEST(ZipArchive, WritesAndReadsEntries) {
    const auto path = make_tmp_zip("round_trip.mcpr");
    const std::string recording = sample_body(200000);
    const std::string meta = R"({"duration":5})";
    {
        persist::ZipArchiveWriter writer;
        ASSERT_TRUE(writer.open(path.string()).ok());
        write_entry(writer, "recording.tmcpr", recording, 9);
        write_entry(writer, "metaData.json", meta, -1);
        write_entry(writer, "empty.bin", "", 0);
        ASSERT_TRUE(writer.finish().ok());
    }

    persist::ZipArchiveReader reader;
    ASSERT_TRUE(reader.open(path.string()).ok());
    ASSERT_EQ(reader.entries().size(), 3u);
    EXPECT_EQ(reader.entries()[0].name, "recording.tmcpr");
    EXPECT_EQ(reader.entries()[0].uncompressed_size, recording.size());
    EXPECT_LT(reader.entries()[0].compressed_size, recording.size());

    std::string back;
    ASSERT_TRUE(read_entry(reader, "recording.tmcpr", back).ok);
    EXPECT_EQ(back, recording);
    ASSERT_TRUE(read_entry(reader, "metaData.json", back).ok);
    EXPECT_EQ(back, meta);
    ASSERT_TRUE(read_entry(reader, "empty.bin", back).ok);
    EXPECT_TRUE(back.empty());
}

TEST(ZipArchive, SecondSessionWhileFirstOpenIsRejected) {
    const auto path = make_tmp_zip("sessions.zip");
    persist::ZipArchiveWriter writer;
    ASSERT_TRUE(writer.open(path.string()).ok());

    std::unique_ptr<persist::IEntrySink> first;
    ASSERT_TRUE(writer.open_entry_for_write("recording.tmcpr", 9, first).ok());
    EXPECT_TRUE(writer.session_active());

    std::unique_ptr<persist::IEntrySink> second;
    EXPECT_EQ(writer.open_entry_for_write("metaData.json", -1, second).status,
              persist::ReplayStatus::WriteSessionActive);
    EXPECT_EQ(second.get(), nullptr);
    EXPECT_EQ(writer.finish().status, persist::ReplayStatus::WriteSessionActive);

    ASSERT_TRUE(first->close().ok);
    EXPECT_FALSE(writer.session_active());
    EXPECT_TRUE(writer.open_entry_for_write("metaData.json", -1, second).ok());
    ASSERT_TRUE(second->close().ok);
    EXPECT_TRUE(writer.finish().ok());

    std::unique_ptr<persist::IEntrySink> late;
    EXPECT_EQ(writer.open_entry_for_write("late", -1, late).status, persist::ReplayStatus::InvalidArgument);
}

TEST(ZipArchive, FailedEntryReleasesWriteSession) {
    // Writes to /dev/full fail with ENOSPC once the file buffer flushes.
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    persist::ZipArchiveWriter writer;
    ASSERT_TRUE(writer.open("/dev/full").ok());
    std::unique_ptr<persist::IEntrySink> sink;
    ASSERT_TRUE(writer.open_entry_for_write("recording.tmcpr", 0, sink).ok());
    EXPECT_TRUE(writer.session_active());

    const std::string body = sample_body(512 * 1024);
    EXPECT_FALSE(persist::write_all(*sink, body.data(), body.size()).ok);
    const persist::IoResult closed = sink->close();
    EXPECT_FALSE(closed.ok);
    EXPECT_EQ(closed.error_code, ENOSPC);
    EXPECT_FALSE(writer.session_active());

    const auto finished = writer.finish();
    EXPECT_NE(finished.status, persist::ReplayStatus::WriteSessionActive);
    EXPECT_EQ(finished.status, persist::ReplayStatus::IoError);
}

TEST(ZipArchive, RejectsBadCompressionLevel) {
    const auto path = make_tmp_zip("levels.zip");
    persist::ZipArchiveWriter writer;
    ASSERT_TRUE(writer.open(path.string()).ok());
    std::unique_ptr<persist::IEntrySink> sink;
    EXPECT_EQ(writer.open_entry_for_write("x", 10, sink).status, persist::ReplayStatus::InvalidArgument);
    EXPECT_EQ(writer.open_entry_for_write("x", -2, sink).status, persist::ReplayStatus::InvalidArgument);
    EXPECT_TRUE(writer.finish().ok());
}

TEST(ZipArchive, MissingEntryIsNotFound) {
    const auto path = make_tmp_zip("missing.zip");
    {
        persist::ZipArchiveWriter writer;
        ASSERT_TRUE(writer.open(path.string()).ok());
        write_entry(writer, "recording.tmcpr", "abc", 6);
        ASSERT_TRUE(writer.finish().ok());
    }
    persist::ZipArchiveReader reader;
    ASSERT_TRUE(reader.open(path.string()).ok());
    std::unique_ptr<persist::IEntrySource> src;
    EXPECT_EQ(reader.open_entry_for_read("metaData.json", src).status, persist::ReplayStatus::EntryNotFound);
}

TEST(ZipArchive, DestructorFinishesArchive) {
    const auto path = make_tmp_zip("implicit_finish.zip");
    {
        persist::ZipArchiveWriter writer;
        ASSERT_TRUE(writer.open(path.string()).ok());
        write_entry(writer, "a.txt", "hello", 1);
    }
    persist::ZipArchiveReader reader;
    ASSERT_TRUE(reader.open(path.string()).ok());
    std::string back;
    ASSERT_TRUE(read_entry(reader, "a.txt", back).ok);
    EXPECT_EQ(back, "hello");
}

TEST(ZipArchive, CorruptedDataFailsIntegrityCheck) {
    const auto path = make_tmp_zip("corrupt.zip");
    const std::string body(4096, 'z');
    {
        persist::ZipArchiveWriter writer;
        ASSERT_TRUE(writer.open(path.string()).ok());
        write_entry(writer, "data", body, 0); // level 0 keeps the bytes verbatim inside deflate blocks
        ASSERT_TRUE(writer.finish().ok());
    }
    {
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        // local header (30) + name (4) + stored-block header (5) + 100 bytes in
        f.seekp(30 + 4 + 5 + 100);
        f.put('y');
    }
    persist::ZipArchiveReader reader;
    ASSERT_TRUE(reader.open(path.string()).ok());
    std::string back;
    const auto r = read_entry(reader, "data", back);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_code, EBADMSG);
}

TEST(ZipArchive, NonArchiveFileIsRejected) {
    const auto path = make_tmp_zip("garbage.zip");
    std::ofstream(path, std::ios::binary) << "definitely not a zip archive, just some text bytes";
    persist::ZipArchiveReader reader;
    const auto res = reader.open(path.string());
    EXPECT_EQ(res.status, persist::ReplayStatus::IoError);
    EXPECT_EQ(res.error_code, EBADMSG);
}

TEST(ZipArchive, ArchiveExtensionDetection) {
    EXPECT_TRUE(persist::has_archive_extension("session.mcpr"));
    EXPECT_TRUE(persist::has_archive_extension("SESSION.ZIP"));
    EXPECT_FALSE(persist::has_archive_extension("session"));
    EXPECT_FALSE(persist::has_archive_extension("session.mcpr.d"));
}
