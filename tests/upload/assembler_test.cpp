#include "guestdrop/upload/assembler.hpp"
#include "support/faulty_filesystem.hpp"
#include "support/gzip_util.hpp"
#include "support/manual_clock.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using guestdrop::ErrorKind;
using guestdrop::testing::FaultyFileSystem;
using guestdrop::testing::ManualClock;
using guestdrop::testing::TempDir;
using guestdrop::testing::bytes_of;
using guestdrop::testing::gzip;
using guestdrop::testing::read_text;
using guestdrop::testing::write_text;
using guestdrop::upload::Assembler;
using guestdrop::upload::ChunkStore;
using guestdrop::upload::SessionRegistry;

namespace {

constexpr std::uint64_t kNoLimit = 1ull << 40;

struct AssemblerFixture {
    TempDir dir;
    FaultyFileSystem filesystem;
    ManualClock clock;
    SessionRegistry registry{clock};
    ChunkStore chunks{filesystem, dir.path() / ".chunks"};
    Assembler assembler{filesystem, chunks, registry};

    std::string open_session(std::uint32_t total) {
        auto created = registry.create("Anna", "clip.mp4", total);
        EXPECT_TRUE(created.is_ok());
        return created.is_ok() ? created.value() : std::string();
    }

    fs::path destination() const { return dir.path() / "clip.mp4"; }
};

} // namespace

TEST(AssemblerTest, ConcatenatesChunksInIndexOrder) {
    AssemblerFixture f;
    const auto id = f.open_session(3);

    ASSERT_TRUE(f.chunks.write_chunk(id, 3, bytes_of("C")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("AA")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 2, bytes_of("BBB")).is_ok());

    auto assembled = f.assembler.assemble(id, 3, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_ok());
    EXPECT_EQ(assembled.value(), 6u);
    EXPECT_EQ(read_text(f.destination()), "AABBBC");

    EXPECT_FALSE(fs::exists(f.chunks.session_dir(id)));
    EXPECT_EQ(f.registry.size(), 0u);
}

TEST(AssemblerTest, MissingChunksLeaveEverythingInPlace) {
    AssemblerFixture f;
    const auto id = f.open_session(4);

    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("a")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 3, bytes_of("c")).is_ok());

    auto assembled = f.assembler.assemble(id, 4, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_error());
    EXPECT_EQ(assembled.error().kind, ErrorKind::IncompleteUpload);
    EXPECT_EQ(assembled.error().missing, (std::vector<std::uint32_t>{2, 4}));

    EXPECT_FALSE(fs::exists(f.destination()));
    EXPECT_TRUE(fs::exists(f.chunks.chunk_path(id, 1)));
    EXPECT_TRUE(f.registry.get(id).is_ok());
}

TEST(AssemblerTest, InflatesGzipChunks) {
    AssemblerFixture f;
    const auto id = f.open_session(3);

    ASSERT_TRUE(f.chunks.write_chunk(id, 1, gzip("hello ")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 2, bytes_of("plain ")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 3, gzip("world")).is_ok());

    auto assembled = f.assembler.assemble(id, 3, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_ok());
    EXPECT_EQ(read_text(f.destination()), "hello plain world");
    EXPECT_EQ(assembled.value(), 17u);
}

TEST(AssemblerTest, CorruptGzipRemovesPartialFile) {
    AssemblerFixture f;
    const auto id = f.open_session(2);

    auto broken = gzip(std::string(4096, 'x'));
    broken.resize(broken.size() - 6);
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("ok")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 2, broken).is_ok());

    auto assembled = f.assembler.assemble(id, 2, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_error());
    EXPECT_EQ(assembled.error().kind, ErrorKind::AssemblyFailed);

    EXPECT_FALSE(fs::exists(f.destination()));
    EXPECT_FALSE(fs::exists(f.chunks.session_dir(id)));
    EXPECT_EQ(f.registry.size(), 0u);
}

TEST(AssemblerTest, RawChunkStartingWithMagicIsStoredRaw) {
    AssemblerFixture f;
    const auto id = f.open_session(2);

    const std::vector<std::uint8_t> raw{0x1f, 0x8b, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("head")).is_ok());
    ASSERT_TRUE(f.chunks.write_chunk(id, 2, raw).is_ok());

    auto assembled = f.assembler.assemble(id, 2, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_ok()) << assembled.error().message;
    EXPECT_EQ(assembled.value(), 12u);

    auto expected = bytes_of("head");
    expected.insert(expected.end(), raw.begin(), raw.end());
    EXPECT_EQ(read_text(f.destination()), std::string(expected.begin(), expected.end()));
}

TEST(AssemblerTest, GzipHeaderWithUndecodableBodyIsStoredRaw) {
    AssemblerFixture f;
    const auto id = f.open_session(1);

    // Valid-looking header followed by a deflate block of reserved type 3.
    const std::vector<std::uint8_t> raw{0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00,
                                        0x00, 0x03, 0xff, 0xff, 0x10, 0x20};
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, raw).is_ok());

    auto assembled = f.assembler.assemble(id, 1, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_ok()) << assembled.error().message;
    EXPECT_EQ(assembled.value(), raw.size());
    EXPECT_EQ(fs::file_size(f.destination()), raw.size());
}

TEST(AssemblerTest, InflatedSizeOverLimitFails) {
    AssemblerFixture f;
    const auto id = f.open_session(1);

    ASSERT_TRUE(f.chunks.write_chunk(id, 1, gzip(std::string(10000, 'b'))).is_ok());

    auto assembled = f.assembler.assemble(id, 1, f.destination(), 1000);
    ASSERT_TRUE(assembled.is_error());
    EXPECT_EQ(assembled.error().kind, ErrorKind::AssemblyFailed);
    EXPECT_FALSE(fs::exists(f.destination()));
}

TEST(AssemblerTest, NeverOverwritesExistingDestination) {
    AssemblerFixture f;
    const auto id = f.open_session(1);

    write_text(f.destination(), "precious");
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("new")).is_ok());

    auto assembled = f.assembler.assemble(id, 1, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_error());
    EXPECT_EQ(assembled.error().kind, ErrorKind::AssemblyFailed);
    EXPECT_EQ(read_text(f.destination()), "precious");
}

TEST(AssemblerTest, WriteFailureRemovesPartialFile) {
    AssemblerFixture f;
    const auto id = f.open_session(1);
    ASSERT_TRUE(f.chunks.write_chunk(id, 1, bytes_of("data")).is_ok());

    f.filesystem.fail_appends = true;
    auto assembled = f.assembler.assemble(id, 1, f.destination(), kNoLimit);
    ASSERT_TRUE(assembled.is_error());
    EXPECT_EQ(assembled.error().kind, ErrorKind::AssemblyFailed);
    EXPECT_FALSE(fs::exists(f.destination()));
    EXPECT_FALSE(fs::exists(f.chunks.session_dir(id)));
}
