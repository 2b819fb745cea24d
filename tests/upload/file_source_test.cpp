#include "rup/upload/file_source.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace rup::upload;
using rup::ErrorCode;

TEST(FileSource, LocalFileReadsRanges) {
    rup::testing::TempDir dir;
    const auto path = dir.write_file("data/file.bin", 100, 3);

    auto opened = LocalFileSource::open(path, "data/file.bin");
    ASSERT_TRUE(opened.is_ok()) << opened.error().message;
    const auto& source = opened.value();

    EXPECT_EQ(source->size(), 100u);
    EXPECT_EQ(source->file_name(), "file.bin");
    EXPECT_TRUE(source->reacquirable());
    EXPECT_TRUE(source->available());
    EXPECT_EQ(source->locator(), path.string());

    auto chunk = source->read_chunk(90, 10);
    ASSERT_TRUE(chunk.is_ok());
    ASSERT_EQ(chunk.value().size(), 10u);
    EXPECT_EQ(chunk.value()[0], static_cast<std::uint8_t>(90 + 3));

    EXPECT_EQ(source->read_chunk(95, 10).error().code, ErrorCode::Validation);
}

TEST(FileSource, LocalFileBecomesUnavailableWhenChanged) {
    rup::testing::TempDir dir;
    const auto path = dir.write_file("f.bin", 10);
    auto source = LocalFileSource::open(path, "f.bin").value();

    dir.write_file("f.bin", 20);
    EXPECT_FALSE(source->available());

    std::filesystem::remove(path);
    EXPECT_FALSE(source->available());
}

TEST(FileSource, OpenRejectsDirectories) {
    rup::testing::TempDir dir;
    auto opened = LocalFileSource::open(dir.make_dir("sub"), "sub");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::Io);
}

TEST(FileSource, MemoryFileDetach) {
    MemoryFileSource source("a/b.txt", {1, 2, 3, 4});
    EXPECT_FALSE(source.reacquirable());
    EXPECT_TRUE(source.locator().empty());
    EXPECT_EQ(source.read_chunk(1, 2).value(), (std::vector<std::uint8_t>{2, 3}));

    source.detach();
    EXPECT_FALSE(source.available());
    EXPECT_EQ(source.read_chunk(0, 1).error().code, ErrorCode::Io);
}

TEST(FileSource, LocalResolverReopensMatchingFile) {
    rup::testing::TempDir dir;
    const auto path = dir.write_file("photo.jpg", 64);

    UploadSession session;
    session.relative_path = "photo.jpg";
    session.source_locator = path.string();
    session.total_size = 64;

    LocalFileSourceResolver resolver;
    auto source = resolver.reacquire(session);
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->relative_path(), "photo.jpg");

    session.total_size = 65;
    EXPECT_EQ(resolver.reacquire(session), nullptr);

    session.source_locator.clear();
    EXPECT_EQ(resolver.reacquire(session), nullptr);
    EXPECT_EQ(NullFileSourceResolver{}.reacquire(session), nullptr);
}
