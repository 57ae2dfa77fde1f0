#include <gtest/gtest.h>
#include "FileAttributeReader.h"
#include "TestFiles.h"

using namespace FileCourier;
using FileCourier::testing_util::TempDir;

class FileAttributeReaderTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(FileAttributeReaderTest, ReadsSizeChecksumAndBasename) {
    auto path = dir_.writeFile("hello.txt", "Hello World");
    FileAttributeReader reader;

    auto attrs = reader.read(path);
    ASSERT_TRUE(attrs.ok()) << attrs.error().message;
    EXPECT_EQ(attrs->size, 11u);
    EXPECT_EQ(attrs->checksum, "b10a8db164e0754105b7a99be72e3fe5");
    EXPECT_EQ(attrs->basename, "hello.txt");
}

TEST_F(FileAttributeReaderTest, HonoursAlgorithm) {
    auto path = dir_.writeFile("hello.txt", "Hello World");
    FileAttributeReader reader(ChecksumAlgorithm::SHA256);

    auto attrs = reader.read(path);
    ASSERT_TRUE(attrs.ok());
    EXPECT_EQ(attrs->checksum, "a591a6d40bf420404a011733cfb7b190d62c65bf0bcda32b57b277d9ad9f146e");
}

TEST_F(FileAttributeReaderTest, MissingFile) {
    FileAttributeReader reader;
    auto attrs = reader.read((dir_.path() / "absent.dat").string());
    ASSERT_FALSE(attrs.ok());
    EXPECT_EQ(attrs.error().code, ErrorCode::FileNotFound);
}

TEST_F(FileAttributeReaderTest, DirectoryIsNotARegularFile) {
    FileAttributeReader reader;
    auto attrs = reader.read(dir_.path().string());
    ASSERT_FALSE(attrs.ok());
    EXPECT_EQ(attrs.error().code, ErrorCode::NotRegularFile);
}

TEST(FileAttributeBasenameTest, Basenames) {
    EXPECT_EQ(FileAttributeReader::basenameOf("/var/data/report.pdf"), "report.pdf");
    EXPECT_EQ(FileAttributeReader::basenameOf("report.pdf"), "report.pdf");
    EXPECT_EQ(FileAttributeReader::basenameOf("relative/dir/archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(FileAttributeReader::basenameOf("/var/data/"), "data");
}
