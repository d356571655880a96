#include <gtest/gtest.h>
#include "torrentflow/metainfo/descriptor.hpp"
#include "torrentflow/core/utils.hpp"
#include <filesystem>

using namespace torrentflow::metainfo;
using torrentflow::core::utils::FileUtils;

namespace {

std::string pieces_for(const std::string& payload, uint64_t piece_length) {
    std::string pieces;
    for (size_t offset = 0; offset < payload.size(); offset += piece_length) {
        auto chunk = payload.substr(offset, piece_length);
        auto digest = sha1(chunk.data(), chunk.size());
        pieces.append(reinterpret_cast<const char*>(digest.data()), digest.size());
    }
    return pieces;
}

BencodeValue::Dict single_file_info(const std::string& name, const std::string& payload, int64_t piece_length) {
    BencodeValue::Dict info;
    info["name"] = BencodeValue(name);
    info["piece length"] = BencodeValue(piece_length);
    info["length"] = BencodeValue(static_cast<int64_t>(payload.size()));
    info["pieces"] = BencodeValue(pieces_for(payload, static_cast<uint64_t>(piece_length)));
    return info;
}

std::string wrap(BencodeValue::Dict info) {
    BencodeValue::Dict root;
    root["announce"] = BencodeValue("udp://tracker.example:6969/announce");
    root["info"] = BencodeValue(std::move(info));
    return bencode(BencodeValue(std::move(root)));
}

}

class DescriptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "torrentflow_descriptor_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(DescriptorTest, Sha1KnownVector) {
    std::string input = "abc";
    EXPECT_EQ(digest_to_hex(sha1(input.data(), input.size())),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(DescriptorTest, ParseSingleFile) {
    std::string payload(40, 'x');
    std::string data = wrap(single_file_info("movie.mkv", payload, 16));

    auto descriptor = TransferDescriptor::parse(data);

    EXPECT_EQ(descriptor.name, "movie.mkv");
    EXPECT_TRUE(descriptor.single_file);
    EXPECT_EQ(descriptor.total_size, 40);
    EXPECT_EQ(descriptor.piece_length, 16);
    EXPECT_EQ(descriptor.piece_count(), 3);
    EXPECT_EQ(descriptor.piece_size(0), 16);
    EXPECT_EQ(descriptor.piece_size(2), 8);
    EXPECT_EQ(descriptor.piece_size(3), 0);
    ASSERT_EQ(descriptor.files.size(), 1);
    EXPECT_EQ(descriptor.files[0].path, "movie.mkv");
    EXPECT_EQ(descriptor.announce, "udp://tracker.example:6969/announce");
    EXPECT_EQ(descriptor.info_hash_hex.size(), 40);
}

TEST_F(DescriptorTest, InfoHashUsesRawInfoBytes) {
    std::string payload(20, 'y');
    auto info = single_file_info("a.bin", payload, 16);
    std::string info_bytes = bencode(BencodeValue(info));
    std::string data = wrap(info);

    auto descriptor = TransferDescriptor::parse(data);
    EXPECT_EQ(descriptor.info_hash, sha1(info_bytes.data(), info_bytes.size()));
}

TEST_F(DescriptorTest, ParseMultiFile) {
    std::string payload(30, 'z');

    BencodeValue::Dict first;
    first["length"] = BencodeValue(int64_t{10});
    first["path"] = BencodeValue(BencodeValue::List{BencodeValue("docs"), BencodeValue("readme.txt")});
    BencodeValue::Dict second;
    second["length"] = BencodeValue(int64_t{20});
    second["path"] = BencodeValue(BencodeValue::List{BencodeValue("data.bin")});

    BencodeValue::Dict info;
    info["name"] = BencodeValue("bundle");
    info["piece length"] = BencodeValue(int64_t{16});
    info["pieces"] = BencodeValue(pieces_for(payload, 16));
    info["files"] = BencodeValue(BencodeValue::List{BencodeValue(first), BencodeValue(second)});

    auto descriptor = TransferDescriptor::parse(wrap(info));

    EXPECT_FALSE(descriptor.single_file);
    EXPECT_EQ(descriptor.total_size, 30);
    ASSERT_EQ(descriptor.files.size(), 2);
    EXPECT_EQ(descriptor.files[0].path, "docs/readme.txt");
    EXPECT_EQ(descriptor.files[0].offset, 0);
    EXPECT_EQ(descriptor.files[1].path, "data.bin");
    EXPECT_EQ(descriptor.files[1].offset, 10);
}

TEST_F(DescriptorTest, RejectsMalformedInput) {
    EXPECT_THROW(TransferDescriptor::parse("not bencode"), DescriptorError);
    EXPECT_THROW(TransferDescriptor::parse("li1ee"), DescriptorError);
    EXPECT_THROW(TransferDescriptor::parse("d8:announce3:urle"), DescriptorError);
}

TEST_F(DescriptorTest, RejectsInconsistentPieces) {
    std::string payload(40, 'x');

    auto too_few = single_file_info("a.bin", payload, 16);
    too_few["pieces"] = BencodeValue(pieces_for(payload.substr(0, 16), 16));
    EXPECT_THROW(TransferDescriptor::parse(wrap(too_few)), DescriptorError);

    auto ragged = single_file_info("a.bin", payload, 16);
    ragged["pieces"] = BencodeValue(std::string(21, 'p'));
    EXPECT_THROW(TransferDescriptor::parse(wrap(ragged)), DescriptorError);

    auto zero_length = single_file_info("a.bin", payload, 16);
    zero_length["piece length"] = BencodeValue(int64_t{0});
    EXPECT_THROW(TransferDescriptor::parse(wrap(zero_length)), DescriptorError);
}

TEST_F(DescriptorTest, RejectsUnsafeNames) {
    std::string payload(16, 'x');
    EXPECT_THROW(TransferDescriptor::parse(wrap(single_file_info("..", payload, 16))), DescriptorError);
    EXPECT_THROW(TransferDescriptor::parse(wrap(single_file_info("a/b", payload, 16))), DescriptorError);
    EXPECT_THROW(TransferDescriptor::parse(wrap(single_file_info("", payload, 16))), DescriptorError);
}

TEST_F(DescriptorTest, EncodeRoundTripKeepsIdentity) {
    std::string payload(40, 'q');
    auto original = TransferDescriptor::parse(wrap(single_file_info("movie.mkv", payload, 16)));
    original.comment = "weekly build";

    auto reparsed = TransferDescriptor::parse(original.encode());

    EXPECT_EQ(reparsed.info_hash, original.info_hash);
    EXPECT_EQ(reparsed.name, original.name);
    ASSERT_TRUE(reparsed.comment.has_value());
    EXPECT_EQ(*reparsed.comment, "weekly build");
}

TEST_F(DescriptorTest, LoadFromFile) {
    std::string payload(40, 'x');
    auto path = test_dir / "movie.torrent";
    ASSERT_TRUE(FileUtils::write_file(path, wrap(single_file_info("movie.mkv", payload, 16))));

    auto descriptor = TransferDescriptor::load_from_file(path);
    EXPECT_EQ(descriptor.name, "movie.mkv");

    EXPECT_THROW(TransferDescriptor::load_from_file(test_dir / "missing.torrent"), DescriptorError);
}

TEST_F(DescriptorTest, BuilderHashesFilesAsOneStream) {
    std::string first(20, 'a');
    std::string second(12, 'b');
    ASSERT_TRUE(FileUtils::write_file(test_dir / "one.bin", first));
    ASSERT_TRUE(FileUtils::write_file(test_dir / "two.bin", second));

    auto descriptor = DescriptorBuilder(16)
        .set_announce("udp://tracker.example:6969/announce")
        .set_comment("seeded locally")
        .build({test_dir / "one.bin", test_dir / "two.bin"});

    EXPECT_EQ(descriptor.name, "one.bin");
    EXPECT_FALSE(descriptor.single_file);
    EXPECT_EQ(descriptor.total_size, 32);
    ASSERT_EQ(descriptor.piece_count(), 2);

    std::string stream = first + second;
    EXPECT_EQ(descriptor.piece_hashes[0], sha1(stream.data(), 16));
    EXPECT_EQ(descriptor.piece_hashes[1], sha1(stream.data() + 16, 16));

    ASSERT_EQ(descriptor.announce_list.size(), 1);
    EXPECT_EQ(descriptor.announce_list[0][0], "udp://tracker.example:6969/announce");
    ASSERT_TRUE(descriptor.created_by.has_value());
    EXPECT_EQ(*descriptor.created_by, "TorrentFlow");
    EXPECT_GT(descriptor.creation_date, 0);

    auto reparsed = TransferDescriptor::parse(descriptor.encode());
    EXPECT_EQ(reparsed.info_hash, descriptor.info_hash);
}

TEST_F(DescriptorTest, BuilderSingleFile) {
    ASSERT_TRUE(FileUtils::write_file(test_dir / "song.flac", std::string(10, 's')));

    auto descriptor = DescriptorBuilder(16).build({test_dir / "song.flac"});

    EXPECT_TRUE(descriptor.single_file);
    EXPECT_EQ(descriptor.name, "song.flac");
    EXPECT_EQ(descriptor.piece_count(), 1);
    EXPECT_TRUE(descriptor.announce.empty());
}

TEST_F(DescriptorTest, BuilderRejectsBadInput) {
    ASSERT_TRUE(FileUtils::write_file(test_dir / "empty.bin", ""));
    std::filesystem::create_directories(test_dir / "other");
    ASSERT_TRUE(FileUtils::write_file(test_dir / "dup.bin", "x"));
    ASSERT_TRUE(FileUtils::write_file(test_dir / "other" / "dup.bin", "y"));

    EXPECT_THROW(DescriptorBuilder(0), DescriptorError);
    EXPECT_THROW(DescriptorBuilder(16).build({}), DescriptorError);
    EXPECT_THROW(DescriptorBuilder(16).build({test_dir / "missing.bin"}), DescriptorError);
    EXPECT_THROW(DescriptorBuilder(16).build({test_dir / "other"}), DescriptorError);
    EXPECT_THROW(DescriptorBuilder(16).build({test_dir / "empty.bin"}), DescriptorError);
    EXPECT_THROW(DescriptorBuilder(16).build({test_dir / "dup.bin", test_dir / "other" / "dup.bin"}),
                 DescriptorError);
}
