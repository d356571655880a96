#pragma once

#include "torrentflow/metainfo/bencode.hpp"
#include <array>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <cstdint>

namespace torrentflow::metainfo {

constexpr size_t SHA1_DIGEST_SIZE = 20;
constexpr uint32_t DEFAULT_PIECE_LENGTH = 256 * 1024;

using Sha1Digest = std::array<std::uint8_t, SHA1_DIGEST_SIZE>;

Sha1Digest sha1(const void* data, size_t size);
std::string digest_to_hex(const Sha1Digest& digest);

class DescriptorError : public std::runtime_error {
public:
    explicit DescriptorError(const std::string& message) : std::runtime_error(message) {}
};

struct DescriptorFile {
    std::string path;       // relative, '/' separated
    uint64_t length = 0;
    uint64_t offset = 0;    // position inside the concatenated payload
};

// Contents of a .torrent file (BitTorrent v1 metainfo).
struct TransferDescriptor {
    std::string name;
    uint64_t piece_length = 0;
    std::vector<Sha1Digest> piece_hashes;
    std::vector<DescriptorFile> files;
    uint64_t total_size = 0;
    bool single_file = true;

    std::string announce;
    std::vector<std::vector<std::string>> announce_list;
    std::optional<std::string> comment;
    std::optional<std::string> created_by;
    int64_t creation_date = 0;

    Sha1Digest info_hash{};
    std::string info_hash_hex;

    // Throw DescriptorError on malformed or inconsistent input.
    static TransferDescriptor parse(const std::string& data);
    static TransferDescriptor load_from_file(const std::filesystem::path& path);

    std::string encode() const;
    bool save_to_file(const std::filesystem::path& path) const;

    BencodeValue info_dict() const;

    size_t piece_count() const { return piece_hashes.size(); }
    uint64_t piece_size(size_t index) const;
};

// Builds a descriptor describing files already present on disk, hashing
// every piece.
class DescriptorBuilder {
public:
    explicit DescriptorBuilder(uint32_t piece_length = DEFAULT_PIECE_LENGTH);

    DescriptorBuilder& set_announce(const std::string& announce);
    DescriptorBuilder& set_comment(const std::string& comment);
    DescriptorBuilder& set_created_by(const std::string& created_by);

    TransferDescriptor build(const std::vector<std::filesystem::path>& paths) const;

private:
    uint32_t piece_length_;
    std::string announce_;
    std::optional<std::string> comment_;
    std::string created_by_;
};

}
