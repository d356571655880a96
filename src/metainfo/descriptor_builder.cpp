#include "torrentflow/metainfo/descriptor.hpp"
#include "torrentflow/core/logger.hpp"
#include <fstream>
#include <set>
#include <chrono>

namespace torrentflow::metainfo {

DescriptorBuilder::DescriptorBuilder(uint32_t piece_length)
    : piece_length_(piece_length)
    , created_by_("TorrentFlow") {
    if (piece_length_ == 0) {
        throw DescriptorError("Piece length must be positive");
    }
}

DescriptorBuilder& DescriptorBuilder::set_announce(const std::string& announce) {
    announce_ = announce;
    return *this;
}

DescriptorBuilder& DescriptorBuilder::set_comment(const std::string& comment) {
    comment_ = comment;
    return *this;
}

DescriptorBuilder& DescriptorBuilder::set_created_by(const std::string& created_by) {
    created_by_ = created_by;
    return *this;
}

TransferDescriptor DescriptorBuilder::build(const std::vector<std::filesystem::path>& paths) const {
    if (paths.empty()) {
        throw DescriptorError("No files given");
    }

    TransferDescriptor descriptor;
    descriptor.piece_length = piece_length_;
    descriptor.single_file = paths.size() == 1;
    descriptor.name = paths.front().filename().string();
    if (descriptor.name.empty()) {
        throw DescriptorError("Cannot derive a name from " + paths.front().string());
    }

    std::set<std::string> seen_names;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw DescriptorError("Not a regular file: " + path.string());
        }

        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw DescriptorError("Cannot stat " + path.string() + ": " + ec.message());
        }

        DescriptorFile file;
        file.path = path.filename().string();
        if (!seen_names.insert(file.path).second) {
            throw DescriptorError("Duplicate file name: " + file.path);
        }
        file.length = size;
        file.offset = descriptor.total_size;
        descriptor.total_size += size;
        descriptor.files.push_back(std::move(file));
    }

    if (descriptor.total_size == 0) {
        throw DescriptorError("Files contain no data");
    }

    // Pieces span file boundaries, so the files are hashed as one stream.
    std::vector<char> piece(piece_length_);
    size_t filled = 0;
    for (const auto& path : paths) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            throw DescriptorError("Cannot open " + path.string());
        }

        while (input.good()) {
            input.read(piece.data() + filled, static_cast<std::streamsize>(piece_length_ - filled));
            filled += static_cast<size_t>(input.gcount());
            if (filled == piece_length_) {
                descriptor.piece_hashes.push_back(sha1(piece.data(), filled));
                filled = 0;
            }
        }

        if (input.bad()) {
            throw DescriptorError("Read error on " + path.string());
        }
    }
    if (filled > 0) {
        descriptor.piece_hashes.push_back(sha1(piece.data(), filled));
    }

    uint64_t expected_pieces = (descriptor.total_size + piece_length_ - 1) / piece_length_;
    if (descriptor.piece_hashes.size() != expected_pieces) {
        throw DescriptorError("Files changed while hashing");
    }

    descriptor.announce = announce_;
    if (!announce_.empty()) {
        descriptor.announce_list.push_back({announce_});
    }
    descriptor.comment = comment_;
    if (!created_by_.empty()) {
        descriptor.created_by = created_by_;
    }
    descriptor.creation_date = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string info = bencode(descriptor.info_dict());
    descriptor.info_hash = sha1(info.data(), info.size());
    descriptor.info_hash_hex = digest_to_hex(descriptor.info_hash);

    LOG_DEBUG("Built descriptor '{}' ({} files, {} pieces, info-hash {})",
              descriptor.name, descriptor.files.size(), descriptor.piece_hashes.size(),
              descriptor.info_hash_hex);

    return descriptor;
}

}
