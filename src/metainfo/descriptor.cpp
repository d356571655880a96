#include "torrentflow/metainfo/descriptor.hpp"
#include "torrentflow/core/utils.hpp"
#include <openssl/sha.h>
#include <algorithm>

namespace torrentflow::metainfo {

Sha1Digest sha1(const void* data, size_t size) {
    Sha1Digest digest{};
    SHA1(static_cast<const unsigned char*>(data), size, digest.data());
    return digest;
}

std::string digest_to_hex(const Sha1Digest& digest) {
    return core::utils::StringUtils::to_hex(digest.data(), digest.size());
}

namespace {

bool is_safe_component(const std::string& component) {
    return !component.empty() &&
           component != "." &&
           component != ".." &&
           component.find('/') == std::string::npos &&
           component.find('\\') == std::string::npos &&
           component.find('\0') == std::string::npos;
}

uint64_t require_length(const BencodeValue* value, const std::string& what) {
    if (!value || !value->is_int() || value->as_int() < 0) {
        throw DescriptorError("Missing or invalid " + what);
    }
    return static_cast<uint64_t>(value->as_int());
}

}

TransferDescriptor TransferDescriptor::parse(const std::string& data) {
    TransferDescriptor descriptor;

    BencodeParser parser(data);
    BencodeValue root;
    try {
        root = parser.parse();
    } catch (const BencodeError& e) {
        throw DescriptorError(std::string("Malformed bencode: ") + e.what());
    }

    if (!root.is_dict()) {
        throw DescriptorError("Descriptor root is not a dictionary");
    }

    const auto* info = root.find("info");
    auto span = parser.info_span();
    if (!info || !info->is_dict() || !span) {
        throw DescriptorError("Missing info dictionary");
    }

    const auto* name = info->find("name");
    if (!name || !name->is_string() || !is_safe_component(name->as_string())) {
        throw DescriptorError("Missing or invalid name");
    }
    descriptor.name = name->as_string();

    descriptor.piece_length = require_length(info->find("piece length"), "piece length");
    if (descriptor.piece_length == 0) {
        throw DescriptorError("Piece length must be positive");
    }

    const auto* pieces = info->find("pieces");
    if (!pieces || !pieces->is_string() || pieces->as_string().size() % SHA1_DIGEST_SIZE != 0) {
        throw DescriptorError("Missing or invalid pieces");
    }
    const auto& pieces_str = pieces->as_string();
    descriptor.piece_hashes.resize(pieces_str.size() / SHA1_DIGEST_SIZE);
    for (size_t i = 0; i < descriptor.piece_hashes.size(); ++i) {
        std::copy_n(reinterpret_cast<const uint8_t*>(pieces_str.data()) + i * SHA1_DIGEST_SIZE,
                    SHA1_DIGEST_SIZE, descriptor.piece_hashes[i].begin());
    }

    const auto* files = info->find("files");
    if (files) {
        if (!files->is_list() || files->as_list().empty()) {
            throw DescriptorError("Invalid file list");
        }

        descriptor.single_file = false;
        for (const auto& entry : files->as_list()) {
            const auto* path = entry.find("path");
            if (!path || !path->is_list() || path->as_list().empty()) {
                throw DescriptorError("File entry without path");
            }

            std::vector<std::string> components;
            for (const auto& component : path->as_list()) {
                if (!component.is_string() || !is_safe_component(component.as_string())) {
                    throw DescriptorError("Unsafe path component in file list");
                }
                components.push_back(component.as_string());
            }

            DescriptorFile file;
            file.path = core::utils::StringUtils::join(components, "/");
            file.length = require_length(entry.find("length"), "file length");
            file.offset = descriptor.total_size;
            descriptor.total_size += file.length;
            descriptor.files.push_back(std::move(file));
        }
    } else {
        DescriptorFile file;
        file.path = descriptor.name;
        file.length = require_length(info->find("length"), "length");
        descriptor.total_size = file.length;
        descriptor.files.push_back(std::move(file));
    }

    if (descriptor.total_size == 0) {
        throw DescriptorError("Descriptor describes no data");
    }

    uint64_t expected_pieces = (descriptor.total_size + descriptor.piece_length - 1) / descriptor.piece_length;
    if (expected_pieces != descriptor.piece_hashes.size()) {
        throw DescriptorError("Piece count does not match total size");
    }

    if (const auto* announce = root.find("announce"); announce && announce->is_string()) {
        descriptor.announce = announce->as_string();
    }

    if (const auto* tiers = root.find("announce-list"); tiers && tiers->is_list()) {
        for (const auto& tier_value : tiers->as_list()) {
            if (!tier_value.is_list()) continue;

            std::vector<std::string> tier;
            for (const auto& tracker : tier_value.as_list()) {
                if (tracker.is_string()) tier.push_back(tracker.as_string());
            }
            if (!tier.empty()) descriptor.announce_list.push_back(std::move(tier));
        }
    }

    if (const auto* comment = root.find("comment"); comment && comment->is_string()) {
        descriptor.comment = comment->as_string();
    }
    if (const auto* created_by = root.find("created by"); created_by && created_by->is_string()) {
        descriptor.created_by = created_by->as_string();
    }
    if (const auto* date = root.find("creation date"); date && date->is_int()) {
        descriptor.creation_date = date->as_int();
    }

    // Hash the info bytes as they appear in the file, not a re-encoding.
    descriptor.info_hash = sha1(data.data() + span->first, span->second - span->first);
    descriptor.info_hash_hex = digest_to_hex(descriptor.info_hash);

    return descriptor;
}

TransferDescriptor TransferDescriptor::load_from_file(const std::filesystem::path& path) {
    auto content = core::utils::FileUtils::read_file(path);
    if (!content) {
        throw DescriptorError("Cannot read descriptor file: " + path.string());
    }
    return parse(*content);
}

BencodeValue TransferDescriptor::info_dict() const {
    BencodeValue::Dict info;
    info["name"] = name;
    info["piece length"] = static_cast<int64_t>(piece_length);

    std::string pieces;
    pieces.reserve(piece_hashes.size() * SHA1_DIGEST_SIZE);
    for (const auto& hash : piece_hashes) {
        pieces.append(reinterpret_cast<const char*>(hash.data()), hash.size());
    }
    info["pieces"] = std::move(pieces);

    if (single_file) {
        info["length"] = static_cast<int64_t>(total_size);
    } else {
        BencodeValue::List file_list;
        for (const auto& file : files) {
            BencodeValue::List components;
            for (const auto& component : core::utils::StringUtils::split(file.path, '/')) {
                components.emplace_back(component);
            }

            BencodeValue::Dict entry;
            entry["length"] = static_cast<int64_t>(file.length);
            entry["path"] = std::move(components);
            file_list.emplace_back(std::move(entry));
        }
        info["files"] = std::move(file_list);
    }

    return BencodeValue(std::move(info));
}

std::string TransferDescriptor::encode() const {
    BencodeValue::Dict root;
    root["info"] = info_dict();

    if (!announce.empty()) {
        root["announce"] = announce;
    }

    if (!announce_list.empty()) {
        BencodeValue::List tiers;
        for (const auto& tier : announce_list) {
            BencodeValue::List urls;
            for (const auto& url : tier) {
                urls.emplace_back(url);
            }
            tiers.emplace_back(std::move(urls));
        }
        root["announce-list"] = std::move(tiers);
    }

    if (comment) root["comment"] = *comment;
    if (created_by) root["created by"] = *created_by;
    if (creation_date > 0) root["creation date"] = creation_date;

    return bencode(BencodeValue(std::move(root)));
}

bool TransferDescriptor::save_to_file(const std::filesystem::path& path) const {
    return core::utils::FileUtils::write_file(path, encode());
}

uint64_t TransferDescriptor::piece_size(size_t index) const {
    if (index >= piece_hashes.size()) {
        return 0;
    }

    uint64_t start = static_cast<uint64_t>(index) * piece_length;
    return std::min<uint64_t>(piece_length, total_size - start);
}

}
