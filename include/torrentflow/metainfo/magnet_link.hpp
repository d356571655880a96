#pragma once

#include "torrentflow/metainfo/descriptor.hpp"
#include <string>
#include <vector>
#include <optional>

namespace torrentflow::metainfo {

struct MagnetLink {
    Sha1Digest info_hash{};
    std::string info_hash_hex;          // lowercase
    std::optional<std::string> display_name;
    std::vector<std::string> trackers;

    // Accepts magnet:?xt=urn:btih:<40 hex | 32 base32>[&dn=...][&tr=...].
    static std::optional<MagnetLink> parse(const std::string& uri);

    std::string to_uri() const;
};

}
