#include "torrentflow/metainfo/bencode.hpp"
#include <cctype>
#include <limits>

namespace torrentflow::metainfo {

const BencodeValue* BencodeValue::find(const std::string& key) const {
    if (!is_dict()) {
        return nullptr;
    }

    const auto& dict = as_dict();
    auto it = dict.find(key);
    return it != dict.end() ? &it->second : nullptr;
}

BencodeParser::BencodeParser(const std::string& input)
    : data_(input)
    , pos_(0) {
}

BencodeValue BencodeParser::parse() {
    pos_ = 0;
    info_span_.reset();

    auto value = parse_value(0);
    if (pos_ != data_.size()) {
        throw BencodeError("Trailing data after bencoded value");
    }
    return value;
}

BencodeValue BencodeParser::parse_value(int depth) {
    if (depth > MAX_DEPTH) throw BencodeError("Nesting too deep");
    if (pos_ >= data_.size()) throw BencodeError("Unexpected end of input");

    char c = data_[pos_];
    if (c == 'i') {
        return BencodeValue(parse_int());
    } else if (c == 'l') {
        ++pos_;
        return BencodeValue(parse_list(depth + 1));
    } else if (c == 'd') {
        ++pos_;
        return BencodeValue(parse_dict(depth + 1));
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
        return BencodeValue(parse_string());
    }

    throw BencodeError(std::string("Invalid bencode token: ") + c);
}

// i<digits>e, no leading zeros, no "-0"
int64_t BencodeParser::parse_int() {
    ++pos_;

    bool negative = false;
    if (pos_ < data_.size() && data_[pos_] == '-') {
        negative = true;
        ++pos_;
    }

    if (pos_ >= data_.size() || !std::isdigit(static_cast<unsigned char>(data_[pos_]))) {
        throw BencodeError("Invalid integer");
    }

    if (data_[pos_] == '0') {
        if (negative) throw BencodeError("Negative zero not allowed");
        ++pos_;
        if (pos_ < data_.size() && std::isdigit(static_cast<unsigned char>(data_[pos_]))) {
            throw BencodeError("Leading zeros not allowed");
        }
    }

    uint64_t magnitude = 0;
    while (pos_ < data_.size() && std::isdigit(static_cast<unsigned char>(data_[pos_]))) {
        uint64_t digit = static_cast<uint64_t>(data_[pos_] - '0');
        if (magnitude > (static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) - digit) / 10) {
            throw BencodeError("Integer overflow");
        }
        magnitude = magnitude * 10 + digit;
        ++pos_;
    }

    if (pos_ >= data_.size() || data_[pos_] != 'e') throw BencodeError("Missing 'e' for integer");
    ++pos_;

    auto value = static_cast<int64_t>(magnitude);
    return negative ? -value : value;
}

// <length>:<bytes>
std::string BencodeParser::parse_string() {
    size_t colon = data_.find(':', pos_);
    if (colon == std::string::npos) throw BencodeError("Missing ':' in string");
    if (colon - pos_ > 1 && data_[pos_] == '0') throw BencodeError("Leading zeros in string length");

    size_t length = 0;
    for (size_t i = pos_; i < colon; ++i) {
        char ch = data_[i];
        if (!std::isdigit(static_cast<unsigned char>(ch))) throw BencodeError("Invalid string length");
        length = length * 10 + static_cast<size_t>(ch - '0');
        if (length > data_.size()) throw BencodeError("String length exceeds input");
    }

    pos_ = colon + 1;
    if (length > data_.size() - pos_) throw BencodeError("String length exceeds input");

    std::string result = data_.substr(pos_, length);
    pos_ += length;
    return result;
}

BencodeValue::List BencodeParser::parse_list(int depth) {
    BencodeValue::List list;
    while (pos_ < data_.size() && data_[pos_] != 'e') {
        list.push_back(parse_value(depth));
    }
    if (pos_ >= data_.size()) throw BencodeError("Missing 'e' at end of list");
    ++pos_;
    return list;
}

BencodeValue::Dict BencodeParser::parse_dict(int depth) {
    BencodeValue::Dict dict;
    while (pos_ < data_.size() && data_[pos_] != 'e') {
        if (!std::isdigit(static_cast<unsigned char>(data_[pos_]))) {
            throw BencodeError("Dictionary key must be a string");
        }
        std::string key = parse_string();

        size_t value_start = pos_;
        BencodeValue value = parse_value(depth);
        size_t value_end = pos_;

        if (depth == 1 && key == "info") {
            info_span_ = std::make_pair(value_start, value_end);
        }

        dict.insert_or_assign(std::move(key), std::move(value));
    }
    if (pos_ >= data_.size()) throw BencodeError("Missing 'e' at end of dict");
    ++pos_;
    return dict;
}

namespace {

void encode_into(const BencodeValue& value, std::string& out) {
    if (value.is_int()) {
        out += 'i';
        out += std::to_string(value.as_int());
        out += 'e';
    } else if (value.is_string()) {
        const auto& str = value.as_string();
        out += std::to_string(str.size());
        out += ':';
        out += str;
    } else if (value.is_list()) {
        out += 'l';
        for (const auto& item : value.as_list()) {
            encode_into(item, out);
        }
        out += 'e';
    } else {
        // std::map keeps keys in the byte order bencode requires
        out += 'd';
        for (const auto& [key, item] : value.as_dict()) {
            out += std::to_string(key.size());
            out += ':';
            out += key;
            encode_into(item, out);
        }
        out += 'e';
    }
}

}

std::string bencode(const BencodeValue& value) {
    std::string out;
    encode_into(value, out);
    return out;
}

}
