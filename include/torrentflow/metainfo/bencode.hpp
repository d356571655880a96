#pragma once

#include <map>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace torrentflow::metainfo {

class BencodeError : public std::runtime_error {
public:
    explicit BencodeError(const std::string& message) : std::runtime_error(message) {}
};

struct BencodeValue {
    using List = std::vector<BencodeValue>;
    using Dict = std::map<std::string, BencodeValue>;

    std::variant<int64_t, std::string, List, Dict> value;

    BencodeValue() : value(int64_t{0}) {}
    BencodeValue(int64_t v) : value(v) {}
    BencodeValue(std::string v) : value(std::move(v)) {}
    BencodeValue(const char* v) : value(std::string(v)) {}
    BencodeValue(List v) : value(std::move(v)) {}
    BencodeValue(Dict v) : value(std::move(v)) {}

    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_list() const { return std::holds_alternative<List>(value); }
    bool is_dict() const { return std::holds_alternative<Dict>(value); }

    int64_t as_int() const { return std::get<int64_t>(value); }
    const std::string& as_string() const { return std::get<std::string>(value); }
    const List& as_list() const { return std::get<List>(value); }
    const Dict& as_dict() const { return std::get<Dict>(value); }

    // Dictionary lookup; nullptr when this is not a dict or the key is absent.
    const BencodeValue* find(const std::string& key) const;
};

class BencodeParser {
public:
    // The input must outlive the parser.
    explicit BencodeParser(const std::string& input);

    // Parses exactly one value spanning the whole input.
    BencodeValue parse();

    // Byte range [first, second) of the top-level "info" value, if any.
    std::optional<std::pair<size_t, size_t>> info_span() const { return info_span_; }

private:
    BencodeValue parse_value(int depth);
    int64_t parse_int();
    std::string parse_string();
    BencodeValue::List parse_list(int depth);
    BencodeValue::Dict parse_dict(int depth);

    const std::string& data_;
    size_t pos_;
    std::optional<std::pair<size_t, size_t>> info_span_;

    static constexpr int MAX_DEPTH = 64;
};

std::string bencode(const BencodeValue& value);

}
