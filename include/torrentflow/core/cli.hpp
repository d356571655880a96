#pragma once

#include <map>
#include <string>
#include <vector>

namespace torrentflow::core {

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    std::string normalize_option_name(const std::string& name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
