#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace parley {

// Command-line argument parser for -key value style arguments.
// --key=value is accepted as well; a key followed by another key (or by
// nothing) is a flag with value "1". Arguments that are not options are
// ignored.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key (last occurrence). Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Parse the integer value of a present key into out.
    // Returns false if the key is present but its value is not an integer;
    // out is left unchanged when the key is absent.
    bool parse_int(const std::string& key, int& out) const;

private:
    std::unordered_map<std::string, std::vector<std::string>> opts_;
};

} // namespace parley
