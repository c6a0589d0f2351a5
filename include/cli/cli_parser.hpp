#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace pchunk {

// Small option parser for the chunk tools:
//   --key value
//   --key=value
//   --flag           (stored as "true")
//   anything else    (kept as a positional argument)
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // True for a bare --flag or an explicit true/1/yes value.
    bool get_flag(const std::string& key) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace pchunk
