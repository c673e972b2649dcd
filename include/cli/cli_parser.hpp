#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace rgb0 {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
//   anything else is positional
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Decimal or 0x-prefixed; throws std::runtime_error if malformed or > max_value.
    unsigned long get_uint(const std::string& key, unsigned long def, unsigned long max_value) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace rgb0
