#include "cli/cli_parser.hpp"

#include <stdexcept>

namespace rgb0 {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) == 0) {
            std::string key = a.substr(2);
            std::string val = "true";
            if (i + 1 < argc) {
                std::string next = argv[i + 1] ? argv[i + 1] : "";
                if (next.rfind("--", 0) != 0) {
                    val = next;
                    ++i;
                }
            }
            kv_[key] = val;
        } else {
            positional_.push_back(a);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

unsigned long CliParser::get_uint(const std::string& key, unsigned long def, unsigned long max_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    const std::string& s = it->second;
    size_t used = 0;
    unsigned long v = 0;
    try {
        if (s.empty() || s[0] == '-') throw std::invalid_argument(s);
        v = std::stoul(s, &used, 0);
    } catch (const std::logic_error&) {
        throw std::runtime_error("--" + key + " expects an unsigned integer, got '" + s + "'");
    }
    if (used != s.size()) {
        throw std::runtime_error("--" + key + " expects an unsigned integer, got '" + s + "'");
    }
    if (v > max_value) {
        throw std::runtime_error("--" + key + " must be <= " + std::to_string(max_value));
    }
    return v;
}

} // namespace rgb0
