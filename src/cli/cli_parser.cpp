#include "cli/cli_parser.hpp"

#include <charconv>
#include <stdexcept>

namespace medslice {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positionals_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0) {
            positionals_.push_back(a);
            continue;
        }
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

void CliParser::reject_positionals() const {
    if (!positionals_.empty()) {
        throw std::runtime_error("Unexpected argument: " + positionals_.front());
    }
}

size_t CliParser::get_size(const std::string& key, size_t def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;

    const std::string& text = it->second;
    size_t value = 0;
    const char* last = text.data() + text.size();
    auto res = std::from_chars(text.data(), last, value, 10);
    if (text.empty() || res.ec != std::errc() || res.ptr != last) {
        throw std::runtime_error("--" + key + " expects a non-negative integer, got '" + text + "'");
    }
    return value;
}

} // namespace medslice
