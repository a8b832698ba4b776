#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace medslice {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
// Anything that is not introduced by "--" is collected as a positional.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;

    // Non-negative base-10 integer; throws std::runtime_error naming the
    // option when the value is malformed or does not fit size_t.
    size_t get_size(const std::string& key, size_t def) const;

    const std::vector<std::string>& positionals() const { return positionals_; }

    // Throws std::runtime_error naming the first argument not introduced by
    // an option; medslice takes no positional arguments.
    void reject_positionals() const;
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positionals_;
};

} // namespace medslice
