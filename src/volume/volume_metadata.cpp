#include "volume/volume_metadata.hpp"

#include "volume/errors.hpp"

#include <plog/Log.h>

#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>
#include <vector>

namespace medslice {
namespace {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

static std::vector<std::string_view> split_whitespace(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        const size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

// Whole token must be digits and fit size_t; no sign, no trailing garbage.
static size_t parse_dimension(std::string_view text, size_t line_number) {
    size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto res = std::from_chars(first, last, value, 10);
    if (text.empty() || res.ec != std::errc() || res.ptr != last) {
        throw InvalidDimSizeValue(line_number, std::string(text));
    }
    return value;
}

} // namespace

VolumeMetadata VolumeMetadata::parse(const std::string& text) {
    std::optional<VolumeMetadata> res;

    const std::string_view buffer(text);
    size_t line_number = 0;
    size_t pos = 0;
    while (pos <= buffer.size()) {
        size_t eol = buffer.find('\n', pos);
        if (eol == std::string_view::npos) eol = buffer.size();
        const std::string_view line = buffer.substr(pos, eol - pos);
        pos = eol + 1;
        ++line_number;

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            if (!trim(line).empty()) {
                LOGW << "Line " << line_number << ": Skipping entry without an `=` sign";
            }
            continue;
        }

        const std::string_view key = trim(line.substr(0, eq));
        if (key.empty()) {
            LOGD << "Line " << line_number << ": Skipping line with empty key";
            continue;
        }
        if (key != "DimSize") {
            LOGD << "Line " << line_number << ": Skipping key " << std::string(key);
            continue;
        }

        if (res) throw DuplicateKey(line_number);

        // Everything after the first '=' is the value, further '=' included.
        const auto dims = split_whitespace(line.substr(eq + 1));
        if (dims.size() < 3) throw MissingDimSizeValues(line_number);
        if (dims.size() > 3) throw TooManyDimSizeValues(line_number);

        const size_t xdim = parse_dimension(dims[0], line_number);
        const size_t ydim = parse_dimension(dims[1], line_number);
        const size_t zdim = parse_dimension(dims[2], line_number);
        LOGD << "Line " << line_number << ": DimSize = " << xdim << " x " << ydim << " x " << zdim;

        // Keep scanning so a later duplicate is still reported.
        res = VolumeMetadata(xdim, ydim, zdim);
    }

    if (!res) throw DimSizeNotFound();
    return *res;
}

} // namespace medslice
