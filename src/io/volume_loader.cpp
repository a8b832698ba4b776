#include "io/volume_loader.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace medslice {

std::string read_text_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) throw std::runtime_error("Read failed: " + path);
    return text;
}

std::vector<uint8_t> read_binary_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    const std::streamsize n = ifs.tellg();
    if (n < 0) throw std::runtime_error("Cannot determine file size: " + path);
    ifs.seekg(0, std::ios::beg);

    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

} // namespace medslice
