#include "io/frame_render.hpp"

#include "util/byte_utils.hpp"

#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace medslice {
namespace {

static int checked_dim(size_t v, const char* what) {
    if (v > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string("render_frame: frame ") + what + " too large");
    }
    return static_cast<int>(v);
}

} // namespace

Image render_frame(const Frame& frame, PixelType type) {
    Image im;
    im.width = checked_dim(frame.width(), "width");
    im.height = checked_dim(frame.height(), "height");
    im.type = type;
    im.bits_stored = (type == PixelType::U8) ? 8 : 12;
    im.pixels.resize(frame.size());

    const size_t w = frame.width();
    for (const FrameElement e : frame) {
        const Voxel v = e.voxel();
        im.pixels[e.y() * w + e.x()] =
            static_cast<uint16_t>((type == PixelType::U8) ? v.normalized() : v.value());
    }
    return im;
}

void write_raw_frame(std::ostream& os, const Frame& frame) {
    // buffered one frame row at a time
    ByteWriter w;
    const size_t row = frame.width();
    size_t n = 0;
    for (const FrameElement e : frame) {
        w.write_u16_le(e.voxel().value());
        if (++n == row) {
            os.write(reinterpret_cast<const char*>(w.bytes().data()),
                     static_cast<std::streamsize>(w.size()));
            w.clear();
            n = 0;
        }
    }
    if (w.size() > 0) {
        os.write(reinterpret_cast<const char*>(w.bytes().data()),
                 static_cast<std::streamsize>(w.size()));
    }
    if (!os.good()) throw std::runtime_error("write_raw_frame: stream write failed");
}

} // namespace medslice
