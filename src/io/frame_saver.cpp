#include "io/frame_saver.hpp"

#include "io/frame_render.hpp"
#include "util/byte_utils.hpp"

#include <dcmtk/config/osconfig.h>   // MUST be first with DCMTK on some platforms
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcuid.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace medslice {
namespace {

static void check_image(const Image& im, const char* who) {
    if (im.width <= 0 || im.height <= 0 || im.empty()) {
        throw std::runtime_error(std::string(who) + ": invalid image size");
    }
    if (im.size() != static_cast<size_t>(im.width) * static_cast<size_t>(im.height)) {
        throw std::runtime_error(std::string(who) + ": pixel buffer size mismatch");
    }
}

static std::ofstream open_out(const std::string& path) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    return ofs;
}

static void write_all(std::ofstream& ofs, const std::vector<uint8_t>& bytes, const std::string& path) {
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

static std::runtime_error dcmtk_error(const std::string& where, const OFCondition& cond) {
    return std::runtime_error(where + ": " + cond.text());
}

static void require_ok(const OFCondition& cond, const char* what) {
    if (cond.bad()) throw dcmtk_error(std::string("Cannot set ") + what, cond);
}

} // namespace

void save_pgm(const std::string& path, const Image& im) {
    check_image(im, "save_pgm");

    const int maxv = (im.bits_stored <= 8) ? 255 : ((1 << im.bits_stored) - 1);
    auto ofs = open_out(path);
    ofs << "P5\n" << im.width << " " << im.height << "\n" << maxv << "\n";

    std::vector<uint8_t> payload;
    payload.reserve(im.pixels.size() * (maxv == 255 ? 1 : 2));
    for (uint16_t v : im.pixels) {
        if (v > maxv) v = static_cast<uint16_t>(maxv);
        if (maxv == 255) {
            payload.push_back(static_cast<uint8_t>(v));
        } else {
            // PGM 16-bit is big-endian
            payload.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
            payload.push_back(static_cast<uint8_t>(v & 0xFF));
        }
    }
    write_all(ofs, payload, path);
}

void save_bmp(const std::string& path, const Image& im) {
    check_image(im, "save_bmp");
    if (im.type != PixelType::U8) throw std::runtime_error("save_bmp: only 8-bit images are supported");

    constexpr uint32_t kFileHeaderBytes = 14;
    constexpr uint32_t kInfoHeaderBytes = 40;
    constexpr int32_t kResolution = 1000;
    const size_t row_bytes = static_cast<size_t>(im.width) * 3;
    const size_t row_stride = (row_bytes + 3) & ~static_cast<size_t>(3);
    const size_t pixel_bytes = row_stride * static_cast<size_t>(im.height);
    const size_t file_bytes = kFileHeaderBytes + kInfoHeaderBytes + pixel_bytes;
    if (file_bytes > 0xFFFFFFFFu) throw std::runtime_error("save_bmp: image too large");

    ByteWriter w;
    // BITMAPFILEHEADER
    w.write_u8('B');
    w.write_u8('M');
    w.write_u32_le(static_cast<uint32_t>(file_bytes));
    w.write_u32_le(0);
    w.write_u32_le(kFileHeaderBytes + kInfoHeaderBytes);
    // BITMAPINFOHEADER
    w.write_u32_le(kInfoHeaderBytes);
    w.write_i32_le(im.width);
    w.write_i32_le(im.height);   // positive: rows stored bottom-up
    w.write_u16_le(1);           // planes
    w.write_u16_le(24);          // bits per pixel
    w.write_u32_le(0);           // BI_RGB
    w.write_u32_le(static_cast<uint32_t>(pixel_bytes));
    w.write_i32_le(kResolution);  // horizontal, pixels per metre
    w.write_i32_le(kResolution);  // vertical
    w.write_u32_le(0);
    w.write_u32_le(0);

    for (int y = im.height - 1; y >= 0; --y) {
        const size_t base = static_cast<size_t>(y) * static_cast<size_t>(im.width);
        for (int x = 0; x < im.width; ++x) {
            const uint8_t g = static_cast<uint8_t>(im.pixels[base + static_cast<size_t>(x)]);
            w.write_u8(g);
            w.write_u8(g);
            w.write_u8(g);
        }
        w.write_zeros(row_stride - row_bytes);
    }

    auto ofs = open_out(path);
    write_all(ofs, w.bytes(), path);
}

void save_dicom(const std::string& path, const Image& im) {
    check_image(im, "save_dicom");
    if (im.width > 0xFFFF || im.height > 0xFFFF) {
        throw std::runtime_error("save_dicom: image dimensions exceed 65535");
    }

    DcmFileFormat file;
    DcmDataset* ds = file.getDataset();

    char uid[100];
    require_ok(ds->putAndInsertString(DCM_SOPClassUID, UID_SecondaryCaptureImageStorage), "SOPClassUID");
    require_ok(ds->putAndInsertString(DCM_SOPInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_INSTANCE_UID_ROOT)), "SOPInstanceUID");
    require_ok(ds->putAndInsertString(DCM_StudyInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_STUDY_UID_ROOT)), "StudyInstanceUID");
    require_ok(ds->putAndInsertString(DCM_SeriesInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_SERIES_UID_ROOT)), "SeriesInstanceUID");
    require_ok(ds->putAndInsertString(DCM_Modality, "OT"), "Modality");
    require_ok(ds->putAndInsertString(DCM_ConversionType, "WSD"), "ConversionType");
    require_ok(ds->putAndInsertString(DCM_InstanceNumber, "1"), "InstanceNumber");

    const Uint16 bits_allocated = static_cast<Uint16>(im.bits_allocated());
    const Uint16 bits_stored = static_cast<Uint16>(im.bits_stored);
    require_ok(ds->putAndInsertUint16(DCM_SamplesPerPixel, 1), "SamplesPerPixel");
    require_ok(ds->putAndInsertString(DCM_PhotometricInterpretation, "MONOCHROME2"), "PhotometricInterpretation");
    require_ok(ds->putAndInsertUint16(DCM_Rows, static_cast<Uint16>(im.height)), "Rows");
    require_ok(ds->putAndInsertUint16(DCM_Columns, static_cast<Uint16>(im.width)), "Columns");
    require_ok(ds->putAndInsertUint16(DCM_BitsAllocated, bits_allocated), "BitsAllocated");
    require_ok(ds->putAndInsertUint16(DCM_BitsStored, bits_stored), "BitsStored");
    require_ok(ds->putAndInsertUint16(DCM_HighBit, static_cast<Uint16>(bits_stored - 1)), "HighBit");
    require_ok(ds->putAndInsertUint16(DCM_PixelRepresentation, 0), "PixelRepresentation");

    if (im.type == PixelType::U8) {
        std::vector<Uint8> px(im.pixels.size());
        for (size_t i = 0; i < px.size(); ++i) px[i] = static_cast<Uint8>(im.pixels[i]);
        require_ok(ds->putAndInsertUint8Array(DCM_PixelData, px.data(), static_cast<unsigned long>(px.size())), "PixelData");
    } else {
        require_ok(ds->putAndInsertUint16Array(DCM_PixelData, im.pixels.data(),
                                        static_cast<unsigned long>(im.pixels.size())), "PixelData");
    }

    OFCondition st = file.saveFile(path.c_str(), EXS_LittleEndianExplicit);
    if (st.bad()) throw dcmtk_error("saveFile failed (" + path + ")", st);
}

void save_raw(const std::string& path, const Frame& frame) {
    auto ofs = open_out(path);
    write_raw_frame(ofs, frame);
}

} // namespace medslice
