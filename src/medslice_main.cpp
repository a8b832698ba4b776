// medslice: extract X/Y/Z frames from a MetaImage-style volume.
#include "cli/cli_parser.hpp"
#include "io/frame_render.hpp"
#include "io/frame_saver.hpp"
#include "io/volume_loader.hpp"
#include "volume/volume.hpp"
#include "volume/volume_metadata.hpp"

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Appenders/ColorConsoleAppender.h>

#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kUsage =
    "Usage: medslice --metadata <volume.mhd> --data <volume.raw>\n"
    "                [--xframe <out>] [--yframe <out>] [--zframe <out>]\n"
    "                [--x-index N] [--y-index N] [--z-index N]\n"
    "                [--format bmp|pgm|dicom|raw] [--verbose N]\n";

plog::Severity severity_for(size_t verbose) {
    switch (verbose) {
    case 0: return plog::warning;
    case 1: return plog::info;
    case 2: return plog::debug;
    default: return plog::verbose;
    }
}

void save_frame(const medslice::Frame& frame, const std::string& format, const std::string& path) {
    if (format == "raw") {
        medslice::save_raw(path, frame);
    } else if (format == "bmp") {
        medslice::save_bmp(path, medslice::render_frame(frame, medslice::PixelType::U8));
    } else if (format == "pgm") {
        medslice::save_pgm(path, medslice::render_frame(frame, medslice::PixelType::U8));
    } else if (format == "dicom") {
        medslice::save_dicom(path, medslice::render_frame(frame, medslice::PixelType::U16));
    } else {
        throw std::runtime_error("Unknown output format: " + format);
    }
}

} // namespace

int main(int argc, char** argv) {
    medslice::CliParser cli;
    cli.parse(argc, argv);

    const std::string metadata_path = cli.get("metadata");
    const std::string data_path = cli.get("data");
    if (metadata_path.empty() || data_path.empty() ||
        !(cli.has("xframe") || cli.has("yframe") || cli.has("zframe"))) {
        std::cerr << kUsage;
        return 1;
    }
    try {
        cli.reject_positionals();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << kUsage;
        return 1;
    }

    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    try {
        plog::init(severity_for(cli.get_size("verbose", 0)), &console_appender);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    try {
        const std::string format = cli.get("format", "bmp");
        if (format != "bmp" && format != "pgm" && format != "dicom" && format != "raw") {
            throw std::runtime_error("Unknown output format: " + format);
        }

        const auto metadata = medslice::VolumeMetadata::parse(medslice::read_text_file(metadata_path));
        LOGI << "Loaded metadata from " << metadata_path;
        LOGI << "  X-dim = " << metadata.xdim();
        LOGI << "  Y-dim = " << metadata.ydim();
        LOGI << "  Z-dim = " << metadata.zdim();

        const std::vector<uint8_t> data = medslice::read_binary_file(data_path);
        LOGI << "Read " << data.size() << " bytes of data from " << data_path;

        const auto volume = medslice::Volume::open(metadata, data);

        struct Request {
            medslice::Axis axis;
            const char* out_key;
            const char* index_key;
        };
        const std::array<Request, 3> requests = {{
            {medslice::Axis::X, "xframe", "x-index"},
            {medslice::Axis::Y, "yframe", "y-index"},
            {medslice::Axis::Z, "zframe", "z-index"},
        }};

        for (const auto& r : requests) {
            if (!cli.has(r.out_key)) continue;
            const std::string out = cli.get(r.out_key);
            const size_t index = cli.get_size(r.index_key, volume.dim(r.axis) / 2);

            const auto frame = volume.frame(r.axis, index);
            LOGD << medslice::axis_name(r.axis) << "-frame " << index << ": "
                 << frame.width() << "x" << frame.height();
            save_frame(frame, format, out);
            LOGI << "Saved " << medslice::axis_name(r.axis) << " frame to " << out;
        }
        return 0;
    } catch (const std::exception& e) {
        LOGE << e.what();
        return 2;
    }
}
