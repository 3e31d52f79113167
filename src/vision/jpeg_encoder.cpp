/**
 * @file jpeg_encoder.cpp
 * @brief libjpeg compression of RGB/RGBA/gray snapshots
 */

#include "vision/jpeg_encoder.h"
#include "core/base64.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>

namespace parley {

namespace {

struct ErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

/// Nearest-neighbour resample to out_w x out_h, converting to RGB or gray
ByteBuffer prepare_pixels(const VisionSnapshot& s, int out_w, int out_h, int out_components) {
    const int in_bpp = bytes_per_pixel(s.format);
    ByteBuffer out(static_cast<size_t>(out_w) * static_cast<size_t>(out_h) * static_cast<size_t>(out_components));

    for (int y = 0; y < out_h; ++y) {
        int sy = std::min(s.height - 1, static_cast<int>((static_cast<int64_t>(y) * s.height) / out_h));
        for (int x = 0; x < out_w; ++x) {
            int sx = std::min(s.width - 1, static_cast<int>((static_cast<int64_t>(x) * s.width) / out_w));
            const uint8_t* src = s.image.data() +
                (static_cast<size_t>(sy) * static_cast<size_t>(s.width) + static_cast<size_t>(sx)) * static_cast<size_t>(in_bpp);
            uint8_t* dst = out.data() +
                (static_cast<size_t>(y) * static_cast<size_t>(out_w) + static_cast<size_t>(x)) * static_cast<size_t>(out_components);
            if (out_components == 1) {
                dst[0] = src[0];
            } else {
                // RGBA drops alpha
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
        }
    }
    return out;
}

/// Compressed bytes written by jpeg_mem_dest; freed with the owner
struct JpegOutput {
    unsigned char* data = nullptr;
    unsigned long size = 0;

    JpegOutput() = default;
    JpegOutput(const JpegOutput&) = delete;
    JpegOutput& operator=(const JpegOutput&) = delete;
    ~JpegOutput() { std::free(data); }
};

/// The destination lives in the caller's frame, outside the setjmp scope
void compress(const ByteBuffer& pixels, int width, int height, bool gray, int quality, JpegOutput& output) {
    jpeg_compress_struct cinfo;
    ErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = error_exit;

    if (setjmp(err.jump)) {
        jpeg_destroy_compress(&cinfo);
        throw MediaFormatError(std::string("JPEG encode failed: ") + err.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &output.data, &output.size);

    const int components = gray ? 1 : 3;
    cinfo.image_width = static_cast<JDIMENSION>(width);
    cinfo.image_height = static_cast<JDIMENSION>(height);
    cinfo.input_components = components;
    cinfo.in_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&cinfo, TRUE);
    const size_t stride = static_cast<size_t>(width) * static_cast<size_t>(components);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(pixels.data() + static_cast<size_t>(cinfo.next_scanline) * stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
}

} // anonymous namespace

JpegEncoder::JpegEncoder(int quality, int max_dim)
    : quality_(std::clamp(quality, constants::vision::MIN_JPEG_QUALITY, constants::vision::MAX_JPEG_QUALITY))
    , max_dim_(std::clamp(max_dim, 0, constants::vision::MAX_DIM_LIMIT)) {}

void JpegEncoder::scaled_size(int width, int height, int max_dim, int& out_width, int& out_height) {
    out_width = width;
    out_height = height;
    int longest = std::max(width, height);
    if (max_dim <= 0 || longest <= max_dim) {
        return;
    }
    double scale = static_cast<double>(max_dim) / static_cast<double>(longest);
    out_width = std::max(1, static_cast<int>(std::lround(width * scale)));
    out_height = std::max(1, static_cast<int>(std::lround(height * scale)));
    out_width = std::min(out_width, max_dim);
    out_height = std::min(out_height, max_dim);
}

ByteBuffer JpegEncoder::encode(const VisionSnapshot& snapshot) const {
    if (snapshot.width <= 0 || snapshot.height <= 0) {
        throw MediaFormatError("snapshot has no dimensions");
    }
    size_t expected = static_cast<size_t>(snapshot.width) * static_cast<size_t>(snapshot.height) *
                      static_cast<size_t>(bytes_per_pixel(snapshot.format));
    if (snapshot.image.size() < expected) {
        throw MediaFormatError("snapshot holds " + std::to_string(snapshot.image.size()) +
                               " bytes, expected " + std::to_string(expected));
    }

    int out_w = 0;
    int out_h = 0;
    scaled_size(snapshot.width, snapshot.height, max_dim_, out_w, out_h);

    const bool gray = snapshot.format == PixelFormat::Gray8;
    const int components = gray ? 1 : 3;
    ByteBuffer pixels = prepare_pixels(snapshot, out_w, out_h, components);

    JpegOutput output;
    compress(pixels, out_w, out_h, gray, quality_, output);
    ByteBuffer result(output.data, output.data + output.size);

    LOG_VISION("Encoded snapshot " + std::to_string(out_w) + "x" + std::to_string(out_h) +
               " -> " + std::to_string(result.size()) + " bytes");
    return result;
}

std::string JpegEncoder::encode_data_url(const VisionSnapshot& snapshot) const {
    return "data:image/jpeg;base64," + base64::encode(encode(snapshot));
}

} // namespace parley
