#pragma once

/**
 * @file jpeg_encoder.h
 * @brief Downscale and JPEG-encode snapshots for inlining into model turns
 */

#include "vision/vision_snapshot.h"
#include "core/constants.h"
#include <string>

namespace parley {

class JpegEncoder {
public:
    /**
     * @param quality JPEG quality, clamped to 30..95
     * @param max_dim Longest side after scaling (0 = keep native size), clamped to 2048
     */
    explicit JpegEncoder(int quality = constants::vision::DEFAULT_JPEG_QUALITY,
                         int max_dim = constants::vision::DEFAULT_MAX_DIM);

    /**
     * @brief Encode a snapshot to JPEG bytes
     * @throws MediaFormatError if the pixel data is inconsistent or libjpeg fails
     */
    ByteBuffer encode(const VisionSnapshot& snapshot) const;

    /// encode() wrapped as "data:image/jpeg;base64,..."
    std::string encode_data_url(const VisionSnapshot& snapshot) const;

    /// Output size for a width x height source, preserving aspect ratio
    static void scaled_size(int width, int height, int max_dim, int& out_width, int& out_height);

    int quality() const { return quality_; }
    int max_dim() const { return max_dim_; }

private:
    int quality_;
    int max_dim_;
};

} // namespace parley
