/**
 * @file track_loader.cpp
 * @brief Background track fetch (https or file) with a process-lifetime cache
 */

#include "audio/track_loader.h"
#include "audio/format_converter.h"
#include "errors.h"
#include "logger.h"
#include "net/http_client.h"
#include "core/constants.h"
#include "utils.h"
#include <fstream>
#include <iterator>
#include <sstream>

namespace parley {

BackgroundTrackLoader::BackgroundTrackLoader(size_t max_bytes)
    : max_bytes_(max_bytes) {}

BackgroundTrackLoader::BackgroundTrackLoader(size_t max_bytes, Fetcher fetcher)
    : max_bytes_(max_bytes), fetcher_(std::move(fetcher)) {}

ProcessCache<std::pair<std::string, int>, BackgroundTrack>& BackgroundTrackLoader::cache() {
    static ProcessCache<std::pair<std::string, int>, BackgroundTrack> instance;
    return instance;
}

ByteBuffer BackgroundTrackLoader::fetch(const std::string& source) const {
    if (fetcher_) {
        return fetcher_(source);
    }

    std::string lower = utils::normalize_copy(source);
    if (utils::starts_with(lower, "http://")) {
        throw MediaFormatError("background audio must be served over https: " + source);
    }

    if (utils::starts_with(lower, "https://")) {
        http::Request request;
        request.url = source;
        request.max_bytes = max_bytes_;
        request.timeout_ms = constants::mixer::FETCH_TIMEOUT_MS;

        auto result = http::perform(request);
        if (result.failed()) {
            throw MediaFormatError("background audio download failed: " + result.error);
        }
        const http::Response& response = *result.value;
        if (!response.ok()) {
            throw MediaFormatError("background audio download failed: HTTP " +
                                   std::to_string(response.status));
        }
        return ByteBuffer(response.body.begin(), response.body.end());
    }

    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        throw MediaFormatError("failed to open background audio: " + source);
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (bytes.size() > max_bytes_) {
        throw MediaFormatError("background audio exceeds " + std::to_string(max_bytes_) + " bytes");
    }
    return bytes;
}

BackgroundTrack BackgroundTrackLoader::load(const std::string& source, int sample_rate) {
    return cache().get_or_load({source, sample_rate}, [&]() {
        ByteBuffer container = fetch(source);
        if (container.empty()) {
            throw MediaFormatError("background audio contained no audio: " + source);
        }

        ByteBuffer pcm = convert::decode_to_mono16(container, sample_rate);
        if (pcm.empty()) {
            throw MediaFormatError("background audio contained no audio: " + source);
        }

        BackgroundTrack track;
        track.pcm = std::make_shared<const ByteBuffer>(std::move(pcm));
        track.sample_rate = sample_rate;
        track.source = source;

        std::ostringstream oss;
        oss << "Loaded background track " << source << ": " << track.size()
            << " bytes @" << sample_rate << "Hz";
        LOG_INFO(oss.str());
        return track;
    });
}

} // namespace parley
