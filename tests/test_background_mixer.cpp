/**
 * Background mixer tests.
 * Asserts:
 * - Cyclic reads wrap to 0 ("ABCD" read for 10 bytes gives "ABCDABCDAB").
 * - Mixed frames keep their length; the cursor advances by N mod L.
 * - Gain 0 leaves speech untouched; clipping saturates at the int16 limits.
 * - A rate mismatch passes the frame through and disables the mixer.
 * - The track loader populates the process cache once per (source, rate).
 *
 * Run from build dir: ./test_background_mixer
 */

#include "audio/background_mixer.h"
#include "audio/format_converter.h"
#include "audio/track_loader.h"
#include "errors.h"
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace parley;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

BackgroundTrack make_track(const PcmBuffer& samples, int rate) {
    BackgroundTrack track;
    track.pcm = std::make_shared<const ByteBuffer>(convert::samples_to_bytes(samples));
    track.sample_rate = rate;
    track.source = "test";
    return track;
}

ByteBuffer make_wav(const PcmBuffer& samples, int rate) {
    ByteBuffer pcm = convert::samples_to_bytes(samples);
    ByteBuffer b = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                    'f', 'm', 't', ' ', 16, 0, 0, 0, 1, 0, 1, 0};
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((rate >> (8 * i)) & 0xFF));
    int byte_rate = rate * 2;
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((byte_rate >> (8 * i)) & 0xFF));
    b.insert(b.end(), {2, 0, 16, 0, 'd', 'a', 't', 'a'});
    uint32_t size = static_cast<uint32_t>(pcm.size());
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((size >> (8 * i)) & 0xFF));
    b.insert(b.end(), pcm.begin(), pcm.end());
    return b;
}

} // namespace

int main() {
    // --- read_cyclic ---
    {
        ByteBuffer track = {'A', 'B', 'C', 'D'};
        ByteBuffer out;
        size_t cursor = 0;
        read_cyclic(track, cursor, 10, out);
        ASSERT(std::string(out.begin(), out.end()) == "ABCDABCDAB");
        ASSERT(cursor == 2);

        read_cyclic(track, cursor, 3, out);
        ASSERT(std::string(out.begin(), out.end()) == "CDA");
        ASSERT(cursor == 1);
    }
    {
        ByteBuffer out;
        size_t cursor = 0;
        read_cyclic(ByteBuffer(), cursor, 4, out);
        ASSERT(out.size() == 4);
        ASSERT(out[0] == 0 && out[3] == 0);
    }

    // --- length and cursor across frame sizes ---
    {
        BackgroundTrack track = make_track(PcmBuffer(7, 10), 16000);  // L = 14 bytes
        const size_t L = track.size();
        for (size_t samples : {1u, 3u, 7u, 10u, 160u}) {
            BackgroundMixer mixer(track, 0.5f);
            Frame frame = Frame::audio(PcmBuffer(samples, 100), 16000);
            size_t n = frame.as_audio().bytes.size();
            ASSERT(mixer.mix(frame.mutable_audio()));
            ASSERT(frame.as_audio().bytes.size() == n);
            ASSERT(frame.as_audio().num_samples == samples);
            ASSERT(mixer.cursor() == n % L);

            PcmBuffer mixed = convert::bytes_to_samples(frame.as_audio().bytes);
            ASSERT(mixed.front() == 105);
        }
    }

    // --- gain 0 is a no-op ---
    {
        BackgroundMixer mixer(make_track(PcmBuffer(4, 1000), 16000), 0.0f);
        ASSERT(!mixer.enabled());
        Frame frame = Frame::audio(PcmBuffer{1, -2, 3}, 16000);
        ByteBuffer before = frame.as_audio().bytes;
        ASSERT(!mixer.mix(frame.mutable_audio()));
        ASSERT(frame.as_audio().bytes == before);
        ASSERT(mixer.cursor() == 0);

        ByteBuffer speech = before;
        mix_pcm16(speech, convert::samples_to_bytes(PcmBuffer{9000, 9000, 9000}), 0.0f);
        ASSERT(speech == before);
    }

    // --- saturation ---
    {
        ByteBuffer speech = convert::samples_to_bytes(PcmBuffer{32000, -32000, 10});
        ByteBuffer background = convert::samples_to_bytes(PcmBuffer{20000, -20000, 20});
        mix_pcm16(speech, background, 1.0f);
        PcmBuffer out = convert::bytes_to_samples(speech);
        ASSERT(out[0] == 32767);
        ASSERT(out[1] == -32768);
        ASSERT(out[2] == 30);
    }

    // --- mismatch passes the frame through and disables mixing ---
    {
        BackgroundMixer mixer(make_track(PcmBuffer(8, 1000), 16000), 1.0f);
        Frame wrong_rate = Frame::audio(PcmBuffer{5, 5}, 24000);
        ByteBuffer before = wrong_rate.as_audio().bytes;
        ASSERT(!mixer.mix(wrong_rate.mutable_audio()));
        ASSERT(wrong_rate.as_audio().bytes == before);
        ASSERT(!mixer.enabled());

        Frame right_rate = Frame::audio(PcmBuffer{5, 5}, 16000);
        ASSERT(!mixer.mix(right_rate.mutable_audio()));
    }

    // --- track loader cache ---
    {
        BackgroundTrackLoader::cache().clear();
        int fetches = 0;
        BackgroundTrackLoader loader(1 << 20, [&](const std::string&) {
            ++fetches;
            return make_wav(PcmBuffer(1600, 300), 16000);
        });

        BackgroundTrack first = loader.load("ambience.wav", 16000);
        BackgroundTrack second = loader.load("ambience.wav", 16000);
        ASSERT(fetches == 1);
        ASSERT(first.pcm == second.pcm);
        ASSERT(first.size() == 3200);

        BackgroundTrack resampled = loader.load("ambience.wav", 8000);
        ASSERT(fetches == 2);
        ASSERT(resampled.size() == 1600);
        ASSERT(BackgroundTrackLoader::cache().size() == 2);

        // Concurrent first use still loads once
        BackgroundTrackLoader::cache().clear();
        fetches = 0;
        std::vector<std::thread> threads;
        std::vector<BackgroundTrack> results(4);
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i] { results[i] = loader.load("ambience.wav", 16000); });
        }
        for (auto& t : threads) t.join();
        ASSERT(fetches == 1);
        for (const auto& r : results) ASSERT(r.pcm == results[0].pcm);
    }
    {
        BackgroundTrackLoader::cache().clear();
        int fetches = 0;
        BackgroundTrackLoader broken(1 << 20, [&](const std::string&) {
            ++fetches;
            return ByteBuffer{'j', 'u', 'n', 'k'};
        });
        bool threw = false;
        try {
            broken.load("broken.wav", 16000);
        } catch (const MediaFormatError&) {
            threw = true;
        }
        ASSERT(threw);
        ASSERT(!BackgroundTrackLoader::cache().contains({"broken.wav", 16000}));
    }
    {
        BackgroundTrackLoader plain(1 << 20);
        bool threw = false;
        try {
            plain.load("http://example.invalid/a.wav", 16000);
        } catch (const MediaFormatError&) {
            threw = true;
        }
        ASSERT(threw);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All background mixer tests passed.\n";
    return 0;
}
