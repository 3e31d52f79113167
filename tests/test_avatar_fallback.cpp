/**
 * Avatar fallback tests.
 * Asserts:
 * - Active avatars consume speech; a failed send degrades and the frame in
 *   flight is handed back for direct output.
 * - A closed connection, a dead sender task or an ended receive stream each degrade.
 * - Simultaneous triggers collapse into one degrade with one teardown.
 * - Once Degraded, nothing returns the controller to Active.
 * - Text mode chunks tokens at sentence boundaries; audio mode ignores text.
 * - Avatar audio re-enters the pipeline as mono at the output rate.
 * - In a running pipeline, audio reaches the output directly after a degrade.
 * - Inbound messages that are not objects or carry mistyped fields are
 *   skipped instead of escaping the reader thread.
 *
 * Run from build dir: ./test_avatar_fallback
 */

#include "avatar/avatar_fallback_controller.h"
#include "avatar/ws_avatar_service.h"
#include "core/base64.h"
#include "audio/format_converter.h"
#include "errors.h"
#include "pipeline/pipeline_executor.h"
#include "stages/avatar_stage.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace parley;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

class FakeAvatar : public AvatarService {
public:
    void start() override {
        if (fail_start) throw UpstreamServiceError("session refused");
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = true;
        ++starts;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        ++stops;
        cv_.notify_all();
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    bool sender_alive() const override { return sender_alive_flag.load(); }

    void send_text(const std::string& text) override {
        check_send();
        std::lock_guard<std::mutex> lock(mutex_);
        texts.push_back(text);
    }

    void send_audio(const AudioData&) override {
        check_send();
        ++audio_sent;
    }

    void send_end_of_speech() override {
        check_send();
        ++end_of_speech;
    }

    void send_image(const ImageData&) override {
        check_send();
        ++images_sent;
    }

    void interrupt() override { ++interrupts; }

    std::optional<AvatarAudioChunk> read_audio() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !audio_.empty() || !connected_ || audio_ended_; });
        if (!audio_.empty()) {
            AvatarAudioChunk chunk = std::move(audio_.front());
            audio_.pop_front();
            return chunk;
        }
        return std::nullopt;
    }

    std::optional<AvatarVideoFrame> read_video() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !video_.empty() || !connected_; });
        if (!video_.empty()) {
            AvatarVideoFrame frame = std::move(video_.front());
            video_.pop_front();
            return frame;
        }
        return std::nullopt;
    }

    std::string name() const override { return "fake-avatar"; }

    void push_audio(AvatarAudioChunk chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        audio_.push_back(std::move(chunk));
        cv_.notify_all();
    }

    void push_video(AvatarVideoFrame frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        video_.push_back(std::move(frame));
        cv_.notify_all();
    }

    void end_audio_stream() {
        std::lock_guard<std::mutex> lock(mutex_);
        audio_ended_ = true;
        cv_.notify_all();
    }

    std::vector<std::string> sent_texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts;
    }

    std::atomic<bool> fail_start{false};
    std::atomic<bool> fail_sends{false};
    std::atomic<bool> sender_alive_flag{true};
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> audio_sent{0};
    std::atomic<int> end_of_speech{0};
    std::atomic<int> images_sent{0};
    std::atomic<int> interrupts{0};

private:
    void check_send() {
        if (fail_sends) throw UpstreamServiceError("send loop closed");
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool connected_ = false;
    bool audio_ended_ = false;
    std::deque<AvatarAudioChunk> audio_;
    std::deque<AvatarVideoFrame> video_;
    std::vector<std::string> texts;
};

/// Thread-safe frame collector for sinks and observers
class Collected {
public:
    void add(const Frame& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(frame);
        cv_.notify_all();
    }

    bool wait_for(const std::function<bool(const std::vector<Frame>&)>& pred,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return pred(frames_); });
    }

    std::vector<Frame> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Frame> frames_;
};

size_t count_audio(const std::vector<Frame>& frames) {
    size_t n = 0;
    for (const auto& f : frames) {
        if (f.is_audio()) ++n;
    }
    return n;
}

bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

AudioData speech(size_t samples = 320) {
    Frame f = Frame::audio(PcmBuffer(samples, 100), 16000);
    return f.as_audio();
}

AvatarOptions audio_options() {
    AvatarOptions options;
    options.mode = AvatarMode::Audio;
    options.output_sample_rate = 16000;
    options.video_fps = 1;
    return options;
}

} // namespace

int main() {
    // --- send failure degrades; the frame in flight is handed back ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        Collected sink;
        ASSERT(controller.start([&](Frame f) { sink.add(f); return true; }));
        ASSERT(controller.active());

        ASSERT(controller.handle_audio(speech()));
        ASSERT(service->audio_sent == 1);

        service->fail_sends = true;
        ASSERT(!controller.handle_audio(speech()));
        ASSERT(controller.state() == AvatarState::Degraded);
        ASSERT(wait_until([&] { return service->stops.load() == 1; }));

        // No way back
        service->fail_sends = false;
        ASSERT(!controller.handle_audio(speech()));
        ASSERT(!controller.handle_text("hi."));
        ASSERT(!controller.handle_participant_image(ImageData{}));
        controller.end_of_turn();
        controller.interrupt();
        ASSERT(!controller.degrade("again"));
        ASSERT(controller.state() == AvatarState::Degraded);
        ASSERT(service->audio_sent == 1);
        ASSERT(service->interrupts == 0);

        controller.shutdown();
        ASSERT(controller.state() == AvatarState::Terminal);
        ASSERT(!controller.degrade("after shutdown"));
        ASSERT(controller.state() == AvatarState::Terminal);
    }

    // --- connection state and sender health ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));
        service->sender_alive_flag = false;
        ASSERT(!controller.handle_audio(speech()));
        ASSERT(controller.state() == AvatarState::Degraded);
        ASSERT(service->audio_sent == 0);
        controller.shutdown();
    }
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));
        service->stop();  // connection dropped underneath us
        ASSERT(!controller.handle_audio(speech()));
        ASSERT(controller.state() == AvatarState::Degraded);
        controller.shutdown();
    }

    // --- receive stream ending early degrades ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));
        service->end_audio_stream();
        ASSERT(wait_until([&] { return controller.state() == AvatarState::Degraded; }));
        controller.shutdown();
    }

    // --- start failure starts degraded, and stays there ---
    {
        auto service = std::make_shared<FakeAvatar>();
        service->fail_start = true;
        AvatarFallbackController controller(service, audio_options());
        ASSERT(!controller.start([](Frame) { return true; }));
        ASSERT(controller.state() == AvatarState::Degraded);

        service->fail_start = false;
        ASSERT(!controller.start([](Frame) { return true; }));
        ASSERT(controller.state() == AvatarState::Degraded);
        controller.shutdown();
    }

    // --- simultaneous triggers collapse ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));

        std::atomic<int> performed{0};
        std::vector<std::thread> triggers;
        for (int i = 0; i < 8; ++i) {
            triggers.emplace_back([&] {
                if (controller.degrade("trigger")) performed++;
            });
        }
        for (auto& t : triggers) t.join();

        ASSERT(performed == 1);
        ASSERT(controller.degrade_triggers() >= 8);
        controller.shutdown();
        ASSERT(service->stops == 1);
    }

    // --- text mode ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarOptions options = audio_options();
        options.mode = AvatarMode::Text;
        AvatarFallbackController controller(service, options);
        ASSERT(controller.start([](Frame) { return true; }));

        ASSERT(controller.handle_text("Hello"));
        ASSERT(service->sent_texts().empty());
        ASSERT(controller.handle_text(" world."));
        ASSERT(controller.handle_text(" How are"));
        auto texts = service->sent_texts();
        ASSERT(texts.size() == 1 && texts[0] == "Hello world.");

        controller.end_of_turn();
        texts = service->sent_texts();
        ASSERT(texts.size() == 2 && texts[1] == " How are");

        // Barge-in drops pending text
        ASSERT(controller.handle_text("Stale words"));
        controller.interrupt();
        ASSERT(service->interrupts == 1);
        controller.end_of_turn();
        ASSERT(service->sent_texts().size() == 2);
        ASSERT(service->end_of_speech == 0);
        controller.shutdown();
    }
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));
        ASSERT(!controller.handle_text("audio mode never takes text."));
        controller.end_of_turn();
        ASSERT(service->end_of_speech == 1);
        ASSERT(controller.active());
        controller.shutdown();
    }

    // --- participant video is throttled toward the avatar ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        ASSERT(controller.start([](Frame) { return true; }));
        ImageData image;
        image.width = 2;
        image.height = 2;
        image.bytes.assign(12, 0);
        TimePoint t0 = Clock::now();
        ASSERT(controller.handle_participant_image(image, t0));
        ASSERT(controller.handle_participant_image(image, t0 + std::chrono::milliseconds(200)));
        ASSERT(controller.handle_participant_image(image, t0 + std::chrono::milliseconds(1200)));
        ASSERT(service->images_sent == 2);
        controller.shutdown();
    }

    // --- avatar media is bridged back ---
    {
        auto service = std::make_shared<FakeAvatar>();
        AvatarFallbackController controller(service, audio_options());
        Collected sink;
        ASSERT(controller.start([&](Frame f) { sink.add(f); return true; }));

        AvatarAudioChunk chunk;
        chunk.sample_rate = 24000;
        chunk.channels = 2;
        chunk.pcm = convert::samples_to_bytes(PcmBuffer(2 * 480, 1000));
        service->push_audio(chunk);

        AvatarVideoFrame video;
        video.width = 2;
        video.height = 1;
        video.pixels.assign(6, 255);
        service->push_video(video);

        ASSERT(sink.wait_for([](const std::vector<Frame>& frames) { return frames.size() >= 2; }));
        bool saw_audio = false;
        bool saw_image = false;
        for (const auto& f : sink.frames()) {
            if (f.is_audio()) {
                saw_audio = true;
                ASSERT(f.as_audio().sample_rate == 16000);
                ASSERT(f.as_audio().channels == 1);
                ASSERT(f.as_audio().num_samples == 320);
            } else if (f.is_image()) {
                saw_image = true;
                ASSERT(f.as_image().width == 2);
            }
        }
        ASSERT(saw_audio);
        ASSERT(saw_image);
        controller.shutdown();
    }

    // --- AvatarStage inside a running pipeline ---
    {
        auto service = std::make_shared<FakeAvatar>();
        auto controller = std::make_shared<AvatarFallbackController>(service, audio_options());
        std::vector<std::shared_ptr<pipeline::Stage>> chain = {
            std::make_shared<stages::AvatarStage>(controller)
        };
        pipeline::ExecutorOptions options;
        options.idle_timeout = std::chrono::milliseconds(0);
        pipeline::PipelineExecutor executor(chain, options);

        Collected output;
        executor.set_frame_observer([&](const Frame& f) { output.add(f); });

        pipeline::RunStatus status;
        std::thread runner([&] { status = executor.run(); });

        ASSERT(output.wait_for([](const std::vector<Frame>& frames) {
            for (const auto& f : frames) {
                if (f.is_control(ControlKind::Start)) return true;
            }
            return false;
        }));
        ASSERT(wait_until([&] { return service->starts.load() == 1; }));

        // Active: speech goes to the avatar, text continues downstream
        executor.queue_frame(Frame::audio(PcmBuffer(320, 5), 16000));
        executor.queue_frame(Frame::text("Hello.", false));
        ASSERT(output.wait_for([](const std::vector<Frame>& frames) {
            for (const auto& f : frames) {
                if (f.is_text()) return true;
            }
            return false;
        }));
        ASSERT(service->audio_sent == 1);
        ASSERT(count_audio(output.frames()) == 0);

        // Avatar's own audio comes back out
        AvatarAudioChunk chunk;
        chunk.sample_rate = 16000;
        chunk.pcm = convert::samples_to_bytes(PcmBuffer(320, 7));
        service->push_audio(chunk);
        ASSERT(output.wait_for([](const std::vector<Frame>& frames) { return count_audio(frames) == 1; }));

        // Degraded: speech passes straight through
        service->fail_sends = true;
        executor.queue_frame(Frame::audio(PcmBuffer(320, 5), 16000));
        executor.queue_frame(Frame::audio(PcmBuffer(320, 6), 16000));
        ASSERT(output.wait_for([](const std::vector<Frame>& frames) { return count_audio(frames) == 3; }));
        ASSERT(controller->state() == AvatarState::Degraded);

        executor.stop();
        runner.join();
        ASSERT(status.kind == pipeline::RunStatus::Kind::Completed);
        ASSERT(controller->state() == AvatarState::Terminal);
    }

    // =========================================================================
    // Inbound message decoding
    // =========================================================================
    {
        std::string pcm = base64::encode(ByteBuffer{1, 0, 2, 0});
        auto audio = decode_avatar_message(
            "{\"type\":\"audio\",\"sample_rate\":24000,\"channels\":2,\"data\":\"" + pcm + "\"}");
        ASSERT(audio && audio->kind == AvatarInbound::Kind::Audio);
        if (audio) {
            ASSERT(audio->audio.pcm == ByteBuffer({1, 0, 2, 0}));
            ASSERT(audio->audio.sample_rate == 24000);
            ASSERT(audio->audio.channels == 2);
        }

        auto video = decode_avatar_message("{\"type\":\"video\",\"width\":2,\"height\":1,\"data\":\"\"}");
        ASSERT(video && video->kind == AvatarInbound::Kind::Video);
        ASSERT(video && video->video.width == 2 && video->video.height == 1);

        auto error = decode_avatar_message("{\"type\":\"error\",\"reason\":\"quota\"}");
        ASSERT(error && error->kind == AvatarInbound::Kind::Error);
        ASSERT(error && error->detail.find("quota") != std::string::npos);

        auto other = decode_avatar_message("{\"type\":\"pong\"}");
        ASSERT(other && other->kind == AvatarInbound::Kind::Other && other->type == "pong");

        ASSERT(!decode_avatar_message("[1]"));
        ASSERT(!decode_avatar_message("\"ping\""));
        ASSERT(!decode_avatar_message("{\"type\":5}"));
        ASSERT(!decode_avatar_message("{\"type\":\"audio\",\"data\":42}"));
        ASSERT(!decode_avatar_message("{\"type\":\"video\",\"width\":\"wide\"}"));
        ASSERT(!decode_avatar_message("not json"));

        // Decoding off the main thread never reaches std::terminate
        std::atomic<int> skipped{0};
        std::thread reader([&] {
            for (const char* raw : {"[1]", "\"ping\"", "{\"type\":5}"}) {
                if (!decode_avatar_message(raw)) skipped++;
            }
        });
        reader.join();
        ASSERT(skipped == 3);
    }

    ASSERT(parse_avatar_mode("TEXT") == AvatarMode::Text);
    ASSERT(!parse_avatar_mode("video").has_value());
    ASSERT(std::string(avatar_state_name(AvatarState::Degraded)) == "degraded");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All avatar fallback tests passed.\n";
    return 0;
}
