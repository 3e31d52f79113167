/**
 * Service adapter tests (no network).
 * Asserts:
 * - The SSE parser reassembles data lines split across reads, forwards
 *   content deltas in order, merges tool-call fragments and stops at [DONE].
 * - Chat requests pick the vision model only when an image is attached.
 * - The tool gateway reports failures as {"success": false} payloads.
 * - Call summaries serialize with truncated turns.
 * - Energy VAD reports speech start/end and drops too-short bursts.
 * - The recognizer refuses to start without a loadable model.
 * - Synthesis messages decode chunks, done markers and errors; messages
 *   that are not objects or carry mistyped fields are skipped.
 *
 * Run from build dir: ./test_services
 */

#include "core/base64.h"
#include "errors.h"
#include "llm/openai_llm_client.h"
#include "session/session_reporter.h"
#include "stt/whisper_recognizer.h"
#include "tools/tool_gateway.h"
#include "tts/ws_tts_client.h"
#include "vad/energy_vad.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace parley;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

std::string content_chunk(const std::string& text) {
    json chunk = {{"choices", json::array({{{"delta", {{"content", text}}}}})}};
    return "data: " + chunk.dump() + "\n\n";
}

void feed(llm::SseCompletionParser& parser, const std::string& data) {
    parser.feed(data.data(), data.size());
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    // =========================================================================
    // SSE completion parser
    // =========================================================================
    {
        std::vector<std::string> tokens;
        llm::SseCompletionParser parser([&](const std::string& t) { tokens.push_back(t); });

        std::string stream = ": keep-alive\n" + content_chunk("Hel") + content_chunk("lo") +
            "data: {\"choices\":[{\"delta\":{},\"finish_reason\":\"stop\"}]}\r\n\r\n" +
            "data: [DONE]\n\n";
        // Deliver in awkward 7-byte reads
        for (size_t i = 0; i < stream.size(); i += 7) {
            feed(parser, stream.substr(i, 7));
        }
        llm::Completion completion = parser.finish();
        ASSERT(tokens == std::vector<std::string>({"Hel", "lo"}));
        ASSERT(completion.content == "Hello");
        ASSERT(completion.finish_reason == "stop");
        ASSERT(!completion.has_tool_calls());
        ASSERT(parser.done());
        ASSERT(parser.stray().empty());
    }
    {
        llm::SseCompletionParser parser(nullptr);
        feed(parser, "data: {\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":0,\"id\":\"call_9\","
                     "\"function\":{\"name\":\"lookup_\",\"arguments\":\"{\\\"id\\\"\"}}]}}]}\n");
        feed(parser, "data: {\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":0,"
                     "\"function\":{\"name\":\"order\",\"arguments\":\":7}\"}}]}}]}\n");
        feed(parser, "data: {\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":1,\"id\":\"call_10\","
                     "\"function\":{\"name\":\"transfer_call\",\"arguments\":\"{}\"}}]},"
                     "\"finish_reason\":\"tool_calls\"}]}\n");
        llm::Completion completion = parser.finish();
        ASSERT(completion.tool_calls.size() == 2);
        if (completion.tool_calls.size() == 2) {
            ASSERT(completion.tool_calls[0].id == "call_9");
            ASSERT(completion.tool_calls[0].name == "lookup_order");
            ASSERT(completion.tool_calls[0].arguments == "{\"id\":7}");
            ASSERT(completion.tool_calls[1].name == "transfer_call");
        }
        ASSERT(completion.finish_reason == "tool_calls");
        ASSERT(!parser.done());

        json exported = json::parse(llm::tool_calls_to_json(completion.tool_calls));
        ASSERT(exported.is_array() && exported.size() == 2);
        ASSERT(exported[0]["type"] == "function");
        ASSERT(exported[0]["id"] == "call_9");
        ASSERT(exported[0]["function"]["arguments"] == "{\"id\":7}");
    }
    {
        // Garbage and error bodies never reach the token callback
        int calls = 0;
        llm::SseCompletionParser parser([&](const std::string&) { calls++; });
        feed(parser, "data: {not json}\n");
        feed(parser, "data: {\"error\":{\"message\":\"rate limited\"}}\n");
        feed(parser, "Bad Gateway\n");
        feed(parser, content_chunk("ok").substr(0, content_chunk("ok").size() - 2));  // unterminated
        llm::Completion completion = parser.finish();
        ASSERT(calls == 1);
        ASSERT(completion.content == "ok");
        ASSERT(contains(parser.stray(), "rate limited"));
        ASSERT(contains(parser.stray(), "Bad Gateway"));
    }

    // =========================================================================
    // Chat request shape
    // =========================================================================
    {
        llm::OpenAiConfig config;
        config.text_model = "text-m";
        config.vision_model = "vision-m";
        config.max_tokens = 300;
        llm::OpenAiLlmClient client(config);

        std::vector<memory::ContextMessage> messages = {
            memory::ContextMessage::system("Be brief."),
            memory::ContextMessage::user("hi")
        };
        ASSERT(client.select_model(messages) == "text-m");

        json request = json::parse(client.build_request(messages, ""));
        ASSERT(request["model"] == "text-m");
        ASSERT(request["stream"] == true);
        ASSERT(request["max_tokens"] == 300);
        ASSERT(request["messages"].size() == 2);
        ASSERT(!request.contains("tools"));

        memory::ContextMessage with_image = memory::ContextMessage::user("what is this");
        with_image.image_url = "data:image/jpeg;base64,AAAA";
        messages.push_back(with_image);
        ASSERT(client.select_model(messages) == "vision-m");

        request = json::parse(client.build_request(
            messages, "[{\"type\":\"function\",\"function\":{\"name\":\"transfer_call\"}}]"));
        ASSERT(request["model"] == "vision-m");
        ASSERT(request["tools"].size() == 1);
        ASSERT(request["tool_choice"] == "auto");
        ASSERT(request["messages"][2]["content"].is_array());

        request = json::parse(client.build_request(messages, "[]"));
        ASSERT(!request.contains("tools"));

        bool threw = false;
        try {
            client.build_request(messages, "[{broken");
        } catch (const ConfigurationError&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // =========================================================================
    // Tool gateway failures
    // =========================================================================
    {
        json failure = json::parse(HttpToolGateway::failure("timed out"));
        ASSERT(failure["success"] == false);
        ASSERT(failure["message"] == "timed out");

        HttpToolGateway unconfigured(ToolGatewayConfig{});
        json result = json::parse(unconfigured.execute({"call_1", "transfer_call", "{}"}));
        ASSERT(result["success"] == false);
        ASSERT(contains(result["message"].get<std::string>(), "not configured"));

        ToolGatewayConfig config;
        config.url = "https://tools.invalid/run";
        HttpToolGateway gateway(config);
        result = json::parse(gateway.execute({"call_2", "lookup_order", "{\"id\":"}));
        ASSERT(result["success"] == false);
        ASSERT(contains(result["message"].get<std::string>(), "lookup_order"));
    }

    // =========================================================================
    // Call summary
    // =========================================================================
    {
        CallSummary summary;
        summary.call_id = "call-7";
        summary.duration_s = 42.0;
        summary.result = "completed";
        summary.final_turns = {
            memory::ContextMessage::user("hello there"),
            memory::ContextMessage::assistant("hi")
        };

        LogSessionReporter reporter(5);
        json doc = json::parse(reporter.to_json(summary));
        ASSERT(doc["call_id"] == "call-7");
        ASSERT(doc["duration_s"] == 42.0);
        ASSERT(doc["transferred"] == false);
        ASSERT(doc["result"] == "completed");
        ASSERT(!doc.contains("detail"));
        ASSERT(doc["final_turns"].size() == 2);
        ASSERT(doc["final_turns"][0]["role"] == "user");
        ASSERT(doc["final_turns"][0]["content"] == "hello");
        ASSERT(doc["final_turns"][1]["content"] == "hi");

        summary.detail = "idle timeout";
        doc = json::parse(reporter.to_json(summary));
        ASSERT(doc["detail"] == "idle timeout");
        reporter.report(summary);
    }

    // =========================================================================
    // Energy VAD (20 ms frames at 16 kHz)
    // =========================================================================
    {
        vad::EnergyVADConfig config;
        config.threshold = 0.05f;
        config.adaptive_threshold = false;
        config.min_speech_ms = 100;
        config.end_silence_ms = 200;
        config.pre_speech_ms = 100;
        vad::EnergyVAD detector(config);

        const PcmBuffer quiet(320, 0);
        const PcmBuffer loud(320, 8000);

        for (int i = 0; i < 5; ++i) {
            ASSERT(detector.process(quiet) == vad::Event::None);
        }
        ASSERT(detector.process(loud) == vad::Event::None);  // debounce
        ASSERT(detector.process(loud) == vad::Event::SpeechStart);
        ASSERT(detector.is_speech());
        for (int i = 0; i < 8; ++i) {
            ASSERT(detector.process(loud) == vad::Event::None);
        }
        for (int i = 0; i < 9; ++i) {
            ASSERT(detector.process(quiet) == vad::Event::None);
        }
        ASSERT(detector.process(quiet) == vad::Event::SpeechEnd);
        ASSERT(!detector.is_speech());

        // Pre-speech window + 9 loud + 10 quiet frames
        PcmBuffer segment = detector.finalize_segment();
        ASSERT(segment.size() == 1600 + 320 + 8 * 320 + 10 * 320);
        ASSERT(detector.finalize_segment().empty());

        // A burst shorter than min_speech is discarded
        detector.process(loud);
        ASSERT(detector.process(loud) == vad::Event::SpeechStart);
        vad::Event last = vad::Event::None;
        for (int i = 0; i < 10; ++i) {
            last = detector.process(quiet);
        }
        ASSERT(last == vad::Event::None);
        ASSERT(!detector.is_speech());
        ASSERT(detector.get_stats().state == vad::State::Silence);
        ASSERT(std::string(vad::event_to_string(vad::Event::SpeechEnd)) == "SpeechEnd");
    }

    // =========================================================================
    // Recognizer start-up
    // =========================================================================
    {
        stt::WhisperConfig config;
        stt::WhisperRecognizer no_path(config);
        bool threw = false;
        try {
            no_path.start([](const stt::RecognitionEvent&) {});
        } catch (const ConfigurationError&) {
            threw = true;
        }
        ASSERT(threw);
        ASSERT(!no_path.is_ready());

        config.model_path = "/nonexistent/ggml-missing.bin";
        stt::WhisperRecognizer missing(config);
        threw = false;
        try {
            missing.start([](const stt::RecognitionEvent&) {});
        } catch (const ConfigurationError& e) {
            threw = contains(e.what(), "ggml-missing.bin");
        }
        ASSERT(threw);
        missing.stop();
    }

    // =========================================================================
    // Synthesis message decoding
    // =========================================================================
    {
        std::string pcm = base64::encode(ByteBuffer{4, 0, 5, 0});
        auto chunk = tts::decode_tts_message(
            "{\"type\":\"chunk\",\"context_id\":\"ctx-1\",\"data\":\"" + pcm + "\"}");
        ASSERT(chunk && chunk->type == "chunk");
        ASSERT(chunk && chunk->context_id == "ctx-1");
        ASSERT(chunk && chunk->audio == ByteBuffer({4, 0, 5, 0}));
        ASSERT(chunk && !chunk->done);

        auto done = tts::decode_tts_message("{\"type\":\"done\",\"context_id\":\"ctx-1\"}");
        ASSERT(done && done->done);
        auto last = tts::decode_tts_message("{\"type\":\"chunk\",\"context_id\":\"ctx-1\",\"data\":\"\",\"done\":true}");
        ASSERT(last && last->done);

        auto error = tts::decode_tts_message("{\"type\":\"error\",\"context_id\":\"ctx-1\",\"error\":\"bad voice\"}");
        ASSERT(error && contains(error->error, "bad voice"));

        ASSERT(!tts::decode_tts_message("[1]"));
        ASSERT(!tts::decode_tts_message("\"ping\""));
        ASSERT(!tts::decode_tts_message("{\"type\":5}"));
        ASSERT(!tts::decode_tts_message("{\"type\":\"chunk\",\"context_id\":7}"));
        ASSERT(!tts::decode_tts_message("{\"type\":\"done\",\"done\":\"yes\"}"));
        ASSERT(!tts::decode_tts_message("{\"type\":\"chunk\",\"data\":[1,2]}"));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All service tests passed.\n";
    return 0;
}
