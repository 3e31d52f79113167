#include "tts/ws_tts_client.h"
#include "core/base64.h"
#include "errors.h"
#include "logger.h"
#include "net/http_client.h"
#include "net/websocket_client.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace parley {
namespace tts {

namespace {

std::string fetch_first_voice(const WsTtsConfig& config) {
    http::Request request;
    request.url = config.api_base + "/voices?limit=1";
    request.headers = {
        "X-API-Key: " + config.api_key,
        "Cartesia-Version: " + config.version
    };
    request.timeout_ms = 10000;

    auto result = http::perform(request);
    if (result.failed()) {
        throw ConnectionError("voice lookup failed: " + result.error);
    }
    if (!result.value->ok()) {
        throw ConfigurationError("voice lookup returned HTTP " + std::to_string(result.value->status));
    }

    json body;
    try {
        body = json::parse(result.value->body);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("voice lookup returned invalid JSON: ") + e.what());
    }

    const json* voices = &body;
    if (body.is_object() && body.contains("data")) {
        voices = &body["data"];
    }
    if (voices->is_array() && !voices->empty() && (*voices)[0].contains("id")) {
        return (*voices)[0]["id"].get<std::string>();
    }
    throw ConfigurationError("no voice configured and the service listed none");
}

} // anonymous namespace

class WsTtsClient::Impl {
public:
    explicit Impl(const WsTtsConfig& config) : config_(config) {}

    ~Impl() { close(); }

    ConnectionState state() const { return state_.load(); }

    std::string resolve_voice() const {
        if (!config_.voice_id.empty()) return config_.voice_id;
        if (!config_.default_voice_id.empty()) return config_.default_voice_id;
        return WsTtsClient::voice_cache().get_or_load(config_.api_base, [this]() {
            std::string voice = fetch_first_voice(config_);
            LOG_TTS("Using first listed voice: " + voice);
            return voice;
        });
    }

    void connect() {
        if (config_.api_key.empty()) {
            throw ConfigurationError("tts.api_key is not set");
        }
        state_ = ConnectionState::Connecting;
        closing_ = true;

        // Retire a dead connection before opening the next one
        std::shared_ptr<WebSocketClient> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = std::move(client_);
        }
        if (previous) {
            previous->close();
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        closing_ = false;

        try {
            if (voice_.empty()) {
                voice_ = resolve_voice();
            }

            WebSocketEndpoint endpoint;
            endpoint.host = config_.host;
            endpoint.port = config_.port;
            endpoint.path = config_.path + "?cartesia_version=" + config_.version;
            endpoint.headers = {
                {"X-API-Key", config_.api_key},
                {"Cartesia-Version", config_.version}
            };

            auto client = std::make_shared<WebSocketClient>();
            client->connect(endpoint);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                client_ = client;
            }
            state_ = ConnectionState::Open;
            reader_ = std::thread(&Impl::reader_loop, this, client);
            LOG_TTS("Connected (voice=" + voice_ + ", model=" + config_.model + ")");
        } catch (const std::exception&) {
            state_ = ConnectionState::Failed;
            throw;
        }
    }

    void speak(const std::string& text, const AudioCallback& on_audio) {
        std::shared_ptr<WebSocketClient> client;
        std::string context_id = "parley-" + std::to_string(++context_counter_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client = client_;
            current_context_ = context_id;
            chunks_.clear();
            context_done_ = false;
            context_cancelled_ = false;
            context_error_.clear();
        }
        if (!client || state_ != ConnectionState::Open) {
            throw ConnectionError("synthesizer is not connected");
        }

        json request = {
            {"model_id", config_.model},
            {"transcript", text},
            {"voice", {{"mode", "id"}, {"id", voice_}}},
            {"output_format", {
                {"container", "raw"},
                {"encoding", "pcm_s16le"},
                {"sample_rate", config_.sample_rate}
            }},
            {"language", config_.language},
            {"context_id", context_id},
            {"continue", false}
        };

        try {
            client->send_text(request.dump());
        } catch (const ConnectionError&) {
            state_ = ConnectionState::Failed;
            throw;
        }

        while (true) {
            std::deque<ByteBuffer> ready;
            bool done = false;
            std::string error;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] {
                    return !chunks_.empty() || context_done_ || context_cancelled_ ||
                           state_ != ConnectionState::Open;
                });
                if (context_cancelled_) {
                    return;
                }
                ready.swap(chunks_);
                done = context_done_;
                error = context_error_;
            }

            for (auto& bytes : ready) {
                AudioData chunk;
                chunk.num_samples = bytes.size() / audio::BYTES_PER_SAMPLE;
                chunk.bytes = std::move(bytes);
                chunk.sample_rate = config_.sample_rate;
                chunk.channels = 1;
                on_audio(chunk);
            }

            if (!error.empty()) {
                throw UpstreamServiceError("synthesis failed: " + error);
            }
            if (done) {
                return;
            }
            if (state_ != ConnectionState::Open) {
                throw ConnectionError("synthesizer connection dropped mid-utterance");
            }
        }
    }

    void cancel() {
        std::shared_ptr<WebSocketClient> client;
        std::string context_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (current_context_.empty() || context_done_) {
                return;
            }
            context_cancelled_ = true;
            context_id = current_context_;
            current_context_.clear();
            client = client_;
        }
        cv_.notify_all();

        if (client && state_ == ConnectionState::Open) {
            json request = {{"context_id", context_id}, {"cancel", true}};
            try {
                client->send_text(request.dump());
            } catch (const ConnectionError& e) {
                LOG_DEBUG(std::string("TTS cancel not delivered: ") + e.what());
            }
        }
    }

    void close() {
        closing_ = true;
        std::shared_ptr<WebSocketClient> client;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client = client_;
        }
        if (client) {
            client->close();
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        state_ = ConnectionState::Idle;
        cv_.notify_all();
    }

    int sample_rate() const { return config_.sample_rate; }

private:
    void reader_loop(std::shared_ptr<WebSocketClient> client) {
        while (auto raw = client->read()) {
            auto message = decode_tts_message(*raw);
            if (!message) continue;

            std::lock_guard<std::mutex> lock(mutex_);
            // Late chunks of a cancelled or finished context are dropped
            if (message->context_id != current_context_) {
                continue;
            }
            if (message->type == "chunk") {
                chunks_.push_back(std::move(message->audio));
            } else if (message->type == "error") {
                context_error_ = message->error;
            }
            if (message->done) {
                context_done_ = true;
            }
            cv_.notify_all();
        }

        if (!closing_) {
            LOG_TTS("Connection closed by service");
            state_ = ConnectionState::Failed;
        }
        cv_.notify_all();
    }

    WsTtsConfig config_;
    std::string voice_;
    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    std::atomic<bool> closing_{false};
    std::atomic<uint64_t> context_counter_{0};

    std::shared_ptr<WebSocketClient> client_;
    std::thread reader_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::string current_context_;
    std::deque<ByteBuffer> chunks_;
    bool context_done_ = false;
    bool context_cancelled_ = false;
    std::string context_error_;
};

// =============================================================================
// Inbound decoding
// =============================================================================

std::optional<TtsMessage> decode_tts_message(const std::string& raw) {
    TtsMessage decoded;
    try {
        json message = json::parse(raw);
        if (!message.is_object()) {
            LOG_WARN("[TTS] Ignoring non-object message");
            return std::nullopt;
        }

        decoded.type = message.value("type", "");
        decoded.context_id = message.value("context_id", "");
        if (decoded.type == "chunk") {
            decoded.audio = base64::decode(message.value("data", ""));
        } else if (decoded.type == "done") {
            decoded.done = true;
        } else if (decoded.type == "error") {
            decoded.error = message.contains("error") ? message["error"].dump() : "unknown error";
        }
        if (message.value("done", false)) {
            decoded.done = true;
        }
    } catch (const json::exception& e) {
        LOG_WARN(std::string("[TTS] Ignoring malformed message: ") + e.what());
        return std::nullopt;
    }
    return decoded;
}

// =============================================================================
// WsTtsClient Public Interface
// =============================================================================

WsTtsClient::WsTtsClient(const WsTtsConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WsTtsClient::~WsTtsClient() = default;

ConnectionState WsTtsClient::connection_state() const {
    return pimpl_->state();
}

void WsTtsClient::connect() {
    pimpl_->connect();
}

void WsTtsClient::speak(const std::string& text, const AudioCallback& on_audio) {
    pimpl_->speak(text, on_audio);
}

void WsTtsClient::cancel() {
    pimpl_->cancel();
}

void WsTtsClient::close() {
    pimpl_->close();
}

int WsTtsClient::sample_rate() const {
    return pimpl_->sample_rate();
}

std::string WsTtsClient::resolve_voice() const {
    return pimpl_->resolve_voice();
}

ProcessCache<std::string, std::string>& WsTtsClient::voice_cache() {
    static ProcessCache<std::string, std::string> instance;
    return instance;
}

} // namespace tts
} // namespace parley
