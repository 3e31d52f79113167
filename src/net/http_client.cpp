#include "net/http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>

namespace parley {
namespace http {

namespace {

std::once_flag g_curl_init;

void ensure_global_init() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CollectState {
    std::string* body;
    size_t max_bytes;
    bool too_large = false;
};

size_t collect_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<CollectState*>(userp);
    size_t total = size * nmemb;
    if (state->max_bytes > 0 && state->body->size() + total > state->max_bytes) {
        state->too_large = true;
        return 0;  // abort transfer
    }
    state->body->append(static_cast<char*>(contents), total);
    return total;
}

struct StreamState {
    const ChunkCallback* on_chunk;
    bool aborted = false;
};

size_t stream_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<StreamState*>(userp);
    size_t total = size * nmemb;
    if (!(*state->on_chunk)(static_cast<const char*>(contents), total)) {
        state->aborted = true;
        return 0;
    }
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancelled = static_cast<const std::function<bool()>*>(clientp);
    return (*cancelled)() ? 1 : 0;
}

/// Owns an easy handle plus its header list for the duration of one request
class EasyHandle {
public:
    explicit EasyHandle(const Request& request) {
        ensure_global_init();
        curl_ = curl_easy_init();
        if (!curl_) return;

        for (const auto& h : request.headers) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }

        curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, request.timeout_ms);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, request.connect_timeout_ms);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        if (request.cancelled) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &request.cancelled);
        }

        if (request.method == "POST") {
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        } else if (request.method != "GET") {
            curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (!request.body.empty()) {
                curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
            }
        }
    }

    ~EasyHandle() {
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const { return curl_; }

    long status() const {
        long code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

private:
    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
};

} // anonymous namespace

Result<Response> perform(const Request& request) {
    EasyHandle handle(request);
    if (!handle.get()) {
        return Result<Response>::failure("Failed to initialize CURL");
    }

    Response response;
    CollectState state{&response.body, request.max_bytes};
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, collect_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &state);

    CURLcode res = curl_easy_perform(handle.get());
    if (state.too_large) {
        return Result<Response>::failure("response exceeds " + std::to_string(request.max_bytes) + " bytes");
    }
    if (res != CURLE_OK) {
        return Result<Response>::failure(curl_easy_strerror(res));
    }

    response.status = handle.status();
    return Result<Response>::success(std::move(response));
}

Result<long> perform_streaming(const Request& request, const ChunkCallback& on_chunk) {
    EasyHandle handle(request);
    if (!handle.get()) {
        return Result<long>::failure("Failed to initialize CURL");
    }

    StreamState state{&on_chunk};
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &state);

    CURLcode res = curl_easy_perform(handle.get());
    if (state.aborted || res == CURLE_ABORTED_BY_CALLBACK) {
        return Result<long>::failure("aborted");
    }
    if (res != CURLE_OK) {
        return Result<long>::failure(curl_easy_strerror(res));
    }
    return Result<long>::success(handle.status());
}

} // namespace http
} // namespace parley
