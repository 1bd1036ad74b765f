#include "curl_transport.hpp"
#include "api/error.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

namespace api {

namespace {

class CurlCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "curl"; }

    std::string message(int ev) const override {
        return curl_easy_strerror(static_cast<CURLcode>(ev));
    }
};

// State shared by the worker thread driving one transfer, the caller
// waiting for headers and the body handed out afterwards.
struct Exchange {
    ContextPtr ctx;
    std::size_t subscription = 0;

    CURL* easy = nullptr;
    CURLM* multi = nullptr;
    curl_slist* header_list = nullptr;
    std::string request_body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    std::mutex mutex;
    std::condition_variable cv;
    bool headers_done = false;
    bool finished = false;
    CURLcode result = CURLE_OK;
    std::atomic<bool> aborted{false};

    long status = 0;
    std::string status_text;
    Headers headers;
    std::string pending;
    std::size_t pending_offset = 0;

    std::thread worker;

    ~Exchange() {
        if (worker.joinable()) {
            aborted = true;
            curl_multi_wakeup(multi);
            worker.join();
        }
        if (multi && easy) curl_multi_remove_handle(multi, easy);
        if (easy) curl_easy_cleanup(easy);
        if (multi) curl_multi_cleanup(multi);
        if (header_list) curl_slist_free_all(header_list);
    }

    bool cancelled() const { return aborted || (ctx && ctx->Done()); }
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    if (ex->aborted) return 0;

    {
        std::lock_guard<std::mutex> lock(ex->mutex);
        ex->headers_done = true;
        ex->pending.append(ptr, size * nmemb);
    }
    ex->cv.notify_all();
    return size * nmemb;
}

size_t write_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    std::string line(buffer, size * nitems);

    std::lock_guard<std::mutex> lock(ex->mutex);

    if (line.rfind("HTTP/", 0) == 0) {
        // A new header block starts; anything before it was interim.
        ex->headers = Headers();
        ex->status = 0;
        ex->status_text.clear();

        std::string rest = trim(line);
        auto sp = rest.find(' ');
        if (sp != std::string::npos) {
            rest = rest.substr(sp + 1);
            auto sp2 = rest.find(' ');
            ex->status = std::strtol(rest.substr(0, sp2).c_str(), nullptr, 10);
            if (sp2 != std::string::npos) ex->status_text = trim(rest.substr(sp2 + 1));
        }
        return size * nitems;
    }

    if (trim(line).empty()) {
        if (ex->status >= 200) {
            ex->headers_done = true;
            ex->cv.notify_all();
        }
        return size * nitems;
    }

    auto pos = line.find(':');
    if (pos == std::string::npos) {
        return size * nitems;
    }
    ex->headers.Add(trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
    return size * nitems;
}

curl_slist* build_headers(const Request& request) {
    curl_slist* list = nullptr;
    for (const auto& header : request.headers) {
        list = curl_slist_append(list, (header.first + ": " + header.second).c_str());
    }
    if (!request.body.empty() && !request.headers.Has("Expect")) {
        list = curl_slist_append(list, "Expect:");
    }
    return list;
}

int poll_timeout_ms(const ContextPtr& ctx) {
    int timeout = 1000;
    if (ctx) {
        if (auto deadline = ctx->Deadline()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Context::Clock::now()).count();
            timeout = static_cast<int>(std::clamp<long long>(left + 1, 0, 1000));
        }
    }
    return timeout;
}

void run_transfer(Exchange& ex) {
    CURLcode result = CURLE_OK;
    int running = 1;

    for (;;) {
        CURLMcode mc = curl_multi_perform(ex.multi, &running);
        if (mc != CURLM_OK) {
            std::strncpy(ex.error_buffer, curl_multi_strerror(mc), CURL_ERROR_SIZE - 1);
            result = CURLE_RECV_ERROR;
            break;
        }

        bool completed = false;
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(ex.multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                result = msg->data.result;
                completed = true;
            }
        }
        if (completed || running == 0) break;

        if (ex.cancelled()) {
            result = CURLE_ABORTED_BY_CALLBACK;
            break;
        }

        mc = curl_multi_poll(ex.multi, nullptr, 0, poll_timeout_ms(ex.ctx), nullptr);
        if (mc != CURLM_OK) {
            std::strncpy(ex.error_buffer, curl_multi_strerror(mc), CURL_ERROR_SIZE - 1);
            result = CURLE_RECV_ERROR;
            break;
        }
    }

    if (ex.ctx) {
        ex.ctx->Unsubscribe(ex.subscription);
    }

    {
        std::lock_guard<std::mutex> lock(ex.mutex);
        ex.finished = true;
        ex.result = result;
    }
    ex.cv.notify_all();
}

// Must only be called once the transfer has finished.
Error transfer_error(const Exchange& ex, ErrorKind kind) {
    if (ex.ctx && ex.ctx->Done()) {
        return cancellation_error(ex.ctx->Err());
    }
    std::string message = ex.error_buffer[0] ? ex.error_buffer : curl_easy_strerror(ex.result);
    return Error(kind, make_curl_error(ex.result), message);
}

class CurlBody : public Body {
public:
    explicit CurlBody(std::shared_ptr<Exchange> exchange) : ex(std::move(exchange)) {}

    ~CurlBody() override { Close(); }

    std::size_t Read(char* buffer, std::size_t size) override {
        if (closed) {
            throw Error(ErrorKind::Read, std::make_error_code(std::errc::bad_file_descriptor),
                        "read on closed body");
        }
        if (size == 0) return 0;

        std::unique_lock<std::mutex> lock(ex->mutex);
        ex->cv.wait(lock, [this] { return ex->pending_offset < ex->pending.size() || ex->finished; });

        if (ex->pending_offset < ex->pending.size()) {
            std::size_t n = std::min(size, ex->pending.size() - ex->pending_offset);
            std::memcpy(buffer, ex->pending.data() + ex->pending_offset, n);
            ex->pending_offset += n;
            if (ex->pending_offset == ex->pending.size()) {
                ex->pending.clear();
                ex->pending_offset = 0;
            }
            return n;
        }

        if (ex->result == CURLE_OK) return 0;
        lock.unlock();
        throw transfer_error(*ex, ErrorKind::Read);
    }

    void Close() override {
        if (closed) return;
        closed = true;

        ex->aborted = true;
        curl_multi_wakeup(ex->multi);
        if (ex->worker.joinable()) {
            ex->worker.join();
        }
    }

private:
    std::shared_ptr<Exchange> ex;
    bool closed = false;
};

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

const std::error_category& curl_category() noexcept {
    static const CurlCategory category;
    return category;
}

std::error_code make_curl_error(int code) noexcept {
    return {code, curl_category()};
}

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options) : options(std::move(options)) {
    global_init();
}

std::unique_ptr<Response> CurlTransport::RoundTrip(const Request& request) {
    auto ex = std::make_shared<Exchange>();
    ex->ctx = request.context;
    ex->request_body = request.body;

    ex->easy = curl_easy_init();
    ex->multi = curl_multi_init();
    if (!ex->easy || !ex->multi) {
        throw Error(ErrorKind::Transport, make_curl_error(CURLE_FAILED_INIT), "curl initialization failed");
    }

    CURL* curl = ex->easy;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, ex.get());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, ex.get());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ex->error_buffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    if (!options.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    }

    ex->header_list = build_headers(request);
    if (ex->header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, ex->header_list);
    }

    if (!ex->request_body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, ex->request_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(ex->request_body.size()));
    }

    CURLMcode mc = curl_multi_add_handle(ex->multi, curl);
    if (mc != CURLM_OK) {
        throw Error(ErrorKind::Transport, make_curl_error(CURLE_FAILED_INIT), curl_multi_strerror(mc));
    }

    if (ex->ctx) {
        std::weak_ptr<Exchange> weak = ex;
        ex->subscription = ex->ctx->Subscribe([weak] {
            if (auto locked = weak.lock()) {
                curl_multi_wakeup(locked->multi);
            }
        });
    }

    API_LOG_TRACE("{} {}: starting transfer", request.method, request.url);
    Exchange* raw = ex.get();
    ex->worker = std::thread([raw] { run_transfer(*raw); });

    bool failed = false;
    {
        std::unique_lock<std::mutex> lock(ex->mutex);
        ex->cv.wait(lock, [&] { return ex->headers_done || ex->finished; });
        failed = !ex->headers_done && ex->result != CURLE_OK;
    }

    if (failed) {
        ex->worker.join();
        Error error = transfer_error(*ex, ErrorKind::Transport);
        API_LOG_DEBUG("{} {}: {}", request.method, request.url, error.what());
        throw error;
    }

    auto response = std::make_unique<Response>();
    {
        std::lock_guard<std::mutex> lock(ex->mutex);
        response->status = ex->status;
        response->status_text = ex->status_text;
        response->headers = ex->headers;
    }
    API_LOG_TRACE("{} {}: status {}", request.method, request.url, response->status);
    response->body = std::make_unique<CurlBody>(std::move(ex));
    return response;
}

} // namespace api
