#include "venue/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include <utility>

namespace venue {
namespace {

constexpr std::size_t kErrorBodyLimit = 256;
constexpr long kMaxRetryAfterMs = 30000;

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

// Picks Retry-After (seconds form) out of the response headers.
size_t scan_header(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t length = size * nitems;
    const std::string line(buffer, length);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (name == "retry-after") {
            *static_cast<long*>(userp) = std::strtol(line.c_str() + colon + 1, nullptr, 10);
        }
    }
    return length;
}

RequestTimings read_timings(CURL* handle) {
    RequestTimings timings;
    const std::pair<CURLINFO, double RequestTimings::*> fields[] = {
        {CURLINFO_NAMELOOKUP_TIME, &RequestTimings::name_lookup_ms},
        {CURLINFO_CONNECT_TIME, &RequestTimings::connect_ms},
        {CURLINFO_APPCONNECT_TIME, &RequestTimings::app_connect_ms},
        {CURLINFO_STARTTRANSFER_TIME, &RequestTimings::start_transfer_ms},
        {CURLINFO_TOTAL_TIME, &RequestTimings::total_ms},
    };
    for (const auto& [info, member] : fields) {
        double seconds = 0.0;
        if (curl_easy_getinfo(handle, info, &seconds) == CURLE_OK) {
            timings.*member = seconds * 1000.0;
        }
    }
    return timings;
}

std::string clip(const std::string& body) {
    return body.size() <= kErrorBodyLimit ? body : body.substr(0, kErrorBodyLimit) + "...";
}

} // namespace

bool is_transient_status(long status_code) noexcept {
    return status_code == 0 || status_code == 408 || status_code == 429 || status_code >= 500;
}

long retry_delay_ms(const RetryPolicy& policy, int attempt, long retry_after_s) noexcept {
    long delay = std::max(policy.base_delay_ms, 0L);
    for (int i = 1; i < attempt && delay < policy.max_delay_ms; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, policy.max_delay_ms);
    return std::max(delay, std::min(std::max(retry_after_s, 0L) * 1000, kMaxRetryAfterMs));
}

std::string describe_request(const HttpRequest& request) {
    std::string target = request.url;
    const auto scheme = target.find("://");
    if (scheme != std::string::npos) {
        const auto path = target.find('/', scheme + 3);
        target = path == std::string::npos ? "/" : target.substr(path);
    }
    return request.method + " " + target.substr(0, target.find('?'));
}

HttpClient::HttpClient(long timeout_ms, long connect_timeout_ms, RetryPolicy retry)
    : timeout_ms_(timeout_ms),
      connect_timeout_ms_(connect_timeout_ms),
      retry_(retry),
      global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

HttpResponse HttpClient::perform_once(const HttpRequest& request) const {
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    HttpResponse response;
    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, scan_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.retry_after_s);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
        auto* appended = curl_slist_append(header_list.get(), (name + ": " + value).c_str());
        if (!appended) {
            throw HttpError("Failed to build headers for " + describe_request(request));
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }
    if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    const auto code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        throw HttpError(describe_request(request) + " failed: " + curl_easy_strerror(code));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.timings = read_timings(curl);
    return response;
}

HttpResponse HttpClient::request(const HttpRequest& request) const {
    const int attempts = request.method == "GET" ? std::max(retry_.max_attempts, 1) : 1;

    for (int attempt = 1;; ++attempt) {
        long status = 0;
        long retry_after_s = 0;
        std::string failure;
        try {
            auto response = perform_once(request);
            if (response.status_code < 400) {
                response.attempts = attempt;
                return response;
            }
            status = response.status_code;
            retry_after_s = response.retry_after_s;
            failure = describe_request(request) + " returned HTTP " + std::to_string(status) + ": " +
                      clip(response.body);
        } catch (const HttpError& ex) {
            failure = ex.what();
        }

        if (attempt >= attempts || !is_transient_status(status)) {
            throw HttpError(failure, status);
        }
        const long delay = retry_delay_ms(retry_, attempt, retry_after_s);
        spdlog::warn("[Http] {} (attempt {}/{}), retrying in {} ms", failure, attempt, attempts, delay);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
}

} // namespace venue
