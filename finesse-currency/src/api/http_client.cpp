#include "api/http_client.hpp"
#include <curl/curl.h>
#include <iostream>
#include <thread>

namespace finesse {
namespace currency {

namespace {

size_t append_body(void* data, size_t size, size_t count, void* target) {
    const size_t bytes = size * count;
    static_cast<std::string*>(target)->append(static_cast<const char*>(data), bytes);
    return bytes;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// "Name: value" lines; the status line and the blank terminator are ignored
size_t collect_header(char* data, size_t size, size_t count, void* target) {
    const size_t bytes = size * count;
    const std::string line(data, bytes);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto& headers = *static_cast<std::map<std::string, std::string>*>(target);
        headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return bytes;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList build_header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Accept: application/json");
    for (const auto& [name, value] : headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    return HeaderList(list);
}

std::string describe_status(long status, const std::string& url, const std::string& body) {
    if (status == 404) {
        return "Not found: " + url;
    }
    if (status >= 500) {
        return "Exchange rate service unavailable (HTTP " + std::to_string(status) + ")";
    }
    return "HTTP " + std::to_string(status) + " from " + url + ": " + body;
}

} // anonymous namespace

struct HttpClient::CurlHandle {
    CURL* curl;

    CurlHandle() : curl(nullptr) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            curl_global_cleanup();
            throw HttpClientError("Failed to initialize libcurl");
        }
    }

    ~CurlHandle() {
        curl_easy_cleanup(curl);
        curl_global_cleanup();
    }
};

RetryPolicy::RetryPolicy()
    : backoff{std::chrono::milliseconds(1000),
              std::chrono::milliseconds(2000),
              std::chrono::milliseconds(4000)} {}

bool RetryPolicy::is_retryable(int status_code) {
    return status_code == 408 || status_code == 429 ||
           (status_code >= 500 && status_code < 600);
}

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : handle_(std::make_unique<CurlHandle>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , verbose_(false)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::perform(const std::string& url,
                                 const std::map<std::string, std::string>& headers) {
    CURL* curl = handle_->curl;
    curl_easy_reset(curl);

    HttpResponse response;
    HeaderList header_list = build_header_list(headers);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "finesse/1.0");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    const auto start = std::chrono::steady_clock::now();
    const CURLcode code = curl_easy_perform(curl);
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (code != CURLE_OK) {
        throw HttpClientError("Request to " + url + " failed: " + curl_easy_strerror(code));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);

    if (verbose_) {
        std::cerr << "[HttpClient] GET " << url << " -> " << status
                  << " (" << response.elapsed.count() << "ms)" << std::endl;
    }

    if (status >= 400) {
        throw HttpClientError(describe_status(status, url, response.body), response.status_code);
    }
    return response;
}

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    const std::string url = base_url_ + path;

    for (int attempt = 1;; ++attempt) {
        try {
            return perform(url, headers);
        } catch (const HttpClientError& e) {
            if (!RetryPolicy::is_retryable(e.status_code()) || attempt >= retry_.max_attempts()) {
                throw;
            }
            const auto delay = retry_.backoff[static_cast<size_t>(attempt - 1)];
            if (verbose_) {
                std::cerr << "[HttpClient] " << e.what() << ", retrying in "
                          << delay.count() << "ms" << std::endl;
            }
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace currency
} // namespace finesse
