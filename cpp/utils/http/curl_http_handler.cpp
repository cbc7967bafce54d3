#include "curl_http_handler.hpp"
#include "../logging/log_helper.hpp"
#include <stdexcept>
#include <string>
#include <memory>

namespace {

std::once_flag g_curl_global_once;

void ensure_curl_global_init() {
    std::call_once(g_curl_global_once, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpHandler::CurlHttpHandler() {
    ensure_curl_global_init();
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpHandler::~CurlHttpHandler() {
    shutdown();
}

bool CurlHttpHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            LOG_ERROR_COMP("HTTP_CLIENT", "curl_easy_init failed");
            return false;
        }
    }

    initialized_ = true;
    return true;
}

void CurlHttpHandler::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    initialized_ = false;
}

bool CurlHttpHandler::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void CurlHttpHandler::set_default_timeout(int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_timeout_ms_ = timeout_ms;
}

void CurlHttpHandler::set_default_headers(const std::map<std::string, std::string>& headers) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_headers_ = headers;
}

HttpResponse CurlHttpHandler::make_request(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    if (!initialized_ || !curl_) {
        response.error_message = "HTTP handler not initialized";
        return response;
    }

    WriteCallbackData data;
    data.buffer = &response.body;
    data.response = &response;

    // Reset CURL handle
    curl_easy_reset(curl_);

    setup_curl_options(request, data);

    std::unique_ptr<curl_slist, SlistDeleter> header_list(build_header_list(request));
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);
    response.success = (response_code >= 200 && response_code < 300);
    if (!response.success) {
        response.error_message = "HTTP " + std::to_string(response_code);
    }

    return response;
}

void CurlHttpHandler::setup_curl_options(const HttpRequest& request, WriteCallbackData& data) {
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "trade-ingest/1.0");
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
    } else if (request.method == "PUT" || request.method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
    }

    long timeout = request.timeout_ms > 0 ? request.timeout_ms : default_timeout_ms_;
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout);

    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &data);

    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &data);
}

curl_slist* CurlHttpHandler::build_header_list(const HttpRequest& request) const {
    // Request headers take precedence over defaults with the same name
    std::map<std::string, std::string> merged = default_headers_;
    for (const auto& [key, value] : request.headers) {
        merged[key] = value;
    }

    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : merged) {
        std::string header = key + ": " + value;
        curl_slist* appended = curl_slist_append(header_list, header.c_str());
        if (!appended) {
            curl_slist_free_all(header_list);
            return nullptr;
        }
        header_list = appended;
    }
    return header_list;
}

size_t CurlHttpHandler::WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->buffer) return 0;

    size_t total_size = size * nmemb;
    data->buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpHandler::HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->response) return 0;

    size_t total_size = size * nmemb;
    std::string header_line(static_cast<char*>(contents), total_size);

    while (!header_line.empty() && (header_line.back() == '\n' || header_line.back() == '\r')) {
        header_line.pop_back();
    }

    // Parse header (format: "Key: Value")
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        data->response->headers[key] = value;
    }

    return total_size;
}
