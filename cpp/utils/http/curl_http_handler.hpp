#pragma once
#include "i_http_handler.hpp"
#include <string>
#include <map>
#include <mutex>
#include <curl/curl.h>

// CURL-based HTTP handler implementation; one easy handle reused under a mutex
class CurlHttpHandler : public IHttpHandler {
public:
    CurlHttpHandler();
    ~CurlHttpHandler() override;
    
    CurlHttpHandler(const CurlHttpHandler&) = delete;
    CurlHttpHandler& operator=(const CurlHttpHandler&) = delete;
    
    HttpResponse make_request(const HttpRequest& request) override;
    
    bool initialize() override;
    void shutdown() override;
    bool is_initialized() const override;
    
    void set_default_timeout(int timeout_ms) override;
    void set_default_headers(const std::map<std::string, std::string>& headers) override;

private:
    struct WriteCallbackData {
        std::string* buffer;
        HttpResponse* response;
    };
    
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);
    static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);
    
    void setup_curl_options(const HttpRequest& request, WriteCallbackData& data);
    curl_slist* build_header_list(const HttpRequest& request) const;
    
    mutable std::mutex mutex_;
    CURL* curl_{nullptr};
    bool initialized_{false};
    int default_timeout_ms_{10000};
    std::map<std::string, std::string> default_headers_;
};
