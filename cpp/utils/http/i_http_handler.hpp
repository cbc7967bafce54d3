#pragma once
#include <string>
#include <map>
#include <memory>

// HTTP request structure
struct HttpRequest {
    std::string method{"GET"};    // GET, POST, PUT, DELETE
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms{0};            // 0 = handler default
    bool verify_ssl{true};
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};           // 0 = transport failure, see error_message
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;
    bool success{false};          // 2xx
};

// Base interface for outbound HTTP clients (discovery sources)
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;
    
    // Synchronous HTTP request; never throws, failures are reported in the response
    virtual HttpResponse make_request(const HttpRequest& request) = 0;
    
    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;
    
    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
    virtual void set_default_headers(const std::map<std::string, std::string>& headers) = 0;
};
