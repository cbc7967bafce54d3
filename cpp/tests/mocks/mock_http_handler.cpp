#include "mock_http_handler.hpp"
#include <fstream>
#include <sstream>
#include <thread>

MockHttpHandler::MockHttpHandler(const std::string& test_data_dir)
    : test_data_dir_(test_data_dir) {
}

HttpResponse MockHttpHandler::make_request(const HttpRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    // Simulate network failure
    if (network_failure_enabled_.load()) {
        HttpResponse response;
        response.status_code = 0;
        response.error_message = "Network failure simulation";
        response.success = false;
        return response;
    }
    
    // Simulate response delay
    if (response_delay_.count() > 0) {
        std::this_thread::sleep_for(response_delay_);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [fragment, canned] : overrides_) {
            if (request.url.find(fragment) != std::string::npos) {
                HttpResponse response;
                response.status_code = canned.status_code;
                response.body = canned.body;
                response.success = canned.status_code >= 200 && canned.status_code < 300;
                if (!response.success) {
                    response.error_message = "HTTP " + std::to_string(canned.status_code);
                }
                return response;
            }
        }
    }
    
    std::string file_path = get_response_file_path(request);
    HttpResponse response = load_response_from_file(file_path);
    
    // If file not found, return 404
    if (response.status_code == 0) {
        response.status_code = 404;
        response.error_message = "Mock response file not found: " + file_path;
        response.success = false;
    }
    
    return response;
}

void MockHttpHandler::set_response(const std::string& url_fragment, int status_code, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[url_fragment] = CannedResponse{status_code, body};
}

void MockHttpHandler::clear_responses() {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.clear();
}

std::vector<HttpRequest> MockHttpHandler::get_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

size_t MockHttpHandler::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

size_t MockHttpHandler::request_count(const std::string& url_fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& request : requests_) {
        if (request.url.find(url_fragment) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

std::string MockHttpHandler::get_response_file_path(const HttpRequest& request) const {
    // Extract endpoint from URL
    std::string url = request.url;
    size_t query_pos = url.find('?');
    if (query_pos != std::string::npos) {
        url = url.substr(0, query_pos);
    }
    
    // Map endpoints to response files
    std::string filename;
    if (url.find("/api/v3/exchangeInfo") != std::string::npos) {
        filename = "binance_exchange_info.json";
    } else if (url.find("/coins/markets") != std::string::npos) {
        filename = "coingecko_markets.json";
    } else {
        filename = "unknown_endpoint.json";
    }
    
    return test_data_dir_ + "/" + filename;
}

HttpResponse MockHttpHandler::load_response_from_file(const std::string& file_path) const {
    HttpResponse response;
    
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return response;
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    response.body = buffer.str();
    response.status_code = 200;
    response.success = true;
    response.headers["Content-Type"] = "application/json";
    
    return response;
}
