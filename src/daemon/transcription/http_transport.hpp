#pragma once

#include "provider_error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

// A multipart/form-data part. When filename is set the part carries
// file_data, otherwise value.
struct FormField {
    std::string name;
    std::string value;
    std::string filename;
    std::string content_type;
    std::span<const uint8_t> file_data;
};

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::vector<FormField> form;   // multipart POST when non-empty
    std::span<const uint8_t> body; // raw POST otherwise
    std::string content_type;
    long timeout_s = 20;
    long connect_timeout_s = 10;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    double elapsed_s = 0.0;
};

// Blocking libcurl POST. Transport failures are classified as NetworkError or
// Timeout; the HTTP status is returned as-is for the caller to classify.
// Requesting stop aborts the transfer from curl's progress callback.
class HttpTransport {
public:
    HttpTransport();
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    std::expected<HttpResponse, ProviderError>
        post(const HttpRequest& request, std::stop_token stop) const;

    static std::string url_encode(std::string_view value);
};
