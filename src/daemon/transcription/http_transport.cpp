#include "http_transport.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

HttpTransport::HttpTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpTransport::~HttpTransport() {
    curl_global_cleanup();
}

std::expected<HttpResponse, ProviderError>
HttpTransport::post(const HttpRequest& request, std::stop_token stop) const {
    if (stop.stop_requested()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::NetworkError, .message = "request cancelled"});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::NetworkError, .message = "curl_easy_init failed"});
    }

    curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_mime* mime = nullptr;
    if (!request.form.empty()) {
        mime = curl_mime_init(curl);
        for (const auto& field : request.form) {
            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, field.name.c_str());
            if (!field.filename.empty()) {
                curl_mime_data(part, reinterpret_cast<const char*>(field.file_data.data()),
                               field.file_data.size());
                curl_mime_filename(part, field.filename.c_str());
            } else {
                curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
            }
            if (!field.content_type.empty()) {
                curl_mime_type(part, field.content_type.c_str());
            }
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else {
        if (!request.content_type.empty()) {
            headers = curl_slist_append(headers,
                                        ("Content-Type: " + request.content_type).c_str());
        }
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_s);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    auto end = std::chrono::steady_clock::now();
    response.elapsed_s = std::chrono::duration<double>(end - start).count();

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    if (mime) curl_mime_free(mime);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::Timeout, .message = curl_easy_strerror(res)});
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::NetworkError, .message = "request cancelled"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::NetworkError,
            .message = std::format("curl error: {}", curl_easy_strerror(res))});
    }

    return response;
}

std::string HttpTransport::url_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}
