#pragma once

#include "hib/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hib::net {

enum class HttpMethod { GET, POST, PUT, DELETE };

const char* method_name(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);
/// Like url_encode but keeps '/' so object keys stay path-shaped.
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);

/// Header names are folded to lowercase. A repeated header is kept as one
/// comma-joined value.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    void set_content_type(const std::string& content_type) { set("Content-Type", content_type); }
    void set_bearer_token(const std::string& token) { set("Authorization", "Bearer " + token); }

    /// Sorted by folded name.
    const std::map<std::string, std::string>& entries() const { return values_; }

private:
    std::map<std::string, std::string> values_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{30000};

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    long status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string error;
    bool is_network_error = false;
    bool timed_out = false;
    std::chrono::milliseconds total_time{0};

    bool ok() const { return error.empty() && is_success_status(static_cast<int>(status_code)); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

struct HttpClientConfig {
    std::string user_agent = "hib/1.0";
    bool verify_ssl = true;
    std::string ca_bundle;
    size_t max_idle_handles = 16;
    size_t max_response_size = 256 * 1024 * 1024;
    bool verbose = false;
};

/// Blocking libcurl client. Easy handles are recycled between calls, so one
/// client can be shared by every worker thread.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// multipart/form-data body builder for image-host upload endpoints.
class MultipartForm {
public:
    MultipartForm();

    void add_field(const std::string& name, const std::string& value);
    void add_file(const std::string& name, const std::string& filename,
                  const std::vector<uint8_t>& data,
                  const std::string& content_type = "application/octet-stream");

    /// Close the body and move it into the request with the matching
    /// Content-Type.
    void apply(HttpRequest& request) const;

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<uint8_t> body_;
};

/// Map a finished response onto the transfer error taxonomy. Returns a
/// TransferError with kind None for 2xx responses.
TransferError classify_response(const HttpResponse& response);

/// Retry-After in delta-seconds form; zero when absent or an HTTP-date.
std::chrono::milliseconds parse_retry_after(const HttpResponse& response);

/// AWS Signature Version 4 header signing for S3-compatible endpoints.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                   std::string region, std::string service = "s3");

    /// Adds host, x-amz-date, x-amz-content-sha256 and Authorization.
    /// Returns false when the request URL cannot be parsed.
    bool sign(HttpRequest& request) const;

private:
    std::string scope(const std::string& date) const;
    std::string signature(const std::string& date, const std::string& string_to_sign) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

}  // namespace hib::net
