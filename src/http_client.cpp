#include "hib/net/http.hpp"
#include "hib/fingerprint.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <random>

namespace hib::net {

namespace {

const char HEX_UPPER[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string fold_case(const std::string& name) {
    std::string out(name.size(), '\0');
    std::transform(name.begin(), name.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status / 100 == 2;
}

bool is_retryable_status(int status) {
    switch (status) {
        case 408: case 429: case 500: case 502: case 503: case 504:
            return true;
        default:
            return false;
    }
}

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_UPPER[c >> 4];
            out += HEX_UPPER[c & 0x0F];
        }
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    std::string segment;
    for (char c : path) {
        if (c == '/') {
            out += url_encode(segment);
            out += '/';
            segment.clear();
        } else {
            segment += c;
        }
    }
    return out + url_encode(segment);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminator
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

// ---------------------------------------------------------------------------
// Headers, requests
// ---------------------------------------------------------------------------

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[fold_case(name)] = value;
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    auto [it, inserted] = values_.emplace(fold_case(name), value);
    if (!inserted) it->second += ", " + value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(fold_case(name));
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------

namespace {

// Per-call buffers handed to the curl callbacks.
struct TransferIo {
    const std::vector<uint8_t>* upload = nullptr;
    size_t upload_pos = 0;

    std::vector<uint8_t> download;
    size_t download_limit = 0;
    bool overflowed = false;

    HttpHeaders* response_headers = nullptr;

    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* io = static_cast<TransferIo*>(userdata);
        size_t n = size * nmemb;
        if (io->download_limit > 0 && io->download.size() + n > io->download_limit) {
            io->overflowed = true;
            return 0;
        }
        io->download.insert(io->download.end(), ptr, ptr + n);
        return n;
    }

    static size_t on_header(char* ptr, size_t size, size_t nitems, void* userdata) {
        auto* io = static_cast<TransferIo*>(userdata);
        size_t n = size * nitems;
        std::string line(ptr, n);
        if (line.compare(0, 5, "HTTP/") == 0) {
            // a new status line (redirect, 100-continue) starts a fresh header block
            *io->response_headers = HttpHeaders{};
            return n;
        }
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            io->response_headers->add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        return n;
    }

    static size_t on_read(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* io = static_cast<TransferIo*>(userdata);
        size_t n = std::min(size * nitems, io->upload->size() - io->upload_pos);
        if (n > 0) {
            std::memcpy(buffer, io->upload->data() + io->upload_pos, n);
            io->upload_pos += n;
        }
        return n;
    }
};

class HeaderList {
public:
    explicit HeaderList(const HttpHeaders& headers) {
        for (const auto& [name, value] : headers.entries()) {
            list_ = curl_slist_append(list_, (name + ": " + value).c_str());
        }
    }
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    ~Impl() {
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    // Borrowed easy handle, returned to the idle list on scope exit.
    class Lease {
    public:
        explicit Lease(Impl& owner) : owner_(owner), handle_(owner.take()) {}
        ~Lease() { owner_.give_back(handle_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        CURL* get() const { return handle_; }

    private:
        Impl& owner_;
        CURL* handle_;
    };

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        Lease lease(*this);
        CURL* curl = lease.get();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        TransferIo io;
        io.download_limit = config_.max_response_size;
        io.response_headers = &response.headers;
        HeaderList header_list(request.headers);

        apply_method(curl, request, io);
        apply_transport(curl, request);
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &TransferIo::on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &io);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &TransferIo::on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &io);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (io.overflowed) {
            response.error = "response larger than " + std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            response.is_network_error = true;
            response.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
        } else {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
            response.body = std::move(io.download);
        }
        return response;
    }

private:
    static void apply_method(CURL* curl, const HttpRequest& request, TransferIo& io) {
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                return;
            case HttpMethod::PUT:
                io.upload = &request.body;
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, &TransferIo::on_read);
                curl_easy_setopt(curl, CURLOPT_READDATA, &io);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                return;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                if (request.body.empty()) return;
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
        }
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    void apply_transport(CURL* curl, const HttpRequest& request) const {
        long verify = config_.verify_ssl ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_VERBOSE, config_.verbose ? 1L : 0L);
    }

    CURL* take() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.empty()) return curl_easy_init();
        CURL* handle = idle_.back();
        idle_.pop_back();
        return handle;
    }

    void give_back(CURL* handle) {
        if (!handle) return;
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
            return;
        }
        curl_easy_cleanup(handle);
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ---------------------------------------------------------------------------
// MultipartForm
// ---------------------------------------------------------------------------

MultipartForm::MultipartForm() {
    std::random_device rd;
    boundary_ = "hib-form-";
    for (int i = 0; i < 16; ++i) boundary_ += HEX_UPPER[rd() & 0x0F];
}

void MultipartForm::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

void MultipartForm::add_field(const std::string& name, const std::string& value) {
    append("--" + boundary_ + "\r\nContent-Disposition: form-data; name=\"" + name +
           "\"\r\n\r\n" + value + "\r\n");
}

void MultipartForm::add_file(const std::string& name, const std::string& filename,
                             const std::vector<uint8_t>& data,
                             const std::string& content_type) {
    append("--" + boundary_ + "\r\nContent-Disposition: form-data; name=\"" + name +
           "\"; filename=\"" + filename + "\"\r\nContent-Type: " + content_type + "\r\n\r\n");
    body_.insert(body_.end(), data.begin(), data.end());
    append("\r\n");
}

void MultipartForm::apply(HttpRequest& request) const {
    request.body = body_;
    std::string closing = "--" + boundary_ + "--\r\n";
    request.body.insert(request.body.end(), closing.begin(), closing.end());
    request.headers.set_content_type("multipart/form-data; boundary=" + boundary_);
}

// ---------------------------------------------------------------------------
// Error classification
// ---------------------------------------------------------------------------

std::chrono::milliseconds parse_retry_after(const HttpResponse& response) {
    auto value = response.headers.get("Retry-After");
    if (!value || value->empty() || value->size() > 9) return std::chrono::milliseconds(0);
    long seconds = 0;
    for (unsigned char c : *value) {
        if (!std::isdigit(c)) return std::chrono::milliseconds(0);
        seconds = seconds * 10 + (c - '0');
    }
    return std::chrono::seconds(seconds);
}

TransferError classify_response(const HttpResponse& response) {
    TransferError err;
    if (response.is_network_error) {
        err.kind = ErrorKind::Transient;
        err.message = response.timed_out ? "timed out: " + response.error : response.error;
        return err;
    }
    if (response.ok()) return err;

    int status = static_cast<int>(response.status_code);
    err.message = response.error.empty() ? "HTTP " + std::to_string(status) : response.error;
    switch (status) {
        case 401: case 403:
            err.kind = ErrorKind::AuthFailed;
            break;
        case 404: case 410:
            err.kind = ErrorKind::NotFound;
            break;
        case 429:
            err.kind = ErrorKind::RateLimited;
            err.retry_after = parse_retry_after(response);
            break;
        default:
            if (is_retryable_status(status) || status >= 500) {
                err.kind = ErrorKind::Transient;
                err.retry_after = parse_retry_after(response);
            } else {
                err.kind = ErrorKind::Rejected;
            }
    }
    return err;
}

// ---------------------------------------------------------------------------
// AwsSigV4Signer
// ---------------------------------------------------------------------------

namespace {

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len);
    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string to_hex(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) {
        out += "0123456789abcdef"[c >> 4];
        out += "0123456789abcdef"[c & 0x0F];
    }
    return out;
}

// Host, path and query of a URL as curl parses them.
struct UrlParts {
    std::string host;
    std::string path;
    std::string query;
};

std::optional<UrlParts> split_url(const std::string& url) {
    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    auto part = [&](CURLUPart which) -> std::optional<std::string> {
        char* value = nullptr;
        if (curl_url_get(handle.get(), which, &value, 0) != CURLUE_OK) return std::nullopt;
        std::string out(value);
        curl_free(value);
        return out;
    };

    auto host = part(CURLUPART_HOST);
    if (!host) return std::nullopt;
    UrlParts parts;
    parts.host = *host;
    if (auto port = part(CURLUPART_PORT)) parts.host += ":" + *port;
    parts.path = part(CURLUPART_PATH).value_or("/");
    if (parts.path.empty()) parts.path = "/";
    parts.query = part(CURLUPART_QUERY).value_or("");
    return parts;
}

// Parameters are already percent-encoded by the caller; sort them and give
// valueless ones an explicit '='.
std::string canonical_query(const std::string& query) {
    std::vector<std::string> params;
    size_t start = 0;
    while (start < query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string param = query.substr(start, end - start);
        if (!param.empty()) {
            if (param.find('=') == std::string::npos) param += '=';
            params.push_back(std::move(param));
        }
        start = end + 1;
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) out += '&';
        out += p;
    }
    return out;
}

std::string amz_datetime_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id, std::string secret_access_key,
                               std::string region, std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string AwsSigV4Signer::signature(const std::string& date,
                                      const std::string& string_to_sign) const {
    std::string key = hmac_sha256("AWS4" + secret_access_key_, date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    key = hmac_sha256(key, "aws4_request");
    return to_hex(hmac_sha256(key, string_to_sign));
}

bool AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = split_url(request.url);
    if (!url) return false;

    std::string datetime = amz_datetime_now();
    std::string date = datetime.substr(0, 8);
    std::string payload_hash = sha256_hex(std::string_view(
        reinterpret_cast<const char*>(request.body.data()), request.body.size()));

    request.headers.set("Host", url->host);
    request.headers.set("X-Amz-Date", datetime);
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    // Every header on the request is signed; entries() is already sorted
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : request.headers.entries()) {
        canonical_headers += name + ":" + trim(value) + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string canonical_request = std::string(method_name(request.method)) + "\n" +
                                    url->path + "\n" +
                                    canonical_query(url->query) + "\n" +
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    payload_hash;

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope(date) + "\n" +
                                 sha256_hex(canonical_request);

    request.headers.set("Authorization",
        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope(date) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + signature(date, string_to_sign));
    return true;
}

}  // namespace hib::net
