// Test suite for hib.
//
// Tests:
//   1. Fingerprints
//   2. Configuration: JSON loading, validation, env overrides, masking
//   3. Provider registry and per-kind validation
//   4. HTTP response classification and backoff
//   5. Manifest store: records, history, duplicates, cleanup, corruption
//   6. Transfer scheduler against a scripted provider
//      - retries below and above the attempt budget
//      - rate limiting, permanent failures, timeouts
//      - bounded concurrency
//   7. Orchestrator: skip-existing, limits, capability checks,
//      multi-provider isolation, cancellation, state sequence
//   8. Destination path sanitization
//   9. Local provider and upload
//  10. Metrics

#include "hib/config.hpp"
#include "hib/fingerprint.hpp"
#include "hib/manifest_store.hpp"
#include "hib/metrics.hpp"
#include "hib/net/http.hpp"
#include "hib/orchestrator.hpp"
#include "hib/provider.hpp"
#include "hib/transfer_scheduler.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace hib;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Config tuned for fast tests: tiny backoff, no jitter in timing.
static AppConfig test_config(const fs::path& root) {
    AppConfig config;
    config.output_dir = root / "out";
    config.state_dir = root / "state";
    config.max_concurrent_transfers = 4;
    config.retry_count = 3;
    config.backoff_initial_ms = 1;
    config.backoff_ceiling_ms = 5;
    config.timeout_secs = 30;
    return config;
}

static TransferError make_error(ErrorKind kind, const std::string& msg = "injected") {
    return {kind, msg, std::chrono::milliseconds(0)};
}

/// In-process provider with scripted per-key failures.
///
/// Each key may carry a queue of errors returned by successive fetch/push
/// calls before the call succeeds. Tracks call counts and how many calls
/// overlap.
class FakeProvider : public Provider {
public:
    explicit FakeProvider(std::string name,
                          CapabilitySet caps = {Capability::List, Capability::Fetch, Capability::Push,
                                                Capability::Delete, Capability::Describe})
        : name_(std::move(name)), caps_(caps) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::Local; }
    CapabilitySet capabilities() const override { return caps_; }

    void add_object(const std::string& key, const std::string& content,
                    std::optional<std::chrono::system_clock::time_point> mtime = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[key] = {content, mtime};
    }

    void script(const std::string& key, std::vector<TransferError> errors) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& e : errors) scripts_[key].push_back(std::move(e));
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    void set_page_size(size_t n) { page_size_ = n; }
    void fail_listing(TransferError err) { list_error_ = std::move(err); }
    void on_fetch(std::function<void(const std::string&)> hook) { on_fetch_ = std::move(hook); }

    int calls(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[key];
    }
    int total_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (auto& [k, v] : calls_) n += v;
        return n;
    }
    int list_calls() const { return list_calls_.load(); }
    size_t peak() const { return peak_.load(); }
    std::map<std::string, std::string> pushed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

    ListPage list(const std::string& prefix, const Cursor& cursor) override {
        list_calls_++;
        ListPage page;
        if (list_error_) {
            page.error = list_error_;
            return page;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        size_t start = cursor.empty() ? 0 : std::stoul(cursor);
        size_t i = 0;
        for (auto& [key, obj] : objects_) {
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            if (i++ < start) continue;
            if (page.objects.size() == page_size_) {
                page.next_cursor = std::to_string(start + page_size_);
                break;
            }
            RemoteObject ro;
            ro.key = key;
            ro.size = obj.content.size();
            ro.last_modified = obj.mtime;
            page.objects.push_back(std::move(ro));
        }
        page.success = true;
        return page;
    }

    FetchResult fetch(const RemoteObject& object, Deadline) override {
        FetchResult result;
        auto err = begin_call(object.key);
        if (on_fetch_) on_fetch_(object.key);
        if (err) {
            result.error = err;
            return result;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(object.key);
        if (it == objects_.end()) {
            result.error = make_error(ErrorKind::NotFound, "no such object");
            return result;
        }
        result.data.assign(it->second.content.begin(), it->second.content.end());
        result.success = true;
        return result;
    }

    PushResult push(const fs::path& local_path, const std::string& dest_key, Deadline) override {
        PushResult result;
        auto err = begin_call(dest_key);
        if (err) {
            result.error = err;
            return result;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        pushed_[dest_key] = read_file(local_path);
        result.object.key = dest_key;
        result.url = "fake://" + name_ + "/" + dest_key;
        result.success = true;
        return result;
    }

    DeleteResult remove(const std::string& key) override {
        DeleteResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        if (objects_.erase(key) == 0) {
            result.error = make_error(ErrorKind::NotFound);
            return result;
        }
        result.success = true;
        return result;
    }

private:
    struct Object {
        std::string content;
        std::optional<std::chrono::system_clock::time_point> mtime;
    };

    // Counts the call, holds it for the configured delay, and pops the next
    // scripted error.
    TransferError begin_call(const std::string& key) {
        size_t now = ++active_;
        size_t prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
        }
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        --active_;

        std::lock_guard<std::mutex> lock(mutex_);
        calls_[key]++;
        auto it = scripts_.find(key);
        if (it == scripts_.end() || it->second.empty()) return {};
        auto err = it->second.front();
        it->second.pop_front();
        return err;
    }

    std::string name_;
    CapabilitySet caps_;
    std::mutex mutex_;
    std::map<std::string, Object> objects_;
    std::map<std::string, std::deque<TransferError>> scripts_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::string> pushed_;
    std::chrono::milliseconds delay_{0};
    size_t page_size_ = 2;
    TransferError list_error_;
    std::function<void(const std::string&)> on_fetch_;
    std::atomic<int> list_calls_{0};
    std::atomic<size_t> active_{0};
    std::atomic<size_t> peak_{0};
};

static std::vector<TransferTask> backup_tasks(const FakeProvider& provider, const fs::path& dir,
                                              const std::vector<std::string>& keys) {
    std::vector<TransferTask> tasks;
    for (const auto& key : keys) {
        TransferTask t;
        t.index = tasks.size();
        t.provider = provider.name();
        t.direction = Direction::Backup;
        t.object.key = key;
        t.destination = dir / key;
        tasks.push_back(std::move(t));
    }
    return tasks;
}

// ---------------------------------------------------------------------------
// 1. Fingerprints
// ---------------------------------------------------------------------------

static void test_fingerprint() {
    std::cout << "\n=== Fingerprint ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-fp");

    {
        TEST(known_digest);
        std::string abc = "abc";
        auto fp = fingerprint_bytes({reinterpret_cast<const uint8_t*>(abc.data()), abc.size()});
        ASSERT_EQ(fp.digest, std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
                  "sha256(abc)");
        ASSERT_EQ(fp.size, 3u, "size");
        PASS();
    }
    {
        TEST(file_matches_bytes_and_is_deterministic);
        std::string content(200000, 'x');
        content += "tail";
        write_file(tmpdir / "a.bin", content);
        auto f1 = fingerprint_file(tmpdir / "a.bin");
        auto f2 = fingerprint_file(tmpdir / "a.bin");
        auto mem = fingerprint_bytes({reinterpret_cast<const uint8_t*>(content.data()), content.size()});
        ASSERT_TRUE(f1 && f2, "file should fingerprint");
        ASSERT_TRUE(*f1 == *f2, "same file, same fingerprint");
        ASSERT_TRUE(*f1 == mem, "streamed digest equals in-memory digest");
        PASS();
    }
    {
        TEST(distinct_content_distinct_digest);
        write_file(tmpdir / "b.bin", "one");
        write_file(tmpdir / "c.bin", "two");
        auto b = fingerprint_file(tmpdir / "b.bin");
        auto c = fingerprint_file(tmpdir / "c.bin");
        ASSERT_TRUE(b && c, "files should fingerprint");
        ASSERT_TRUE(b->digest != c->digest, "different content must differ");
        PASS();
    }
    {
        TEST(missing_file_is_nullopt);
        ASSERT_TRUE(!fingerprint_file(tmpdir / "nope"), "missing file");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 2. Configuration
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== Configuration ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-config");

    {
        TEST(load_json_overlays_values);
        write_file(tmpdir / "config.json", R"({
            "output_dir": "/srv/backup",
            "max_concurrent_transfers": 8,
            "timeout": 60,
            "retry_count": 5,
            "skip_existing": false,
            "providers": {
                "github": {"enabled": true, "token": "ghp_abcdefghijkl", "owner": "me", "repo": "pics"},
                "photos": {"type": "local", "enabled": false, "path": "/srv/photos", "depth": 3},
                "nested": {"type": "smms", "params": {"api_token": "t"}}
            }
        })");
        AppConfig config;
        ASSERT_TRUE(config.load_json(tmpdir / "config.json"), "should load");
        ASSERT_EQ(config.output_dir.string(), std::string("/srv/backup"), "output_dir");
        ASSERT_EQ(config.max_concurrent_transfers, 8u, "width");
        ASSERT_EQ(config.timeout_secs, 60u, "timeout");
        ASSERT_EQ(config.retry_count, 5u, "retry_count");
        ASSERT_TRUE(!config.skip_existing, "skip_existing");
        ASSERT_EQ(config.backoff_initial_ms, constants::DEFAULT_BACKOFF_INITIAL_MS, "default kept");
        ASSERT_EQ(config.providers.size(), 3u, "three providers");

        auto* gh = config.find_provider("github");
        ASSERT_TRUE(gh != nullptr, "github present");
        ASSERT_EQ(gh->effective_type(), std::string("github"), "type defaults to name");
        ASSERT_EQ(gh->params.at("owner"), std::string("me"), "owner");

        auto* photos = config.find_provider("photos");
        ASSERT_TRUE(photos && !photos->enabled, "photos disabled");
        ASSERT_EQ(photos->effective_type(), std::string("local"), "explicit type");
        ASSERT_EQ(photos->params.at("depth"), std::string("3"), "numbers become strings");

        auto* nested = config.find_provider("nested");
        ASSERT_TRUE(nested && nested->params.count("api_token"), "nested params flattened");
        PASS();
    }
    {
        TEST(malformed_json_fails);
        write_file(tmpdir / "bad.json", "{ not json");
        AppConfig config;
        ASSERT_TRUE(!config.load_json(tmpdir / "bad.json"), "should fail");
        ASSERT_TRUE(!config.load_json(tmpdir / "missing.json"), "missing file should fail");
        PASS();
    }
    {
        TEST(save_then_load);
        auto config = AppConfig::example();
        ASSERT_TRUE(config.save_json(tmpdir / "sub" / "saved.json"), "should save");
        ASSERT_TRUE(!fs::exists(tmpdir / "sub" / "saved.json.tmp"), "tmp file removed");
        AppConfig loaded;
        ASSERT_TRUE(loaded.load_json(tmpdir / "sub" / "saved.json"), "should reload");
        ASSERT_EQ(loaded.providers.size(), config.providers.size(), "provider count");
        ASSERT_TRUE(loaded.find_provider("oss") != nullptr, "oss entry");
        ASSERT_TRUE(!loaded.find_provider("oss")->enabled, "example providers start disabled");
        PASS();
    }
    {
        TEST(global_validation);
        AppConfig config;
        ASSERT_EMPTY(config.validate(), "defaults valid");
        config.max_concurrent_transfers = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero width");
        config.max_concurrent_transfers = 2;
        config.retry_count = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero attempts");
        config.retry_count = 1;
        config.backoff_initial_ms = 1000;
        config.backoff_ceiling_ms = 10;
        ASSERT_NOT_EMPTY(config.validate(), "ceiling below initial");
        config.backoff_ceiling_ms = 1000;
        config.timeout_secs = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero timeout");
        PASS();
    }
    {
        TEST(duplicate_provider_names_rejected);
        AppConfig config;
        ProviderConfig a;
        a.name = "x";
        a.type = "local";
        config.providers = {a, a};
        ASSERT_TRUE(config.validate().find("x") != std::string::npos, "names the duplicate");
        PASS();
    }
    {
        TEST(env_overrides_fill_missing_only);
        setenv("GITHUB_TOKEN", "from-env", 1);
        setenv("COS_SECRET_ID", "cos-env", 1);
        AppConfig config;
        ProviderConfig gh;
        gh.name = "github";
        ProviderConfig gh2;
        gh2.name = "work";
        gh2.type = "github";
        gh2.params["token"] = "explicit";
        ProviderConfig cos;
        cos.name = "cos";
        config.providers = {gh, gh2, cos};
        config.apply_env_overrides();
        unsetenv("GITHUB_TOKEN");
        unsetenv("COS_SECRET_ID");
        ASSERT_EQ(config.providers[0].params["token"], std::string("from-env"), "filled");
        ASSERT_EQ(config.providers[1].params["token"], std::string("explicit"), "kept");
        ASSERT_EQ(config.providers[2].params["secret_id"], std::string("cos-env"), "cos filled");
        PASS();
    }
    {
        TEST(defaults_resolve_directories);
        setenv("XDG_DATA_HOME", tmpdir.c_str(), 1);
        AppConfig config;
        config.apply_defaults();
        unsetenv("XDG_DATA_HOME");
        ASSERT_EQ(config.output_dir.string(), std::string(constants::DEFAULT_OUTPUT_DIR), "output dir");
        ASSERT_EQ(config.state_dir, tmpdir / "hib", "state dir under XDG_DATA_HOME");
        ASSERT_EQ(config.manifest_path(), tmpdir / "hib" / "manifest.db", "manifest path");
        PASS();
    }
    {
        TEST(secret_masking);
        ASSERT_TRUE(is_secret_param("access_key_secret"), "secret");
        ASSERT_TRUE(is_secret_param("api_token"), "token");
        ASSERT_TRUE(!is_secret_param("bucket"), "bucket is not secret");
        ASSERT_EQ(mask_secret("short"), std::string("****"), "short fully masked");
        ASSERT_EQ(mask_secret("ghp_abcdefghijkl"), std::string("ghp_****"), "long keeps prefix");
        ASSERT_EQ(mask_secret(""), std::string(""), "empty stays empty");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. Provider registry
// ---------------------------------------------------------------------------

static void test_registry() {
    std::cout << "\n=== Provider registry ===" << std::endl;

    {
        TEST(every_kind_registered);
        auto registry = provider_registry();
        ASSERT_EQ(registry.size(), 6u, "six kinds");
        for (const auto& reg : registry) {
            ASSERT_TRUE(find_registration(reg.kind) == &reg, "lookup by kind");
            auto kind = provider_kind_from_name(reg.type_name);
            ASSERT_TRUE(kind && *kind == reg.kind, "lookup by name");
        }
        PASS();
    }
    {
        TEST(names_resolve_case_insensitively);
        ASSERT_TRUE(provider_kind_from_name("GitHub") == ProviderKind::GitHub, "GitHub");
        ASSERT_TRUE(provider_kind_from_name("sms") == ProviderKind::SMMS, "sms alias");
        ASSERT_TRUE(!provider_kind_from_name("ftp"), "unknown");
        PASS();
    }
    {
        TEST(unknown_type_fails_validation_and_creation);
        ProviderConfig pc;
        pc.name = "x";
        pc.type = "ftp";
        ASSERT_TRUE(pc.validate().find("unknown") != std::string::npos, "should say unknown");
        bool threw = false;
        try {
            ProviderFactory::create(pc, nullptr);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "create should throw");
        PASS();
    }
    {
        TEST(required_params_per_kind);
        ProviderConfig oss;
        oss.name = "oss";
        ASSERT_TRUE(oss.validate().find("bucket") != std::string::npos, "oss needs bucket");
        oss.params = {{"bucket", "b"}, {"access_key_id", "id"}, {"access_key_secret", "s"}};
        ASSERT_NOT_EMPTY(oss.validate(), "oss needs endpoint or region");
        oss.params["region"] = "cn-hangzhou";
        ASSERT_EMPTY(oss.validate(), "oss complete");

        ProviderConfig cos;
        cos.name = "cos";
        cos.params = {{"bucket", "b-125"}, {"secret_id", "id"}, {"secret_key", "k"}};
        ASSERT_TRUE(cos.validate().find("region") != std::string::npos, "cos needs region");

        ProviderConfig gh;
        gh.name = "github";
        gh.params = {{"token", "t"}, {"owner", "o"}};
        ASSERT_TRUE(gh.validate().find("repo") != std::string::npos, "github needs repo");

        ProviderConfig imgur;
        imgur.name = "imgur";
        ASSERT_TRUE(imgur.validate().find("client_id") != std::string::npos, "imgur needs client_id");

        ProviderConfig smms;
        smms.name = "smms";
        ASSERT_TRUE(smms.validate().find("api_token") != std::string::npos, "smms needs api_token");

        ProviderConfig local;
        local.name = "nas";
        local.type = "local";
        local.params["path"] = "/nonexistent/path/abc123";
        ASSERT_TRUE(local.validate().find("does not exist") != std::string::npos, "local path must exist");
        local.params["path"] = "/tmp";
        ASSERT_EMPTY(local.validate(), "local with existing path");
        PASS();
    }
    {
        TEST(capability_rendering);
        CapabilitySet caps{Capability::List, Capability::Push};
        ASSERT_TRUE(caps.has(Capability::List), "has list");
        ASSERT_TRUE(!caps.has(Capability::Fetch), "no fetch");
        ASSERT_TRUE(!caps.has_all({Capability::List, Capability::Fetch}), "not list+fetch");
        ASSERT_EQ(caps.to_string(), std::string("list,push"), "rendering");
        PASS();
    }
    {
        TEST(unsupported_operation_default);
        FakeProvider base("bare", {});
        Provider& p = base;
        auto del = p.Provider::remove("k");
        ASSERT_TRUE(!del.success, "should fail");
        ASSERT_TRUE(del.error.kind == ErrorKind::CapabilityUnsupported, "CapabilityUnsupported");
        PASS();
    }
    {
        TEST(image_keys);
        ASSERT_TRUE(is_image_key("a/b/c.PNG"), "uppercase ext");
        ASSERT_TRUE(is_image_key("x.webp"), "webp");
        ASSERT_TRUE(!is_image_key("notes.txt"), "txt");
        ASSERT_TRUE(!is_image_key("png"), "bare name");
        ASSERT_EQ(image_content_type("a.jpg"), std::string("image/jpeg"), "jpeg mime");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. HTTP classification and backoff
// ---------------------------------------------------------------------------

static void test_classification() {
    std::cout << "\n=== HTTP classification ===" << std::endl;

    auto status = [](long code) {
        net::HttpResponse r;
        r.status_code = code;
        return net::classify_response(r).kind;
    };

    {
        TEST(status_codes_map_to_kinds);
        ASSERT_TRUE(status(200) == ErrorKind::None, "200");
        ASSERT_TRUE(status(401) == ErrorKind::AuthFailed, "401");
        ASSERT_TRUE(status(403) == ErrorKind::AuthFailed, "403");
        ASSERT_TRUE(status(404) == ErrorKind::NotFound, "404");
        ASSERT_TRUE(status(410) == ErrorKind::NotFound, "410");
        ASSERT_TRUE(status(429) == ErrorKind::RateLimited, "429");
        ASSERT_TRUE(status(408) == ErrorKind::Transient, "408");
        ASSERT_TRUE(status(503) == ErrorKind::Transient, "503");
        ASSERT_TRUE(status(400) == ErrorKind::Rejected, "400");
        ASSERT_TRUE(status(422) == ErrorKind::Rejected, "422");
        PASS();
    }
    {
        TEST(network_error_is_transient);
        net::HttpResponse r;
        r.is_network_error = true;
        r.timed_out = true;
        r.error = "Operation timed out";
        auto err = net::classify_response(r);
        ASSERT_TRUE(err.kind == ErrorKind::Transient, "transient");
        ASSERT_TRUE(err.message.find("timed out") != std::string::npos, "message kept");
        PASS();
    }
    {
        TEST(retry_after_honored);
        net::HttpResponse r;
        r.status_code = 429;
        r.headers.set("Retry-After", "3");
        auto err = net::classify_response(r);
        ASSERT_EQ(err.retry_after.count(), 3000, "3s hint");
        r.headers.set("Retry-After", "Wed, 21 Oct 2015 07:28:00 GMT");
        ASSERT_EQ(net::classify_response(r).retry_after.count(), 0, "date form ignored");
        PASS();
    }
    {
        TEST(encoding_helpers);
        ASSERT_EQ(net::url_encode("a b/c~"), std::string("a%20b%2Fc~"), "component");
        ASSERT_EQ(net::url_encode_path("dir/a b.png"), std::string("dir/a%20b.png"), "path keeps slash");
        std::string hello = "hello";
        ASSERT_EQ(net::base64_encode(std::vector<uint8_t>(hello.begin(), hello.end())),
                  std::string("aGVsbG8="), "base64 padded");
        ASSERT_EMPTY(net::base64_encode({}), "empty input");
        PASS();
    }
    {
        TEST(sigv4_sign_sets_headers);
        net::AwsSigV4Signer signer("AKID", "secret", "oss-cn-hangzhou");
        auto req = net::HttpRequest::get("https://bucket.example.com:8443/a%20b.png?b=2&a");
        ASSERT_TRUE(signer.sign(req), "signed");
        ASSERT_EQ(req.headers.get("host").value_or(""), std::string("bucket.example.com:8443"), "host with port");
        auto auth = req.headers.get("Authorization").value_or("");
        ASSERT_TRUE(auth.rfind("AWS4-HMAC-SHA256 Credential=AKID/", 0) == 0, "credential scope");
        ASSERT_TRUE(auth.find("SignedHeaders=host;x-amz-content-sha256;x-amz-date,") != std::string::npos,
                    "signed header list");
        ASSERT_EQ(auth.size() - auth.find("Signature=") - 10, 64u, "hex signature");

        auto bad = net::HttpRequest::get("not a url");
        ASSERT_TRUE(!signer.sign(bad), "unparseable url refused");
        PASS();
    }
    {
        TEST(backoff_doubles_and_caps);
        SchedulerOptions opts;
        opts.backoff_initial = std::chrono::milliseconds(100);
        opts.backoff_ceiling = std::chrono::milliseconds(1000);
        using ms = std::chrono::milliseconds;
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 1, ms(0)).count(), 100, "attempt 1");
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 2, ms(0)).count(), 200, "attempt 2");
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 3, ms(0)).count(), 400, "attempt 3");
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 10, ms(0)).count(), 1000, "capped");
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 1, ms(700)).count(), 700, "hint raises delay");
        ASSERT_EQ(TransferScheduler::backoff_delay(opts, 1, ms(5000)).count(), 1000, "hint still capped");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Manifest store
// ---------------------------------------------------------------------------

static LocalRecord make_record(const std::string& provider, const std::string& key,
                               const fs::path& path, const std::string& fingerprint) {
    LocalRecord rec;
    rec.provider = provider;
    rec.remote_key = key;
    rec.local_path = path;
    rec.fingerprint = fingerprint;
    rec.size = 10;
    rec.last_success = now_epoch();
    rec.updated_at = now_epoch();
    rec.outcome = Outcome::Success;
    return rec;
}

static void test_manifest() {
    std::cout << "\n=== Manifest store ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-manifest");

    {
        TEST(next_seq_uses_index);
        auto db = tmpdir / "idx" / "manifest.db";
        {
            ManifestStore store(db);
            ASSERT_EMPTY(store.record(make_record("p", "a.png", tmpdir / "a.png", "fa")), "record");
        }
        sqlite3* raw = nullptr;
        ASSERT_TRUE(sqlite3_open_v2(db.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr) == SQLITE_OK, "open");
        std::unique_ptr<sqlite3, decltype(&sqlite3_close)> conn(raw, &sqlite3_close);
        sqlite3_stmt* stmt = nullptr;
        ASSERT_TRUE(sqlite3_prepare_v2(conn.get(), "EXPLAIN QUERY PLAN SELECT MAX(seq) FROM records",
                                       -1, &stmt, nullptr) == SQLITE_OK, "prepare");
        std::string plan;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            plan += reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
            plan += "\n";
        }
        sqlite3_finalize(stmt);
        ASSERT_TRUE(plan.find("idx_seq") != std::string::npos, "max(seq) served by index: " + plan);
        PASS();
    }

    {
        TEST(record_and_lookup);
        ManifestStore store(tmpdir / "m1" / "manifest.db");
        ASSERT_TRUE(!store.lookup("p", "k"), "empty store");
        auto rec = make_record("p", "k", tmpdir / "k.png", "abc");
        rec.retry_count = 2;
        ASSERT_EMPTY(store.record(rec), "record");
        auto got = store.lookup("p", "k");
        ASSERT_TRUE(got.has_value(), "found");
        ASSERT_EQ(got->fingerprint, std::string("abc"), "fingerprint");
        ASSERT_EQ(got->retry_count, 2u, "retry_count");
        ASSERT_TRUE(got->outcome == Outcome::Success, "outcome");

        rec.outcome = Outcome::Failed;
        rec.error_kind = ErrorKind::NotFound;
        rec.message = "gone";
        ASSERT_EMPTY(store.record(rec), "upsert");
        got = store.lookup("p", "k");
        ASSERT_TRUE(got->outcome == Outcome::Failed, "last write wins");
        ASSERT_TRUE(got->error_kind == ErrorKind::NotFound, "error kind");
        ASSERT_EQ(store.all_records().size(), 1u, "one row per key");
        PASS();
    }
    {
        TEST(records_survive_reopen);
        {
            ManifestStore store(tmpdir / "m2.db");
            ASSERT_EMPTY(store.record(make_record("p", "a", tmpdir / "a", "f1")), "record");
        }
        ManifestStore reopened(tmpdir / "m2.db");
        ASSERT_TRUE(reopened.lookup("p", "a").has_value(), "persisted");
        PASS();
    }
    {
        TEST(history_newest_first);
        ManifestStore store(tmpdir / "m3.db");
        for (int i = 0; i < 5; ++i) {
            auto rec = make_record(i % 2 ? "odd" : "even", "k" + std::to_string(i), tmpdir / "x", "");
            ASSERT_EMPTY(store.record(rec), "record");
        }
        auto all = store.history(std::nullopt, 0);
        ASSERT_EQ(all.size(), 5u, "all records");
        ASSERT_EQ(all.front().remote_key, std::string("k4"), "newest first");
        auto limited = store.history(std::nullopt, 2);
        ASSERT_EQ(limited.size(), 2u, "limit");
        auto odd = store.history(std::string("odd"), 0);
        ASSERT_EQ(odd.size(), 2u, "provider filter");
        PASS();
    }
    {
        TEST(duplicates_grouped_exactly);
        ManifestStore store(tmpdir / "m4.db");
        ASSERT_EMPTY(store.record(make_record("a", "1", tmpdir / "1", "same")), "r1");
        ASSERT_EMPTY(store.record(make_record("b", "2", tmpdir / "2", "same")), "r2");
        ASSERT_EMPTY(store.record(make_record("a", "3", tmpdir / "3", "other")), "r3");
        ASSERT_EMPTY(store.record(make_record("a", "4", tmpdir / "4", "")), "r4");
        ASSERT_EMPTY(store.record(make_record("c", "5", tmpdir / "5", "")), "r5");
        auto groups = store.find_duplicates();
        ASSERT_EQ(groups.size(), 1u, "one group");
        ASSERT_EQ(groups[0].size(), 2u, "two members");
        for (const auto& r : groups[0]) {
            ASSERT_EQ(r.fingerprint, std::string("same"), "group fingerprint");
        }
        PASS();
    }
    {
        TEST(cleanup_removes_only_orphans);
        ManifestStore store(tmpdir / "m5.db");
        write_file(tmpdir / "present.png", "data");
        ASSERT_EMPTY(store.record(make_record("a", "present", tmpdir / "present.png", "f")), "r1");
        ASSERT_EMPTY(store.record(make_record("a", "gone", tmpdir / "gone.png", "g")), "r2");
        ASSERT_EMPTY(store.record(make_record("b", "gone", tmpdir / "gone2.png", "h")), "r3");

        auto dry = store.cleanup([](const LocalRecord&) { return true; }, true);
        ASSERT_EQ(dry.size(), 2u, "dry run reports orphans");
        ASSERT_EQ(store.all_records().size(), 3u, "dry run keeps rows");

        auto removed = store.cleanup([](const LocalRecord& r) { return r.provider == "a"; });
        ASSERT_EQ(removed.size(), 1u, "predicate restricts");
        ASSERT_TRUE(!store.lookup("a", "gone"), "orphan removed");
        ASSERT_TRUE(store.lookup("a", "present").has_value(), "existing file kept");
        ASSERT_TRUE(store.lookup("b", "gone").has_value(), "other provider kept");
        PASS();
    }
    {
        TEST(stats_from_operations);
        ManifestStore store(tmpdir / "m6.db");
        ASSERT_EMPTY(store.record(make_record("a", "1", tmpdir / "1", "f")), "r1");
        auto failed = make_record("a", "2", tmpdir / "2", "");
        failed.outcome = Outcome::Failed;
        failed.error_kind = ErrorKind::Transient;
        ASSERT_EMPTY(store.record(failed), "r2");
        ASSERT_EMPTY(store.record_skip("a", "1", Direction::Backup, 10), "skip");
        auto up = make_record("b", "3", tmpdir / "3", "g");
        up.direction = Direction::Upload;
        ASSERT_EMPTY(store.record(up), "r3");

        auto st = store.stats();
        ASSERT_EQ(st.records, 3u, "records");
        ASSERT_EQ(st.providers, 2u, "providers");
        ASSERT_EQ(st.operations, 4u, "operations");
        ASSERT_EQ(st.backups.success, 1u, "backup success");
        ASSERT_EQ(st.backups.failed, 1u, "backup failed");
        ASSERT_EQ(st.backups.skipped, 1u, "backup skipped");
        ASSERT_EQ(st.backups.bytes, 10u, "backup bytes");
        ASSERT_EQ(st.uploads.success, 1u, "upload success");
        ASSERT_TRUE(st.last_operation > 0, "last operation");
        ASSERT_TRUE(store.lookup("a", "1")->outcome == Outcome::Success, "skip leaves record");
        PASS();
    }
    {
        TEST(corrupt_database_raises);
        std::string garbage;
        for (int i = 0; i < 256; ++i) garbage += "this is not a database ";
        write_file(tmpdir / "corrupt.db", garbage);
        bool threw = false;
        try {
            ManifestStore store(tmpdir / "corrupt.db");
        } catch (const ManifestError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "ManifestError expected");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Transfer scheduler
// ---------------------------------------------------------------------------

static void test_scheduler() {
    std::cout << "\n=== Transfer scheduler ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-sched");
    ManifestStore store(tmpdir / "manifest.db");
    CancellationToken cancel;

    SchedulerOptions opts;
    opts.width = 4;
    opts.max_attempts = 3;
    opts.backoff_initial = std::chrono::milliseconds(1);
    opts.backoff_ceiling = std::chrono::milliseconds(5);

    {
        TEST(transient_below_budget_succeeds);
        FakeProvider fake("t1");
        fake.add_object("a.png", "AAA");
        fake.script("a.png", {make_error(ErrorKind::Transient), make_error(ErrorKind::Transient)});
        TransferScheduler sched(opts, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t1", {"a.png"}), fake, cancel);
        ASSERT_EQ(results.size(), 1u, "one result");
        ASSERT_TRUE(results[0].state == TaskState::Success, "success");
        ASSERT_EQ(results[0].attempts, 3u, "three attempts");
        ASSERT_EQ(read_file(tmpdir / "t1" / "a.png"), std::string("AAA"), "content written");
        auto rec = store.lookup("t1", "a.png");
        ASSERT_TRUE(rec && rec->outcome == Outcome::Success, "recorded success");
        ASSERT_EQ(rec->retry_count, 2u, "retry count");
        ASSERT_EQ(rec->size, 3u, "size");
        PASS();
    }
    {
        TEST(transient_above_budget_fails_with_last_kind);
        FakeProvider fake("t2");
        fake.add_object("a.png", "AAA");
        fake.script("a.png", {make_error(ErrorKind::RateLimited), make_error(ErrorKind::Transient),
                              make_error(ErrorKind::Transient, "last"), make_error(ErrorKind::Transient)});
        TransferScheduler sched(opts, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t2", {"a.png"}), fake, cancel);
        ASSERT_TRUE(results[0].state == TaskState::Failed, "failed");
        ASSERT_EQ(fake.calls("a.png"), 3, "exactly R attempts");
        auto rec = store.lookup("t2", "a.png");
        ASSERT_TRUE(rec && rec->outcome == Outcome::Failed, "recorded failure");
        ASSERT_TRUE(rec->error_kind == ErrorKind::Transient, "last error kind");
        ASSERT_EQ(rec->message, std::string("last"), "last message");
        ASSERT_TRUE(!fs::exists(tmpdir / "t2" / "a.png"), "nothing written");
        PASS();
    }
    {
        TEST(rate_limited_twice_then_success);
        FakeProvider fake("t3");
        fake.add_object("d.png", "DDDD");
        fake.script("d.png", {make_error(ErrorKind::RateLimited), make_error(ErrorKind::RateLimited)});
        TransferScheduler sched(opts, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t3", {"d.png"}), fake, cancel);
        ASSERT_TRUE(results[0].state == TaskState::Success, "success");
        auto rec = store.lookup("t3", "d.png");
        ASSERT_TRUE(rec && rec->outcome == Outcome::Success, "recorded success");
        ASSERT_EQ(rec->retry_count, 2u, "retry_count 2");
        PASS();
    }
    {
        TEST(not_found_is_not_retried);
        FakeProvider fake("t4");
        fake.script("e.png", {make_error(ErrorKind::NotFound)});
        TransferScheduler sched(opts, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t4", {"e.png"}), fake, cancel);
        ASSERT_TRUE(results[0].state == TaskState::Failed, "failed");
        ASSERT_EQ(results[0].attempts, 1u, "single attempt");
        ASSERT_EQ(fake.calls("e.png"), 1, "provider called once");
        auto rec = store.lookup("t4", "e.png");
        ASSERT_TRUE(rec && rec->error_kind == ErrorKind::NotFound, "NotFound recorded");
        ASSERT_EQ(rec->retry_count, 0u, "no retries");
        PASS();
    }
    {
        TEST(failure_does_not_abort_siblings);
        FakeProvider fake("t5");
        fake.add_object("ok1.png", "1");
        fake.add_object("ok2.png", "2");
        fake.script("bad.png", {make_error(ErrorKind::AuthFailed)});
        TransferScheduler sched(opts, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t5", {"ok1.png", "bad.png", "ok2.png"}),
                                 fake, cancel);
        ASSERT_EQ(results.size(), 3u, "all results");
        ASSERT_EQ(results[1].task.object.key, std::string("bad.png"), "ordered by index");
        ASSERT_TRUE(results[0].state == TaskState::Success, "first ok");
        ASSERT_TRUE(results[1].state == TaskState::Failed, "middle failed");
        ASSERT_TRUE(results[2].state == TaskState::Success, "last ok");
        PASS();
    }
    {
        TEST(attempt_over_timeout_is_transient);
        FakeProvider fake("t6");
        fake.add_object("slow.png", "S");
        fake.set_delay(std::chrono::milliseconds(120));
        auto slow = opts;
        slow.max_attempts = 1;
        slow.task_timeout = std::chrono::milliseconds(30);
        TransferScheduler sched(slow, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t6", {"slow.png"}), fake, cancel);
        ASSERT_TRUE(results[0].state == TaskState::Failed, "failed");
        ASSERT_TRUE(results[0].error.kind == ErrorKind::Transient, "timeout is transient");
        PASS();
    }
    {
        TEST(in_flight_never_exceeds_width);
        FakeProvider fake("t7");
        std::vector<std::string> keys;
        for (int i = 0; i < 12; ++i) {
            keys.push_back("img" + std::to_string(i) + ".png");
            fake.add_object(keys.back(), std::string(64, 'a' + i));
        }
        fake.set_delay(std::chrono::milliseconds(30));
        auto narrow = opts;
        narrow.width = 3;
        TransferScheduler sched(narrow, store);
        auto results = sched.run(backup_tasks(fake, tmpdir / "t7", keys), fake, cancel);
        ASSERT_EQ(results.size(), 12u, "all ran");
        ASSERT_TRUE(sched.peak_in_flight() <= 3, "scheduler peak bounded by W");
        ASSERT_TRUE(fake.peak() <= 3, "provider saw at most W concurrent calls");
        ASSERT_EQ(sched.in_flight(), 0u, "drained");
        PASS();
    }
    {
        TEST(task_exception_surfaces_from_run);
        struct ProviderCrash {};
        FakeProvider fake("t7x");
        std::vector<std::string> keys = {"x1.png", "x2.png", "x3.png", "x4.png"};
        for (const auto& k : keys) fake.add_object(k, "X");
        fake.on_fetch([](const std::string& key) {
            if (key == "x2.png") throw ProviderCrash{};
        });
        auto one = opts;
        one.width = 1;
        TransferScheduler sched(one, store);
        bool thrown = false;
        try {
            sched.run(backup_tasks(fake, tmpdir / "t7x", keys), fake, cancel);
        } catch (const ProviderCrash&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "rethrown on the calling thread");
        ASSERT_EQ(fake.calls("x3.png"), 0, "dispatch stopped");
        ASSERT_EQ(sched.in_flight(), 0u, "drained");
        PASS();
    }
    {
        TEST(upload_task_records_fingerprint);
        FakeProvider fake("t8");
        write_file(tmpdir / "src" / "u.png", "UPLOAD");
        TransferTask task;
        task.provider = "t8";
        task.direction = Direction::Upload;
        task.source = tmpdir / "src" / "u.png";
        task.object.key = "remote/u.png";
        TransferScheduler sched(opts, store);
        auto results = sched.run({task}, fake, cancel);
        ASSERT_TRUE(results[0].state == TaskState::Success, "success");
        ASSERT_EQ(fake.pushed()["remote/u.png"], std::string("UPLOAD"), "pushed content");
        auto rec = store.lookup("t8", "remote/u.png");
        ASSERT_TRUE(rec && rec->direction == Direction::Upload, "upload record");
        ASSERT_EQ(rec->fingerprint, fingerprint_file(task.source)->digest, "source fingerprint");
        ASSERT_EQ(rec->message, std::string("fake://t8/remote/u.png"), "url kept");
        PASS();
    }
    {
        TEST(unreadable_upload_source_is_local_io_error);
        FakeProvider fake("t9");
        TransferTask task;
        task.provider = "t9";
        task.direction = Direction::Upload;
        task.source = tmpdir / "src" / "missing.png";
        task.object.key = "missing.png";
        TransferScheduler sched(opts, store);
        auto results = sched.run({task}, fake, cancel);
        ASSERT_TRUE(results[0].error.kind == ErrorKind::LocalIOError, "LocalIOError");
        ASSERT_EQ(results[0].attempts, 1u, "not retried");
        ASSERT_EQ(fake.total_calls(), 0, "provider never called");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. Orchestrator
// ---------------------------------------------------------------------------

static void test_orchestrator() {
    std::cout << "\n=== Orchestrator ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-orch");
    CancellationToken cancel;

    {
        TEST(scenario_skip_one_transfer_two);
        auto config = test_config(tmpdir / "abc");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("abc");
        auto hour_ago = std::chrono::system_clock::now() - std::chrono::hours(1);
        fake.add_object("a.png", "A");
        fake.add_object("b.png", "B", hour_ago);
        fake.add_object("c.png", "C-new", std::chrono::system_clock::now() + std::chrono::minutes(1));

        // b.png was backed up after its last remote change, file still on disk
        auto existing = config.output_dir / "abc" / "b.png";
        write_file(existing, "B");
        auto rec = make_record("abc", "b.png", existing, fingerprint_file(existing)->digest);
        ASSERT_EMPTY(store.record(rec), "seed b");

        // c.png was backed up, but the remote copy changed since
        auto stale = config.output_dir / "abc" / "c.png";
        write_file(stale, "C-old");
        auto stale_rec = make_record("abc", "c.png", stale, fingerprint_file(stale)->digest);
        stale_rec.last_success = now_epoch() - 7200;
        ASSERT_EMPTY(store.record(stale_rec), "seed c");

        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup(fake, {}, cancel);
        ASSERT_EQ(summary.listed, 3u, "listed");
        ASSERT_EQ(summary.attempted, 2u, "attempted");
        ASSERT_EQ(summary.skipped, 1u, "skipped");
        ASSERT_EQ(summary.succeeded, 2u, "succeeded");
        ASSERT_EQ(summary.failed, 0u, "failed");
        ASSERT_EQ(fake.calls("b.png"), 0, "skipped key never fetched");
        ASSERT_EQ(fake.calls("c.png"), 1, "stale key fetched");
        ASSERT_EQ(read_file(config.output_dir / "abc" / "a.png"), std::string("A"), "a written");
        ASSERT_EQ(read_file(stale), std::string("C-new"), "c refreshed in place");

        auto c_now = store.lookup("abc", "c.png");
        ASSERT_TRUE(c_now.has_value(), "c record");
        ASSERT_EQ(c_now->local_path, stale, "c keeps its path");
        ASSERT_EQ(c_now->fingerprint, fingerprint_file(stale)->digest, "c fingerprint updated");
        ASSERT_TRUE(c_now->fingerprint != stale_rec.fingerprint, "c fingerprint changed");
        ASSERT_TRUE(summary.ok(), "summary ok");
        PASS();
    }
    {
        TEST(colliding_keys_keep_their_files_across_runs);
        auto config = test_config(tmpdir / "collide");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("p");
        auto hour_ago = std::chrono::system_clock::now() - std::chrono::hours(1);
        fake.add_object("a:b.png", "colon", hour_ago);
        fake.add_object("a_b.png", "underscore-v1", hour_ago);

        Orchestrator orch(config, store, nullptr);
        auto first = orch.backup(fake, {}, cancel);
        ASSERT_EQ(first.succeeded, 2u, "first run");
        auto colon = store.lookup("p", "a:b.png");
        auto under = store.lookup("p", "a_b.png");
        ASSERT_TRUE(colon && under, "both recorded");
        ASSERT_TRUE(colon->local_path != under->local_path, "distinct files");

        // only a_b.png changes remotely
        fake.add_object("a_b.png", "underscore-v2",
                        std::chrono::system_clock::now() + std::chrono::minutes(1));
        auto second = orch.backup(fake, {}, cancel);
        ASSERT_EQ(second.attempted, 1u, "one refetch");
        ASSERT_EQ(second.skipped, 1u, "one skip");
        ASSERT_EQ(store.lookup("p", "a_b.png")->local_path, under->local_path, "refetch reuses its path");
        ASSERT_EQ(read_file(colon->local_path), std::string("colon"), "other key untouched");
        ASSERT_EQ(read_file(under->local_path), std::string("underscore-v2"), "refetched content");

        auto report = orch.verify();
        ASSERT_EQ(report.checked, 2u, "both checked");
        ASSERT_TRUE(report.clean(), "fingerprints match files");
        PASS();
    }
    {
        TEST(rerun_transfers_nothing);
        auto config = test_config(tmpdir / "rerun");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("rerun");
        for (int i = 0; i < 5; ++i) fake.add_object("p" + std::to_string(i) + ".jpg", "data" + std::to_string(i));

        Orchestrator orch(config, store, nullptr);
        auto first = orch.backup(fake, {}, cancel);
        ASSERT_EQ(first.succeeded, 5u, "first run");
        auto before = store.all_records();

        auto second = orch.backup(fake, {}, cancel);
        ASSERT_EQ(second.attempted, 0u, "no transfers");
        ASSERT_EQ(second.skipped, 5u, "all skipped");
        ASSERT_EQ(fake.total_calls(), 5, "no new fetches");
        auto after = store.all_records();
        ASSERT_EQ(after.size(), before.size(), "same records");
        for (size_t i = 0; i < after.size(); ++i) {
            ASSERT_EQ(after[i].fingerprint, before[i].fingerprint, "fingerprint unchanged");
            ASSERT_EQ(after[i].local_path, before[i].local_path, "path unchanged");
        }

        BackupOptions force;
        force.skip_existing = false;
        auto third = orch.backup(fake, force, cancel);
        ASSERT_EQ(third.attempted, 5u, "skip disabled transfers everything");
        PASS();
    }
    {
        TEST(modified_remote_is_refetched);
        auto past = make_record("p", "k.png", "/tmp", "f");
        past.last_success = now_epoch() - 3600;
        RemoteObject obj;
        obj.key = "k.png";
        ASSERT_TRUE(should_skip_backup(past, obj), "no mtime: skip");
        obj.last_modified = std::chrono::system_clock::now();
        ASSERT_TRUE(!should_skip_backup(past, obj), "newer remote: transfer");
        obj.last_modified = std::chrono::system_clock::now() - std::chrono::hours(2);
        ASSERT_TRUE(should_skip_backup(past, obj), "older remote: skip");
        past.outcome = Outcome::Failed;
        ASSERT_TRUE(!should_skip_backup(past, obj), "failed record: transfer");
        past.outcome = Outcome::Success;
        past.local_path = "/nonexistent/abc123.png";
        ASSERT_TRUE(!should_skip_backup(past, obj), "missing file: transfer");
        ASSERT_TRUE(!should_skip_backup(std::nullopt, obj), "no record: transfer");
        PASS();
    }
    {
        TEST(limit_truncates_mid_page);
        auto config = test_config(tmpdir / "limit");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("limit");
        for (int i = 0; i < 7; ++i) fake.add_object("k" + std::to_string(i) + ".png", "x");
        fake.set_page_size(2);

        Orchestrator orch(config, store, nullptr);
        BackupOptions opts;
        opts.limit = 3;
        auto summary = orch.backup(fake, opts, cancel);
        ASSERT_EQ(summary.listed, 3u, "listed up to limit");
        ASSERT_EQ(summary.attempted, 3u, "attempted");
        ASSERT_EQ(fake.list_calls(), 2, "stopped paging");
        ASSERT_EQ(fake.calls("k3.png"), 0, "beyond limit untouched");
        PASS();
    }
    {
        TEST(prefix_passed_to_listing);
        auto config = test_config(tmpdir / "prefix");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("prefix");
        fake.add_object("2024/a.png", "a");
        fake.add_object("2025/b.png", "b");
        Orchestrator orch(config, store, nullptr);
        BackupOptions opts;
        opts.prefix = "2025/";
        auto summary = orch.backup(fake, opts, cancel);
        ASSERT_EQ(summary.succeeded, 1u, "one under prefix");
        ASSERT_TRUE(fs::exists(config.output_dir / "prefix" / "2025" / "b.png"), "nested layout");
        PASS();
    }
    {
        TEST(missing_capability_aborts_before_work);
        auto config = test_config(tmpdir / "caps");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("caps", {Capability::Push, Capability::Describe});
        fake.add_object("a.png", "a");
        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup(fake, {}, cancel);
        ASSERT_EQ(summary.aborted.size(), 1u, "aborted");
        ASSERT_TRUE(summary.aborted[0].kind == ErrorKind::CapabilityUnsupported, "kind");
        ASSERT_EQ(fake.list_calls(), 0, "never listed");
        ASSERT_EQ(fake.total_calls(), 0, "never fetched");
        ASSERT_TRUE(!summary.ok(), "not ok");
        PASS();
    }
    {
        TEST(listing_failure_aborts_segment);
        auto config = test_config(tmpdir / "listfail");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("listfail");
        fake.fail_listing(make_error(ErrorKind::AuthFailed, "bad token"));
        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup(fake, {}, cancel);
        ASSERT_EQ(summary.aborted.size(), 1u, "aborted");
        ASSERT_TRUE(summary.aborted[0].kind == ErrorKind::AuthFailed, "kind propagated");
        ASSERT_EQ(summary.attempted, 0u, "nothing attempted");
        PASS();
    }
    {
        TEST(state_sequence_reaches_done_once);
        auto config = test_config(tmpdir / "states");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("states");
        for (int i = 0; i < 5; ++i) fake.add_object("s" + std::to_string(i) + ".png", "s");
        fake.set_page_size(2);
        Orchestrator orch(config, store, nullptr);
        std::mutex mu;
        std::vector<OrchestratorState> seen;
        orch.set_observer([&](const std::string&, OrchestratorState s) {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back(s);
        });
        orch.backup(fake, {}, cancel);
        ASSERT_TRUE(!seen.empty(), "states observed");
        ASSERT_TRUE(seen.front() == OrchestratorState::Idle, "starts idle");
        ASSERT_TRUE(seen.back() == OrchestratorState::Done, "ends done");
        ASSERT_EQ(std::count(seen.begin(), seen.end(), OrchestratorState::Done), 1, "done once");
        ASSERT_EQ(std::count(seen.begin(), seen.end(), OrchestratorState::Listing), 3, "one listing per page");
        ASSERT_EQ(std::count(seen.begin(), seen.end(), OrchestratorState::Draining), 1, "drained once");
        PASS();
    }
    {
        TEST(cancel_before_run_dispatches_nothing);
        auto config = test_config(tmpdir / "cancel1");
        ManifestStore store(config.manifest_path());
        FakeProvider fake("cancel1");
        fake.add_object("a.png", "a");
        CancellationToken cancelled;
        cancelled.cancel();
        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup(fake, {}, cancelled);
        ASSERT_TRUE(summary.cancelled, "cancelled flag");
        ASSERT_EQ(summary.attempted, 0u, "nothing attempted");
        ASSERT_EQ(fake.total_calls(), 0, "no fetches");
        PASS();
    }
    {
        TEST(cancel_mid_run_finishes_in_flight);
        auto config = test_config(tmpdir / "cancel2");
        config.max_concurrent_transfers = 1;
        ManifestStore store(config.manifest_path());
        FakeProvider fake("cancel2");
        for (int i = 0; i < 5; ++i) fake.add_object("c" + std::to_string(i) + ".png", "c");
        CancellationToken token;
        fake.on_fetch([&token](const std::string&) { token.cancel(); });
        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup(fake, {}, token);
        ASSERT_TRUE(summary.cancelled, "cancelled");
        ASSERT_EQ(summary.attempted, 1u, "only the in-flight task ran");
        ASSERT_EQ(summary.succeeded, 1u, "in-flight task completed");
        ASSERT_EQ(store.all_records().size(), 1u, "its outcome recorded");
        PASS();
    }
    {
        TEST(multi_provider_isolation);
        auto root = tmpdir / "multi";
        auto config = test_config(root);
        write_file(root / "srcA" / "one.png", "1");
        write_file(root / "srcA" / "two.gif", "2");
        write_file(root / "srcA" / "readme.txt", "not an image");
        write_file(root / "srcC" / "three.jpg", "3");

        ProviderConfig a;
        a.name = "alpha";
        a.type = "local";
        a.params["path"] = (root / "srcA").string();
        ProviderConfig b;
        b.name = "broken";
        b.type = "local";
        b.params["path"] = (root / "missing").string();
        ProviderConfig off;
        off.name = "off";
        off.type = "local";
        off.enabled = false;
        off.params["path"] = (root / "srcA").string();
        ProviderConfig c;
        c.name = "gamma";
        c.type = "local";
        c.params["path"] = (root / "srcC").string();
        config.providers = {a, b, off, c};

        ManifestStore store(config.manifest_path());
        Orchestrator orch(config, store, nullptr);
        auto summary = orch.backup_all({}, cancel);
        ASSERT_EQ(summary.providers.size(), 3u, "enabled providers only");
        ASSERT_EQ(summary.aborted.size(), 1u, "one aborted");
        ASSERT_EQ(summary.aborted[0].provider, std::string("broken"), "the broken one");
        ASSERT_TRUE(summary.aborted[0].kind == ErrorKind::Rejected, "config error kind");
        ASSERT_EQ(summary.succeeded, 3u, "others ran");
        ASSERT_EQ(read_file(config.output_dir / "alpha" / "two.gif"), std::string("2"), "alpha copied");
        ASSERT_EQ(read_file(config.output_dir / "gamma" / "three.jpg"), std::string("3"), "gamma copied");
        ASSERT_TRUE(!fs::exists(config.output_dir / "alpha" / "readme.txt"), "non-image ignored");
        ASSERT_TRUE(!fs::exists(config.output_dir / "off"), "disabled provider untouched");

        BackupOptions limited;
        limited.limit = 1;
        limited.skip_existing = false;
        auto per = orch.backup_all(limited, cancel);
        ASSERT_EQ(per.attempted, 2u, "limit applies per provider");
        PASS();
    }
    {
        TEST(resolver_supplies_providers);
        auto config = test_config(tmpdir / "resolver");
        ProviderConfig pc;
        pc.name = "remote";
        pc.type = "local";
        pc.params["path"] = "/tmp";
        config.providers = {pc};
        ManifestStore store(config.manifest_path());
        Orchestrator orch(config, store, nullptr);
        orch.set_resolver([](const ProviderConfig& cfg) -> std::unique_ptr<Provider> {
            auto fake = std::make_unique<FakeProvider>(cfg.name);
            fake->add_object("only.png", "resolved");
            return fake;
        });
        auto summary = orch.backup("remote", {}, cancel);
        ASSERT_EQ(summary.succeeded, 1u, "resolved provider used");
        ASSERT_EQ(read_file(config.output_dir / "remote" / "only.png"), std::string("resolved"), "content");

        auto unknown = orch.backup("nobody", {}, cancel);
        ASSERT_EQ(unknown.aborted.size(), 1u, "unknown provider aborts");
        PASS();
    }
    {
        TEST(describe_reports_config_errors_without_probe);
        auto config = test_config(tmpdir / "describe");
        ProviderConfig gh;
        gh.name = "github";
        ProviderConfig nas;
        nas.name = "nas";
        nas.type = "local";
        nas.params["path"] = tmpdir.string();
        config.providers = {gh, nas};
        ManifestStore store(config.manifest_path());
        Orchestrator orch(config, store, nullptr);

        auto bad = orch.describe("github", true);
        ASSERT_NOT_EMPTY(bad.config_error, "missing token reported");
        ASSERT_TRUE(!bad.reachable, "not probed");
        ASSERT_TRUE(bad.kind == ProviderKind::GitHub, "kind resolved");

        auto good = orch.describe("nas", true);
        ASSERT_EMPTY(good.config_error, "valid config");
        ASSERT_TRUE(good.reachable, "local directory reachable");

        auto listed = orch.list_providers();
        ASSERT_EQ(listed.size(), 2u, "both listed");
        PASS();
    }
    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. Destination paths
// ---------------------------------------------------------------------------

static void test_sanitize() {
    std::cout << "\n=== Destination paths ===" << std::endl;

    {
        TEST(reserved_characters_replaced);
        ASSERT_EQ(sanitize_key_path("a:b?c*.png").string(), std::string("a_b_c_.png"), "replaced");
        ASSERT_EQ(sanitize_key_path("x<y>|\"z\\.jpg").string(), std::string("x_y___z_.jpg"), "replaced");
        ASSERT_EQ(sanitize_key_path(std::string("tab\tname.png")).string(), std::string("tab_name.png"),
                  "control char");
        PASS();
    }
    {
        TEST(traversal_components_dropped);
        ASSERT_EQ(sanitize_key_path("../../etc/passwd.png").string(), std::string("etc/passwd.png"), "dotdot");
        ASSERT_EQ(sanitize_key_path("/abs//./x.png").string(), std::string("abs/x.png"), "absolute and dot");
        ASSERT_EQ(sanitize_key_path("").string(), std::string("_"), "empty");
        ASSERT_EQ(sanitize_key_path("..").string(), std::string("_"), "only dotdot");
        PASS();
    }
    {
        TEST(long_component_capped_keeping_extension);
        std::string name(300, 'n');
        auto p = sanitize_key_path("dir/" + name + ".jpeg");
        auto file = p.filename().string();
        ASSERT_EQ(file.size(), 255u, "capped");
        ASSERT_TRUE(file.compare(file.size() - 5, 5, ".jpeg") == 0, "extension kept");
        PASS();
    }
    {
        TEST(collisions_get_hash_suffix);
        DestinationAllocator alloc("/out");
        auto first = alloc.allocate("a:b.png");
        auto second = alloc.allocate("a?b.png");
        ASSERT_EQ(first.string(), std::string("/out/a_b.png"), "first keeps name");
        auto expected = "/out/a_b-" + sha256_hex("a?b.png").substr(0, 8) + ".png";
        ASSERT_EQ(second.string(), expected, "second suffixed");
        ASSERT_TRUE(alloc.allocate("other.png") == fs::path("/out/other.png"), "unrelated unaffected");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Local provider and upload
// ---------------------------------------------------------------------------

static void test_local_provider() {
    std::cout << "\n=== Local provider ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-local");
    auto store_root = tmpdir / "store";
    fs::create_directories(store_root);

    ProviderConfig pc;
    pc.name = "nas";
    pc.type = "local";
    pc.params["path"] = store_root.string();
    CancellationToken cancel;

    {
        TEST(pagination_covers_everything_once);
        for (int i = 0; i < 250; ++i) {
            char name[32];
            snprintf(name, sizeof(name), "img%03d.png", i);
            write_file(store_root / "bulk" / name, std::to_string(i));
        }
        auto provider = ProviderFactory::create(pc, nullptr);
        std::vector<std::string> keys;
        Cursor cursor;
        int pages = 0;
        while (true) {
            auto page = provider->list("bulk/", cursor);
            ASSERT_TRUE(page.success, "page");
            pages++;
            for (auto& o : page.objects) keys.push_back(o.key);
            if (!page.next_cursor) break;
            cursor = *page.next_cursor;
        }
        ASSERT_EQ(pages, 3, "three pages");
        ASSERT_EQ(keys.size(), 250u, "every object");
        ASSERT_TRUE(std::is_sorted(keys.begin(), keys.end()), "stable order");
        ASSERT_TRUE(std::adjacent_find(keys.begin(), keys.end()) == keys.end(), "no repeats");
        ASSERT_EQ(keys.front(), std::string("bulk/img000.png"), "relative keys");
        PASS();
    }
    {
        TEST(push_fetch_remove);
        auto provider = ProviderFactory::create(pc, nullptr);
        write_file(tmpdir / "up.png", "PIXELS");
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        auto pushed = provider->push(tmpdir / "up.png", "new/up.png", deadline);
        ASSERT_TRUE(pushed.success, "push");
        ASSERT_EQ(read_file(store_root / "new" / "up.png"), std::string("PIXELS"), "stored");

        RemoteObject obj;
        obj.key = "new/up.png";
        auto fetched = provider->fetch(obj, deadline);
        ASSERT_TRUE(fetched.success, "fetch");
        ASSERT_EQ(std::string(fetched.data.begin(), fetched.data.end()), std::string("PIXELS"), "content");

        ASSERT_TRUE(provider->remove("new/up.png").success, "remove");
        auto again = provider->fetch(obj, deadline);
        ASSERT_TRUE(again.error.kind == ErrorKind::NotFound, "gone");
        ASSERT_TRUE(provider->remove("new/up.png").error.kind == ErrorKind::NotFound, "second remove");

        obj.key = "../escape.png";
        ASSERT_TRUE(!provider->fetch(obj, deadline).success, "traversal refused");
        PASS();
    }
    {
        TEST(upload_directory_and_skip_unchanged);
        auto config = test_config(tmpdir / "upload");
        config.providers = {pc};
        ManifestStore store(config.manifest_path());
        Orchestrator orch(config, store, nullptr);

        auto src = tmpdir / "photos";
        write_file(src / "a.png", "a");
        write_file(src / "trip" / "b.jpg", "b");
        write_file(src / "trip" / "c.png", "c");
        write_file(src / "notes.txt", "n");

        UploadOptions opts;
        opts.remote_prefix = "up/";
        auto first = orch.upload_directory("nas", src, opts, cancel);
        ASSERT_EQ(first.succeeded, 3u, "three images");
        ASSERT_EQ(read_file(store_root / "up" / "trip" / "b.jpg"), std::string("b"), "relative key");
        ASSERT_TRUE(!fs::exists(store_root / "up" / "notes.txt"), "non-image skipped");

        auto second = orch.upload_directory("nas", src, opts, cancel);
        ASSERT_EQ(second.attempted, 0u, "unchanged files skipped");
        ASSERT_EQ(second.skipped, 3u, "skip count");

        write_file(src / "a.png", "changed");
        auto third = orch.upload_directory("nas", src, opts, cancel);
        ASSERT_EQ(third.attempted, 1u, "changed file uploaded");

        UploadOptions png_only = opts;
        png_only.pattern = "*.png";
        png_only.skip_existing = false;
        auto fourth = orch.upload_directory("nas", src, png_only, cancel);
        ASSERT_EQ(fourth.attempted, 2u, "pattern filters");
        PASS();
    }
    {
        TEST(single_upload_and_verify);
        auto config = test_config(tmpdir / "single");
        config.providers = {pc};
        ManifestStore store(config.manifest_path());
        Orchestrator orch(config, store, nullptr);

        write_file(tmpdir / "one.png", "ONE");
        auto summary = orch.upload_file("nas", tmpdir / "one.png", "single/renamed.png", {},
                                        cancel);
        ASSERT_EQ(summary.succeeded, 1u, "uploaded");
        ASSERT_TRUE(store.lookup("nas", "single/renamed.png").has_value(), "recorded under key");

        auto report = orch.verify();
        ASSERT_TRUE(report.clean(), "clean");
        write_file(tmpdir / "one.png", "TAMPERED");
        report = orch.verify();
        ASSERT_EQ(report.mismatched.size(), 1u, "mismatch detected");
        fs::remove(tmpdir / "one.png");
        report = orch.verify();
        ASSERT_EQ(report.missing.size(), 1u, "missing detected");

        auto del = orch.remove("nas", "single/renamed.png");
        ASSERT_TRUE(del.success, "delete");
        ASSERT_TRUE(store.lookup("nas", "single/renamed.png").has_value(), "delete leaves record");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("hib-metrics");
    auto prom_path = tmpdir / "hib.prom";

    {
        TEST(families_written);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"host", "test"}});
        exporter.transfers(Direction::Backup, Outcome::Success).Increment();
        exporter.transfer_bytes(Direction::Backup).Increment(1234);
        {
            ScopedTimer timer(exporter.transfer_duration());
        }
        ASSERT_TRUE(exporter.write_file(), "write");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("hib_transfers_total{") != std::string::npos, "transfers");
        ASSERT_TRUE(content.find("direction=\"backup\"") != std::string::npos, "direction label");
        ASSERT_TRUE(content.find("hib_transfer_bytes_total") != std::string::npos, "bytes");
        ASSERT_TRUE(content.find("hib_transfer_duration_seconds_count") != std::string::npos, "histogram");
        ASSERT_TRUE(content.find("host=\"test\"") != std::string::npos, "constant label");
        auto tmp = prom_path;
        tmp += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp), ".tmp file should not persist");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(scheduler_updates_metrics);
        ManifestStore store(tmpdir / "manifest.db");
        MetricsExporter exporter(prom_path, std::chrono::seconds(60));
        FakeProvider fake("m");
        fake.add_object("a.png", "aaaa");
        fake.script("a.png", {make_error(ErrorKind::Transient)});
        SchedulerOptions opts;
        opts.backoff_initial = std::chrono::milliseconds(1);
        opts.backoff_ceiling = std::chrono::milliseconds(1);
        TransferScheduler sched(opts, store, &exporter);
        CancellationToken cancel;
        sched.run(backup_tasks(fake, tmpdir / "out", {"a.png"}), fake, cancel);
        ASSERT_EQ(exporter.retries_total().Value(), 1.0, "one retry");
        ASSERT_EQ(exporter.transfers(Direction::Backup, Outcome::Success).Value(), 1.0, "one success");
        ASSERT_EQ(exporter.transfer_bytes(Direction::Backup).Value(), 4.0, "bytes");
        ASSERT_EQ(exporter.in_flight().Value(), 0.0, "gauge back to zero");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "hib test suite" << std::endl;
    std::cout << "==============" << std::endl;

    test_fingerprint();
    test_config();
    test_registry();
    test_classification();
    test_manifest();
    test_scheduler();
    test_orchestrator();
    test_sanitize();
    test_local_provider();
    test_metrics();

    std::cout << "\n==============" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
