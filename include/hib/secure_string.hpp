#pragma once

#include <openssl/crypto.h>

#include <string>
#include <utility>

namespace hib {

/// Holder for provider credentials. The buffer is wiped with OPENSSL_cleanse
/// whenever the held value is dropped.
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString(SecureString&& other) noexcept { data_.swap(other.data_); }

    SecureString& operator=(SecureString other) noexcept {
        data_.swap(other.data_);
        return *this;
    }

    ~SecureString() { wipe(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void wipe() {
        if (data_.empty()) return;
        OPENSSL_cleanse(data_.data(), data_.size());
        data_.clear();
    }

    std::string data_;
};

}  // namespace hib
