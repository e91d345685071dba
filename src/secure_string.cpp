#include "storekit/core/secure_string.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace storekit {

SecureString::SecureString(std::string_view secret)
    : data_(secret.begin(), secret.end()) {}

SecureString::SecureString(const SecureString& other)
    : data_(other.data_) {}

SecureString::SecureString(SecureString&& other) noexcept
    : data_(std::move(other.data_)) {
    other.wipe();
}

SecureString& SecureString::operator=(SecureString other) noexcept {
    // other takes the old bytes and wipes them when it goes out of scope
    data_.swap(other.data_);
    return *this;
}

SecureString::~SecureString() {
    wipe();
}

void SecureString::wipe() noexcept {
    if (!data_.empty()) {
        OPENSSL_cleanse(data_.data(), data_.size());
    }
    data_.clear();
    data_.shrink_to_fit();
}

}  // namespace storekit
