#pragma once

#include <string_view>
#include <vector>

namespace storekit {

// Holder for a secret (the secret access key). The bytes live in one
// exactly-sized heap block that is wiped before it is released, on
// destruction, on assignment and when moved from. Callers read it through
// view() and must not copy it into a std::string.
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string_view secret);

    SecureString(const SecureString& other);
    SecureString(SecureString&& other) noexcept;
    SecureString& operator=(SecureString other) noexcept;

    ~SecureString();

    std::string_view view() const { return {data_.data(), data_.size()}; }
    bool empty() const { return data_.empty(); }

private:
    void wipe() noexcept;

    std::vector<char> data_;
};

} // namespace storekit
