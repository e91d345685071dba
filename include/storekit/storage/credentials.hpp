#pragma once

#include "storekit/core/secure_string.hpp"
#include "storekit/storage/error.hpp"

#include <string>
#include <string_view>

namespace storekit {

// Access key pair used to sign requests
struct Credentials {
    std::string access_key_id;
    SecureString secret_access_key;
};

struct CredentialLookup {
    Credentials credentials;
    StorageError error;     // Configuration error naming the missing value
};

// Supplies credentials at signing time
class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    virtual CredentialLookup lookup() const = 0;

    // Short description for logs, never includes the secret
    virtual std::string describe() const = 0;
};

// Reads AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY on every lookup, so
// changes to the environment take effect on the next request.
class EnvironmentCredentialSource : public CredentialSource {
public:
    CredentialLookup lookup() const override;
    std::string describe() const override { return "environment"; }
};

// Fixed credentials, e.g. from a configuration file
class StaticCredentialSource : public CredentialSource {
public:
    StaticCredentialSource(std::string access_key_id, std::string_view secret_access_key);

    CredentialLookup lookup() const override;
    std::string describe() const override { return "static"; }

private:
    std::string access_key_id_;
    SecureString secret_access_key_;
};

} // namespace storekit
