#include "storekit/storage/credentials.hpp"
#include "storekit/core/constants.hpp"

#include <cstdlib>
#include <utility>

namespace storekit {

CredentialLookup EnvironmentCredentialSource::lookup() const {
    CredentialLookup result;

    const char* access_key = std::getenv(constants::ENV_ACCESS_KEY_ID);
    if (!access_key || access_key[0] == '\0') {
        result.error = StorageError::configuration(
            std::string(constants::ENV_ACCESS_KEY_ID) + " not set");
        return result;
    }

    const char* secret_key = std::getenv(constants::ENV_SECRET_ACCESS_KEY);
    if (!secret_key || secret_key[0] == '\0') {
        result.error = StorageError::configuration(
            std::string(constants::ENV_SECRET_ACCESS_KEY) + " not set");
        return result;
    }

    result.credentials.access_key_id = access_key;
    result.credentials.secret_access_key = SecureString(secret_key);
    return result;
}

StaticCredentialSource::StaticCredentialSource(std::string access_key_id,
                                               std::string_view secret_access_key)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(secret_access_key) {}

CredentialLookup StaticCredentialSource::lookup() const {
    CredentialLookup result;

    if (access_key_id_.empty()) {
        result.error = StorageError::configuration("access_key not configured");
        return result;
    }
    if (secret_access_key_.empty()) {
        result.error = StorageError::configuration("secret_key not configured");
        return result;
    }

    result.credentials.access_key_id = access_key_id_;
    result.credentials.secret_access_key = secret_access_key_;
    return result;
}

}  // namespace storekit
