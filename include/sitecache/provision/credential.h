#pragma once

#include <cstddef>
#include <string>
#include <sitecache/core/types.h>

namespace sitecache::provision {

inline constexpr std::size_t kCredentialLength = 32;

/**
 * Random secret drawn from the OpenSSL CSPRNG: base64 alphabet without '=',
 * '+' and '/', exactly `length` characters. Never logged.
 */
Result<std::string> generateCredential(std::size_t length = kCredentialLength);

} // namespace sitecache::provision
