#include <sitecache/provision/credential.h>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <vector>

namespace sitecache::provision {

Result<std::string> generateCredential(std::size_t length) {
    if (length == 0) {
        return Error{ErrorCode::InvalidArgument, "Credential length must be positive"};
    }

    std::string out;
    out.reserve(length);
    // Dropping '=', '+' and '/' shortens the encoding, so refill until long enough
    while (out.size() < length) {
        std::vector<unsigned char> raw(32);
        if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
            return Error{ErrorCode::InternalError, "OpenSSL random generator unavailable"};
        }
        std::vector<unsigned char> encoded(4 * ((raw.size() + 2) / 3) + 1);
        int n = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));
        for (int i = 0; i < n && out.size() < length; ++i) {
            char c = static_cast<char>(encoded[static_cast<std::size_t>(i)]);
            if (c == '=' || c == '+' || c == '/')
                continue;
            out.push_back(c);
        }
    }
    return out;
}

} // namespace sitecache::provision
