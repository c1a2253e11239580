#include <sitecache/provision/instance.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sitecache::provision {

Result<MaxMemory> MaxMemory::parse(std::string_view text) {
    if (text.size() < 2) {
        return Error{ErrorCode::ValidationError,
                     "Invalid memory format '" + std::string(text) + "'. Use format like 256M or 1G"};
    }
    char unit = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    auto digits = text.substr(0, text.size() - 1);
    if ((unit != 'M' && unit != 'G') ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return Error{ErrorCode::ValidationError,
                     "Invalid memory format '" + std::string(text) + "'. Use format like 256M or 1G"};
    }

    std::uint64_t amount = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), amount);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return Error{ErrorCode::ValidationError, "Memory amount out of range: " + std::string(text)};
    }
    if (amount == 0) {
        return Error{ErrorCode::ValidationError, "Memory amount must be greater than zero"};
    }
    return MaxMemory{amount, unit};
}

Result<void> validateSiteName(std::string_view site) {
    if (site.empty()) {
        return Error{ErrorCode::ValidationError, "Site name must not be empty"};
    }
    if (site == "." || site == "..") {
        return Error{ErrorCode::ValidationError, "Invalid site name '" + std::string(site) + "'"};
    }
    for (unsigned char c : site) {
        if (!(std::isalnum(c) || c == '.' || c == '_' || c == '-')) {
            return Error{ErrorCode::ValidationError,
                         "Site name '" + std::string(site) + "' contains an unsupported character"};
        }
    }
    return {};
}

Result<Port> validatePortNumber(long long value) {
    if (value < 1024 || value > 65535) {
        return Error{ErrorCode::ValidationError, "Invalid port " + std::to_string(value) +
                                                     ". Please enter a number between 1024 and "
                                                     "65535."};
    }
    return static_cast<Port>(value);
}

} // namespace sitecache::provision
