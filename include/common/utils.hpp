#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result = encoded ? std::string(encoded) : str;
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

std::string trim(const std::string& value);
std::vector<std::string> splitLines(const std::string& text);
std::vector<std::string> splitWhitespace(const std::string& line);
bool startsWith(const std::string& value, const std::string& prefix);

// Dotted quad IPv4 address, as accepted by inet_pton.
bool isValidIPv4(const std::string& address);

// Lowercase hex string of the given length drawn from the OpenSSL CSPRNG.
std::string randomHex(size_t length);

// Last path segment of a file path or resource URL, with or without its extension.
std::string baseName(const std::string& path);
std::string stem(const std::string& path);

} // namespace utils
