#pragma once

#include <string>
#include <curl/curl.h>
#include <curl/urlapi.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        curl_easy_cleanup(curl);
        return str;
    }
    std::string result(encoded);
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

// Accepts absolute http:// or https:// URLs with a host part.
inline bool isHttpUrl(const std::string& str) {
    CURLU* url = curl_url();
    if (!url) {
        return false;
    }

    bool valid = false;
    if (curl_url_set(url, CURLUPART_URL, str.c_str(), 0) == CURLUE_OK) {
        char* scheme = nullptr;
        char* host = nullptr;
        if (curl_url_get(url, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK &&
            curl_url_get(url, CURLUPART_HOST, &host, 0) == CURLUE_OK) {
            std::string s(scheme);
            valid = (s == "https" || s == "http") && host[0] != '\0';
        }
        curl_free(scheme);
        curl_free(host);
    }
    curl_url_cleanup(url);
    return valid;
}

// Quotes a string for display in a shell-like command line.
inline std::string shellQuote(const std::string& str) {
    if (!str.empty() && str.find_first_not_of(
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_./=:,+@") == std::string::npos) {
        return str;
    }
    std::string quoted = "'";
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

} // namespace utils
