#include "http/CurlTransport.hpp"
#include <curl/curl.h>
#include <iostream>
#include <mutex>
#include <sstream>

namespace geminiai {
namespace http {

namespace {
    std::once_flag curlInitFlag;

    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    // Called once per received header line, status line included
    size_t headerCallback(char* buffer, size_t size, size_t nitems, Headers* headers) {
        size_t totalSize = size * nitems;
        std::string line(buffer, totalSize);

        // A new status line (after 100 Continue or a redirect) starts a fresh header block
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return totalSize;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return totalSize;
        }

        auto trim = [](std::string s) {
            size_t a = 0, b = s.size();
            while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
            while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
            return s.substr(a, b - a);
        };

        headers->emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        return totalSize;
    }

    std::string buildUrl(CURL* curl, const Request& request) {
        if (request.query.empty()) {
            return request.url;
        }

        std::string url = request.url;
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto& param : request.query) {
            char* key = curl_easy_escape(curl, param.first.c_str(), static_cast<int>(param.first.size()));
            char* value = curl_easy_escape(curl, param.second.c_str(), static_cast<int>(param.second.size()));
            if (!key || !value) {
                curl_free(key);
                curl_free(value);
                throw TransportError("Failed to encode query parameter: " + param.first);
            }
            url += separator;
            url += key;
            url += '=';
            url += value;
            separator = '&';
            curl_free(key);
            curl_free(value);
        }
        return url;
    }
}

CurlTransport::CurlTransport(long timeoutSeconds, bool verbose)
    : timeoutSeconds_(timeoutSeconds), verbose_(verbose) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Response CurlTransport::send(const Request& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }

    Response response;
    struct curl_slist* headerList = nullptr;

    for (const auto& header : request.headers) {
        headerList = curl_slist_append(headerList, (header.first + ": " + header.second).c_str());
    }
    // Send the body right away instead of waiting for 100 Continue
    headerList = curl_slist_append(headerList, "Expect:");
    // Raw bodies must not go out as application/x-www-form-urlencoded
    if (request.method != HttpRequest::GET && request.header("Content-Type").empty()) {
        headerList = curl_slist_append(headerList, "Content-Type:");
    }

    std::string url;
    try {
        url = buildUrl(curl, request);
    } catch (const TransportError&) {
        curl_slist_free_all(headerList);
        curl_easy_cleanup(curl);
        throw;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // required when used from several threads

    switch (request.method) {
        case HttpRequest::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpRequest::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        case HttpRequest::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, to_string(request.method));
            break;
    }

    if (request.method != HttpRequest::GET) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    if (verbose_) {
        std::ostringstream line;
        line << "DEBUG: " << to_string(request.method) << " " << request.url
             << " (" << request.body.size() << " bytes)";
        std::cerr << line.str() << std::endl;
    }

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "CURL error: " << curl_easy_strerror(res) << std::endl;
        throw TransportError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    response.status = static_cast<int>(httpCode);

    if (verbose_) {
        std::ostringstream line;
        line << "DEBUG HTTP code: " << httpCode << " (" << response.body.size() << " bytes)";
        std::cerr << line.str() << std::endl;
    }

    return response;
}

} // namespace http
} // namespace geminiai
