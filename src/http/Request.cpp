#include "http/Request.hpp"
#include <cctype>

namespace geminiai {
namespace http {

namespace {
    std::vector<std::string> collect(const Headers& headers, const std::string& name) {
        std::vector<std::string> values;
        for (const auto& header : headers) {
            if (iequals(header.first, name)) {
                values.push_back(header.second);
            }
        }
        return values;
    }
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
        if (ca != cb) return false;
    }
    return true;
}

Request& Request::setJson(const nlohmann::json& payload) {
    body = payload.dump();
    headers.emplace_back("Content-Type", "application/json");
    return *this;
}

std::vector<std::string> Request::header(const std::string& name) const {
    return collect(headers, name);
}

std::vector<std::string> Response::header(const std::string& name) const {
    return collect(headers, name);
}

} // namespace http
} // namespace geminiai
