#include "files/FileDescriptor.hpp"
#include "core/Error.hpp"
#include <cctype>
#include <limits>

namespace geminiai {
namespace files {

namespace {
    [[noreturn]] void malformed(const std::string& message) {
        throw ClientException(ErrorKind::MalformedResponse, message);
    }

    std::string requiredString(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j[key].is_null()) {
            malformed(std::string("File payload is missing '") + key + "'");
        }
        if (!j[key].is_string()) {
            malformed(std::string("File field '") + key + "' must be a string");
        }
        return j[key].get<std::string>();
    }

    std::string optionalString(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j[key].is_null()) {
            return "";
        }
        if (!j[key].is_string()) {
            malformed(std::string("File field '") + key + "' must be a string");
        }
        return j[key].get<std::string>();
    }
}

std::optional<std::uint64_t> FileDescriptor::parseSize(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return std::nullopt;  // overflow
        }
        value = value * 10 + digit;
    }
    return value;
}

FileDescriptor FileDescriptor::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        malformed("File payload must be a JSON object");
    }

    FileDescriptor file;
    file.name = requiredString(j, "name");
    file.uri = requiredString(j, "uri");

    // The service sends int64 fields as strings; accept a plain integer as well
    if (!j.contains("sizeBytes") || j["sizeBytes"].is_null()) {
        malformed("File payload is missing 'sizeBytes'");
    }
    const auto& size = j["sizeBytes"];
    if (size.is_string()) {
        auto parsed = parseSize(size.get<std::string>());
        if (!parsed) {
            malformed("File field 'sizeBytes' is not a non-negative integer: '" +
                      size.get<std::string>() + "'");
        }
        file.sizeBytes = *parsed;
    } else if (size.is_number_unsigned()) {
        file.sizeBytes = size.get<std::uint64_t>();
    } else if (size.is_number_integer() && size.get<std::int64_t>() >= 0) {
        file.sizeBytes = static_cast<std::uint64_t>(size.get<std::int64_t>());
    } else {
        malformed("File field 'sizeBytes' is not a non-negative integer: " + size.dump());
    }

    file.mimeType = optionalString(j, "mimeType");
    file.displayName = optionalString(j, "displayName");
    file.state = optionalString(j, "state");
    file.sha256Hash = optionalString(j, "sha256Hash");
    file.createTime = optionalString(j, "createTime");
    file.updateTime = optionalString(j, "updateTime");
    file.expirationTime = optionalString(j, "expirationTime");
    return file;
}

nlohmann::json FileDescriptor::to_json() const {
    return {
        {"name", name},
        {"uri", uri},
        {"mimeType", mimeType},
        {"displayName", displayName},
        {"sizeBytes", std::to_string(sizeBytes)},
        {"state", state},
        {"sha256Hash", sha256Hash},
        {"createTime", createTime},
        {"updateTime", updateTime},
        {"expirationTime", expirationTime}
    };
}

} // namespace files
} // namespace geminiai
