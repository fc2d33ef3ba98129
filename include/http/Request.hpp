#pragma once

#include <string>
#include <unordered_map>
#include "const/rest_enums.hpp"

namespace formdrop {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpMethod method = HttpMethod::GET;
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> headers;  // Lower-cased names, trimmed values
    std::string body;                                      // Fully buffered body

    std::string getHeader(const std::string& name, const std::string& defaultValue = "") const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : defaultValue;
    }

    bool hasHeader(const std::string& name) const {
        return headers.find(name) != headers.end();
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "text/plain";
    std::string body;

    static Response ok(const std::string& body) {
        return {200, "text/plain", body};
    }

    static Response html(const std::string& body) {
        return {200, "text/html", body};
    }

    static Response badRequest(const std::string& message) {
        return {400, "text/plain", message};
    }

    static Response notFound(const std::string& message = "Not Found") {
        return {404, "text/plain", message};
    }

    static Response methodNotAllowed() {
        return {405, "text/plain", "Method Not Allowed"};
    }

    static Response lengthRequired() {
        return {411, "text/plain", "Length Required"};
    }

    static Response payloadTooLarge() {
        return {413, "text/plain", "Payload Too Large"};
    }

    static Response error(const std::string& message) {
        return {500, "text/plain", message};
    }
};

inline const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

} // namespace http
} // namespace formdrop
