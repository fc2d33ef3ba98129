#pragma once

#include <string>
#include <stdexcept>

namespace formdrop {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE,
    HEAD,
};


inline const char* to_string(HttpMethod method) {
    switch(method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        default: return "UNKNOWN";
    }
}


inline HttpMethod method_from_string(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    else if (method == "POST") return HttpMethod::POST;
    else if (method == "PUT") return HttpMethod::PUT;
    else if (method == "PATCH") return HttpMethod::PATCH;
    else if (method == "DELETE") return HttpMethod::DELETE;
    else if (method == "HEAD") return HttpMethod::HEAD;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

} // namespace formdrop
