#pragma once 

#include <string>
#include <functional>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"

namespace formdrop {

using RequestHandler = std::function<http::Response(const http::Request&)>;

class endpoint
{
    RequestHandler handler;
    HttpMethod method;
    std::string path;

public:
    endpoint(RequestHandler handler, 
             HttpMethod method, 
             const std::string& path)
        : handler(std::move(handler)), method(method), path(path) {}

    const std::string& get_path() const { return path; }
    const RequestHandler& get_handler() const { return handler; }
    HttpMethod get_method() const { return method; }
};

} // namespace formdrop
