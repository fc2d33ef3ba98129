#include "server/HttpServer.hpp"
#include "http/StringUtils.hpp"
#include "config.hpp"
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace formdrop {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpServer::HttpServer(size_t max_body_bytes, std::chrono::milliseconds read_timeout)
    : acceptor_(io_context_), max_body_bytes_(max_body_bytes), read_timeout_(read_timeout) {}


void HttpServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

void HttpServer::parseHead(std::istream& stream, http::Request& request)
{
    std::string method, target, version;
    stream >> method >> target >> version;
    if (method.empty() || target.empty() || version.compare(0, 5, "HTTP/") != 0) {
        throw std::invalid_argument("Malformed request line");
    }
    request.method = method_from_string(method);

    request.path = target;
    auto qm = target.find('?');
    if (qm != std::string::npos) request.path = target.substr(0, qm);

    std::string header_line;
    std::getline(stream, header_line);

    while (std::getline(stream, header_line))
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        http::trim(name);
        http::trim(value);
        http::toLower(name);
        request.headers.emplace(name, value);
    }
}

std::optional<http::Response> HttpServer::checkBodyLength(const http::Request& request, size_t& content_length) const
{
    content_length = 0;
    if (!request.hasHeader("content-length")) {
        if (request.method == HttpMethod::POST || request.method == HttpMethod::PUT) {
            return http::Response::lengthRequired();
        }
        return std::nullopt;
    }

    std::string value = request.getHeader("content-length");
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return http::Response::badRequest("Bad Request: Invalid Content-Length");
    }
    try {
        content_length = static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return http::Response::payloadTooLarge();
    }
    if (content_length > max_body_bytes_) {
        return http::Response::payloadTooLarge();
    }
    return std::nullopt;
}

http::Response HttpServer::dispatch(const http::Request& request) const
{
    std::cout << "Request received: " << to_string(request.method) << " " << request.path << std::endl;

    auto it = handlers_.find(request.path);
    if (it == handlers_.end()) {
        return http::Response::notFound();
    }
    if (it->second.get_method() != request.method) {
        return http::Response::methodNotAllowed();
    }

    try {
        return it->second.get_handler()(request);
    } catch (const std::exception& e) {
        std::cerr << "Handler for " << request.path << " failed: " << e.what() << std::endl;
        return http::Response::error("Internal Server Error");
    }
}

void HttpServer::runWithDeadline(tcp::socket& socket)
{
    io_context_.restart();
    io_context_.run_for(read_timeout_);
    if (!io_context_.stopped()) {
        // Deadline passed: abort the pending operation and let its handler run
        boost::system::error_code ignored;
        socket.close(ignored);
        io_context_.run();
        throw boost::system::system_error(asio::error::timed_out, "Client did not complete the request in time");
    }
}

void HttpServer::readUntil(tcp::socket& socket, asio::streambuf& buf, const std::string& delim)
{
    boost::system::error_code result;
    asio::async_read_until(socket, buf, delim,
        [&result](const boost::system::error_code& ec, size_t) { result = ec; });
    runWithDeadline(socket);
    if (result) throw boost::system::system_error(result);
}

void HttpServer::readExactly(tcp::socket& socket, std::string& out, size_t length)
{
    out.resize(length);
    if (length == 0) return;

    boost::system::error_code result;
    asio::async_read(socket, asio::buffer(&out[0], out.size()),
        [&result](const boost::system::error_code& ec, size_t) { result = ec; });
    runWithDeadline(socket);
    if (result) throw boost::system::system_error(result);
}

void HttpServer::writeResponse(tcp::socket& socket, const http::Response& response)
{
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << http::status_text(response.status) << "\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Content-Type: " << response.contentType << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << response.body;

    const std::string data = out.str();
    boost::system::error_code result;
    asio::async_write(socket, asio::buffer(data),
        [&result](const boost::system::error_code& ec, size_t) { result = ec; });
    runWithDeadline(socket);
    if (result) throw boost::system::system_error(result);
}

void HttpServer::serveConnection(tcp::socket& socket)
{
    asio::streambuf buf(FORMDROP_MAX_HEADER_BYTES + max_body_bytes_);
    readUntil(socket, buf, "\r\n\r\n");
    std::istream request_stream(&buf);

    http::Request request;
    try {
        parseHead(request_stream, request);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Rejecting request: " << e.what() << std::endl;
        writeResponse(socket, http::Response::badRequest("Bad Request"));
        return;
    }

    size_t content_length = 0;
    std::optional<http::Response> rejection = checkBodyLength(request, content_length);
    if (rejection) {
        writeResponse(socket, *rejection);
        return;
    }

    std::string body(std::istreambuf_iterator<char>(request_stream), {});
    if (body.size() < content_length) {
        std::string rest;
        readExactly(socket, rest, content_length - body.size());
        body += rest;
    } else if (body.size() > content_length) {
        body.resize(content_length);
    }
    request.body.swap(body);

    writeResponse(socket, dispatch(request));
}

void HttpServer::listen(uint16_t port)
{
    tcp::endpoint listen_endpoint(tcp::v4(), port);
    acceptor_ = tcp::acceptor(io_context_, listen_endpoint);
}

uint16_t HttpServer::localPort() const
{
    return acceptor_.local_endpoint().port();
}

void HttpServer::acceptOne()
{
    tcp::socket socket(io_context_);
    acceptor_.accept(socket);

    try {
        serveConnection(socket);
    } catch (const std::exception& e) {
        std::cerr << "Request error: " << e.what() << std::endl;
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

void HttpServer::run(uint16_t port)
{
    listen(port);
    std::cout << "Server running at http://localhost:" << localPort() << "/" << std::endl;

    while (true)
    {
        acceptOne();
    }
}

} // namespace formdrop
