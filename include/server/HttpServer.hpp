#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include "config.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace formdrop {

/**
 * Blocking HTTP/1.1 server. Serves one connection at a time, always
 * answers with "Connection: close". Every read and write on a connection
 * must finish within read_timeout or the connection is dropped.
 */
class HttpServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unordered_map<std::string, endpoint> handlers_;
  size_t max_body_bytes_;
  std::chrono::milliseconds read_timeout_;
public:
    explicit HttpServer(size_t max_body_bytes,
                        std::chrono::milliseconds read_timeout = std::chrono::milliseconds(FORMDROP_DEFAULT_READ_TIMEOUT_MS));
    void add_endpoint(const endpoint& ep);

    // listen() then acceptOne() forever
    void run(uint16_t port);

    // Bind and listen on all IPv4 interfaces; port 0 picks a free port
    void listen(uint16_t port);
    uint16_t localPort() const;

    // Accept and serve a single connection. Errors are logged, not thrown.
    void acceptOne();

    // Route a fully read request to its endpoint
    http::Response dispatch(const http::Request& request) const;

    /**
     * Parse request line and headers from the stream, leaving the stream
     * positioned at the first body byte.
     * @throws std::invalid_argument on a malformed request line or unknown method
     */
    static void parseHead(std::istream& stream, http::Request& request);

    /**
     * Validate Content-Length against the body limit.
     * @return Error response, or nullopt if the body may be read
     */
    std::optional<http::Response> checkBodyLength(const http::Request& request, size_t& content_length) const;

private:
    void serveConnection(boost::asio::ip::tcp::socket& socket);
    void writeResponse(boost::asio::ip::tcp::socket& socket, const http::Response& response);

    // Run the pending async operation; close the socket and throw timed_out past the deadline
    void runWithDeadline(boost::asio::ip::tcp::socket& socket);
    void readUntil(boost::asio::ip::tcp::socket& socket, boost::asio::streambuf& buf, const std::string& delim);
    void readExactly(boost::asio::ip::tcp::socket& socket, std::string& out, size_t length);
};

} // namespace formdrop
