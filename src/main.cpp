#include <iostream>
#include <string>    
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>

#include "server/HttpServer.hpp"
#include "server/endpoint.hpp"
#include "server/FileStorage.hpp"
#include "server/ServerConfig.hpp"
#include "server/UploadHandler.hpp"
#include "const/rest_enums.hpp"
#include "const/upload_form.hpp"

using namespace formdrop;

void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        std::cout << "\nShutting down..." << std::endl;
        std::exit(0);  
    }
}

int main(int argc, char** argv)
{
    ServerConfig config;
    try {
        if (argc > 1) {
            config = ServerConfig::loadFromFile(argv[1]);
        }
        config.applyEnvironment();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Effective config: " << config.toJson().dump() << std::endl;

    std::unique_ptr<FileStorage> storage;
    try {
        storage = std::make_unique<FileStorage>(config.uploadDir);
    } catch (const StorageError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto server = std::make_shared<HttpServer>(config.maxBodyBytes,
                                               std::chrono::milliseconds(config.readTimeoutMs));
    UploadHandler uploadHandler(*storage, config.multipartOptions());

    const std::string form = upload_form_html(config.fieldName);
    endpoint form_ep(
        [form](const http::Request&) {
            return http::Response::html(form);
        },
        HttpMethod::GET,
        "/"
    );
    server->add_endpoint(form_ep);

    endpoint upload_ep(
        [&uploadHandler](const http::Request& request) {
            return uploadHandler.handle(request);
        },
        HttpMethod::POST,
        "/upload"
    );
    server->add_endpoint(upload_ep);

    std::cout << "Uploads will be saved to: " << storage->basePath() << std::endl;
    try {
        server->run(config.port);
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
