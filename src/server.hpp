#pragma once

#include <memory>
#include <string>
#include "metrics.hpp"
#include "search_service.hpp"

namespace httplib {
struct Request;
struct Response;
}

class Server {
public:
    // A null service leaves the server uninitialized: /search answers 500.
    Server(std::shared_ptr<const SearchService> service, std::string host, int port);

    // Blocks until the listener stops. Returns false if it could not bind.
    bool run();

    // Route handlers
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_search(const httplib::Request& req, httplib::Response& res);

private:
    const std::shared_ptr<const SearchService> service_;
    SearchMetrics metrics_;
    std::string host_;
    int port_;

    void send_error(httplib::Response& res, int status, const std::string& code,
                    const std::string& message) const;
};
