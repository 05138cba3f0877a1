// include/termlease/http.hpp
// Purpose: HTTP/1.1 JSON front end for the orchestrator
// Routes are mounted on a cpp-httplib server backed by its thread pool

#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace termlease {

// Maps termlease error codes to HTTP status codes
int http_status_for(const Error& error);

std::string http_reason_phrase(int status);

// JSON body helpers shared by every route
void write_json(httplib::Response& response, int status, const nlohmann::json& body);
void write_error(httplib::Response& response, int status, const std::string& detail);

//=============================================================================
// ROUTER
//=============================================================================

class ApiRouter {
public:
    explicit ApiRouter(Orchestrator& orchestrator);

    // Registers every route plus the 405 and error fallbacks on the server
    void mount(httplib::Server& server);

private:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    Orchestrator& orchestrator_;

    // Turns exceptions escaping a route into {"detail": ...} responses
    Handler guarded(Handler handler) const;

    void create_session(const httplib::Request& request, httplib::Response& response);
    void get_session(const httplib::Request& request, httplib::Response& response);
    void delete_session(const httplib::Request& request, httplib::Response& response);
    void open_terminal(const httplib::Request& request, httplib::Response& response);
    void export_leads(const httplib::Request& request, httplib::Response& response);
    void health(const httplib::Request& request, httplib::Response& response);
};

//=============================================================================
// SERVER
//=============================================================================

class HttpServer {
public:
    HttpServer(const ServerConfig& config, ApiRouter& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and start serving on a background thread.
    // Throws SystemError if the address cannot be bound.
    void start();
    void stop();
    bool is_running() const { return running_; }

    // Port actually bound (useful when configured with port 0)
    Port bound_port() const noexcept { return bound_port_; }

    uint64_t requests_handled() const noexcept { return requests_handled_.load(); }

private:
    ServerConfig config_;
    ApiRouter& router_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    Port bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> requests_handled_{0};
};

} // namespace termlease
