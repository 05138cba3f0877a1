// src/http.cpp
// Implementation of the HTTP front end

#include "termlease/http.hpp"
#include "termlease/logger.hpp"
#include "termlease/utils.hpp"

#include <httplib.h>

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "http";

// Path captures for httplib's regex routes
constexpr const char* SESSION_ROUTE = R"(/api/session/([^/]+))";
constexpr const char* TERMINAL_ROUTE = R"(/terminal/([^/]+)/?)";

std::string client_address_of(const httplib::Request& request) {
    std::string forwarded = request.get_header_value("X-Forwarded-For");
    if (forwarded.empty()) {
        return request.remote_addr;
    }
    return Utils::trim(forwarded.substr(0, forwarded.find(',')));
}
}

//=============================================================================
// RESPONSES
//=============================================================================

void write_json(httplib::Response& response, int status, const nlohmann::json& body) {
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

void write_error(httplib::Response& response, int status, const std::string& detail) {
    write_json(response, status, nlohmann::json{{"detail", detail}});
}

std::string http_reason_phrase(int status) {
    switch (status) {
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Error";
    }
}

int http_status_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::PAYLOAD_TOO_LARGE:
            return 413;
        case ErrorCode::INVALID_EMAIL:
        case ErrorCode::BLOCKED_EMAIL_DOMAIN:
        case ErrorCode::INVALID_SESSION_ID:
        case ErrorCode::MALFORMED_REQUEST:
            return 400;
        case ErrorCode::CAPACITY_EXCEEDED:
        case ErrorCode::PORT_EXHAUSTED:
        case ErrorCode::ORCHESTRATOR_STOPPED:
            return 503;
        case ErrorCode::SESSION_NOT_FOUND:
            return 404;
        case ErrorCode::SESSION_NOT_RUNNING:
            return 410;
        case ErrorCode::UNAUTHORIZED:
            return 403;
        default:
            return 500;
    }
}

//=============================================================================
// ROUTER
//=============================================================================

ApiRouter::ApiRouter(Orchestrator& orchestrator)
    : orchestrator_(orchestrator) {}

void ApiRouter::mount(httplib::Server& server) {
    using namespace std::placeholders;

    server.Post("/api/session", guarded(std::bind(&ApiRouter::create_session, this, _1, _2)));
    server.Get(SESSION_ROUTE, guarded(std::bind(&ApiRouter::get_session, this, _1, _2)));
    server.Delete(SESSION_ROUTE, guarded(std::bind(&ApiRouter::delete_session, this, _1, _2)));
    server.Get(TERMINAL_ROUTE, guarded(std::bind(&ApiRouter::open_terminal, this, _1, _2)));
    server.Get("/api/leads", guarded(std::bind(&ApiRouter::export_leads, this, _1, _2)));
    server.Get("/api/health", guarded(std::bind(&ApiRouter::health, this, _1, _2)));

    // Registered after the real routes, so they only see the remaining methods
    auto allow_only = [&server](const std::string& pattern, const std::string& allow) {
        Handler reject = [allow](const httplib::Request&, httplib::Response& response) {
            write_error(response, 405, http_reason_phrase(405));
            response.set_header("Allow", allow);
        };
        server.Get(pattern, reject);
        server.Post(pattern, reject);
        server.Put(pattern, reject);
        server.Patch(pattern, reject);
        server.Delete(pattern, reject);
    };
    allow_only("/api/session", "POST");
    allow_only(SESSION_ROUTE, "GET, DELETE");
    allow_only(TERMINAL_ROUTE, "GET");
    allow_only("/api/leads", "GET");
    allow_only("/api/health", "GET");

    // Unmatched routes and transport-level failures (413, 400) arrive without a body
    server.set_error_handler([](const httplib::Request&, httplib::Response& response) {
        if (response.body.empty()) {
            write_error(response, response.status, http_reason_phrase(response.status));
        }
    });
}

ApiRouter::Handler ApiRouter::guarded(Handler handler) const {
    return [handler](const httplib::Request& request, httplib::Response& response) {
        try {
            handler(request, response);
        } catch (const Error& e) {
            int status = http_status_for(e);
            if (status >= 500) {
                TL_LOG_WARN(LOG_COMPONENT, request.method << " " << request.path << " -> " << status
                            << ": " << e.what());
            }
            // Worker details stay in the log
            std::string detail = e.code() >= ErrorCode::START_FAILURE && e.code() <= ErrorCode::HEALTH_CHECK_FAILED
                ? "Failed to start demo environment"
                : e.what();
            write_error(response, status, detail);
        } catch (const std::exception& e) {
            TL_LOG_ERROR(LOG_COMPONENT, request.method << " " << request.path << " failed: " << e.what());
            write_error(response, 500, "Internal server error");
        }
    };
}

void ApiRouter::create_session(const httplib::Request& request, httplib::Response& response) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error&) {
        throw Errors::malformed_request("body must be a JSON object");
    }
    if (!body.is_object()) {
        throw Errors::malformed_request("body must be a JSON object");
    }

    auto email_it = body.find("email");
    if (email_it == body.end() || !email_it->is_string()) {
        throw Errors::empty_email();
    }

    SessionGrant grant = orchestrator_.create_session(email_it->get<std::string>(),
                                                      client_address_of(request));

    write_json(response, 200, {
        {"session_id", grant.session_id},
        {"session_url", grant.terminal_path},
        {"state", Utils::session_state_to_string(grant.state)},
        {"host", grant.host},
        {"port", grant.port},
        {"expires_at", Utils::timestamp_to_iso8601(grant.expires_at)},
        {"expires_in_minutes", grant.duration.count() / 60}
    });
}

void ApiRouter::get_session(const httplib::Request& request, httplib::Response& response) {
    SessionStatus status = orchestrator_.get_session(request.matches[1].str());
    write_json(response, 200, {
        {"session_id", status.session_id},
        {"state", Utils::session_state_to_string(status.state)},
        {"active", status.active},
        {"remaining_seconds", status.remaining_seconds}
    });
}

void ApiRouter::delete_session(const httplib::Request& request, httplib::Response& response) {
    orchestrator_.delete_session(request.matches[1].str());
    write_json(response, 200, {{"status", "ended"}});
}

void ApiRouter::open_terminal(const httplib::Request& request, httplib::Response& response) {
    response.set_redirect(orchestrator_.terminal_target(request.matches[1].str()));
}

void ApiRouter::export_leads(const httplib::Request& request, httplib::Response& response) {
    std::vector<Lead> leads = orchestrator_.export_leads(request.get_param_value("secret"));

    nlohmann::json items = nlohmann::json::array();
    for (const auto& lead : leads) {
        items.push_back(lead_to_json(lead));
    }
    write_json(response, 200, {{"leads", items}});
}

void ApiRouter::health(const httplib::Request&, httplib::Response& response) {
    HealthReport report = orchestrator_.health();

    nlohmann::json metrics = nlohmann::json::object();
    for (const auto& [name, value] : report.metrics) {
        metrics[name] = value;
    }

    write_json(response, 200, {
        {"status", health_status_to_string(report.status)},
        {"message", report.message},
        {"active_sessions", report.active_sessions},
        {"max_sessions", report.max_sessions},
        {"available_ports", report.available_ports},
        {"last_sweep_at", report.last_sweep_at ? Utils::timestamp_to_iso8601(report.last_sweep_at) : ""},
        {"metrics", metrics}
    });
}

//=============================================================================
// SERVER
//=============================================================================

HttpServer::HttpServer(const ServerConfig& config, ApiRouter& router)
    : config_(config)
    , router_(router) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        return;
    }

    server_ = std::make_unique<httplib::Server>();

    size_t threads = config_.handler_threads;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_->set_read_timeout(config_.receive_timeout.count() / 1000,
                              (config_.receive_timeout.count() % 1000) * 1000);
    server_->set_payload_max_length(config_.max_request_bytes);
    server_->set_logger([this](const httplib::Request& request, const httplib::Response& response) {
        requests_handled_.fetch_add(1, std::memory_order_relaxed);
        TL_LOG_DEBUG(LOG_COMPONENT, request.method << " " << request.path << " -> " << response.status);
    });
    router_.mount(*server_);

    int port = -1;
    if (config_.listen_port == 0) {
        port = server_->bind_to_any_port(config_.bind_address);
    } else if (server_->bind_to_port(config_.bind_address, config_.listen_port)) {
        port = config_.listen_port;
    }
    if (port <= 0) {
        server_.reset();
        throw SystemError(ErrorCode::SERVER_ERROR,
            "Cannot listen on " + config_.bind_address + ":" + std::to_string(config_.listen_port));
    }

    bound_port_ = static_cast<Port>(port);
    running_ = true;
    listen_thread_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            TL_LOG_ERROR(LOG_COMPONENT, "Listener on port " << bound_port_ << " exited with an error");
        }
    });
    // stop() is a no-op until the listener is up
    server_->wait_until_ready();

    TL_LOG_INFO(LOG_COMPONENT, "Listening on " << config_.bind_address << ":" << bound_port_
                << " with " << threads << " handler threads");
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    server_->stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    server_.reset();
    TL_LOG_INFO(LOG_COMPONENT, "Server stopped after " << requests_handled_.load() << " requests");
}

} // namespace termlease
