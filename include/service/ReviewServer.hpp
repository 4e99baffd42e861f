#pragma once
#include <chrono>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "agent/ReviewOrchestrator.hpp"
#include "session/SessionStore.hpp"

namespace reviewer {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

/**
 * HTTP front end. Each handle_* method is the whole behavior of one route; the
 * httplib callbacks only unpack the request and write the reply.
 */
class ReviewServer {
public:
    ReviewServer(ReviewOrchestrator& orchestrator, SessionStore& store);

    void run(const std::string& host, int port);
    void stop() { server_.stop(); }

    HttpReply handle_health() const;
    HttpReply handle_review(const std::string& body);
    HttpReply handle_list_sessions(const std::string& project, const std::string& limit,
                                   const std::string& sort_by) const;
    HttpReply handle_get_session(const std::string& name, const std::string& project_root) const;
    HttpReply handle_delete_session(const std::string& name, const std::string& project_root);
    HttpReply handle_logs() const;

private:
    void setup_routes();

    ReviewOrchestrator& orchestrator_;
    SessionStore& store_;
    httplib::Server server_;
    const std::chrono::steady_clock::time_point started_;
};

} // namespace reviewer
