#include "service/ReviewServer.hpp"
#include "LogManager.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr size_t kDefaultListLimit = 50;
constexpr size_t kMaxListLimit = 1000;

HttpReply error_reply(int status, ErrorCode code, const std::string& message) {
    return HttpReply{status, json{{"error", {{"code", to_string(code)}, {"message", message}}}}};
}

int status_for(const ReviewResult& result) {
    if (!result.error) return 200;
    switch (result.error->code) {
        case ErrorCode::SessionBusy:
        case ErrorCode::IncompatibleRecord:
            return 409;
        case ErrorCode::RateLimitExceeded:
            // Only when nothing was explored yet; later the partial result is the answer
            return result.reached(ReviewState::Exploring) ? 200 : 429;
        case ErrorCode::NotFound:
            return result.reached(ReviewState::Seeded) ? 200 : 400;
        default:
            return 200;
    }
}

void write(httplib::Response& res, const HttpReply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

} // namespace

ReviewServer::ReviewServer(ReviewOrchestrator& orchestrator, SessionStore& store)
    : orchestrator_(orchestrator), store_(store), started_(std::chrono::steady_clock::now()) {
    setup_routes();
}

void ReviewServer::run(const std::string& host, int port) {
    spdlog::info("🚀 Review service listening on {}:{}", host, port);
    if (!server_.listen(host, port)) {
        throw ReviewerError(ErrorCode::IoError, "Cannot listen on " + host + ":" + std::to_string(port));
    }
}

// --- 1. ROUTES ---

void ReviewServer::setup_routes() {
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write(res, handle_health());
    });

    server_.Post("/review", [this](const httplib::Request& req, httplib::Response& res) {
        write(res, handle_review(req.body));
    });

    server_.Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        write(res, handle_list_sessions(req.get_param_value("project"), req.get_param_value("limit"),
                                        req.get_param_value("sort_by")));
    });

    server_.Get("/sessions/:name", [this](const httplib::Request& req, httplib::Response& res) {
        write(res, handle_get_session(req.path_params.at("name"), req.get_param_value("project_root")));
    });

    server_.Delete("/sessions/:name", [this](const httplib::Request& req, httplib::Response& res) {
        write(res, handle_delete_session(req.path_params.at("name"), req.get_param_value("project_root")));
    });

    server_.Get("/api/admin/logs", [this](const httplib::Request&, httplib::Response& res) {
        write(res, handle_logs());
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        spdlog::error("💥 {} {} failed: {}", req.method, req.path, what);
        write(res, error_reply(500, ErrorCode::IoError, what));
    });
}

// --- 2. HANDLERS ---

HttpReply ReviewServer::handle_health() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_);
    return HttpReply{200, json{
        {"status", "ok"},
        {"uptime_seconds", uptime.count()},
        {"active_reviews", orchestrator_.active_reviews()},
        {"timestamp", now_ms()}
    }};
}

HttpReply ReviewServer::handle_review(const std::string& body) {
    ReviewRequest request;
    try {
        request = ReviewRequest::from_json(json::parse(body), orchestrator_.config().bounds);
    } catch (const json::parse_error& e) {
        return error_reply(400, ErrorCode::InvalidArguments, std::string("Body is not JSON: ") + e.what());
    } catch (const ReviewerError& e) {
        return error_reply(400, e.code(), e.what());
    }

    std::error_code ec;
    fs::path root = fs::canonical(request.project_root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        return error_reply(400, ErrorCode::InvalidArguments, "Invalid project root: " + request.project_root);
    }
    request.project_root = root.string();

    ReviewResult result = orchestrator_.run(request);
    return HttpReply{status_for(result), json{
        {"session_info", result.session.to_json()},
        {"review_result", result.to_json()}
    }};
}

HttpReply ReviewServer::handle_list_sessions(const std::string& project, const std::string& limit,
                                             const std::string& sort_by) const {
    size_t n = kDefaultListLimit;
    if (!limit.empty()) {
        try {
            long long parsed = std::stoll(limit);
            if (parsed < 0) throw std::out_of_range("negative");
            n = std::min<size_t>(static_cast<size_t>(parsed), kMaxListLimit);
        } catch (const std::logic_error&) {
            return error_reply(400, ErrorCode::InvalidArguments, "limit must be a non-negative integer");
        }
    }

    try {
        SortKey key = sort_key_from_string(sort_by);
        std::optional<std::string> filter;
        if (!project.empty()) filter = project;

        json sessions = json::array();
        for (const auto& s : store_.list(filter, n, key)) sessions.push_back(s.to_json());
        return HttpReply{200, json{{"sessions", sessions}}};
    } catch (const ReviewerError& e) {
        return error_reply(e.code() == ErrorCode::InvalidArguments ? 400 : 500, e.code(), e.what());
    }
}

HttpReply ReviewServer::handle_get_session(const std::string& name, const std::string& project_root) const {
    if (project_root.empty()) {
        return error_reply(400, ErrorCode::InvalidArguments, "project_root is required");
    }
    try {
        auto session = store_.find(name, project_root);
        if (!session) return error_reply(404, ErrorCode::NotFound, "No session '" + name + "'");
        return HttpReply{200, SessionSummary::of(*session).to_json()};
    } catch (const ReviewerError& e) {
        return error_reply(e.code() == ErrorCode::IncompatibleRecord ? 409 : 500, e.code(), e.what());
    }
}

HttpReply ReviewServer::handle_delete_session(const std::string& name, const std::string& project_root) {
    if (project_root.empty()) {
        return error_reply(400, ErrorCode::InvalidArguments, "project_root is required");
    }
    try {
        if (!store_.remove(name, project_root)) {
            return error_reply(404, ErrorCode::NotFound, "No session '" + name + "'");
        }
        return HttpReply{200, json{{"deleted", true}}};
    } catch (const ReviewerError& e) {
        return error_reply(e.code() == ErrorCode::SessionBusy ? 409 : 500, e.code(), e.what());
    }
}

HttpReply ReviewServer::handle_logs() const {
    return HttpReply{200, json{{"logs", LogManager::instance().get_logs_json()}}};
}

} // namespace reviewer
