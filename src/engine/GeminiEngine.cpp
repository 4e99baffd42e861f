#include "engine/GeminiEngine.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace reviewer {

using json = nlohmann::json;

GeminiEngine::GeminiEngine(std::shared_ptr<KeyManager> key_manager, std::string base_url,
                           std::chrono::milliseconds backoff)
    : key_manager_(std::move(key_manager)), base_url_(std::move(base_url)), backoff_(backoff) {}

std::string GeminiEngine::endpoint_url(const std::string& model) const {
    return base_url_ + model + ":generateContent?key=" + key_manager_->get_current_key();
}

// --- 1. WIRE FORMAT ---

json GeminiEngine::build_payload(const EngineRequest& request) {
    json contents = json::array();

    for (const auto& m : request.messages) {
        if (m.role == "tool") {
            json part = {{"functionResponse", {{"name", m.tool.value("name", "")},
                                               {"response", m.tool.value("response", json::object())}}}};
            // Consecutive tool results travel together in one turn
            if (!contents.empty() && contents.back().value("role", "") == "function") {
                contents.back()["parts"].push_back(part);
            } else {
                contents.push_back({{"role", "function"}, {"parts", json::array({part})}});
            }
            continue;
        }

        json parts = json::array();
        if (!m.content.empty()) parts.push_back({{"text", m.content}});
        if (m.role == "model" && m.tool.is_object() && m.tool.contains("calls")) {
            for (const auto& call : m.tool["calls"]) {
                parts.push_back({{"functionCall", {{"name", call.value("name", "")},
                                                   {"args", call.value("args", json::object())}}}});
            }
        }
        if (parts.empty()) parts.push_back({{"text", ""}});
        contents.push_back({{"role", m.role == "model" ? "model" : "user"}, {"parts", parts}});
    }

    json payload = {{"contents", contents}};
    if (request.tools.is_array() && !request.tools.empty()) {
        payload["tools"] = json::array({{{"functionDeclarations", request.tools}}});
    }
    return payload;
}

EngineReply GeminiEngine::parse_reply(const json& body, size_t request_chars) {
    if (!body.is_object() || !body.contains("candidates") || !body["candidates"].is_array() ||
        body["candidates"].empty()) {
        throw ReviewerError(ErrorCode::EngineProtocolError, "Engine reply has no candidates");
    }
    const json& candidate = body["candidates"][0];
    if (!candidate.contains("content") || !candidate["content"].contains("parts") ||
        !candidate["content"]["parts"].is_array()) {
        throw ReviewerError(ErrorCode::EngineProtocolError,
                            "Engine candidate has no content (finishReason: " + candidate.value("finishReason", "?") + ")");
    }

    EngineReply reply;
    for (const auto& part : candidate["content"]["parts"]) {
        if (part.contains("text") && part["text"].is_string()) {
            reply.text += part["text"].get<std::string>();
        }
        if (part.contains("functionCall")) {
            const json& fc = part["functionCall"];
            if (!fc.contains("name") || !fc["name"].is_string()) {
                throw ReviewerError(ErrorCode::EngineProtocolError, "functionCall without a name");
            }
            EngineToolCall call;
            call.name = fc["name"].get<std::string>();
            call.args = fc.value("args", json::object());
            reply.tool_calls.push_back(std::move(call));
        }
    }

    if (body.contains("usageMetadata") && body["usageMetadata"].contains("totalTokenCount")) {
        reply.tokens_used = body["usageMetadata"]["totalTokenCount"].get<int64_t>();
    } else {
        reply.tokens_used = static_cast<int64_t>((request_chars + reply.text.size()) / 4);
    }
    return reply;
}

// --- 2. TRANSPORT ---

EngineReply GeminiEngine::complete(const EngineRequest& request) {
    if (key_manager_->get_active_key_count() == 0) {
        throw ReviewerError(ErrorCode::EngineUnreachable, "No API key configured for the reasoning engine");
    }

    const std::string body = build_payload(request).dump(-1, ' ', false, json::error_handler_t::replace);
    cpr::Response r;

    for (int i = 0; i < kMaxAttempts; ++i) {
        // Fresh URL each attempt so a rotated key is used
        r = cpr::Post(cpr::Url{endpoint_url(request.model)},
                      cpr::Body{body},
                      cpr::Header{{"Content-Type", "application/json"}});

        if (r.status_code == 200) break;

        bool transient = r.status_code == 429 || r.status_code == 503 || r.error.code != cpr::ErrorCode::OK;
        if (transient && i + 1 < kMaxAttempts) {
            spdlog::warn("⚠️ Engine {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, r.error.message.empty() ? "quota" : r.error.message, i + 1, kMaxAttempts);
            if (r.status_code == 429 || r.status_code == 503) key_manager_->report_rate_limit();
            std::this_thread::sleep_for(backoff_ + std::chrono::milliseconds(i * 1000));
            continue;
        }
        break;
    }

    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) {
        spdlog::error("❌ Engine unreachable: {}", r.error.message);
        throw ReviewerError(ErrorCode::EngineUnreachable, "Engine unreachable: " + r.error.message);
    }
    if (r.status_code == 429 || r.status_code == 503) {
        spdlog::error("❌ Engine still throttled after {} attempts", kMaxAttempts);
        throw ReviewerError(ErrorCode::EngineUnreachable,
                            "Engine throttled after " + std::to_string(kMaxAttempts) + " attempts");
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Engine API error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 500));
        throw ReviewerError(ErrorCode::EngineProtocolError,
                            "Engine returned HTTP " + std::to_string(r.status_code));
    }

    json parsed;
    try {
        parsed = json::parse(r.text);
    } catch (const json::exception& e) {
        throw ReviewerError(ErrorCode::EngineProtocolError, std::string("Engine reply is not JSON: ") + e.what());
    }
    return parse_reply(parsed, body.size());
}

} // namespace reviewer
