#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "session/Session.hpp"
#include "utf8.hpp"

namespace reviewer {

struct EngineRequest {
    std::vector<Message> messages;   // full history, resubmitted every turn
    nlohmann::json tools = nlohmann::json::array(); // function declarations; empty means answer only
    std::string model;
};

struct EngineToolCall {
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

struct EngineReply {
    std::vector<EngineToolCall> tool_calls;
    std::string text;
    int64_t tokens_used = 0;

    bool wants_tools() const { return !tool_calls.empty(); }
};

// Stateless reasoning engine. Implementations must not keep conversation state between calls.
class IReasoningEngine {
public:
    virtual ~IReasoningEngine() = default;

    // Throws EngineUnreachable or EngineProtocolError.
    virtual EngineReply complete(const EngineRequest& request) = 0;
};

} // namespace reviewer
