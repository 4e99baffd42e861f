#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/KeyManager.hpp"
#include "engine/ReasoningEngine.hpp"

namespace reviewer {

// generateContent over HTTPS. Every call carries the full history and the tool declarations.
class GeminiEngine : public IReasoningEngine {
public:
    static constexpr int kMaxAttempts = 4;

    explicit GeminiEngine(std::shared_ptr<KeyManager> key_manager,
                          std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/",
                          std::chrono::milliseconds backoff = std::chrono::milliseconds(2000));

    EngineReply complete(const EngineRequest& request) override;

    // Request body for a history plus tool declarations.
    static nlohmann::json build_payload(const EngineRequest& request);

    // Reads candidates[0]; throws EngineProtocolError when the body has no usable candidate.
    static EngineReply parse_reply(const nlohmann::json& body, size_t request_chars);

private:
    std::string endpoint_url(const std::string& model) const;

    std::shared_ptr<KeyManager> key_manager_;
    const std::string base_url_;
    const std::chrono::milliseconds backoff_;
};

} // namespace reviewer
