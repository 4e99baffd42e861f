#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>
#include <string>

#include "agent/ReviewOrchestrator.hpp"
#include "config.hpp"
#include "engine/GeminiEngine.hpp"
#include "engine/KeyManager.hpp"
#include "errors.hpp"
#include "rate_limiter.hpp"
#include "service/ReviewServer.hpp"
#include "session/SessionStore.hpp"

using namespace reviewer;

// reviewer_service [--config <path>] [--port <n>] [--verbose]
int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path;
    int port_override = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port_override = std::atoi(argv[++i]);
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::error("Unknown argument: {}", arg);
            return 2;
        }
    }

    try {
        ReviewerConfig config = load_config("", config_path);
        if (port_override > 0) config.service.port = port_override;

        SessionStore store(config.session_dir);
        RateLimitManager limiter(config.rate_limits);
        GeminiEngine engine(std::make_shared<KeyManager>());
        ReviewOrchestrator orchestrator(store, limiter, engine, config);

        ReviewServer server(orchestrator, store);
        server.run(config.service.host, config.service.port);
    } catch (const ReviewerError& e) {
        spdlog::critical("💥 {}: {}", to_string(e.code()), e.what());
        return 1;
    }
    return 0;
}
