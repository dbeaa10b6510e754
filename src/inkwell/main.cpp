#include <inkwell/base/event-loop.h>
#include <inkwell/config.h>
#include <inkwell/overlay/overlay-api.h>
#include <inkwell/rpc/overlay-handler.h>
#include <inkwell/rpc/remote-game-window.h>
#include <inkwell/rpc/rpc-server.h>
#include <inkwell/rpc/socket-path.h>
#include <inkwell/scene/scene-surface.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <uv.h>

#include <csignal>
#include <iostream>
#include <string>

using namespace inkwell;

static overlay::OverlayConfig overlayConfigFrom(const Config& config) {
    overlay::OverlayConfig out;
    out.maxFontSize = config.maxFontSize();
    out.fallbackFont = config.fallbackFont();
    out.animationMs = config.animationMs();
    int cacheSize = config.imageCacheSize();
    out.imageCacheSize = cacheSize > 0 ? static_cast<size_t>(cacheSize) : overlay::DEFAULT_IMAGE_CACHE_SIZE;
    return out;
}

struct ShutdownContext {
    rpc::RpcServer::Ptr server;
    base::EventLoop::Ptr loop;
};

static void onSignal(uv_signal_t* handle, int signum) {
    auto* ctx = static_cast<ShutdownContext*>(handle->data);
    spdlog::info("inkwell: signal {}, shutting down", signum);
    if (auto res = ctx->server->stop(); !res) {
        spdlog::error("inkwell: server stop failed: {}", error_msg(res));
    }
    uv_signal_stop(handle);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), nullptr);
    if (auto res = ctx->loop->stop(); !res) {
        spdlog::error("inkwell: loop stop failed: {}", error_msg(res));
    }
}

int main(int argc, const char** argv) {
    args::ArgumentParser parser("inkwell", "Overlay command daemon");
    parser.Prog(argv[0]);
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path",
        "Config file (default: $XDG_CONFIG_HOME/inkwell/config.yaml)", {'c', "config"});
    args::ValueFlag<std::string> socketFlag(parser, "path",
        "Socket path (default: $XDG_RUNTIME_DIR/inkwell/inkwell-<pid>.sock)", {'s', "socket"});
    args::ValueFlag<std::string> logLevelFlag(parser, "level",
        "Log level: trace, debug, info, warn, error", {'l', "log-level"});
    args::Flag detachedFlag(parser, "detached",
        "Start without a surface; every command is a no-op", {"detached"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (socketFlag) {
        overrides["rpc"]["socket"] = args::get(socketFlag);
    }
    if (logLevelFlag) {
        overrides["log"]["level"] = args::get(logLevelFlag);
    }
    if (detachedFlag) {
        overrides["overlay"]["attach-on-start"] = false;
    }

    auto configResult = Config::create(configFlag ? args::get(configFlag) : std::string(), overrides);
    if (!configResult) {
        std::cerr << "error: " << error_msg(configResult) << "\n";
        return 1;
    }
    auto config = *configResult;

    spdlog::set_level(spdlog::level::from_str(config->logLevel()));
    spdlog::info("inkwell starting...");

    auto loopResult = base::EventLoop::instance();
    if (!loopResult) {
        spdlog::error("inkwell: {}", error_msg(loopResult));
        return 1;
    }
    auto loop = *loopResult;

    auto window = std::make_shared<rpc::RemoteGameWindow>();

    auto apiResult = overlay::OverlayApi::create(loop, window, overlayConfigFrom(*config));
    if (!apiResult) {
        spdlog::error("inkwell: {}", error_msg(apiResult));
        return 1;
    }
    auto api = *apiResult;

    auto sceneResult = scene::SceneSurface::create();
    if (!sceneResult) {
        spdlog::error("inkwell: {}", error_msg(sceneResult));
        return 1;
    }
    auto scene = *sceneResult;
    if (config->attachOnStart()) {
        api->attachSurface(scene);
    } else {
        spdlog::info("inkwell: starting detached");
    }

    std::string socketPath = config->socketPath();
    if (socketPath.empty()) {
        auto pathResult = rpc::createSocketPath();
        if (!pathResult) {
            spdlog::error("inkwell: {}", error_msg(pathResult));
            return 1;
        }
        socketPath = *pathResult;
    }

    auto serverResult = rpc::RpcServer::create(socketPath);
    if (!serverResult) {
        spdlog::error("inkwell: {}", error_msg(serverResult));
        return 1;
    }
    auto server = *serverResult;

    if (auto res = rpc::registerOverlayHandlers(*server, api); !res) {
        spdlog::error("inkwell: {}", error_msg(res));
        return 1;
    }
    if (auto res = rpc::registerWindowHandlers(*server, window, loop); !res) {
        spdlog::error("inkwell: {}", error_msg(res));
        return 1;
    }
    if (auto res = rpc::registerSceneHandlers(*server, api, scene); !res) {
        spdlog::error("inkwell: {}", error_msg(res));
        return 1;
    }

    if (auto res = server->start(); !res) {
        spdlog::error("inkwell: {}", error_msg(res));
        return 1;
    }
    if (auto res = rpc::exportSocketPath(socketPath); !res) {
        spdlog::warn("inkwell: {}", error_msg(res));
    }
    spdlog::info("inkwell: listening on {}", socketPath);

    ShutdownContext shutdown{server, loop};
    uv_signal_t sigint;
    uv_signal_t sigterm;
    uv_signal_init(uv_default_loop(), &sigint);
    uv_signal_init(uv_default_loop(), &sigterm);
    sigint.data = &shutdown;
    sigterm.data = &shutdown;
    uv_signal_start(&sigint, onSignal, SIGINT);
    uv_signal_start(&sigterm, onSignal, SIGTERM);

    int rc = loop->start();

    api->detachSurface();
    spdlog::info("inkwell: stopped");
    return rc;
}
