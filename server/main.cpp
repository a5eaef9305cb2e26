// scenesync_server: realtime sync server for the scene editor.
//
// Usage: scenesync_server [--config <file.json>]
//
// Settings come from the optional JSON file, then the environment
// (PORT, STORAGE_DIR, REDIS_URL, ...). See scenesync/config.hpp.

#include "ws_server.hpp"

#include <scenesync/auth.hpp>
#include <scenesync/blob_store.hpp>
#include <scenesync/config.hpp>
#include <scenesync/fanout_bus.hpp>
#include <scenesync/log.hpp>
#include <scenesync/persistence.hpp>
#include <scenesync/session_manager.hpp>

#ifdef SCENESYNC_WITH_REDIS
#include <scenesync/redis_bus.hpp>
#endif

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

namespace {

namespace asio = boost::asio;
using scenesync::server::tcp;

constexpr auto tick_interval = std::chrono::milliseconds{100};

auto parse_args(int argc, char** argv) -> std::optional<std::filesystem::path> {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) return std::filesystem::path{argv[++i]};
        if (arg == "--help" || arg == "-h") {
            std::printf("usage: %s [--config <file.json>]\n", argv[0]);
            std::exit(EXIT_SUCCESS);
        }
    }
    return std::nullopt;
}

auto make_bus(const scenesync::Config& config) -> std::shared_ptr<scenesync::FanoutBus> {
    if (!config.redis_url.empty()) {
#ifdef SCENESYNC_WITH_REDIS
        scenesync::log::get()->info("fan-out over redis at {}", config.redis_url);
        return std::make_shared<scenesync::RedisBus>(config.redis_url);
#else
        scenesync::log::get()->warn("REDIS_URL is set but this build has no redis support; "
                                    "running single-process");
#endif
    }
    return std::make_shared<scenesync::LocalBus>();
}

auto make_authorizer(const scenesync::Config& config) -> std::shared_ptr<scenesync::Authorizer> {
    if (config.grants_file.empty()) {
        scenesync::log::get()->warn("no grants file configured; every connection will be rejected");
        return std::make_shared<scenesync::StaticAuthorizer>();
    }
    return std::make_shared<scenesync::StaticAuthorizer>(
        scenesync::StaticAuthorizer::from_file(config.grants_file));
}

}  // namespace

int main(int argc, char** argv) {
    auto log = scenesync::log::get();

    auto config = scenesync::Config{};
    try {
        config = scenesync::load_config(parse_args(argc, argv));
    } catch (const std::exception& e) {
        log->critical("invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    if (!scenesync::log::set_level(config.log_level)) {
        log->warn("unknown log level '{}', keeping info", config.log_level);
    }

    try {
        auto store = std::make_shared<scenesync::FileBlobStore>(config.storage_dir);
        auto persistence = std::make_shared<scenesync::PersistenceService>(store,
            scenesync::PersistenceOptions{
                .snapshot_interval = config.snapshot_interval,
                .snapshot_every_ops = config.snapshot_every_ops,
                .retain_generations = config.retain_generations,
                .retry_initial = config.retry_initial,
                .retry_max = config.retry_max,
                .max_attempts = config.max_attempts,
                .writer = config.instance_id.empty() ? std::string{"local"} : config.instance_id,
            });
        auto bus = make_bus(config);
        auto manager = std::make_unique<scenesync::SessionManager>(
            scenesync::SessionManagerOptions::from_config(config), make_authorizer(config),
            persistence, bus);

        auto ctx = scenesync::server::ServerContext{.manager = *manager, .bus = *bus, .store = *store};
        auto ioc = asio::io_context{static_cast<int>(config.io_threads)};
        auto endpoint = tcp::endpoint{asio::ip::make_address(config.bind_address), config.port};
        auto listener = std::make_shared<scenesync::server::Listener>(ioc, endpoint, ctx);
        listener->run();

        auto ticker = std::jthread{[&](std::stop_token stop) {
            while (!stop.stop_requested()) {
                std::this_thread::sleep_for(tick_interval);
                manager->tick(scenesync::SessionManager::Clock::now());
            }
        }};

        auto signals = asio::signal_set{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            log->info("received signal {}, shutting down", signal);
            listener->stop();
            ticker.request_stop();
            manager->shutdown(scenesync::SessionManager::Clock::now());
            ioc.stop();
        });

        log->info("{} listening on {}:{} (instance {})", "scenesync", config.bind_address,
                  config.port, manager->instance_id());
        log->info("websocket endpoint: ws://{}:{}/ws/:siteId/:version", config.bind_address, config.port);

        auto threads = std::vector<std::jthread>{};
        for (std::size_t i = 1; i < config.io_threads; ++i) {
            threads.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        threads.clear();
        ticker.request_stop();
        ticker.join();
        log->info("shutdown complete");
    } catch (const std::exception& e) {
        log->critical("fatal: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
