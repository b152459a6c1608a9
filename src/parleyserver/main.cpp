#include "broker/broker.hpp"
#include "config/server_config.hpp"
#include "core/config.hpp"
#include "core/varint.hpp"
#include "core/version.hpp"
#include "parleyserver/health.hpp"
#include "parleyserver/notifier.hpp"
#include "parleyserver/ws_controller.hpp"
#include "protocol/envelope.hpp"
#include "session/keepalive.hpp"
#include "store/memory_store.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/Logger.h>

#include <cstdio>
#include <memory>
#include <string>

#include <unistd.h>

using namespace parley;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Options:\n"
        "  -config <path>              JSON configuration file\n"
        "  -listen <host>:<port>       Listen address (default: 0.0.0.0:8080)\n"
        "  -threads <int>              Drogon I/O threads (default: all cores)\n"
        "  -workers <int>              Session/broker worker threads (default: all cores)\n"
        "  -ping_interval <int>        Keep-alive ping interval in seconds (default: %d, 0 = off)\n"
        "  -mailbox_capacity <int>     Pending events per session before it is dropped (default: %zu)\n"
        "  -pid <path>                 PID file path\n"
        "  -v, --verbose               Verbose logging\n"
        "  --version                   Print version and exit\n",
        prog, DEFAULT_PING_INTERVAL, DEFAULT_MAILBOX_CAPACITY);
}

static void write_pid_file(const std::string& path, const Logger& logger) {
    FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        logger.warn("Cannot write PID file %s", path.c_str());
        return;
    }
    std::fprintf(f, "%d\n", ::getpid());
    std::fclose(f);
}

// Sessions go first: stopping them posts their disconnects to the broker.
// Every queued task has finished on return, so the pool, store, notifier and
// logger on main's frame can be destroyed.
static void shut_down(ConversationSocket& socket, Broker& broker, KeepAlive& keepalive,
                      WorkerPool& pool, const Logger& logger) {
    keepalive.stop();
    size_t stopped = socket.close_all();
    pool.wait();
    broker.close_mailbox();
    pool.wait();
    logger.info("Stopped %zu session(s)", stopped);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "parleyserver")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    ServerConfig config;
    std::string err;
    if (cli.has("-config") &&
        !load_server_config(cli.get_string("-config"), config, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    if (!apply_cli_overrides(cli, config, err) ||
        !validate_server_config(config, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        print_usage(argv[0]);
        return 1;
    }

    Logger logger(config.log_level);
    bool verbose = logger.verbose();

    InMemoryMessageStore store;
    for (const auto& c : config.conversations) {
        store.add_conversation(c.id, c.members);
    }
    if (config.conversations.empty()) {
        logger.warn("No conversations configured; every join will be refused");
    }

    int workers = resolve_threads(config.workers);
    WorkerPool pool(workers);

    LoggingNotifier notifier(logger);
    BrokerOptions broker_options;
    broker_options.require_membership = config.require_membership;
    auto broker = Broker::create(pool, store, broker_options, logger, &notifier);

    KeepAlive keepalive;
    keepalive.start(config.ping_interval, logger);

    SessionContext ctx;
    ctx.pool = &pool;
    ctx.broker = broker;
    ctx.keepalive = &keepalive;
    ctx.options.mailbox_capacity = config.mailbox_capacity;
    ctx.options.max_held_frames = config.mailbox_capacity;
    ctx.logger = &logger;

    auto socket = std::make_shared<ConversationSocket>(ctx);
    drogon::app().registerController(socket);
    register_health_route("/api/v1/health", broker);

    int threads = resolve_threads(config.threads);

    drogon::app()
        .addListener(config.host, config.port)
        .setThreadNum(static_cast<size_t>(threads))
        .setClientMaxWebSocketMessageSize(
            static_cast<size_t>(MAX_PAYLOAD_SIZE) + ENVELOPE_FIXED_SIZE + VARINT_MAX_BYTES)
        .setLogLevel(verbose ? trantor::Logger::kDebug
                             : trantor::Logger::kWarn);

    if (!config.pid_file.empty()) {
        write_pid_file(config.pid_file, logger);
    }

    logger.info("parleyserver %s listening on %s:%u (threads: %d, workers: %d)",
                PARLEY_VERSION, config.host.c_str(), config.port, threads, workers);
    logger.info("Conversations: %zu, membership %s, ping interval: %d seconds",
                config.conversations.size(),
                config.require_membership ? "enforced" : "not enforced",
                config.ping_interval);

    // Blocks until shutdown via SIGTERM/SIGINT
    drogon::app().run();

    logger.info("Shutting down");
    shut_down(*socket, *broker, keepalive, pool, logger);

    if (!config.pid_file.empty()) {
        std::remove(config.pid_file.c_str());
    }

    return 0;
}
