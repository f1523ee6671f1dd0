/**
 * @file tf_node_cli.cpp
 * @brief Dispatcher/worker CLI
 *
 * Single binary, two modes:
 *   --mode=host  Start a dispatcher, print the OTP, wait for workers
 *   --mode=join  Connect to a dispatcher as a worker running the demo
 *                handlers (echo, sum, sleep_ms, word_count)
 *
 * Defaults come from TASKFABRIC_* environment variables (see config.hpp).
 * SIGUSR1 in host mode issues a fresh OTP.
 */

#include "taskfabric/cipher.hpp"
#include "taskfabric/config.hpp"
#include "taskfabric/dispatcher.hpp"
#include "taskfabric/metrics.h"
#include "taskfabric/task_registry.hpp"
#include "taskfabric/worker_agent.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

using namespace taskfabric;

static volatile sig_atomic_t g_stop  = 0;
static volatile sig_atomic_t g_regen = 0;
static void sig_handler(int) { g_stop = 1; }
static void sig_regen(int)   { g_regen = 1; }

static bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

/* ================================================================== */
/*  Host Mode — dispatcher                                             */
/* ================================================================== */

static int run_host(const Config& cfg, const std::string& key_file,
                    const char* password) {
    cipher::Key key{};
    if (file_exists(key_file)) {
        tf_status st = load_key_file(key_file, &key);
        if (st != TF_OK) {
            std::fprintf(stderr, "[host] cannot load %s: %s\n",
                         key_file.c_str(), tf_status_str(st));
            return 1;
        }
        std::printf("[host] using existing key from %s\n", key_file.c_str());
    } else {
        tf_status st;
        if (password) {
            std::vector<uint8_t> salt;
            st = cipher::derive_key(password, &salt, &key);
        } else {
            st = cipher::generate_key(&key);
        }
        if (st == TF_OK) st = save_key_file(key_file, key);
        if (st != TF_OK) {
            std::fprintf(stderr, "[host] cannot create key: %s\n", tf_status_str(st));
            return 1;
        }
        std::printf("[host] generated new key, saved to %s\n", key_file.c_str());
    }

    Dispatcher dispatcher(cfg.dispatcher_config(), key);
    tf_status st = dispatcher.start();
    if (st != TF_OK) {
        std::fprintf(stderr, "[host] start failed: %s\n", tf_status_str(st));
        return 1;
    }

    std::string hex = cipher::key_to_hex(key);
    std::printf("[host] listening on port %u\n", static_cast<unsigned>(dispatcher.port()));
    std::printf("[host] one-time password: %s\n", dispatcher.session_secret().c_str());
    std::printf("[host] encryption key: %.16s...\n", hex.c_str());
    std::printf("[host] waiting for workers (Ctrl+C to stop, SIGUSR1 for a new OTP)\n");
    std::fflush(stdout);

    auto next_report = std::chrono::steady_clock::now();
    const auto report_every = std::chrono::milliseconds(cfg.heartbeat_interval_ms);
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (g_regen) {
            g_regen = 0;
            std::printf("[host] new one-time password: %s\n",
                        dispatcher.regenerate_session_secret().c_str());
            std::fflush(stdout);
        }

        auto now = std::chrono::steady_clock::now();
        if (now < next_report) continue;
        next_report = now + report_every;

        auto workers = dispatcher.snapshot_workers();
        tf_log(TF_LOG_INFO, "cli", "%zu worker(s), %zu pending task(s)",
               workers.size(), dispatcher.pending_count());
        for (const auto& w : workers) {
            tf_log(TF_LOG_DEBUG, "cli", "  %s (%s) %s task=%s",
                   w.worker_id.c_str(), w.hostname.c_str(), w.address.c_str(),
                   w.current_task.empty() ? "-" : w.current_task.c_str());
        }
    }

    std::printf("\n[host] stopping\n");
    dispatcher.stop();

    char buf[1024];
    if (tf_metrics_to_json(buf, sizeof(buf)) > 0)
        tf_log(TF_LOG_INFO, "cli", "metrics %s", buf);
    return 0;
}

/* ================================================================== */
/*  Join Mode — worker                                                 */
/* ================================================================== */

static int run_join(const Config& cfg, const char* host, const char* otp,
                    const char* worker_id, const std::string& key_file) {
    if (!file_exists(key_file)) {
        std::fprintf(stderr, "[join] key file %s not found; start the host "
                             "with --key-file first\n", key_file.c_str());
        return 1;
    }
    cipher::Key key{};
    tf_status st = load_key_file(key_file, &key);
    if (st != TF_OK) {
        std::fprintf(stderr, "[join] cannot load %s: %s\n",
                     key_file.c_str(), tf_status_str(st));
        return 1;
    }

    auto registry = std::make_shared<TaskRegistry>();
    register_demo_handlers(registry.get());

    WorkerAgent worker(cfg.worker_config(host, otp, worker_id ? worker_id : "", key),
                       registry);

    std::printf("[join] connecting to %s:%u as %s\n", host,
                static_cast<unsigned>(cfg.host_port),
                worker.worker_id().c_str());
    std::string reason;
    st = worker.connect(&reason);
    if (st != TF_OK) {
        std::fprintf(stderr, "[join] failed to connect: %s (%s)\n",
                     tf_status_str(st), reason.c_str());
        return 1;
    }
    std::printf("[join] connected; serving %zu handlers\n", registry->size());
    std::fflush(stdout);

    while (!g_stop && !worker.wait_until_disconnected(200)) {}

    WorkerStatus s = worker.status();
    worker.stop();
    std::printf("[join] done: %llu task(s) executed, %llu failed\n",
                static_cast<unsigned long long>(s.tasks_executed),
                static_cast<unsigned long long>(s.tasks_failed));
    return 0;
}

/* ================================================================== */
/*  Main — argument parsing                                            */
/* ================================================================== */

static void usage(const char* prog) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --mode=host [--port=PORT] [--key-file=PATH] [--password=PW]\n"
        "  %s --mode=join --host=HOST --otp=OTP [--port=PORT] [--worker-id=ID]"
        " [--key-file=PATH]\n", prog, prog);
}

int main(int argc, char** argv) {
    const char* mode      = nullptr;
    const char* host      = nullptr;
    const char* otp       = nullptr;
    const char* worker_id = nullptr;
    const char* password  = nullptr;
    std::string key_file  = "taskfabric.key";

    Config cfg = Config::from_env();
    tf_log_set_level(cfg.log_level);

    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--mode=", 7) == 0)      mode      = argv[i] + 7;
        if (std::strncmp(argv[i], "--host=", 7) == 0)      host      = argv[i] + 7;
        if (std::strncmp(argv[i], "--otp=", 6) == 0)       otp       = argv[i] + 6;
        if (std::strncmp(argv[i], "--key=", 6) == 0)       otp       = argv[i] + 6;
        if (std::strncmp(argv[i], "--worker-id=", 12) == 0) worker_id = argv[i] + 12;
        if (std::strncmp(argv[i], "--password=", 11) == 0) password  = argv[i] + 11;
        if (std::strncmp(argv[i], "--key-file=", 11) == 0) key_file  = argv[i] + 11;
        if (std::strncmp(argv[i], "--port=", 7) == 0)
            cfg.host_port = static_cast<uint16_t>(std::atoi(argv[i] + 7));
    }

    if (!mode) { usage(argv[0]); return 1; }

    std::signal(SIGINT, sig_handler);
    std::signal(SIGTERM, sig_handler);
    std::signal(SIGPIPE, SIG_IGN);

    if (std::strcmp(mode, "host") == 0) {
        std::signal(SIGUSR1, sig_regen);
        return run_host(cfg, key_file, password);
    }

    if (std::strcmp(mode, "join") == 0) {
        if (!host || !otp) {
            std::fprintf(stderr, "join mode requires --host=HOST --otp=OTP\n");
            return 1;
        }
        return run_join(cfg, host, otp, worker_id, key_file);
    }

    std::fprintf(stderr, "unknown mode: %s\n", mode);
    usage(argv[0]);
    return 1;
}
