// SPDX-License-Identifier: Apache-2.0
// Part of Shelf project.
// apps/shelf_server.cpp

#include "shelf/server.hpp"
#include "shelf/server_config.hpp"
#include "shelf/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <csignal>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --directory <root> [--port 4221] [--bind 127.0.0.1]\n"
         "  [--workers 8] [--max_request <bytes>] [--io_timeout <sec>]\n"
         "  [--request_timeout <sec>]          (deadline for reading one request)\n"
         "  [--strict_paths 0|1]               (reject '..' and absolute file names)\n"
         "  [--log_file <path>]                (empty string disables the log file)\n"
         "  [--quiet 0|1]                      (suppress all console logs when 1)\n"
         "  Redis blob backend (instead of --directory):\n"
         "    --store_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix shelf:blob:] [--redis_pool 8]\n"
         "    [--redis_timeout_ms 200]\n";
}

int main(int argc, char** argv) {
    shelf::ServerConfig cfg;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--directory" && i+1 < argc) cfg.directory = argv[++i];
            else if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--bind" && i+1 < argc) cfg.bind_address = argv[++i];
            else if (a == "--workers" && i+1 < argc) cfg.workers = std::stoi(argv[++i]);
            else if (a == "--max_request" && i+1 < argc) cfg.max_request = std::stoul(argv[++i]);
            else if (a == "--io_timeout" && i+1 < argc) cfg.io_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--request_timeout" && i+1 < argc) cfg.request_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--strict_paths" && i+1 < argc) cfg.strict_paths = (std::stoi(argv[++i]) != 0);
            else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);

            // Redis backend flags
            else if (a == "--store_redis" && i+1 < argc) cfg.store_use_redis = (std::stoi(argv[++i]) != 0);
            else if (a == "--redis_host" && i+1 < argc) cfg.redis.host = argv[++i];
            else if (a == "--redis_port" && i+1 < argc) cfg.redis.port = std::stoi(argv[++i]);
            else if (a == "--redis_db" && i+1 < argc)   cfg.redis.db = std::stoi(argv[++i]);
            else if (a == "--redis_password" && i+1<argc) cfg.redis.password = argv[++i];
            else if (a == "--redis_prefix" && i+1<argc)   cfg.redis.key_prefix = argv[++i];
            else if (a == "--redis_pool" && i+1<argc)     cfg.redis.pool_size = std::stoi(argv[++i]);
            else if (a == "--redis_timeout_ms" && i+1<argc) cfg.redis.timeout_ms = std::stoi(argv[++i]);

            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends: invalid_argument / out_of_range
        std::cerr << "bad numeric argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    shelf::set_log_file(cfg.log_file);

    // Store backend requirement
    if (!cfg.store_use_redis && cfg.directory.empty()) {
        std::cerr << "Either --directory (file backend) or --store_redis 1 (Redis backend) must be provided\n";
        return 2;
    }

    // A client hanging up mid-response must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        shelf::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
