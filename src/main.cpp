/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing (`--config`, `--set`, data directory, command).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (tiers, draft store, event loop).
 * 4. Command Execution; `edit` runs the event loop until EOF or a signal.
 */

#include "lyra/diag/handler.hpp"
#include "lyra/diag/line_reader.hpp"
#include "lyra/infra/clock.hpp"
#include "lyra/infra/event_loop.hpp"
#include "lyra/infra/logger.hpp"
#include "lyra/infra/worker_pool.hpp"
#include "lyra/session/config.hpp"
#include "lyra/session/editor_session.hpp"
#include "lyra/session/recovery.hpp"
#include "lyra/storage/draft_store.hpp"
#include "lyra/storage/file_tier.hpp"
#include "lyra/storage/memory_tier.hpp"
#include "lyra/storage/tiered_store.hpp"

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using lyra::infra::LogLevel;
using lyra::infra::Logger;

/// @brief Raised by the signal handler, polled by the event loop.
static volatile std::sig_atomic_t g_interrupted = 0;

/**
 * @brief System Signal Handler.
 *
 * Only raises a flag; the `edit` loop notices it and performs the final flush.
 */
void signal_handler(int signum)
{
    g_interrupted = signum;
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name
              << " [--config FILE] [--set KEY=VALUE]... DATA_DIR COMMAND [ARGS]\n"
              << "Commands:\n"
              << "  stats        Show used/capacity bytes per tier\n"
              << "  drafts       List stored drafts (least recently used first)\n"
              << "  show DOC     Print the content recovery would restore for DOC\n"
              << "  purge        Delete drafts older than maxDraftAgeMs\n"
              << "  clear-all    Delete every stored draft\n"
              << "  edit DOC     Open DOC and apply JSON requests read from stdin\n"
              << "Options:\n"
              << "  --config FILE     JSON configuration file\n"
              << "  --set KEY=VALUE   Override one option (e.g. --set throttleMs=5000)\n"
              << "  --help            Show this help message\n";
}

namespace {

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot read configuration file " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void check(const lyra::infra::Status& st)
{
    if (!st.ok()) {
        throw std::invalid_argument(st.describe());
    }
}

constexpr std::int64_t kInputPollMs = 20;

/**
 * @brief Runs an interactive editing session over stdin/stdout.
 *
 * The event loop owns the main thread and polls standard input every
 * `kInputPollMs`; each request line is dispatched and its response printed.
 */
int run_edit(const std::string& document_id, lyra::storage::DraftStore& store,
             const lyra::session::Config& cfg)
{
    lyra::infra::SteadyClock clock;
    lyra::infra::EventLoop loop(clock);
    lyra::infra::WorkerPool pool(2);

    lyra::session::EditorSession editor(lyra::session::DocumentRef{document_id, false}, loop,
                                        store, cfg, nullptr, &pool);
    const auto& outcome = editor.open();
    if (outcome.found()) {
        std::cout << "{\"status\":\"recovered\",\"source\":\"" << to_string(outcome.source)
                  << "\",\"age\":\"" << outcome.age_text(clock.wall_ms()) << "\"}" << std::endl;
    }

    lyra::diag::Context ctx{store, &editor};

    // Poll the signal flag from inside the loop.
    std::function<void()> watch = [&]() {
        if (g_interrupted) {
            Logger::log(LogLevel::WARN, "System: Interrupt received (Signal " +
                                            std::to_string(g_interrupted) +
                                            "). Flushing session...");
            loop.stop();
            return;
        }
        loop.schedule_after(100, watch);
    };
    loop.schedule_after(100, watch);

    lyra::diag::LineReader input(STDIN_FILENO);
    std::function<void()> pump = [&]() {
        std::vector<std::string> lines;
        bool more = input.drain(lines);
        for (const auto& line : lines) {
            if (line.empty()) {
                continue;
            }
            std::string response = lyra::diag::Handler::process(ctx, line);
            std::cout << response << std::endl;
            if (response.find("\"goodbye\"") != std::string::npos) {
                loop.stop();
                return;
            }
        }
        if (!more) {
            loop.stop();
            return;
        }
        loop.schedule_after(kInputPollMs, pump);
    };
    loop.post(pump);

    loop.run();

    editor.close();
    pool.wait_idle();
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help") {
        print_help(argv[0]);
        return args.empty() ? 1 : 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::init_from_env();
    Logger::set_color(isatty(fileno(stderr)) != 0);

    try {
        lyra::session::Config cfg;
        std::vector<std::string> positional;

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config" && i + 1 < args.size()) {
                lyra::infra::Status st;
                cfg = lyra::session::Config::from_json(read_file(args[++i]), st);
                check(st);
            } else if (args[i] == "--set" && i + 1 < args.size()) {
                check(cfg.apply_assignment(args[++i]));
            } else {
                positional.push_back(args[i]);
            }
        }

        if (positional.size() < 2) {
            print_help(argv[0]);
            return 1;
        }
        check(cfg.apply("dataDir", positional[0]));
        check(cfg.validate());

        LogLevel level;
        if (Logger::parse_level(cfg.log_level, level)) {
            Logger::set_threshold(level);
        }
        Logger::init_from_env();

        const std::string& command = positional[1];
        Logger::log(LogLevel::DEBUG, "Config: " + cfg.to_json());

        auto durable = std::make_unique<lyra::storage::FileTier>(cfg.data_dir, cfg.durable_capacity);
        durable->init();

        lyra::storage::TieredStore tiers(
            std::make_unique<lyra::storage::MemoryTier>(cfg.volatile_capacity), std::move(durable));
        lyra::infra::SteadyClock clock;
        lyra::storage::DraftStore store(tiers, clock, cfg.store_options());
        lyra::diag::Context ctx{store, nullptr};

        if (command == "stats") {
            std::cout << lyra::diag::Handler::process(ctx, "{\"action\":\"stats\"}") << std::endl;
        } else if (command == "drafts") {
            std::cout << lyra::diag::Handler::process(ctx, "{\"action\":\"drafts\"}") << std::endl;
        } else if (command == "clear-all") {
            std::cout << lyra::diag::Handler::process(ctx, "{\"action\":\"clear_all\"}")
                      << std::endl;
        } else if (command == "purge") {
            std::cout << lyra::diag::Handler::process(
                             ctx, "{\"action\":\"purge\",\"maxAgeMs\":" +
                                      std::to_string(cfg.max_draft_age_ms) + "}")
                      << std::endl;
        } else if (command == "show" && positional.size() > 2) {
            lyra::session::RecoveryResolver resolver(store);
            auto outcome = resolver.resolve(positional[2], false, false);
            if (!outcome.found()) {
                std::cerr << "No draft for " << positional[2] << std::endl;
                return 2;
            }
            std::cout << "# source: " << to_string(outcome.source)
                      << ", saved " << outcome.age_text(clock.wall_ms()) << "\n"
                      << outcome.content << std::endl;
        } else if (command == "edit" && positional.size() > 2) {
            return run_edit(positional[2], store, cfg);
        } else {
            print_help(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
