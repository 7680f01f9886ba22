// coordinatorMain.cpp - Demo process running the coordinator against simulated agents.
#include "coordination/Coordinator.hpp"
#include "CoordinatorOptions.hpp"
#include "SimulatedAgent.hpp"
#include "WorkloadGenerator.hpp"
#include "options/Options.hpp"
#include "processUtils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <sstream>
#include <thread>

using namespace TaskRelay;

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

static std::string format_statistics(const Coordinator& coordinator, ProcessUsageSampler& sampler) {
    const auto queue = coordinator.get_queue_status();
    const auto handoffs = coordinator.handoff_stats();
    const auto usage = sampler.sample();

    std::ostringstream oss;
    oss << "Tasks: queued=" << queue.queued << " pending=" << queue.pending
        << " assigned=" << queue.assigned << " in_progress=" << queue.in_progress
        << " completed=" << queue.completed << " failed=" << queue.failed
        << " executions=" << coordinator.active_executions()
        << " | Handoffs: total=" << handoffs.total << " success_rate=" << handoffs.success_rate
        << " avg_ms=" << handoffs.average_duration_ms
        << " | CPU " << usage.cpu_percent << "% RSS " << (usage.memory_bytes / 1024) << " KiB\n"
        << coordinator.execution_loop().format_statistics();
    return oss.str();
}

// Submits demo batches until the workload is exhausted or shutdown is requested
static void workload_thread_func(Coordinator* coordinator,
                                 DefaultWorkloadGenerator* generator,
                                 WorkloadOptions workload,
                                 uint32_t stats_interval_s,
                                 ProcessUsageSampler* sampler,
                                 std::shared_ptr<Logger> logger) {
    const auto batch_interval = std::chrono::milliseconds(workload.interval_ms);
    const auto stats_interval = std::chrono::seconds(stats_interval_s);
    auto next_batch = std::chrono::steady_clock::now();
    auto next_stats = next_batch + stats_interval;

    while (!shutdown_requested.load(std::memory_order_relaxed)) {
        const auto now = std::chrono::steady_clock::now();
        const bool exhausted = workload.max_tasks != 0 && generator->generated() >= workload.max_tasks;
        if (!exhausted && now >= next_batch) {
            uint32_t count = workload.batch_size;
            if (workload.max_tasks != 0) {
                const auto remaining = workload.max_tasks - generator->generated();
                if (remaining < count) count = static_cast<uint32_t>(remaining);
            }
            auto ids = generator->submit_tasks(*coordinator, count);
            logger->info("Submitted " + std::to_string(ids.size()) + " demo task(s)");
            next_batch = now + batch_interval;
        }
        if (stats_interval_s != 0 && now >= next_stats) {
            logger->info(format_statistics(*coordinator, *sampler));
            next_stats = now + stats_interval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    logger->info("Workload thread received shutdown signal");
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("TaskRelay");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---
        // Options auto-register via static objects
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        if (auto level = parse_log_level(coordinator_opts::get_log_level())) {
            stdout_sink->set_level(*level);
        }
        if (auto config_file = shared_opts::Options::get_config_file()) {
            logger->info("Loaded configuration from " + config_file->string());
        }

        // --- Stage 3: Bring up the coordinator ---
        logger->info("task-relay starting...");
        Coordinator coordinator(logger, coordinator_opts::get_coordinator_config());

        coordinator.subscribe([logger](const CoordinatorEvent& event) {
            logger->info("[event] " + describe(event));
        });

        std::vector<std::shared_ptr<SimulatedAgent>> agents;
        for (auto& spec : coordinator_opts::get_agents()) {
            auto agent = std::make_shared<SimulatedAgent>(std::move(spec), logger);
            coordinator.register_agent(agent);
            agents.push_back(std::move(agent));
        }
        logger->info("Registered " + std::to_string(agents.size()) + " simulated agent(s)");

        coordinator.start();

        // --- Stage 4: Feed the demo workload until shutdown ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        const auto workload = coordinator_opts::get_workload();
        DefaultWorkloadGenerator generator(workload.templates);
        ProcessUsageSampler sampler;
        std::thread workload_thread(workload_thread_func, &coordinator, &generator, workload,
                                    coordinator_opts::get_stats_interval_s(), &sampler, logger);
        workload_thread.join();

        logger->info("Shutting down coordinator...");
        generator.stop();
        coordinator.stop();
        logger->info(format_statistics(coordinator, sampler));

    } catch (const std::exception& e) {
        logger->error("Exception in task-relay main: " + std::string(e.what()));
        return 1;
    }

    // --- Stage 5: Final shutdown log ---
    logger->info("task-relay shut down successfully");
    return 0;
}
