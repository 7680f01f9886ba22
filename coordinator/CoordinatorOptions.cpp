// CoordinatorOptions.cpp - task-relay options provider with auto-registration
#include "CoordinatorOptions.hpp"
#include "options/Options.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>

using namespace TaskRelay;

namespace {

struct CoordinatorOptionValues {
    int64_t assignment_interval_ms{1000};
    int64_t health_interval_ms{60000};
    int64_t inactivity_threshold_ms{300000};
    uint32_t max_retries{0};
    size_t max_handoffs{3};
    size_t history_limit{kTransferHistoryLimit};
    size_t execution_threads{1};
    bool default_rules{true};
    bool rules_on_assignment{true};
    bool rules_on_completion{true};
    SelectionWeights weights;
    std::vector<HandoffRule> rules;
    std::string log_level{"info"};
    uint32_t stats_interval_s{10};
    std::vector<SimulatedAgentSpec> agents;
    WorkloadOptions workload;
};

std::mutex g_coordinator_opts_mtx;
CoordinatorOptionValues g_values;
std::atomic<bool> g_coordinator_registered{false};

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

SimulatedAgentSpec parse_agent(const nlohmann::json& j) {
    SimulatedAgentSpec spec;
    spec.id = j.at("id").get<std::string>();
    spec.type = j.at("type").get<std::string>();
    read_value(j, "capabilities", spec.capabilities);
    read_value(j, "latency_ms", spec.latency_ms);
    read_value(j, "failure_rate", spec.failure_rate);
    read_value(j, "handoff_keyword", spec.handoff_keyword);
    read_value(j, "handoff_capabilities", spec.handoff_capabilities);
    if (spec.id.empty()) throw std::invalid_argument("agent id cannot be empty");
    if (spec.failure_rate < 0.0 || spec.failure_rate > 1.0) {
        throw std::invalid_argument("agent " + spec.id + ": failure_rate must be within [0,1]");
    }
    return spec;
}

WorkloadTemplate parse_template(const nlohmann::json& j) {
    WorkloadTemplate t;
    t.task = j.at("task").get<std::string>();
    read_value(j, "capabilities", t.capabilities);
    if (j.contains("priority")) {
        auto p = parse_task_priority(j["priority"].get<std::string>());
        if (!p) throw std::invalid_argument("unknown task priority '" + j["priority"].get<std::string>() + "'");
        t.priority = *p;
    }
    if (j.contains("metadata") && j["metadata"].is_object()) t.metadata = j["metadata"];
    return t;
}

void load_section(const nlohmann::json& cj, CoordinatorOptionValues& v) {
    read_value(cj, "assignment_interval_ms", v.assignment_interval_ms);
    read_value(cj, "health_interval_ms", v.health_interval_ms);
    read_value(cj, "inactivity_threshold_ms", v.inactivity_threshold_ms);
    read_value(cj, "max_retries", v.max_retries);
    read_value(cj, "max_handoffs_per_task", v.max_handoffs);
    read_value(cj, "handoff_history_limit", v.history_limit);
    read_value(cj, "execution_threads", v.execution_threads);
    read_value(cj, "default_rules", v.default_rules);
    read_value(cj, "evaluate_rules_on_assignment", v.rules_on_assignment);
    read_value(cj, "evaluate_rules_on_completion", v.rules_on_completion);
    read_value(cj, "log_level", v.log_level);
    read_value(cj, "stats_interval_s", v.stats_interval_s);

    if (cj.contains("selection") && cj["selection"].is_object()) {
        const auto& s = cj["selection"];
        read_value(s, "capability_weight", v.weights.capability_weight);
        read_value(s, "performance_weight", v.weights.performance_weight);
        read_value(s, "success_rate_weight", v.weights.success_rate_weight);
        read_value(s, "response_time_weight", v.weights.response_time_weight);
        read_value(s, "reference_response_ms", v.weights.reference_response_ms);
    }
    if (cj.contains("rules") && cj["rules"].is_array()) {
        for (const auto& r : cj["rules"]) v.rules.push_back(r.get<HandoffRule>());
    }
    if (cj.contains("agents") && cj["agents"].is_array()) {
        for (const auto& a : cj["agents"]) v.agents.push_back(parse_agent(a));
    }
    if (cj.contains("workload") && cj["workload"].is_object()) {
        const auto& w = cj["workload"];
        read_value(w, "interval_ms", v.workload.interval_ms);
        read_value(w, "batch_size", v.workload.batch_size);
        read_value(w, "max_tasks", v.workload.max_tasks);
        if (w.contains("templates") && w["templates"].is_array()) {
            for (const auto& t : w["templates"]) v.workload.templates.push_back(parse_template(t));
        }
    }
}

} // namespace

namespace coordinator_opts {

void register_options() {
    bool expected = false;
    if (!g_coordinator_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
        g_values = CoordinatorOptionValues{};
        if (j.contains("coordinator") && j["coordinator"].is_object()) {
            load_section(j["coordinator"], g_values);
        }

        app.add_option("--assignment-interval-ms", g_values.assignment_interval_ms,
                       "Assignment loop period in milliseconds")
            ->check(CLI::PositiveNumber)
            ->group("Coordinator");
        app.add_option("--health-interval-ms", g_values.health_interval_ms,
                       "Health sweep period in milliseconds")
            ->check(CLI::PositiveNumber)
            ->group("Coordinator");
        app.add_option("--inactivity-threshold-ms", g_values.inactivity_threshold_ms,
                       "Idle time after which an agent is taken offline")
            ->check(CLI::PositiveNumber)
            ->group("Coordinator");
        app.add_option("--max-retries", g_values.max_retries,
                       "Retry cap per task (0 = only the handoff/priority rule applies)")
            ->group("Coordinator");
        app.add_option("--max-handoffs", g_values.max_handoffs, "Handoff cap per task")
            ->group("Coordinator");
        app.add_option("--execution-threads", g_values.execution_threads,
                       "Threads of the execution loop observing agent results")
            ->check(CLI::Range(1, 64))
            ->group("Coordinator");
        app.add_flag("--default-rules,!--no-default-rules", g_values.default_rules,
                     "Install the built-in handoff rules")
            ->group("Coordinator");
        app.add_option("--log-level", g_values.log_level, "debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}, CLI::ignore_case))
            ->group("Coordinator");
        app.add_option("--stats-interval", g_values.stats_interval_s,
                       "Seconds between statistics reports (0 = off)")
            ->group("Coordinator");
        app.add_option("--workload-interval-ms", g_values.workload.interval_ms,
                       "Delay between demo task batches")
            ->group("Workload");
        app.add_option("--workload-batch", g_values.workload.batch_size, "Tasks per demo batch")
            ->group("Workload");
        app.add_option("--max-tasks", g_values.workload.max_tasks, "Total demo tasks (0 = unbounded)")
            ->group("Workload");
    });
}

CoordinatorConfig get_coordinator_config() {
    std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
    CoordinatorConfig config;
    config.scheduler.assignment_interval = std::chrono::milliseconds(g_values.assignment_interval_ms);
    config.scheduler.max_retries = g_values.max_retries;
    config.scheduler.max_handoffs_per_task = g_values.max_handoffs;
    config.scheduler.handoff_history_limit = g_values.history_limit;
    config.scheduler.evaluate_rules_on_assignment = g_values.rules_on_assignment;
    config.scheduler.evaluate_rules_on_completion = g_values.rules_on_completion;
    config.health.health_interval = std::chrono::milliseconds(g_values.health_interval_ms);
    config.health.inactivity_threshold = std::chrono::milliseconds(g_values.inactivity_threshold_ms);
    config.selection = g_values.weights;
    config.execution_threads = g_values.execution_threads;
    config.install_default_rules = g_values.default_rules;
    config.rules = g_values.rules;
    return config;
}

std::string get_log_level() {
    std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
    return g_values.log_level;
}

uint32_t get_stats_interval_s() {
    std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
    return g_values.stats_interval_s;
}

std::vector<SimulatedAgentSpec> get_agents() {
    std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
    return g_values.agents.empty() ? default_agents() : g_values.agents;
}

WorkloadOptions get_workload() {
    std::lock_guard<std::mutex> lk(g_coordinator_opts_mtx);
    return g_values.workload;
}

std::vector<SimulatedAgentSpec> default_agents() {
    return {
        {"strategist-1", "Strategic", {"analysis", "architecture", "planning"}, 150, 0.0, {}, {}},
        {"coder-1", "Coding", {"javascript-coding", "python-coding", "refactoring"}, 300, 0.1,
         "legacy", {"refactoring"}},
        {"coder-2", "Coding", {"python-coding", "debugging"}, 400, 0.05, {}, {}},
        {"tester-1", "Testing", {"unit-testing", "integration-testing"}, 250, 0.05, {}, {}},
        {"runner-1", "ToolExecution", {"shell", "build", "deploy"}, 100, 0.0, {}, {}},
        {"planner-1", "Planning", {"planning", "estimation"}, 200, 0.0, {}, {}},
    };
}

} // namespace coordinator_opts

// Static auto-registration object
namespace {
    struct CoordinatorOptsAutoReg {
        CoordinatorOptsAutoReg() { coordinator_opts::register_options(); }
    };
    [[maybe_unused]] static CoordinatorOptsAutoReg s_coordinator_auto_reg;
}
