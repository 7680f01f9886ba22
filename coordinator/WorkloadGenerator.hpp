/**
 * \file coordinator/WorkloadGenerator.hpp
 * \brief Interfaces and demo implementation for feeding tasks into the coordinator.
 */
#pragma once

#include "coordination/Coordinator.hpp"
#include "CoordinatorOptions.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

/** \brief A task ready for Coordinator::submit_task. */
struct GeneratedTask {
    std::vector<std::string> required_capabilities;
    TaskRelay::TaskContext context;
    TaskRelay::TaskPriority priority{TaskRelay::TaskPriority::Medium};
};

/**
 * \brief Contract for components that supply tasks to the coordinator.
 */
class IWorkloadGenerator {
public:
    virtual ~IWorkloadGenerator() = default;

    /** \brief Produce tasks without submitting them. */
    virtual std::vector<GeneratedTask> make_tasks(uint32_t count) = 0;

    /** \brief Submit \p count fresh tasks. \return ids of the submitted tasks. */
    virtual std::vector<std::string> submit_tasks(TaskRelay::Coordinator& coordinator, uint32_t count) = 0;

    /** \brief Signal shutdown so generators stop producing work. */
    virtual void stop() = 0;
};

/**
 * \brief Cycles through a list of templates, one session per generated task.
 */
class DefaultWorkloadGenerator : public IWorkloadGenerator {
public:
    /// \p templates empty = built-in templates.
    explicit DefaultWorkloadGenerator(std::vector<WorkloadTemplate> templates = {});
    ~DefaultWorkloadGenerator() override = default;

    std::vector<GeneratedTask> make_tasks(uint32_t count) override;
    std::vector<std::string> submit_tasks(TaskRelay::Coordinator& coordinator, uint32_t count) override;
    void stop() override;

    bool is_stopped() const { return stopped_.load(); }
    uint64_t generated() const { return counter_.load(); }

    static std::vector<WorkloadTemplate> builtin_templates();

private:
    std::vector<WorkloadTemplate> templates_;
    std::atomic<uint64_t> counter_{0};
    std::atomic<bool> stopped_{false};
};
