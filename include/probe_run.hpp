/*
 * Service Monitor - Run Aggregator
 *
 * Probes every configured test in order and collects the classified
 * results. Decides which notifications a run calls for but never sends
 * them itself.
 */

#pragma once

#include "monitor_config.hpp"
#include "probe_executor.hpp"
#include "probe_types.hpp"
#include <memory>
#include <vector>

class ProbeRun {
public:
    explicit ProbeRun(std::unique_ptr<ProbeExecutor> executor);

    // One result per test, in input order. A failing test never stops the run.
    RunSummary run(const std::vector<TestDefinition>& tests);

    // SERVICE_DOWN to contacts.recipients when anything is DOWN, SCRIPT_ERROR
    // to contacts.script_recipients when anything is ERROR. Empty when all UP.
    static std::vector<NotificationRequest> plan_notifications(
        const RunSummary& summary,
        const std::vector<TestDefinition>& tests,
        const Contacts& contacts);

private:
    ClassifiedResult probe(const TestDefinition& test);
    void log_summary(const RunSummary& summary);

    std::unique_ptr<ProbeExecutor> executor;
};
