#include <gtest/gtest.h>

#include <limits>
#include <numeric>
#include <sstream>

#include "errors/simulation_errors.hpp"
#include "process_generator/process_generator.hpp"
#include "simulator/scheduler_engine.hpp"
#include "test_helpers.hpp"

namespace {
Tick timelineTicks(const SimulationReport &report) {
    return std::accumulate(report.timeline.begin(), report.timeline.end(), Tick{0},
                           [](Tick acc, const ExecutionSlice &s) { return acc + s.length(); });
}
} // namespace

TEST(SchedulerEngine, FcfsRunsInArrivalOrder) {
    auto table = makeTable({{1, 0, 5, 0}, {2, 1, 3, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 5}, {2, 0, 5, 8}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 1).waitingTime, 0);
    EXPECT_EQ(metricsFor(report, 2).waitingTime, 4);
    EXPECT_EQ(metricsFor(report, 2).responseTime, 4);
    EXPECT_EQ(metricsFor(report, 2).completionTime, 8);
    EXPECT_DOUBLE_EQ(report.averageWaitingTime, 2.0);
    EXPECT_DOUBLE_EQ(report.cpuUtilization, 1.0);
    EXPECT_DOUBLE_EQ(report.throughput, 0.25);
}

TEST(SchedulerEngine, RoundRobinInterleavesByQuantum) {
    auto table = makeTable({{1, 0, 5, 0}, {2, 0, 3, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::ROUND_ROBIN, PolicyConfig{2});

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{
        {1, 0, 0, 2}, {2, 0, 2, 4}, {1, 0, 4, 6}, {2, 0, 6, 7}, {1, 0, 7, 8}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 2).completionTime, 7);
    EXPECT_EQ(metricsFor(report, 1).completionTime, 8);
    EXPECT_EQ(metricsFor(report, 1).dispatches, 3);
}

TEST(SchedulerEngine, RoundRobinArrivalsGoAheadOfExpiredProcess) {
    // 3 chega exatamente quando o quantum de 1 expira: entra na fila antes de 1
    auto table = makeTable({{1, 0, 6, 0}, {2, 1, 2, 0}, {3, 3, 2, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::ROUND_ROBIN, PolicyConfig{3});

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 3}, {2, 0, 3, 5}, {3, 0, 5, 7}, {1, 0, 7, 10}};
    EXPECT_EQ(report.timeline, expected);
}

TEST(SchedulerEngine, RoundRobinLoneProcessIsRedispatched) {
    auto table = makeTable({{1, 0, 5, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::ROUND_ROBIN, PolicyConfig{2});

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 2}, {1, 0, 2, 4}, {1, 0, 4, 5}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 1).waitingTime, 0);
}

TEST(SchedulerEngine, PriorityPreemptsOnArrival) {
    auto table = makeTable({{1, 0, 5, 3}, {2, 2, 2, 1}});
    std::ostringstream trace;
    SchedulerEngine engine(table, SchedulingPolicy::PRIORITY_PREEMPTIVE, {}, 1, &trace);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 2}, {2, 0, 2, 4}, {1, 0, 4, 7}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 1).preemptions, 1);
    EXPECT_EQ(metricsFor(report, 2).responseTime, 0);
    EXPECT_EQ(metricsFor(report, 1).completionTime, 7);
    EXPECT_NE(trace.str().find("processo 1 preemptado no core 0 (restante 3)"), std::string::npos);
}

TEST(SchedulerEngine, PriorityEqualValueDoesNotPreempt) {
    auto table = makeTable({{1, 0, 5, 2}, {2, 1, 2, 2}});
    SchedulerEngine engine(table, SchedulingPolicy::PRIORITY_PREEMPTIVE);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 5}, {2, 0, 5, 7}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 1).preemptions, 0);
}

TEST(SchedulerEngine, PriorityNonPreemptiveRunsToCompletion) {
    auto table = makeTable({{1, 0, 5, 3}, {2, 2, 2, 1}, {3, 1, 1, 2}});
    SchedulerEngine engine(table, SchedulingPolicy::PRIORITY_NON_PREEMPTIVE);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 5}, {2, 0, 5, 7}, {3, 0, 7, 8}};
    EXPECT_EQ(report.timeline, expected);
}

TEST(SchedulerEngine, SjnPicksShortestAtEachCompletion) {
    auto table = makeTable({{1, 0, 7, 0}, {2, 1, 4, 0}, {3, 2, 1, 0}, {4, 3, 4, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::SHORTEST_JOB_NEXT);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{{1, 0, 0, 7}, {3, 0, 7, 8}, {2, 0, 8, 12}, {4, 0, 12, 16}};
    EXPECT_EQ(report.timeline, expected);
}

TEST(SchedulerEngine, SrtfPreemptsOnShorterArrival) {
    auto table = makeTable({{1, 0, 7, 0}, {2, 1, 4, 0}, {3, 2, 1, 0}, {4, 3, 4, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST);

    auto report = engine.run();

    std::vector<ExecutionSlice> expected{
        {1, 0, 0, 1}, {2, 0, 1, 2}, {3, 0, 2, 3}, {2, 0, 3, 6}, {4, 0, 6, 10}, {1, 0, 10, 16}};
    EXPECT_EQ(report.timeline, expected);
    EXPECT_EQ(metricsFor(report, 2).preemptions, 1);
    EXPECT_EQ(metricsFor(report, 1).waitingTime, 9);
}

TEST(SchedulerEngine, IdleGapsCountAgainstUtilization) {
    auto table = makeTable({{1, 2, 3, 0}, {2, 10, 1, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED);

    auto report = engine.run();

    EXPECT_EQ(report.stats.totalTicks, 11);
    EXPECT_EQ(report.stats.idleTicks, 7);
    EXPECT_EQ(report.stats.busyTicks, 4);
    EXPECT_DOUBLE_EQ(report.cpuUtilization, 4.0 / 11.0);
    EXPECT_DOUBLE_EQ(report.throughput, 2.0 / 11.0);
    EXPECT_EQ(metricsFor(report, 1).responseTime, 0);
    EXPECT_EQ(metricsFor(report, 2).firstRunTime, 10);
}

TEST(SchedulerEngine, MultipleCoresShareTheLoad) {
    auto table = makeTable({{1, 0, 4, 0}, {2, 0, 2, 0}, {3, 1, 3, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED, {}, 2);

    auto report = engine.run();

    EXPECT_EQ(metricsFor(report, 1).completionTime, 4);
    EXPECT_EQ(metricsFor(report, 2).completionTime, 2);
    EXPECT_EQ(metricsFor(report, 3).completionTime, 5);
    EXPECT_EQ(metricsFor(report, 3).coresAssigned, std::vector<int>{1});
    EXPECT_EQ(report.stats.idleTicks, 1);
    EXPECT_DOUBLE_EQ(report.cpuUtilization, 0.9);
}

TEST(SchedulerEngine, EmptyWorkloadYieldsZeroReport) {
    ProcessTable table;
    SchedulerEngine engine(table, SchedulingPolicy::ROUND_ROBIN, PolicyConfig{3});

    auto report = engine.run();

    EXPECT_TRUE(report.processes.empty());
    EXPECT_EQ(report.stats.totalTicks, 0);
    EXPECT_DOUBLE_EQ(report.averageWaitingTime, 0.0);
    EXPECT_DOUBLE_EQ(report.cpuUtilization, 0.0);
    EXPECT_DOUBLE_EQ(report.throughput, 0.0);
}

TEST(SchedulerEngine, RejectsInvalidSetup) {
    auto table = makeTable({{1, 0, 5, 0}});
    EXPECT_THROW(SchedulerEngine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED, {}, 0), InvalidCoreCountError);
    EXPECT_THROW(SchedulerEngine(table, SchedulingPolicy::ROUND_ROBIN, PolicyConfig{0}), InvalidQuantumError);
}

TEST(SchedulerEngine, LateArrivalNearTickRangeCompletes) {
    constexpr Tick maxTick = std::numeric_limits<Tick>::max();
    auto table = makeTable({{1, maxTick - 3, 1, 0}, {2, 0, 2, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED);

    auto report = engine.run();

    EXPECT_EQ(metricsFor(report, 2).completionTime, 2);
    EXPECT_EQ(metricsFor(report, 1).completionTime, maxTick - 2);
    EXPECT_EQ(report.stats.totalTicks, maxTick - 2);
    EXPECT_EQ(report.stats.idleTicks, maxTick - 5);
}

TEST(SchedulerEngine, RejectsHorizonTooLargeForCoreCount) {
    constexpr Tick maxTick = std::numeric_limits<Tick>::max();
    auto table = makeTable({{1, maxTick / 2, 1, 0}});
    EXPECT_NO_THROW(SchedulerEngine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED, {}, 1));
    EXPECT_THROW(SchedulerEngine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED, {}, 3), SetupError);
}

TEST(SchedulerEngine, MetricsBeforeRunAreIncomplete) {
    auto table = makeTable({{1, 0, 5, 0}});
    SchedulerEngine engine(table, SchedulingPolicy::FIRST_COME_FIRST_SERVED);

    EXPECT_EQ(engine.processes().front().state, State::New);
    EXPECT_THROW(MetricsCalculator::compute(engine.policy(), engine.processes(), engine.stats()),
                 IncompleteSimulationError);

    engine.run();
    EXPECT_NO_THROW(MetricsCalculator::compute(engine.policy(), engine.processes(), engine.stats()));
}

TEST(SchedulerEngine, RunIsDeterministic) {
    GeneratorConfig generator;
    generator.count = 25;
    generator.seed = 7;
    generator.arrivalMax = 40;
    generator.burstMax = 9;
    auto table = makeTable(generateProcesses(generator));

    for (auto policy : allPolicies()) {
        SchedulerEngine first(table, policy, PolicyConfig{3});
        SchedulerEngine second(table, policy, PolicyConfig{3});

        auto a = first.run();
        auto b = second.run();
        auto again = first.run();

        EXPECT_EQ(a.timeline, b.timeline) << schedulerName(policy);
        EXPECT_EQ(a.timeline, again.timeline) << schedulerName(policy);
        EXPECT_EQ(a.averageWaitingTime, b.averageWaitingTime);
        EXPECT_EQ(a.cpuUtilization, b.cpuUtilization);
        EXPECT_EQ(a.throughput, again.throughput);
    }
}

// Propriedades válidas para toda política e número de cores
class SchedulerEngineProperties
    : public ::testing::TestWithParam<std::tuple<SchedulingPolicy, int, unsigned>> {};

TEST_P(SchedulerEngineProperties, HoldForGeneratedWorkloads) {
    const auto policy = std::get<0>(GetParam());
    const int cores = std::get<1>(GetParam());

    GeneratorConfig generator;
    generator.count = 40;
    generator.seed = std::get<2>(GetParam());
    generator.arrivalMax = 60;
    generator.burstMin = 1;
    generator.burstMax = 15;
    generator.priorityMax = 4;
    auto table = makeTable(generateProcesses(generator));

    SchedulerEngine engine(table, policy, PolicyConfig{4}, cores);
    auto report = engine.run();

    ASSERT_EQ(report.processes.size(), table.size());
    for (const auto &m : report.processes) {
        EXPECT_GE(m.completionTime, m.arrivalTime + m.burstTime) << "pid " << m.id;
        EXPECT_GE(m.turnaroundTime, m.burstTime);
        EXPECT_GE(m.waitingTime, 0);
        EXPECT_GE(m.responseTime, 0);
        EXPECT_LE(m.responseTime, m.waitingTime);
    }
    for (const auto &pcb : engine.processes()) {
        EXPECT_EQ(pcb.state, State::Terminated);
        EXPECT_EQ(pcb.remainingTime, 0);
    }

    EXPECT_EQ(report.stats.busyTicks, table.totalBurstTime());
    EXPECT_EQ(timelineTicks(report), table.totalBurstTime());
    EXPECT_LE(report.stats.totalTicks, table.totalBurstTime() + table.maxArrivalTime());
    EXPECT_GT(report.cpuUtilization, 0.0);
    EXPECT_LE(report.cpuUtilization, 1.0);
}

INSTANTIATE_TEST_SUITE_P(
    AllPolicies,
    SchedulerEngineProperties,
    ::testing::Combine(::testing::ValuesIn(allPolicies()),
                       ::testing::Values(1, 3),
                       ::testing::Values(1u, 99u)));
