#include "scheduler.hpp"

#include <algorithm>
#include <cctype>

#include "../errors/simulation_errors.hpp"

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}
} // namespace

const std::vector<SchedulingPolicy> &allPolicies() {
    static const std::vector<SchedulingPolicy> policies = {
        SchedulingPolicy::FIRST_COME_FIRST_SERVED,
        SchedulingPolicy::SHORTEST_JOB_NEXT,
        SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST,
        SchedulingPolicy::ROUND_ROBIN,
        SchedulingPolicy::PRIORITY_PREEMPTIVE,
        SchedulingPolicy::PRIORITY_NON_PREEMPTIVE,
    };
    return policies;
}

std::string schedulerName(SchedulingPolicy policy) {
    switch (policy) {
    case SchedulingPolicy::FIRST_COME_FIRST_SERVED:
        return "First-Come First-Served";
    case SchedulingPolicy::SHORTEST_JOB_NEXT:
        return "Shortest Job Next";
    case SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST:
        return "Shortest Remaining Time First";
    case SchedulingPolicy::ROUND_ROBIN:
        return "Round-Robin";
    case SchedulingPolicy::PRIORITY_PREEMPTIVE:
        return "Priority (preemptivo)";
    case SchedulingPolicy::PRIORITY_NON_PREEMPTIVE:
        return "Priority (não preemptivo)";
    }
    return "Desconhecido";
}

std::string policyKey(SchedulingPolicy policy) {
    switch (policy) {
    case SchedulingPolicy::FIRST_COME_FIRST_SERVED:
        return "fcfs";
    case SchedulingPolicy::SHORTEST_JOB_NEXT:
        return "sjn";
    case SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST:
        return "srtf";
    case SchedulingPolicy::ROUND_ROBIN:
        return "rr";
    case SchedulingPolicy::PRIORITY_PREEMPTIVE:
        return "priority";
    case SchedulingPolicy::PRIORITY_NON_PREEMPTIVE:
        return "priority_np";
    }
    return "unknown";
}

SchedulingPolicy parsePolicy(const std::string &name) {
    const std::string key = toLower(name);
    if (key == "fcfs") return SchedulingPolicy::FIRST_COME_FIRST_SERVED;
    if (key == "sjn" || key == "sjf") return SchedulingPolicy::SHORTEST_JOB_NEXT;
    if (key == "srtf") return SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST;
    if (key == "rr" || key == "round_robin") return SchedulingPolicy::ROUND_ROBIN;
    if (key == "priority") return SchedulingPolicy::PRIORITY_PREEMPTIVE;
    if (key == "priority_np") return SchedulingPolicy::PRIORITY_NON_PREEMPTIVE;
    throw UnknownPolicyError(name);
}

bool isPreemptive(SchedulingPolicy policy) {
    return policy == SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST ||
           policy == SchedulingPolicy::PRIORITY_PREEMPTIVE;
}
