#include "comparison.hpp"

#include <array>
#include <exception>
#include <thread>

PolicyOutcome runPolicy(Policy policy,
                        const std::vector<int> &requests,
                        int head,
                        int diskSize) {
    PolicyOutcome outcome;
    outcome.schedule = schedule(policy, requests, head, diskSize);
    try {
        outcome.metrics = computeMetrics(outcome.schedule, requests.size());
    } catch (const EmptyInputError &e) {
        outcome.error = e.what();
    } catch (const std::exception &e) {
        outcome.error = policyName(policy) + ": " + e.what();
    }
    return outcome;
}

ComparisonResult compareAll(const std::vector<int> &requests,
                            int head,
                            int diskSize,
                            bool parallel) {
    std::array<PolicyOutcome, ALL_POLICIES.size()> slots;

    if (parallel) {
        std::vector<std::thread> workers;
        workers.reserve(ALL_POLICIES.size());
        for (std::size_t i = 0; i < ALL_POLICIES.size(); ++i) {
            workers.emplace_back([&, i]() {
                slots[i] = runPolicy(ALL_POLICIES[i], requests, head, diskSize);
            });
        }
        for (auto &worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    } else {
        for (std::size_t i = 0; i < ALL_POLICIES.size(); ++i) {
            slots[i] = runPolicy(ALL_POLICIES[i], requests, head, diskSize);
        }
    }

    ComparisonResult result;
    for (std::size_t i = 0; i < ALL_POLICIES.size(); ++i) {
        result.emplace(ALL_POLICIES[i], std::move(slots[i]));
    }
    return result;
}
