/**
 * @file cancellation.hpp
 * @brief Batch cancellation token and the exceptions that abort a batch.
 */

#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace fleetplan {

/**
 * @brief Set by the caller, polled by the pipeline and the solver.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Unrecoverable failure of a planning batch. Nothing is committed.
 */
class PlanningError : public std::runtime_error {
public:
    explicit PlanningError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The caller cancelled the batch. Nothing is committed.
 */
class PlanCancelled : public PlanningError {
public:
    PlanCancelled() : PlanningError("planning batch cancelled") {}
};

inline void throw_if_cancelled(const CancellationToken* token) {
    if (token && token->cancelled()) throw PlanCancelled();
}

}  // namespace fleetplan
