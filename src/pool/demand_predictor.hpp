/**
 * @file demand_predictor.hpp
 * @brief Per-runtime demand forecast driving the prewarm targets.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>
#include <unordered_map>

namespace execution_engine {

/**
 * @brief Abstract demand predictor (runtime-selectable).
 *
 * Requests are counted as they arrive; roll() closes the current interval
 * and folds its counts into the forecast.
 */
class IDemandPredictor {
public:
    virtual ~IDemandPredictor() = default;

    virtual void record_request(const RuntimeId& runtime) = 0;
    virtual void roll() = 0;

    /// Expected requests per interval for `runtime`.
    [[nodiscard]] virtual double forecast(const RuntimeId& runtime) const = 0;
};

/**
 * @brief Exponentially weighted moving average of requests per interval.
 *
 *   f(t) = α · count(t) + (1 − α) · f(t − 1)
 */
class EwmaPredictor final : public IDemandPredictor {
public:
    explicit EwmaPredictor(double alpha);

    void record_request(const RuntimeId& runtime) override;
    void roll() override;
    [[nodiscard]] double forecast(const RuntimeId& runtime) const override;

private:
    double alpha_;
    mutable std::mutex mutex_;
    std::unordered_map<RuntimeId, uint64_t> current_;
    std::unordered_map<RuntimeId, double> forecast_;
};

}  // namespace execution_engine
