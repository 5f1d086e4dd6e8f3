/**
 * @file demand_predictor.cpp
 * @brief EwmaPredictor implementation.
 */

#include "pool/demand_predictor.hpp"

#include <algorithm>

namespace execution_engine {

EwmaPredictor::EwmaPredictor(double alpha)
    : alpha_(std::clamp(alpha, 0.01, 1.0)) {}

void EwmaPredictor::record_request(const RuntimeId& runtime) {
    std::lock_guard lock(mutex_);
    ++current_[runtime];
}

void EwmaPredictor::roll() {
    std::lock_guard lock(mutex_);
    for (const auto& [runtime, count] : current_) {
        forecast_.try_emplace(runtime, 0.0);
    }
    for (auto& [runtime, value] : forecast_) {
        auto it = current_.find(runtime);
        double observed = it == current_.end() ? 0.0 : static_cast<double>(it->second);
        value = alpha_ * observed + (1.0 - alpha_) * value;
    }
    current_.clear();
}

double EwmaPredictor::forecast(const RuntimeId& runtime) const {
    std::lock_guard lock(mutex_);
    auto it = forecast_.find(runtime);
    return it == forecast_.end() ? 0.0 : it->second;
}

}  // namespace execution_engine
