#ifndef OMR_THRESHOLD_STRATEGY_HPP
#define OMR_THRESHOLD_STRATEGY_HPP

#include "omr/Config.hpp"

#include <memory>
#include <vector>

namespace omr {

constexpr double kMaxIntensity = 255.0;

enum class ThresholdMethod {
    Global,
    Local,
    LocalFallbackToGlobal,
    Adaptive
};

const char* methodName(ThresholdMethod method);

struct ThresholdResult {
    double value = 0.0;
    double confidence = 0.0;   // [0, 1]
    ThresholdMethod method = ThresholdMethod::Global;
    bool fallbackUsed = false;
    double maxJump = 0.0;      // gap the value was derived from
};

// Turns a set of bubble intensities into a marked/unmarked cut value.
// Implementations hold no mutable state; calculate() may be called
// concurrently from several workers.
class ThresholdStrategy {
public:
    virtual ~ThresholdStrategy() = default;

    virtual ThresholdResult calculate(
        const std::vector<double>& values,
        const TuningConfig& config
    ) const = 0;
};

// File-wide cut: centre of the largest gap over every bubble of the file.
class GlobalThresholdStrategy : public ThresholdStrategy {
public:
    ThresholdResult calculate(
        const std::vector<double>& values,
        const TuningConfig& config
    ) const override;
};

// Per-field cut with fallback to the file-wide value when the field
// does not show a trustworthy split of its own.
class LocalThresholdStrategy : public ThresholdStrategy {
public:
    explicit LocalThresholdStrategy(double globalFallback);

    ThresholdResult calculate(
        const std::vector<double>& values,
        const TuningConfig& config
    ) const override;

private:
    double globalFallback_;

    ThresholdResult fallback(double confidence, double maxJump) const;
};

// Confidence-weighted average of several strategies.
class AdaptiveThresholdStrategy : public ThresholdStrategy {
public:
    // Throws std::invalid_argument when sizes differ or no strategy is given.
    AdaptiveThresholdStrategy(
        std::vector<std::unique_ptr<ThresholdStrategy>> strategies,
        std::vector<double> weights
    );

    ThresholdResult calculate(
        const std::vector<double>& values,
        const TuningConfig& config
    ) const override;

private:
    std::vector<std::unique_ptr<ThresholdStrategy>> strategies_;
    std::vector<double> weights_;
};

// Strategy used for a single field, selected by config.fieldStrategy.
std::unique_ptr<ThresholdStrategy> makeFieldStrategy(
    const TuningConfig& config,
    double globalFallback
);

// Population standard deviation; 0 for an empty set.
double populationStdDev(const std::vector<double>& values);

}

#endif
