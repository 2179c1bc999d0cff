#include "omr/ThresholdStrategy.hpp"
#include "omr/Log.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <stdexcept>

namespace omr {

namespace {

struct Gap {
    double jump = 0.0;
    double value = 0.0;
};

// Largest jump between sorted[i] and sorted[i + lookahead].
// Ties keep the lowest i. Requires sorted.size() >= 2.
Gap largestGap(const std::vector<double>& sorted, int lookahead) {
    size_t w = std::min<size_t>(static_cast<size_t>(std::max(1, lookahead)), sorted.size() - 1);

    Gap best;
    best.jump = -1.0;
    for (size_t i = 0; i + w < sorted.size(); ++i) {
        double jump = sorted[i + w] - sorted[i];
        if (jump > best.jump) {
            best.jump = jump;
            best.value = sorted[i] + jump / 2.0;
        }
    }
    return best;
}

std::vector<double> sortedCopy(const std::vector<double>& values) {
    std::vector<double> s(values);
    std::sort(s.begin(), s.end());
    return s;
}

}

const char* methodName(ThresholdMethod method) {
    switch (method) {
        case ThresholdMethod::Global: return "GLOBAL";
        case ThresholdMethod::Local: return "LOCAL";
        case ThresholdMethod::LocalFallbackToGlobal: return "LOCAL_FALLBACK_TO_GLOBAL";
        case ThresholdMethod::Adaptive: return "ADAPTIVE";
    }
    return "UNKNOWN";
}

double populationStdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    cv::Scalar mean, stddev;
    cv::meanStdDev(values, mean, stddev);
    return stddev[0];
}

ThresholdResult GlobalThresholdStrategy::calculate(
    const std::vector<double>& values,
    const TuningConfig& config) const
{
    ThresholdResult r;
    r.method = ThresholdMethod::Global;

    if (values.size() < 2) {
        r.value = config.defaultThreshold;
        r.confidence = 0.0;
        r.fallbackUsed = true;
        return r;
    }

    Gap g = largestGap(sortedCopy(values), config.lookahead);
    r.value = g.value;
    r.maxJump = g.jump;
    r.confidence = std::min(1.0, g.jump / (3.0 * config.minJump));
    r.fallbackUsed = g.jump < config.minJump;
    return r;
}

LocalThresholdStrategy::LocalThresholdStrategy(double globalFallback)
    : globalFallback_(globalFallback) {}

ThresholdResult LocalThresholdStrategy::fallback(double confidence, double maxJump) const {
    ThresholdResult r;
    r.value = globalFallback_;
    r.confidence = confidence;
    r.method = ThresholdMethod::LocalFallbackToGlobal;
    r.fallbackUsed = true;
    r.maxJump = maxJump;
    return r;
}

ThresholdResult LocalThresholdStrategy::calculate(
    const std::vector<double>& values,
    const TuningConfig& config) const
{
    if (values.size() < 2) {
        return fallback(0.0, 0.0);
    }

    std::vector<double> sorted = sortedCopy(values);

    if (sorted.size() == 2) {
        double gap = sorted[1] - sorted[0];
        if (gap < config.minGapTwoBubbles) {
            return fallback(0.3, gap);
        }
        ThresholdResult r;
        r.value = (sorted[0] + sorted[1]) / 2.0;
        r.confidence = 0.7;
        r.method = ThresholdMethod::Local;
        r.maxJump = gap;
        return r;
    }

    Gap g = largestGap(sorted, config.lookahead);
    double confidentJump = config.confidentJump();

    // A cut at the top of the scale means no gap was found at all.
    if (g.value >= kMaxIntensity) {
        return fallback(0.0, g.jump);
    }

    if (g.jump < confidentJump) {
        bool noOutliers = populationStdDev(values) < config.outlierDeviationThreshold;
        if (noOutliers) {
            return fallback(0.4, g.jump);
        }
        OMR_LOG_DEBUG("keeping low-confidence local threshold " << g.value
                      << " (jump " << g.jump << " < " << confidentJump << ")");
    }

    ThresholdResult r;
    r.value = g.value;
    r.confidence = std::min(1.0, g.jump / (2.0 * confidentJump));
    r.method = ThresholdMethod::Local;
    r.maxJump = g.jump;
    return r;
}

AdaptiveThresholdStrategy::AdaptiveThresholdStrategy(
    std::vector<std::unique_ptr<ThresholdStrategy>> strategies,
    std::vector<double> weights)
    : strategies_(std::move(strategies)),
      weights_(std::move(weights))
{
    if (strategies_.empty())
        throw std::invalid_argument("AdaptiveThresholdStrategy needs at least one strategy");
    if (strategies_.size() != weights_.size())
        throw std::invalid_argument("number of strategies must match number of weights");
}

ThresholdResult AdaptiveThresholdStrategy::calculate(
    const std::vector<double>& values,
    const TuningConfig& config) const
{
    double totalWeight = 0.0;
    double weightedSum = 0.0;

    ThresholdResult r;
    r.method = ThresholdMethod::Adaptive;

    for (size_t i = 0; i < strategies_.size(); ++i) {
        ThresholdResult part = strategies_[i]->calculate(values, config);
        double w = part.confidence * weights_[i];
        totalWeight += w;
        weightedSum += part.value * w;

        r.confidence = std::max(r.confidence, part.confidence);
        r.maxJump = std::max(r.maxJump, part.maxJump);
        r.fallbackUsed = r.fallbackUsed || part.fallbackUsed;
    }

    if (totalWeight <= 0.0) {
        r.value = config.defaultThreshold;
        r.confidence = 0.0;
        r.maxJump = 0.0;
        r.fallbackUsed = true;
        return r;
    }

    r.value = weightedSum / totalWeight;
    return r;
}

std::unique_ptr<ThresholdStrategy> makeFieldStrategy(
    const TuningConfig& config,
    double globalFallback)
{
    if (config.fieldStrategy == "adaptive") {
        std::vector<std::unique_ptr<ThresholdStrategy>> parts;
        parts.push_back(std::make_unique<GlobalThresholdStrategy>());
        parts.push_back(std::make_unique<LocalThresholdStrategy>(globalFallback));
        return std::make_unique<AdaptiveThresholdStrategy>(
            std::move(parts), std::vector<double>{0.4, 0.6});
    }
    return std::make_unique<LocalThresholdStrategy>(globalFallback);
}

}
