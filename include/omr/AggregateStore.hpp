#ifndef OMR_AGGREGATE_STORE_HPP
#define OMR_AGGREGATE_STORE_HPP

#include "omr/BubbleSample.hpp"
#include "omr/Config.hpp"
#include "omr/FieldInterpreter.hpp"
#include "omr/ThresholdStrategy.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace omr {

// Everything measured for one file. Owned by a single processing task
// and never shared across workers, so it carries no lock.
class FileAggregate {
public:
    FileAggregate(std::string filePath, const TuningConfig& config);

    // Throws std::logic_error when the field was already recorded or the
    // global threshold has already been computed.
    void record(const std::string& fieldId, std::vector<BubbleSample> samples);

    // Throws std::out_of_range for an unknown field.
    const std::vector<BubbleSample>& fieldSamples(const std::string& fieldId) const;

    // All samples of the file, in field record order.
    std::vector<BubbleSample> allSamplesForFile() const;

    // Computed on first call from allSamplesForFile(), then memoized.
    const ThresholdResult& globalThresholdForFile();

    void setInterpretation(FieldInterpretation interpretation);
    const FieldInterpretation* interpretation(const std::string& fieldId) const;

    // Population std deviation of every recorded field, in record order.
    std::vector<double> fieldStdDeviations() const;

    const std::vector<std::string>& fieldOrder() const { return fieldOrder_; }
    size_t sampleCount() const;

private:
    std::string filePath_;
    TuningConfig config_;
    std::vector<std::string> fieldOrder_;
    std::map<std::string, std::vector<BubbleSample>> samples_;
    std::map<std::string, FieldInterpretation> interpretations_;
    std::optional<ThresholdResult> globalThreshold_;
};

// Batch-wide counters. No samples are kept across files.
class BatchAggregate {
public:
    void increment(const std::string& key, long by = 1);

    // Applies all keys under one lock; used once per file completion.
    void incrementAll(const std::vector<std::string>& keys);

    long count(const std::string& key) const;
    std::map<std::string, long> snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, long> counters_;
};

}

#endif
