#include "omr/AggregateStore.hpp"
#include "omr/Log.hpp"

#include <stdexcept>

namespace omr {

FileAggregate::FileAggregate(std::string filePath, const TuningConfig& config)
    : filePath_(std::move(filePath)), config_(config) {}

void FileAggregate::record(const std::string& fieldId, std::vector<BubbleSample> samples) {
    if (globalThreshold_)
        throw std::logic_error("field '" + fieldId + "' recorded after the global threshold of "
                               + filePath_ + " was computed");
    if (samples_.count(fieldId))
        throw std::logic_error("field '" + fieldId + "' recorded twice for " + filePath_);

    fieldOrder_.push_back(fieldId);
    samples_.emplace(fieldId, std::move(samples));
}

const std::vector<BubbleSample>& FileAggregate::fieldSamples(const std::string& fieldId) const {
    auto it = samples_.find(fieldId);
    if (it == samples_.end())
        throw std::out_of_range("no samples recorded for field '" + fieldId + "'");
    return it->second;
}

std::vector<BubbleSample> FileAggregate::allSamplesForFile() const {
    std::vector<BubbleSample> all;
    all.reserve(sampleCount());
    for (const auto& id : fieldOrder_) {
        const auto& s = samples_.at(id);
        all.insert(all.end(), s.begin(), s.end());
    }
    return all;
}

const ThresholdResult& FileAggregate::globalThresholdForFile() {
    if (!globalThreshold_) {
        std::vector<double> values;
        values.reserve(sampleCount());
        for (const auto& s : allSamplesForFile()) values.push_back(s.meanIntensity());

        globalThreshold_ = GlobalThresholdStrategy().calculate(values, config_);
        OMR_LOG_DEBUG(filePath_ << ": global threshold " << globalThreshold_->value
                      << " (jump " << globalThreshold_->maxJump
                      << ", confidence " << globalThreshold_->confidence << ")");
    }
    return *globalThreshold_;
}

void FileAggregate::setInterpretation(FieldInterpretation interpretation) {
    std::string id = interpretation.fieldId;
    interpretations_[id] = std::move(interpretation);
}

const FieldInterpretation* FileAggregate::interpretation(const std::string& fieldId) const {
    auto it = interpretations_.find(fieldId);
    return it == interpretations_.end() ? nullptr : &it->second;
}

std::vector<double> FileAggregate::fieldStdDeviations() const {
    std::vector<double> out;
    out.reserve(fieldOrder_.size());
    for (const auto& id : fieldOrder_) {
        std::vector<double> values;
        for (const auto& s : samples_.at(id)) values.push_back(s.meanIntensity());
        out.push_back(populationStdDev(values));
    }
    return out;
}

size_t FileAggregate::sampleCount() const {
    size_t n = 0;
    for (const auto& kv : samples_) n += kv.second.size();
    return n;
}

void BatchAggregate::increment(const std::string& key, long by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[key] += by;
}

void BatchAggregate::incrementAll(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& k : keys) counters_[k] += 1;
}

long BatchAggregate::count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
}

std::map<std::string, long> BatchAggregate::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

void BatchAggregate::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
}

}
