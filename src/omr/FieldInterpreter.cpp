#include "omr/FieldInterpreter.hpp"
#include "omr/Log.hpp"

namespace omr {

const char* qualityName(ScanQuality quality) {
    switch (quality) {
        case ScanQuality::Excellent: return "EXCELLENT";
        case ScanQuality::Good: return "GOOD";
        case ScanQuality::Acceptable: return "ACCEPTABLE";
        case ScanQuality::Poor: return "POOR";
    }
    return "UNKNOWN";
}

ScanQuality qualityFromStdDev(double stdDeviation) {
    if (stdDeviation > 50.0) return ScanQuality::Excellent;
    if (stdDeviation > 30.0) return ScanQuality::Good;
    if (stdDeviation > 15.0) return ScanQuality::Acceptable;
    return ScanQuality::Poor;
}

std::string FieldInterpretation::answerString(const std::string& emptyValue) const {
    if (markedLabels.empty()) return emptyValue;
    std::string out;
    for (const auto& l : markedLabels) out += l;
    return out;
}

FieldInterpreter::FieldInterpreter(const TuningConfig& config)
    : config_(config) {}

FieldInterpretation FieldInterpreter::interpret(
    const FieldDef& field,
    const std::vector<BubbleSample>& samples,
    double globalFallback) const
{
    FieldInterpretation out;
    out.fieldId = field.label;

    std::vector<double> values;
    values.reserve(samples.size());
    for (const auto& s : samples) values.push_back(s.meanIntensity());

    out.stdDeviation = populationStdDev(values);
    out.quality = qualityFromStdDev(out.stdDeviation);
    out.threshold = makeFieldStrategy(config_, globalFallback)->calculate(values, config_);

    for (const auto& s : samples) {
        bool marked = s.meanIntensity() < out.threshold.value;
        if (marked) out.markedLabels.push_back(s.label());
        if (marked != (s.meanIntensity() < globalFallback))
            out.disparityLabels.push_back(s.label());
    }
    out.isMultiMarked = out.markedLabels.size() > 1;

    OMR_LOG_DEBUG("field '" << field.label << "': threshold " << out.threshold.value
                  << " (" << methodName(out.threshold.method) << ", confidence "
                  << out.threshold.confidence << "), marked " << out.markedLabels.size());

    if (out.isMultiMarked) {
        OMR_LOG_WARN("multi-marking in field '" << field.label << "': "
                     << out.markedLabels.size() << " bubbles marked");
    }
    if (!out.disparityLabels.empty()) {
        OMR_LOG_DEBUG("threshold disparity in field '" << field.label << "': "
                      << out.disparityLabels.size() << " bubble(s) in doubt (local "
                      << out.threshold.value << ", global " << globalFallback << ")");
    }
    return out;
}

}
