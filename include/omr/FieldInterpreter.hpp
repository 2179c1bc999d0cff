#ifndef OMR_FIELD_INTERPRETER_HPP
#define OMR_FIELD_INTERPRETER_HPP

#include "omr/BubbleSample.hpp"
#include "omr/Config.hpp"
#include "omr/Template.hpp"
#include "omr/ThresholdStrategy.hpp"

#include <string>
#include <vector>

namespace omr {

enum class ScanQuality {
    Excellent,
    Good,
    Acceptable,
    Poor
};

const char* qualityName(ScanQuality quality);

// Higher spread of intensities means a cleaner marked/blank separation.
ScanQuality qualityFromStdDev(double stdDeviation);

struct FieldInterpretation {
    std::string fieldId;
    std::vector<std::string> markedLabels;    // in field (position) order
    bool isMultiMarked = false;                // markedLabels.size() > 1
    ThresholdResult threshold;
    double stdDeviation = 0.0;
    ScanQuality quality = ScanQuality::Poor;
    std::vector<std::string> disparityLabels;  // local and global cut disagree

    bool isBlank() const { return markedLabels.empty(); }

    // Marked labels concatenated, or emptyValue when nothing is marked.
    std::string answerString(const std::string& emptyValue) const;
};

class FieldInterpreter {
public:
    explicit FieldInterpreter(const TuningConfig& config);

    // Pure: identical inputs always give identical results.
    FieldInterpretation interpret(
        const FieldDef& field,
        const std::vector<BubbleSample>& samples,
        double globalFallback
    ) const;

private:
    TuningConfig config_;
};

}

#endif
