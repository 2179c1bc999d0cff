#ifndef OMR_FILE_PROCESSOR_HPP
#define OMR_FILE_PROCESSOR_HPP

#include "omr/AggregateStore.hpp"
#include "omr/Config.hpp"
#include "omr/Errors.hpp"
#include "omr/FieldInterpreter.hpp"
#include "omr/ImageAccessor.hpp"
#include "omr/ScoreCalculator.hpp"
#include "omr/Template.hpp"
#include "omr/ThresholdStrategy.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omr {

struct QualitySummary {
    int excellent = 0;
    int good = 0;
    int acceptable = 0;
    int poor = 0;
    int fallbackFields = 0;
    int multiMarkedFields = 0;
    double minConfidence = 1.0;

    void add(const FieldInterpretation& field);
    ScanQuality worst() const;
};

struct FileResult {
    int inputIndex = -1;
    std::string filePath;

    bool ok = false;
    FileError error = FileError::None;
    std::string errorMessage;

    std::map<std::string, std::string> omrResponse;  // column -> answer string
    bool isMultiMarked = false;
    QualitySummary quality;
    ThresholdResult globalThreshold;
    std::vector<FieldInterpretation> fields;         // template order
    std::optional<ScoreResult> score;
};

// Detection + interpretation of a single file. Stateless between calls
// apart from the shared batch counters, so one instance serves all workers.
class FileProcessor {
public:
    FileProcessor(const TuningConfig& config, BatchAggregate& batch);

    // Enables scoring; scorer must outlive the processor.
    void setScoreCalculator(const ScoreCalculator* scorer) { scorer_ = scorer; }

    // Writes a marked copy of every page into dir when not empty.
    void setDebugDirectory(const std::string& dir) { debugDir_ = dir; }

    // Never throws for per-file problems; those come back as ok == false.
    FileResult process(
        const std::string& filePath,
        int inputIndex,
        const Template& tmpl,
        const ImageAccessor& images
    ) const;

private:
    TuningConfig config_;
    BatchAggregate& batch_;
    FieldInterpreter interpreter_;
    const ScoreCalculator* scorer_ = nullptr;
    std::string debugDir_;

    void interpretFile(
        FileResult& result,
        const Template& tmpl,
        const ImageAccessor& images,
        const cv::Mat& page
    ) const;

    void writeDebugImage(
        const FileResult& result,
        const Template& tmpl,
        const ImageAccessor& images,
        const cv::Mat& page
    ) const;

    void updateBatchCounters(const FileResult& result, const Template& tmpl) const;
};

// Builds the response map: one entry per output column of the template.
std::map<std::string, std::string> buildResponse(
    const Template& tmpl,
    const std::vector<FieldInterpretation>& fields
);

}

#endif
