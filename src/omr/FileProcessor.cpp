#include "omr/FileProcessor.hpp"
#include "omr/BubbleDetector.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace omr {

void QualitySummary::add(const FieldInterpretation& field) {
    switch (field.quality) {
        case ScanQuality::Excellent: excellent++; break;
        case ScanQuality::Good: good++; break;
        case ScanQuality::Acceptable: acceptable++; break;
        case ScanQuality::Poor: poor++; break;
    }
    if (field.threshold.fallbackUsed) fallbackFields++;
    if (field.isMultiMarked) multiMarkedFields++;
    minConfidence = std::min(minConfidence, field.threshold.confidence);
}

ScanQuality QualitySummary::worst() const {
    if (poor > 0) return ScanQuality::Poor;
    if (acceptable > 0) return ScanQuality::Acceptable;
    if (good > 0) return ScanQuality::Good;
    return ScanQuality::Excellent;
}

std::map<std::string, std::string> buildResponse(
    const Template& tmpl,
    const std::vector<FieldInterpretation>& fields)
{
    std::map<std::string, std::string> response;
    for (const auto& f : fields) {
        response[f.fieldId] = f.answerString(tmpl.emptyValue());
    }

    // Custom labels replace their member fields with one concatenated value.
    for (const auto& custom : tmpl.customLabels()) {
        std::string joined;
        for (const auto& member : custom.second) {
            auto it = response.find(member);
            if (it == response.end()) continue;
            joined += it->second;
            response.erase(it);
        }
        response[custom.first] = joined;
    }
    return response;
}

FileProcessor::FileProcessor(const TuningConfig& config, BatchAggregate& batch)
    : config_(config), batch_(batch), interpreter_(config) {}

FileResult FileProcessor::process(
    const std::string& filePath,
    int inputIndex,
    const Template& tmpl,
    const ImageAccessor& images) const
{
    FileResult result;
    result.inputIndex = inputIndex;
    result.filePath = filePath;

    cv::Mat page;
    std::string loadContext = filePath;
    try {
        page = images.load(filePath, tmpl.pageSize());
    } catch (const std::exception& e) {
        page.release();
        loadContext += ": " + std::string(e.what());
    }

    if (page.empty()) {
        result.error = FileError::ImageUnreadable;
        result.errorMessage = ErrorMessage::format(result.error, loadContext);
        OMR_LOG_ERROR("[" << inputIndex << "] " << result.errorMessage);
        return result;
    }

    try {
        interpretFile(result, tmpl, images, page);
    } catch (const std::exception& e) {
        result.fields.clear();
        result.omrResponse.clear();
        result.score.reset();
        result.error = FileError::DetectionFailed;
        result.errorMessage = ErrorMessage::format(result.error, filePath + ": " + e.what());
        OMR_LOG_ERROR("[" << inputIndex << "] " << result.errorMessage);
        return result;
    }

    result.ok = true;
    updateBatchCounters(result, tmpl);

    if (!debugDir_.empty())
        writeDebugImage(result, tmpl, images, page);

    OMR_LOG_INFO("[" << inputIndex << "] " << filePath << ": " << result.fields.size()
                 << " fields, global threshold " << result.globalThreshold.value
                 << (result.isMultiMarked ? ", multi-marked" : "")
                 << ", quality " << qualityName(result.quality.worst()));
    return result;
}

void FileProcessor::interpretFile(
    FileResult& result,
    const Template& tmpl,
    const ImageAccessor& images,
    const cv::Mat& page) const
{
    BubbleDetector detector(images);
    FileAggregate aggregate(result.filePath, config_);

    for (const auto& field : tmpl.fields()) {
        aggregate.record(field.label, detector.detectField(field, page));
    }

    const ThresholdResult& global = aggregate.globalThresholdForFile();
    result.globalThreshold = global;

    for (const auto& field : tmpl.fields()) {
        const auto& samples = aggregate.fieldSamples(field.label);
        if (samples.empty()) {
            OMR_LOG_WARN(result.filePath << ": field '" << field.label
                         << "' has no bubble regions, reading it as blank");
        }
        aggregate.setInterpretation(interpreter_.interpret(field, samples, global.value));
    }

    for (const auto& id : aggregate.fieldOrder()) {
        const FieldInterpretation& fi = *aggregate.interpretation(id);
        result.quality.add(fi);
        result.isMultiMarked = result.isMultiMarked || fi.isMultiMarked;
        result.fields.push_back(fi);
    }

    result.omrResponse = buildResponse(tmpl, result.fields);
    if (scorer_) {
        result.score = scorer_->calculateScore(result.omrResponse);
    }
}

void FileProcessor::updateBatchCounters(const FileResult& result, const Template& tmpl) const {
    std::vector<std::string> keys;
    keys.push_back("files_processed");
    if (result.isMultiMarked) keys.push_back("files_multi_marked");

    const auto& defs = tmpl.fields();
    for (size_t i = 0; i < result.fields.size() && i < defs.size(); ++i) {
        const std::string& type = defs[i].fieldType.empty() ? std::string("UNTYPED") : defs[i].fieldType;
        keys.push_back("fields." + type);
        keys.push_back(std::string("quality.") + qualityName(result.fields[i].quality));
        if (result.fields[i].threshold.fallbackUsed) keys.push_back("fields_fallback");
    }
    batch_.incrementAll(keys);
}

void FileProcessor::writeDebugImage(
    const FileResult& result,
    const Template& tmpl,
    const ImageAccessor& images,
    const cv::Mat& page) const
{
    cv::Mat debugImg;
    if (page.channels() == 1)
        cv::cvtColor(page, debugImg, cv::COLOR_GRAY2BGR);
    else
        debugImg = page.clone();

    BubbleDetector detector(images);
    const auto& defs = tmpl.fields();
    for (size_t i = 0; i < defs.size() && i < result.fields.size(); ++i) {
        detector.drawFieldDebug(debugImg, defs[i], result.fields[i]);
    }

    fs::path out = fs::path(debugDir_)
        / (std::to_string(result.inputIndex) + "_" + fs::path(result.filePath).stem().string() + "_marked.png");
    try {
        if (!cv::imwrite(out.string(), debugImg))
            OMR_LOG_WARN("could not write debug image " << out.string());
    } catch (const cv::Exception& e) {
        OMR_LOG_WARN("could not write debug image " << out.string() << ": " << e.what());
    }
}

}
