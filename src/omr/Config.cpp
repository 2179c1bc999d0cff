#include "omr/Config.hpp"
#include "omr/Errors.hpp"

#include <opencv2/core.hpp>

namespace omr {

namespace {

void readNumber(const cv::FileNode& root, const char* key, double& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isReal() && !n.isInt())
        throw ConfigError(std::string("'") + key + "' must be a number");
    out = static_cast<double>(n);
}

void readInt(const cv::FileNode& root, const char* key, int& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isInt())
        throw ConfigError(std::string("'") + key + "' must be an integer");
    out = static_cast<int>(n);
}

void readString(const cv::FileNode& root, const char* key, std::string& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return;
    if (!n.isString())
        throw ConfigError(std::string("'") + key + "' must be a string");
    out = static_cast<std::string>(n);
}

TuningConfig parse(cv::FileStorage& fs) {
    TuningConfig cfg;
    cv::FileNode root = fs.root();

    // Accept either a flat object or one nested under "thresholding".
    cv::FileNode thr = root["thresholding"];
    cv::FileNode src = thr.empty() ? root : thr;

    readNumber(src, "minJump", cfg.minJump);
    readNumber(src, "minGapTwoBubbles", cfg.minGapTwoBubbles);
    readNumber(src, "minJumpSurplus", cfg.minJumpSurplus);
    readNumber(src, "outlierDeviationThreshold", cfg.outlierDeviationThreshold);
    readNumber(src, "defaultThreshold", cfg.defaultThreshold);
    readInt(src, "lookahead", cfg.lookahead);
    readString(src, "fieldStrategy", cfg.fieldStrategy);

    readInt(root, "workerCount", cfg.workerCount);
    readString(root, "logLevel", cfg.logLevel);

    cfg.validate();
    return cfg;
}

TuningConfig open(const std::string& source, int flags, const std::string& what) {
    try {
        cv::FileStorage fs(source, cv::FileStorage::READ | cv::FileStorage::FORMAT_JSON | flags);
        if (!fs.isOpened())
            throw ConfigError("cannot open " + what);
        return parse(fs);
    } catch (const cv::Exception& e) {
        throw ConfigError("failed to parse " + what + ": " + e.what());
    }
}

}

void TuningConfig::validate() const {
    if (minJump <= 0.0)
        throw ConfigError("minJump must be positive");
    if (minGapTwoBubbles < 0.0)
        throw ConfigError("minGapTwoBubbles must not be negative");
    if (minJumpSurplus < 0.0)
        throw ConfigError("minJumpSurplus must not be negative");
    if (outlierDeviationThreshold < 0.0)
        throw ConfigError("outlierDeviationThreshold must not be negative");
    if (defaultThreshold < 0.0 || defaultThreshold > 255.0)
        throw ConfigError("defaultThreshold must lie in [0, 255]");
    if (lookahead < 1)
        throw ConfigError("lookahead must be at least 1");
    if (fieldStrategy != "local" && fieldStrategy != "adaptive")
        throw ConfigError("unknown fieldStrategy '" + fieldStrategy + "'");
    if (workerCount < 1)
        throw ConfigError("workerCount must be at least 1");
}

TuningConfig loadConfig(const std::string& path) {
    return open(path, 0, path);
}

TuningConfig loadConfigFromString(const std::string& json) {
    return open(json, cv::FileStorage::MEMORY, "inline config");
}

}
