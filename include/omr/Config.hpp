#ifndef OMR_CONFIG_HPP
#define OMR_CONFIG_HPP

#include <string>

namespace omr {

// Named tunables of the detection & interpretation engine.
// Values are in grayscale intensity units (0 = black, 255 = white).
struct TuningConfig {
    double minJump = 25.0;                  // smallest gap treated as a real mark/blank split
    double minGapTwoBubbles = 30.0;         // two-option fields need at least this gap
    double minJumpSurplus = 5.0;            // extra gap a local threshold needs to be trusted
    double outlierDeviationThreshold = 5.0; // field std below this => no outliers
    double defaultThreshold = 127.5;        // used when a file has fewer than 2 samples
    int lookahead = 1;                      // window of the largest-gap scan, 1 = adjacent pairs
    std::string fieldStrategy = "local";    // "local" or "adaptive"
    int workerCount = 4;
    std::string logLevel = "info";

    double confidentJump() const { return minJump + minJumpSurplus; }

    // Throws ConfigError on the first invalid value.
    void validate() const;
};

// Missing keys keep their defaults. Throws ConfigError.
TuningConfig loadConfig(const std::string& path);
TuningConfig loadConfigFromString(const std::string& json);

}

#endif
