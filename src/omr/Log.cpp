#include "omr/Log.hpp"

#include <map>
#include <mutex>

using cv::utils::logging::LogLevel;

namespace omr {
namespace log {

namespace {

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

}

bool enabled(LogLevel level) {
    return level <= cv::utils::logging::getLogLevel();
}

// Bypasses the CV_LOG_* macros, which compile DEBUG out under NDEBUG.
// Filtering is done by enabled().
void write(LogLevel level, const std::string& message) {
    const std::string line = "omrscan: " + message;
    std::lock_guard<std::mutex> lock(sinkMutex());
    cv::utils::logging::internal::writeLogMessage(level, line.c_str());
}

bool setLevel(const std::string& name) {
    static const std::map<std::string, LogLevel> levels = {
        {"silent", cv::utils::logging::LOG_LEVEL_SILENT},
        {"error", cv::utils::logging::LOG_LEVEL_ERROR},
        {"warning", cv::utils::logging::LOG_LEVEL_WARNING},
        {"info", cv::utils::logging::LOG_LEVEL_INFO},
        {"debug", cv::utils::logging::LOG_LEVEL_DEBUG},
        {"verbose", cv::utils::logging::LOG_LEVEL_VERBOSE},
    };
    auto it = levels.find(name);
    if (it == levels.end()) return false;

    std::lock_guard<std::mutex> lock(sinkMutex());
    cv::utils::logging::setLogLevel(it->second);
    return true;
}

}
}
