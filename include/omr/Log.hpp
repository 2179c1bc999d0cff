#ifndef OMR_LOG_HPP
#define OMR_LOG_HPP

#include <opencv2/core/utils/logger.hpp>
#include <sstream>
#include <string>

namespace omr {
namespace log {

// Writes one already formatted message through OpenCV's logger.
// Writes are serialized so concurrent workers never interleave lines.
void write(cv::utils::logging::LogLevel level, const std::string& message);

bool enabled(cv::utils::logging::LogLevel level);

// Accepts "silent", "error", "warning", "info", "debug", "verbose".
// Returns false (and leaves the level untouched) for anything else.
bool setLevel(const std::string& name);

}
}

#define OMR_LOG_AT(level, msg)                                   \
    do {                                                         \
        if (::omr::log::enabled(level)) {                        \
            std::ostringstream omr_log_ss_;                      \
            omr_log_ss_ << msg;                                  \
            ::omr::log::write(level, omr_log_ss_.str());         \
        }                                                        \
    } while (0)

#define OMR_LOG_ERROR(msg) OMR_LOG_AT(::cv::utils::logging::LOG_LEVEL_ERROR, msg)
#define OMR_LOG_WARN(msg)  OMR_LOG_AT(::cv::utils::logging::LOG_LEVEL_WARNING, msg)
#define OMR_LOG_INFO(msg)  OMR_LOG_AT(::cv::utils::logging::LOG_LEVEL_INFO, msg)
#define OMR_LOG_DEBUG(msg) OMR_LOG_AT(::cv::utils::logging::LOG_LEVEL_DEBUG, msg)

#endif
