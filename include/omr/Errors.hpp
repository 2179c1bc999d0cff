#ifndef OMR_ERRORS_HPP
#define OMR_ERRORS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace omr {

// Raised while loading or validating tuning configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Config Error: " + what) {}
};

// Raised while loading or validating a template. Also used for
// template/shape contract violations detected before a batch starts.
class TemplateError : public std::runtime_error {
public:
    explicit TemplateError(const std::string& what)
        : std::runtime_error("Template Error: " + what) {}
};

// Per-file failure codes. These never abort a batch.
enum class FileError {
    None,
    ImageUnreadable,
    DetectionFailed
};

class ErrorMessage {
public:
    static std::string format(FileError err, const std::string& context = "") {
        std::ostringstream oss;
        switch (err) {
            case FileError::None: oss << "No error"; break;
            case FileError::ImageUnreadable: oss << "Image could not be read"; break;
            case FileError::DetectionFailed: oss << "Bubble detection failed"; break;
        }
        if (!context.empty()) {
            oss << " - " << context;
        }
        return oss.str();
    }

    static const char* code(FileError err) {
        switch (err) {
            case FileError::None: return "NONE";
            case FileError::ImageUnreadable: return "IMAGE_UNREADABLE";
            case FileError::DetectionFailed: return "DETECTION_FAILED";
        }
        return "UNKNOWN";
    }
};

}

#endif
