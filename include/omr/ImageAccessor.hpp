#ifndef OMR_IMAGE_ACCESSOR_HPP
#define OMR_IMAGE_ACCESSOR_HPP

#include <opencv2/core.hpp>
#include <string>

namespace omr {

// Boundary to the image-processing collaborator.
class ImageAccessor {
public:
    virtual ~ImageAccessor() = default;

    // Grayscale page, scaled to pageSize when pageSize is not empty.
    // Returns an empty Mat when the image cannot be read.
    virtual cv::Mat load(const std::string& path, cv::Size pageSize) const = 0;

    // Mean intensity of region in [0, 255].
    virtual double meanIntensity(const cv::Rect& region, const cv::Mat& image) const = 0;
};

class OpenCvImageAccessor : public ImageAccessor {
public:
    cv::Mat load(const std::string& path, cv::Size pageSize) const override;
    double meanIntensity(const cv::Rect& region, const cv::Mat& image) const override;
};

}

#endif
