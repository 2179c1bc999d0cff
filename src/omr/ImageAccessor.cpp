#include "omr/ImageAccessor.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace omr {

cv::Mat OpenCvImageAccessor::load(const std::string& path, cv::Size pageSize) const {
    cv::Mat gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (gray.empty()) return gray;

    if (!pageSize.empty() && gray.size() != pageSize) {
        cv::Mat scaled;
        cv::resize(gray, scaled, pageSize, 0, 0, cv::INTER_AREA);
        return scaled;
    }
    return gray;
}

double OpenCvImageAccessor::meanIntensity(const cv::Rect& region, const cv::Mat& image) const {
    CV_Assert(!image.empty());
    cv::Rect r = region & cv::Rect(0, 0, image.cols, image.rows);
    CV_Assert(r.area() > 0);

    cv::Mat sub = image(r);
    if (sub.channels() == 1)
        return cv::mean(sub)[0];

    cv::Mat gray;
    cv::cvtColor(sub, gray, sub.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return cv::mean(gray)[0];
}

}
