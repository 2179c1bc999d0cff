#ifndef OMR_BUBBLE_SAMPLE_HPP
#define OMR_BUBBLE_SAMPLE_HPP

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <utility>

namespace omr {

// One selectable answer option on the template.
struct BubbleDef {
    std::string label;   // answer value, e.g. "A" or "7"
    cv::Rect rect;       // measured region in page pixels
    cv::Point position;  // centre of rect

    BubbleDef(std::string label_, const cv::Rect& rect_)
        : label(std::move(label_)),
          rect(rect_),
          position(rect_.x + rect_.width / 2, rect_.y + rect_.height / 2) {}
};

using BubbleRef = std::shared_ptr<const BubbleDef>;

// Measured mean intensity of one bubble region. Immutable.
class BubbleSample {
public:
    BubbleSample(double meanIntensity, BubbleRef bubble)
        : meanIntensity_(meanIntensity), bubble_(std::move(bubble)) {}

    double meanIntensity() const { return meanIntensity_; }
    const BubbleRef& bubble() const { return bubble_; }
    const std::string& label() const { return bubble_->label; }

private:
    double meanIntensity_;
    BubbleRef bubble_;
};

}

#endif
