#ifndef OMR_BUBBLE_DETECTOR_HPP
#define OMR_BUBBLE_DETECTOR_HPP

#include "omr/BubbleSample.hpp"
#include "omr/FieldInterpreter.hpp"
#include "omr/ImageAccessor.hpp"
#include "omr/Template.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace omr {

class BubbleDetector {
public:
    explicit BubbleDetector(const ImageAccessor& images);

    // One sample per bubble of the field, in field order. Bubbles that fall
    // outside the page are skipped, so the result may be shorter than
    // field.bubbles (or empty).
    std::vector<BubbleSample> detectField(const FieldDef& field, const cv::Mat& page) const;

    // Marked bubbles are boxed (green, red when multi-marked), the rest circled.
    void drawFieldDebug(
        cv::Mat& debugImg,
        const FieldDef& field,
        const FieldInterpretation& interpretation
    ) const;

private:
    const ImageAccessor& images_;
};

}

#endif
