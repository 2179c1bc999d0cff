#include "omr/BubbleDetector.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace omr {

BubbleDetector::BubbleDetector(const ImageAccessor& images)
    : images_(images) {}

std::vector<BubbleSample> BubbleDetector::detectField(const FieldDef& field, const cv::Mat& page) const {
    std::vector<BubbleSample> samples;
    samples.reserve(field.bubbles.size());

    const cv::Rect bounds(0, 0, page.cols, page.rows);
    for (const auto& bubble : field.bubbles) {
        cv::Rect cell = bubble->rect & bounds;
        if (cell.width <= 0 || cell.height <= 0) {
            OMR_LOG_DEBUG("bubble '" << bubble->label << "' of field '" << field.label
                          << "' is outside the page, skipped");
            continue;
        }
        samples.emplace_back(images_.meanIntensity(cell, page), bubble);
    }
    return samples;
}

void BubbleDetector::drawFieldDebug(
    cv::Mat& debugImg,
    const FieldDef& field,
    const FieldInterpretation& interpretation) const
{
    const cv::Rect bounds(0, 0, debugImg.cols, debugImg.rows);
    const cv::Scalar markColor = interpretation.isMultiMarked ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 200, 0);

    for (const auto& bubble : field.bubbles) {
        cv::Rect cell = bubble->rect & bounds;
        if (cell.area() <= 0) continue;

        bool marked = std::find(interpretation.markedLabels.begin(),
                                interpretation.markedLabels.end(),
                                bubble->label) != interpretation.markedLabels.end();
        if (marked) {
            cv::rectangle(debugImg, cell, markColor, 2);
            cv::putText(debugImg, bubble->label,
                        cv::Point(cell.x + 2, cell.y + cell.height - 3),
                        cv::FONT_HERSHEY_SIMPLEX, 0.40, markColor, 1);
        } else {
            int radius = static_cast<int>(std::min(cell.width, cell.height) * 0.45);
            cv::circle(debugImg, bubble->position, std::max(1, radius),
                       cv::Scalar(120, 120, 120), 1, cv::LINE_AA);
        }
    }
}

}
