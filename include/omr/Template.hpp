#ifndef OMR_TEMPLATE_HPP
#define OMR_TEMPLATE_HPP

#include "omr/BubbleSample.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace omr {

// One question / one output value: an ordered list of bubbles.
struct FieldDef {
    std::string label;
    std::string fieldType;
    std::vector<BubbleRef> bubbles;
};

// Rectangular block of bubbles laid out on a regular grid.
//   Grid   - every row is one field, columns are its options
//   Column - every column is one field, rows are its options
struct FieldBlock {
    enum Type {
        Grid,
        Column
    };

    std::string name;
    Type type = Grid;
    float rectPct[4] = {0.f, 0.f, 0.f, 0.f};  // x, y, w, h as fractions of the page
    int rows = 0;
    int cols = 0;
    std::vector<std::string> labels;          // option labels, in layout order
    std::string fieldPrefix;
    int startNumber = 1;
    std::string fieldType;
    double margin = 0.2;                      // fraction of the cell trimmed on each side
};

class Template {
public:
    Template();
    Template(std::string name, cv::Size pageSize);

    // Throws TemplateError.
    static Template fromFile(const std::string& path);
    static Template fromString(const std::string& json);

    // Expands the block into fields appended in layout order.
    // Throws TemplateError for a malformed block.
    void addBlock(const FieldBlock& block);
    void addField(FieldDef field);
    void addCustomLabel(const std::string& label, std::vector<std::string> members);
    void setEmptyValue(const std::string& value) { emptyValue_ = value; }

    const std::string& name() const { return name_; }
    cv::Size pageSize() const { return pageSize_; }
    const std::string& emptyValue() const { return emptyValue_; }
    const std::vector<FieldDef>& fields() const { return fields_; }
    const std::vector<std::pair<std::string, std::vector<std::string>>>& customLabels() const {
        return customLabels_;
    }

    const FieldDef* findField(const std::string& label) const;

    // Response columns: field labels in template order, with the members of
    // a custom label replaced by the custom label at its first member.
    std::vector<std::string> outputColumns() const;

    // Shape checks run once before a batch is dispatched. Throws TemplateError.
    void validate() const;

private:
    std::string name_;
    cv::Size pageSize_;
    std::string emptyValue_;
    std::vector<FieldDef> fields_;
    std::vector<std::pair<std::string, std::vector<std::string>>> customLabels_;
};

// Convenience for callers that lay bubbles out by hand.
FieldDef makeField(
    const std::string& label,
    const std::vector<std::pair<std::string, cv::Rect>>& bubbles,
    const std::string& fieldType = ""
);

}

#endif
