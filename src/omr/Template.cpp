#include "omr/Template.hpp"
#include "omr/Errors.hpp"
#include "omr/Log.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace omr {

namespace {

cv::Rect rectPct(cv::Size page, const float pct[4]) {
    int X = static_cast<int>(pct[0] * page.width);
    int Y = static_cast<int>(pct[1] * page.height);
    int W = static_cast<int>(pct[2] * page.width);
    int H = static_cast<int>(pct[3] * page.height);
    return cv::Rect(X, Y, W, H);
}

cv::Rect innerCell(const cv::Rect& cell, double margin) {
    int mx = static_cast<int>(cell.width * margin);
    int my = static_cast<int>(cell.height * margin);
    return cv::Rect(cell.x + mx, cell.y + my,
                    std::max(1, cell.width - 2 * mx),
                    std::max(1, cell.height - 2 * my));
}

std::string requireString(const cv::FileNode& n, const std::string& what) {
    if (!n.isString())
        throw TemplateError(what + " must be a string");
    return static_cast<std::string>(n);
}

int optionalInt(const cv::FileNode& n, int fallback, const std::string& what) {
    if (n.empty()) return fallback;
    if (!n.isInt())
        throw TemplateError(what + " must be an integer");
    return static_cast<int>(n);
}

std::vector<std::string> readLabels(const cv::FileNode& n, const std::string& what) {
    std::vector<std::string> out;
    if (n.isString()) {
        for (char c : static_cast<std::string>(n))
            out.push_back(std::string(1, c));
    } else if (n.isSeq()) {
        for (cv::FileNodeIterator it = n.begin(); it != n.end(); ++it)
            out.push_back(requireString(*it, what + " entry"));
    } else {
        throw TemplateError(what + " must be a string or a list of strings");
    }
    return out;
}

FieldBlock parseBlock(const cv::FileNode& b, size_t index) {
    FieldBlock block;
    std::string where = "block #" + std::to_string(index);

    block.name = b["name"].empty() ? where : requireString(b["name"], where + " name");
    where = "block '" + block.name + "'";

    std::string type = b["type"].empty() ? "GRID" : requireString(b["type"], where + " type");
    if (type == "GRID") block.type = FieldBlock::Grid;
    else if (type == "COLUMN") block.type = FieldBlock::Column;
    else throw TemplateError(where + ": unknown type '" + type + "'");

    std::vector<float> pct;
    if (!b["rectPct"].isSeq())
        throw TemplateError(where + ": rectPct must be a list of 4 numbers");
    b["rectPct"] >> pct;
    if (pct.size() != 4)
        throw TemplateError(where + ": rectPct must be a list of 4 numbers");
    std::copy(pct.begin(), pct.end(), block.rectPct);

    block.rows = optionalInt(b["rows"], 0, where + " rows");
    block.cols = optionalInt(b["cols"], 0, where + " cols");
    block.labels = readLabels(b["labels"], where + " labels");
    block.fieldPrefix = b["fieldPrefix"].empty() ? block.name
                                                 : requireString(b["fieldPrefix"], where + " fieldPrefix");
    block.startNumber = optionalInt(b["startNumber"], 1, where + " startNumber");
    block.fieldType = b["fieldType"].empty() ? type : requireString(b["fieldType"], where + " fieldType");
    if (!b["margin"].empty()) {
        if (!b["margin"].isReal() && !b["margin"].isInt())
            throw TemplateError(where + " margin must be a number");
        block.margin = static_cast<double>(b["margin"]);
    }
    return block;
}

Template parse(cv::FileStorage& fs) {
    cv::FileNode root = fs.root();

    std::string name = root["name"].empty() ? "template" : requireString(root["name"], "name");
    cv::Size page(optionalInt(root["pageWidth"], 0, "pageWidth"),
                  optionalInt(root["pageHeight"], 0, "pageHeight"));
    Template t(name, page);

    if (!root["emptyValue"].empty())
        t.setEmptyValue(requireString(root["emptyValue"], "emptyValue"));

    cv::FileNode blocks = root["blocks"];
    if (!blocks.isSeq())
        throw TemplateError("'blocks' must be a list");
    size_t index = 0;
    for (cv::FileNodeIterator it = blocks.begin(); it != blocks.end(); ++it, ++index)
        t.addBlock(parseBlock(*it, index));

    cv::FileNode custom = root["customLabels"];
    if (!custom.empty()) {
        if (!custom.isMap())
            throw TemplateError("'customLabels' must be an object");
        for (cv::FileNodeIterator it = custom.begin(); it != custom.end(); ++it) {
            cv::FileNode entry = *it;
            t.addCustomLabel(entry.name(), readLabels(entry, "customLabels." + entry.name()));
        }
    }

    t.validate();
    return t;
}

Template open(const std::string& source, int flags, const std::string& what) {
    try {
        cv::FileStorage fs(source, cv::FileStorage::READ | cv::FileStorage::FORMAT_JSON | flags);
        if (!fs.isOpened())
            throw TemplateError("cannot open " + what);
        return parse(fs);
    } catch (const cv::Exception& e) {
        throw TemplateError("failed to parse " + what + ": " + e.what());
    }
}

}

Template::Template() : name_("template"), pageSize_(0, 0) {}

Template::Template(std::string name, cv::Size pageSize)
    : name_(std::move(name)), pageSize_(pageSize) {}

Template Template::fromFile(const std::string& path) {
    return open(path, 0, path);
}

Template Template::fromString(const std::string& json) {
    return open(json, cv::FileStorage::MEMORY, "inline template");
}

void Template::addBlock(const FieldBlock& block) {
    const std::string where = "block '" + block.name + "'";
    if (pageSize_.width <= 0 || pageSize_.height <= 0)
        throw TemplateError(where + ": page size must be set before adding blocks");
    if (block.rows <= 0 || block.cols <= 0)
        throw TemplateError(where + ": rows and cols must be positive");
    for (float p : block.rectPct) {
        if (p < 0.f || p > 1.f)
            throw TemplateError(where + ": rectPct values must lie in [0, 1]");
    }
    if (block.margin < 0.0 || block.margin >= 0.5)
        throw TemplateError(where + ": margin must lie in [0, 0.5)");

    const int options = block.type == FieldBlock::Grid ? block.cols : block.rows;
    const int count = block.type == FieldBlock::Grid ? block.rows : block.cols;
    if (static_cast<int>(block.labels.size()) < options)
        throw TemplateError(where + ": " + std::to_string(options) + " options but only "
                            + std::to_string(block.labels.size()) + " labels");

    cv::Rect roi = rectPct(pageSize_, block.rectPct);
    int cellW = roi.width / block.cols;
    int cellH = roi.height / block.rows;
    if (cellW <= 0 || cellH <= 0)
        throw TemplateError(where + ": block is too small for its grid");

    for (int f = 0; f < count; ++f) {
        FieldDef field;
        field.label = block.fieldPrefix + std::to_string(block.startNumber + f);
        field.fieldType = block.fieldType;

        for (int o = 0; o < options; ++o) {
            int r = block.type == FieldBlock::Grid ? f : o;
            int c = block.type == FieldBlock::Grid ? o : f;
            cv::Rect cell(roi.x + c * cellW, roi.y + r * cellH, cellW, cellH);
            field.bubbles.push_back(std::make_shared<BubbleDef>(block.labels[o], innerCell(cell, block.margin)));
        }
        fields_.push_back(std::move(field));
    }
}

void Template::addField(FieldDef field) {
    fields_.push_back(std::move(field));
}

void Template::addCustomLabel(const std::string& label, std::vector<std::string> members) {
    customLabels_.emplace_back(label, std::move(members));
}

const FieldDef* Template::findField(const std::string& label) const {
    for (const auto& f : fields_) {
        if (f.label == label) return &f;
    }
    return nullptr;
}

std::vector<std::string> Template::outputColumns() const {
    std::map<std::string, std::string> owner;
    for (const auto& custom : customLabels_) {
        for (const auto& m : custom.second) owner[m] = custom.first;
    }

    std::vector<std::string> columns;
    std::set<std::string> emitted;
    for (const auto& f : fields_) {
        auto it = owner.find(f.label);
        const std::string& column = it == owner.end() ? f.label : it->second;
        if (emitted.insert(column).second) columns.push_back(column);
    }
    return columns;
}

void Template::validate() const {
    if (fields_.empty())
        throw TemplateError("template '" + name_ + "' defines no fields");
    if (pageSize_.width <= 0 || pageSize_.height <= 0)
        throw TemplateError("template '" + name_ + "' has no page size");

    const cv::Rect page(0, 0, pageSize_.width, pageSize_.height);
    std::set<std::string> labels;
    for (const auto& f : fields_) {
        if (!labels.insert(f.label).second)
            throw TemplateError("duplicate field label '" + f.label + "'");
        if (f.bubbles.empty())
            OMR_LOG_WARN("field '" << f.label << "' has no bubble regions, it will always read blank");
        for (const auto& b : f.bubbles) {
            if (!b)
                throw TemplateError("field '" + f.label + "' has a null bubble");
            if ((b->rect & page) != b->rect || b->rect.area() <= 0)
                throw TemplateError("bubble '" + b->label + "' of field '" + f.label
                                    + "' lies outside the page");
        }
    }

    std::set<std::string> claimed;
    for (const auto& custom : customLabels_) {
        if (custom.second.empty())
            throw TemplateError("custom label '" + custom.first + "' has no members");
        if (labels.count(custom.first))
            throw TemplateError("custom label '" + custom.first + "' clashes with a field label");
        for (const auto& m : custom.second) {
            if (!labels.count(m))
                throw TemplateError("custom label '" + custom.first + "' refers to unknown field '" + m + "'");
            if (!claimed.insert(m).second)
                throw TemplateError("field '" + m + "' belongs to more than one custom label");
        }
    }
}

FieldDef makeField(
    const std::string& label,
    const std::vector<std::pair<std::string, cv::Rect>>& bubbles,
    const std::string& fieldType)
{
    FieldDef field;
    field.label = label;
    field.fieldType = fieldType;
    for (const auto& b : bubbles)
        field.bubbles.push_back(std::make_shared<BubbleDef>(b.first, b.second));
    return field;
}

}
