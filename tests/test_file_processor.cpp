#include <gtest/gtest.h>

#include "omr/FileProcessor.hpp"

#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <map>
#include <stdexcept>

using namespace omr;

namespace {

// Serves pages from memory; unknown paths read as unreadable.
class MemoryAccessor : public ImageAccessor {
public:
    void add(const std::string& path, const cv::Mat& page) { pages_[path] = page; }

    cv::Mat load(const std::string& path, cv::Size) const override {
        auto it = pages_.find(path);
        return it == pages_.end() ? cv::Mat() : it->second.clone();
    }

    double meanIntensity(const cv::Rect& region, const cv::Mat& image) const override {
        return real_.meanIntensity(region, image);
    }

private:
    std::map<std::string, cv::Mat> pages_;
    OpenCvImageAccessor real_;
};

class BrokenAccessor : public MemoryAccessor {
public:
    double meanIntensity(const cv::Rect&, const cv::Mat&) const override {
        throw std::runtime_error("sensor glitch");
    }
};

// 200x100 page, two rows of ABCD; cells are 50x50, bubbles 30x30 inside.
Template makeTemplate() {
    Template t("two-questions", cv::Size(200, 100));
    FieldBlock block;
    block.name = "mcq";
    block.rectPct[2] = 1.f;
    block.rectPct[3] = 1.f;
    block.rows = 2;
    block.cols = 4;
    block.labels = {"A", "B", "C", "D"};
    block.fieldPrefix = "q";
    block.fieldType = "MCQ4";
    t.addBlock(block);
    return t;
}

cv::Mat makePage(const std::vector<std::pair<int, int>>& filled) {
    cv::Mat page(100, 200, CV_8UC1, cv::Scalar(255));
    for (const auto& rc : filled) {
        cv::rectangle(page, cv::Rect(10 + 50 * rc.second, 10 + 50 * rc.first, 30, 30),
                      cv::Scalar(40), cv::FILLED);
    }
    return page;
}

}

TEST(FileProcessor, ReadsMarksFromPage) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();

    MemoryAccessor images;
    images.add("sheet.png", makePage({{0, 0}, {1, 1}, {1, 2}}));

    FileResult r = processor.process("sheet.png", 3, tmpl, images);
    ASSERT_TRUE(r.ok) << r.errorMessage;
    EXPECT_EQ(r.inputIndex, 3);
    EXPECT_EQ(r.error, FileError::None);
    EXPECT_DOUBLE_EQ(r.globalThreshold.value, 147.5);

    ASSERT_EQ(r.fields.size(), 2u);
    EXPECT_EQ(r.fields[0].markedLabels, std::vector<std::string>{"A"});
    EXPECT_FALSE(r.fields[0].isMultiMarked);
    EXPECT_EQ(r.fields[1].markedLabels, (std::vector<std::string>{"B", "C"}));
    EXPECT_TRUE(r.fields[1].isMultiMarked);

    EXPECT_TRUE(r.isMultiMarked);
    EXPECT_EQ(r.omrResponse.at("q1"), "A");
    EXPECT_EQ(r.omrResponse.at("q2"), "BC");
    EXPECT_EQ(r.quality.multiMarkedFields, 1);
    EXPECT_EQ(r.quality.worst(), ScanQuality::Excellent);
    EXPECT_FALSE(r.score.has_value());
}

TEST(FileProcessor, UpdatesBatchCounters) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();

    MemoryAccessor images;
    images.add("a.png", makePage({{0, 0}, {1, 3}}));
    images.add("b.png", makePage({{0, 1}, {0, 2}, {1, 0}}));

    processor.process("a.png", 0, tmpl, images);
    processor.process("b.png", 1, tmpl, images);

    EXPECT_EQ(batch.count("files_processed"), 2);
    EXPECT_EQ(batch.count("files_multi_marked"), 1);
    EXPECT_EQ(batch.count("fields.MCQ4"), 4);
    EXPECT_EQ(batch.count("quality.EXCELLENT"), 4);
}

TEST(FileProcessor, BlankPageUsesEmptyValue) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();
    tmpl.setEmptyValue("-");

    MemoryAccessor images;
    images.add("blank.png", makePage({}));

    FileResult r = processor.process("blank.png", 0, tmpl, images);
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.globalThreshold.fallbackUsed);
    EXPECT_EQ(r.omrResponse.at("q1"), "-");
    EXPECT_EQ(r.omrResponse.at("q2"), "-");
    EXPECT_FALSE(r.isMultiMarked);
}

TEST(FileProcessor, UnreadableImageIsReportedNotThrown) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();
    MemoryAccessor images;

    FileResult r = processor.process("missing.png", 5, tmpl, images);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.inputIndex, 5);
    EXPECT_EQ(r.error, FileError::ImageUnreadable);
    EXPECT_NE(r.errorMessage.find("missing.png"), std::string::npos);
    EXPECT_TRUE(r.fields.empty());
    EXPECT_EQ(batch.count("files_processed"), 0);
}

TEST(FileProcessor, MeasurementFailureIsReportedNotThrown) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();

    BrokenAccessor images;
    images.add("sheet.png", makePage({{0, 0}}));

    FileResult r = processor.process("sheet.png", 0, tmpl, images);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, FileError::DetectionFailed);
    EXPECT_NE(r.errorMessage.find("sensor glitch"), std::string::npos);
    EXPECT_TRUE(r.omrResponse.empty());
}

TEST(FileProcessor, ScoresAndMergesCustomLabels) {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    Template tmpl = makeTemplate();
    tmpl.addCustomLabel("code", {"q1", "q2"});

    AnswerKey key;
    key.loadAnswerKey({{"code", "AD"}});
    ScoreCalculator scorer(key, tmpl.emptyValue());
    processor.setScoreCalculator(&scorer);

    MemoryAccessor images;
    images.add("sheet.png", makePage({{0, 0}, {1, 3}}));

    FileResult r = processor.process("sheet.png", 0, tmpl, images);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.omrResponse.size(), 1u);
    EXPECT_EQ(r.omrResponse.at("code"), "AD");
    ASSERT_TRUE(r.score.has_value());
    EXPECT_EQ(r.score->correct, 1);
    EXPECT_DOUBLE_EQ(r.score->score, 1.0);
}

TEST(FileProcessor, WritesDebugImage) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(::testing::TempDir()) / "omrscan_debug";
    fs::create_directories(dir);

    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor(cfg, batch);
    processor.setDebugDirectory(dir.string());
    Template tmpl = makeTemplate();

    MemoryAccessor images;
    images.add("pages/sheet.png", makePage({{0, 0}}));

    FileResult r = processor.process("pages/sheet.png", 7, tmpl, images);
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(fs::exists(dir / "7_sheet_marked.png"));
}

TEST(BuildResponse, CustomLabelJoinsMembersInOrder) {
    Template tmpl("t", cv::Size(100, 100));
    tmpl.addField(makeField("d1", {{"1", cv::Rect(0, 0, 10, 10)}}));
    tmpl.addField(makeField("d2", {{"2", cv::Rect(20, 0, 10, 10)}}));
    tmpl.addField(makeField("q", {{"A", cv::Rect(40, 0, 10, 10)}}));
    tmpl.addCustomLabel("roll", {"d1", "d2"});

    std::vector<FieldInterpretation> fields(3);
    fields[0].fieldId = "d1";
    fields[0].markedLabels = {"4"};
    fields[1].fieldId = "d2";
    fields[1].markedLabels = {"2"};
    fields[2].fieldId = "q";

    auto response = buildResponse(tmpl, fields);
    EXPECT_EQ(response.size(), 2u);
    EXPECT_EQ(response.at("roll"), "42");
    EXPECT_EQ(response.at("q"), "");
}
