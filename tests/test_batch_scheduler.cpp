#include <gtest/gtest.h>

#include "omr/BatchScheduler.hpp"
#include "omr/Errors.hpp"

#include <opencv2/imgproc.hpp>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>

using namespace omr;

namespace {

// Every known path yields the same page. A path can be held back until
// another input index has finished, which fixes the completion order.
class GatedAccessor : public ImageAccessor {
public:
    GatedAccessor() : page_(100, 200, CV_8UC1, cv::Scalar(255)) {
        cv::rectangle(page_, cv::Rect(10, 10, 30, 30), cv::Scalar(40), cv::FILLED);
    }

    void add(const std::string& path, int afterIndex = -1) { gates_[path] = afterIndex; }

    void markDone(int inputIndex) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_.insert(inputIndex);
        }
        cv_.notify_all();
    }

    cv::Mat load(const std::string& path, cv::Size) const override {
        auto it = gates_.find(path);
        if (it == gates_.end()) return cv::Mat();
        if (it->second >= 0) {
            int waitFor = it->second;
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(5),
                         [&]() { return done_.count(waitFor) > 0; });
        }
        return page_.clone();
    }

    double meanIntensity(const cv::Rect& region, const cv::Mat& image) const override {
        return real_.meanIntensity(region, image);
    }

private:
    cv::Mat page_;
    std::map<std::string, int> gates_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::set<int> done_;
    OpenCvImageAccessor real_;
};

class RecordingSink : public OutputSink {
public:
    const BatchScheduler* scheduler = nullptr;
    std::vector<int> emitted;
    std::vector<int> errors;
    std::vector<SchedulerState> statesAtEmit;

    void write(const FileResult& result) override {
        emitted.push_back(result.inputIndex);
        if (scheduler) statesAtEmit.push_back(scheduler->state());
    }

    void writeError(const FileResult& result) override {
        emitted.push_back(result.inputIndex);
        errors.push_back(result.inputIndex);
        if (scheduler) statesAtEmit.push_back(scheduler->state());
    }
};

Template makeTemplate() {
    Template t("one-row", cv::Size(200, 100));
    FieldBlock block;
    block.name = "mcq";
    block.rectPct[2] = 1.f;
    block.rectPct[3] = 0.5f;
    block.rows = 1;
    block.cols = 4;
    block.labels = {"A", "B", "C", "D"};
    block.fieldPrefix = "q";
    t.addBlock(block);
    return t;
}

struct SchedulerFixture : public ::testing::Test {
    TuningConfig cfg;
    BatchAggregate batch;
    FileProcessor processor{cfg, batch};
    Template tmpl = makeTemplate();
    GatedAccessor images;
    std::vector<int> finished;
    RecordingSink sink;
    BatchScheduler scheduler{processor, batch, tmpl, images, &sink};

    void SetUp() override {
        sink.scheduler = &scheduler;
        scheduler.setCompletionListener([this](const FileResult& r) {
            finished.push_back(r.inputIndex);
            images.markDone(r.inputIndex);
        });
    }
};

}

TEST_F(SchedulerFixture, EmitsInInputOrderDespiteCompletionOrder) {
    images.add("f0.png", 2);
    images.add("f1.png", 0);
    images.add("f2.png");

    std::vector<FileResult> results = scheduler.run({"f0.png", "f1.png", "f2.png"}, 3);

    const BatchSummary& s = scheduler.summary();
    EXPECT_EQ(s.completionOrder, (std::vector<int>{2, 0, 1}));
    EXPECT_EQ(finished, s.completionOrder);
    EXPECT_EQ(sink.emitted, (std::vector<int>{0, 1, 2}));
    EXPECT_GT(s.reorderedSlots, 0);
    EXPECT_FALSE(s.sequential);
    EXPECT_EQ(s.workersUsed, 3);

    ASSERT_EQ(results.size(), 3u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].inputIndex, static_cast<int>(i));
        EXPECT_EQ(results[i].omrResponse.at("q1"), "A");
    }

    // nothing reaches the sink before the reordering stage
    for (SchedulerState st : sink.statesAtEmit) {
        EXPECT_EQ(st, SchedulerState::Reordering);
    }
    EXPECT_EQ(scheduler.state(), SchedulerState::Done);
}

TEST_F(SchedulerFixture, SequentialModeEmitsImmediatelyInOrder) {
    std::vector<std::string> files;
    for (int i = 0; i < 5; ++i) {
        files.push_back("s" + std::to_string(i) + ".png");
        images.add(files.back());
    }

    scheduler.run(files, 1);

    const BatchSummary& s = scheduler.summary();
    EXPECT_TRUE(s.sequential);
    EXPECT_EQ(s.workersUsed, 1);
    EXPECT_EQ(s.reorderedSlots, 0);
    EXPECT_EQ(sink.emitted, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(s.completionOrder, sink.emitted);
    EXPECT_EQ(finished, sink.emitted);
    for (SchedulerState st : sink.statesAtEmit) {
        EXPECT_EQ(st, SchedulerState::Dispatching);
    }
    EXPECT_EQ(s.succeeded, 5);
    EXPECT_EQ(s.counters.at("files_processed"), 5);
}

TEST_F(SchedulerFixture, FailedFilesGoToErrorOutput) {
    images.add("good0.png");
    images.add("good2.png");

    std::vector<FileResult> results = scheduler.run({"good0.png", "lost.png", "good2.png"}, 2);

    EXPECT_EQ(sink.emitted, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(sink.errors, std::vector<int>{1});
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].error, FileError::ImageUnreadable);

    const BatchSummary& s = scheduler.summary();
    EXPECT_EQ(s.total, 3);
    EXPECT_EQ(s.succeeded, 2);
    EXPECT_EQ(s.failed, 1);
    EXPECT_EQ(s.counters.at("files_processed"), 2);
}

TEST_F(SchedulerFixture, RejectsInvalidWorkerCountBeforeDispatch) {
    images.add("f0.png");

    EXPECT_THROW(scheduler.run({"f0.png"}, 0), std::invalid_argument);
    EXPECT_THROW(scheduler.run({"f0.png"}, -3), std::invalid_argument);
    EXPECT_TRUE(sink.emitted.empty());
    EXPECT_EQ(batch.count("files_processed"), 0);
    EXPECT_EQ(scheduler.state(), SchedulerState::Init);
}

TEST_F(SchedulerFixture, RejectsInvalidTemplateBeforeDispatch) {
    images.add("f0.png");
    tmpl.addField(makeField("q1", {{"A", cv::Rect(0, 0, 5, 5)}}));

    EXPECT_THROW(scheduler.run({"f0.png"}, 2), TemplateError);
    EXPECT_TRUE(sink.emitted.empty());
}

TEST_F(SchedulerFixture, PoolNeverExceedsFileCount) {
    images.add("only.png");

    scheduler.run({"only.png"}, 8);
    EXPECT_EQ(scheduler.summary().workersUsed, 1);
    EXPECT_EQ(scheduler.summary().reorderedSlots, 0);
    EXPECT_EQ(sink.emitted, std::vector<int>{0});
}

TEST_F(SchedulerFixture, CountersAreResetPerRun) {
    images.add("a.png");
    images.add("b.png");

    scheduler.run({"a.png", "b.png"}, 2);
    scheduler.run({"a.png"}, 2);
    EXPECT_EQ(scheduler.summary().counters.at("files_processed"), 1);
}

TEST_F(SchedulerFixture, EmptyBatchCompletes) {
    std::vector<FileResult> results = scheduler.run({}, 4);
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(scheduler.summary().total, 0);
    EXPECT_EQ(scheduler.state(), SchedulerState::Done);
}

TEST(SchedulerState, Names) {
    EXPECT_STREQ(stateName(SchedulerState::Reordering), "REORDERING");
    EXPECT_STREQ(stateName(SchedulerState::Done), "DONE");
}
