#ifndef OMR_BATCH_SCHEDULER_HPP
#define OMR_BATCH_SCHEDULER_HPP

#include "omr/AggregateStore.hpp"
#include "omr/FileProcessor.hpp"
#include "omr/ImageAccessor.hpp"
#include "omr/OutputSink.hpp"
#include "omr/Template.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace omr {

enum class SchedulerState {
    Init,
    Dispatching,
    Collecting,
    Reordering,
    Done
};

const char* stateName(SchedulerState state);

struct BatchSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    int multiMarked = 0;
    int workersUsed = 0;
    bool sequential = false;
    int reorderedSlots = 0;              // results whose completion slot != input index
    double elapsedSeconds = 0.0;
    std::vector<int> completionOrder;    // input indices in the order workers finished them
    std::map<std::string, long> counters;
};

// Runs the per-file pipeline over a list of inputs with a bounded pool of
// worker threads and hands results to the sink in input order.
class BatchScheduler {
public:
    static constexpr int kRecommendedMaxWorkers = 16;

    // Called once per finished file in completion order, from the thread
    // that finished it. Calls never overlap.
    using CompletionListener = std::function<void(const FileResult&)>;

    BatchScheduler(
        const FileProcessor& processor,
        BatchAggregate& batch,
        const Template& tmpl,
        const ImageAccessor& images,
        OutputSink* sink = nullptr
    );

    // Throws std::invalid_argument for workerCount < 1 and TemplateError for
    // an invalid template, both before any file is dispatched.
    std::vector<FileResult> run(const std::vector<std::string>& files, int workerCount);

    void setCompletionListener(CompletionListener listener) { listener_ = std::move(listener); }

    SchedulerState state() const { return state_.load(); }
    const BatchSummary& summary() const { return summary_; }

private:
    const FileProcessor& processor_;
    BatchAggregate& batch_;
    const Template& tmpl_;
    const ImageAccessor& images_;
    OutputSink* sink_;
    CompletionListener listener_;

    std::atomic<SchedulerState> state_{SchedulerState::Init};
    std::mutex sinkMutex_;
    BatchSummary summary_;

    void runSequential(const std::vector<std::string>& files, std::vector<FileResult>& results);
    void runParallel(const std::vector<std::string>& files, int workerCount, std::vector<FileResult>& results);
    void emit(const FileResult& result);
};

}

#endif
