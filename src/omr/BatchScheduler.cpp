#include "omr/BatchScheduler.hpp"
#include "omr/Log.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>

namespace omr {

namespace {

// Keeps OpenCV's own pool out of the way while our workers run.
struct CvThreadsGuard {
    int previous;
    CvThreadsGuard() : previous(cv::getNumThreads()) { cv::setNumThreads(1); }
    ~CvThreadsGuard() { cv::setNumThreads(previous); }
};

}

const char* stateName(SchedulerState state) {
    switch (state) {
        case SchedulerState::Init: return "INIT";
        case SchedulerState::Dispatching: return "DISPATCHING";
        case SchedulerState::Collecting: return "COLLECTING";
        case SchedulerState::Reordering: return "REORDERING";
        case SchedulerState::Done: return "DONE";
    }
    return "UNKNOWN";
}

BatchScheduler::BatchScheduler(
    const FileProcessor& processor,
    BatchAggregate& batch,
    const Template& tmpl,
    const ImageAccessor& images,
    OutputSink* sink)
    : processor_(processor), batch_(batch), tmpl_(tmpl), images_(images), sink_(sink) {}

std::vector<FileResult> BatchScheduler::run(const std::vector<std::string>& files, int workerCount)
{
    state_ = SchedulerState::Init;
    summary_ = BatchSummary();

    if (workerCount < 1)
        throw std::invalid_argument("workerCount must be >= 1, got " + std::to_string(workerCount));
    tmpl_.validate();

    if (workerCount > kRecommendedMaxWorkers) {
        OMR_LOG_WARN("workerCount " << workerCount << " is above the recommended maximum of "
                     << kRecommendedMaxWorkers);
    }

    batch_.reset();
    auto start = std::chrono::steady_clock::now();

    summary_.total = static_cast<int>(files.size());
    summary_.sequential = workerCount == 1;
    summary_.workersUsed = summary_.sequential
        ? 1
        : std::max(1, std::min(workerCount, static_cast<int>(files.size())));

    OMR_LOG_INFO("processing " << files.size() << " file(s) with "
                 << summary_.workersUsed << " worker(s)");

    std::vector<FileResult> results;
    results.reserve(files.size());

    if (summary_.sequential)
        runSequential(files, results);
    else
        runParallel(files, workerCount, results);

    for (const auto& r : results) {
        if (r.ok) summary_.succeeded++;
        else summary_.failed++;
        if (r.ok && r.isMultiMarked) summary_.multiMarked++;
    }
    summary_.counters = batch_.snapshot();
    summary_.elapsedSeconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    state_ = SchedulerState::Done;
    OMR_LOG_INFO("batch done: " << summary_.succeeded << " ok, " << summary_.failed
                 << " failed, " << summary_.multiMarked << " multi-marked in "
                 << summary_.elapsedSeconds << "s");
    return results;
}

void BatchScheduler::runSequential(const std::vector<std::string>& files, std::vector<FileResult>& results)
{
    state_ = SchedulerState::Dispatching;
    for (size_t i = 0; i < files.size(); ++i) {
        results.push_back(processor_.process(files[i], static_cast<int>(i), tmpl_, images_));
        summary_.completionOrder.push_back(static_cast<int>(i));
        if (listener_) listener_(results.back());
        emit(results.back());
    }
    state_ = SchedulerState::Collecting;
}

void BatchScheduler::runParallel(
    const std::vector<std::string>& files,
    int workerCount,
    std::vector<FileResult>& results)
{
    CvThreadsGuard cvThreads;

    std::mutex collectMutex;
    std::vector<FileResult> collected;
    collected.reserve(files.size());

    std::atomic<size_t> next{0};
    std::exception_ptr workerError;

    state_ = SchedulerState::Dispatching;

    auto work = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= files.size())
                break;
            try {
                FileResult r = processor_.process(files[i], static_cast<int>(i), tmpl_, images_);
                std::lock_guard<std::mutex> lock(collectMutex);
                collected.push_back(std::move(r));
                if (listener_) listener_(collected.back());
            } catch (...) {
                std::lock_guard<std::mutex> lock(collectMutex);
                if (!workerError) workerError = std::current_exception();
                next.store(files.size());
            }
        }
    };

    std::vector<std::thread> workers;
    int poolSize = std::min(workerCount, std::max(1, static_cast<int>(files.size())));
    try {
        for (int w = 0; w < poolSize; ++w) {
            workers.emplace_back(work);
        }
    } catch (...) {
        // Thread creation failed: drain the cursor and join what was started.
        next.store(files.size());
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    state_ = SchedulerState::Collecting;
    for (auto& worker : workers) {
        worker.join();
    }

    if (workerError)
        std::rethrow_exception(workerError);

    state_ = SchedulerState::Reordering;

    for (const auto& r : collected) {
        summary_.completionOrder.push_back(r.inputIndex);
    }
    for (size_t slot = 0; slot < collected.size(); ++slot) {
        if (collected[slot].inputIndex != static_cast<int>(slot)) summary_.reorderedSlots++;
    }

    std::sort(collected.begin(), collected.end(),
              [](const FileResult& a, const FileResult& b) { return a.inputIndex < b.inputIndex; });

    if (summary_.reorderedSlots > 0) {
        OMR_LOG_DEBUG("reordered " << summary_.reorderedSlots << " result(s) into input order");
    }

    for (auto& r : collected) {
        emit(r);
        results.push_back(std::move(r));
    }
}

void BatchScheduler::emit(const FileResult& result)
{
    if (!sink_) return;
    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (result.ok)
        sink_->write(result);
    else
        sink_->writeError(result);
}

}
