#include <opencv2/core.hpp>
#include "omr/AnswerKey.hpp"
#include "omr/BatchScheduler.hpp"
#include "omr/Config.hpp"
#include "omr/Errors.hpp"
#include "omr/FileProcessor.hpp"
#include "omr/ImageAccessor.hpp"
#include "omr/Log.hpp"
#include "omr/OutputSink.hpp"
#include "omr/ScoreCalculator.hpp"
#include "omr/Template.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

static const char* kKeys =
    "{help h usage ? |            | print this message }"
    "{template t     |            | template JSON (required) }"
    "{config c       |            | tuning config JSON }"
    "{answer_key k   |            | answer key JSON, enables scoring }"
    "{output o       | results.csv| results CSV path }"
    "{workers w      | -1         | worker threads, overrides the config }"
    "{debug_dir d    |            | write marked pages here }"
    "{log_level l    |            | error, warning, info or debug }"
    "{@input         |            | image file or directory of images }";

static bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg"
        || ext == ".tif" || ext == ".tiff" || ext == ".bmp";
}

// Sorted path order; the position in this list is the input index.
static std::vector<std::string> collectInputs(const std::string& input) {
    std::vector<std::string> files;
    fs::path root(input);
    if (fs::is_directory(root)) {
        for (const auto& entry : fs::directory_iterator(root)) {
            if (entry.is_regular_file() && isImageFile(entry.path()))
                files.push_back(entry.path().string());
        }
        std::sort(files.begin(), files.end());
    } else {
        files.push_back(root.string());
    }
    return files;
}

static void printSummary(const omr::BatchSummary& s, const std::string& outputPath) {
    std::cout << "\n=== omrscan ===\n";
    std::cout << "Files:        " << s.total << " (" << s.succeeded << " ok, "
              << s.failed << " failed)\n";
    std::cout << "Multi-marked: " << s.multiMarked << "\n";
    std::cout << "Workers:      " << s.workersUsed << (s.sequential ? " (sequential)" : "") << "\n";
    std::cout << "Reordered:    " << s.reorderedSlots << "\n";
    std::cout << "Elapsed:      " << std::fixed << std::setprecision(2) << s.elapsedSeconds << " s\n";
    for (const auto& kv : s.counters) {
        std::cout << "  " << std::left << std::setw(24) << kv.first << kv.second << "\n";
    }
    std::cout << "Results:      " << outputPath << "\n";
}

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("omrscan - batch OMR sheet reader");

    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    std::string templatePath = parser.get<std::string>("template");
    std::string configPath = parser.get<std::string>("config");
    std::string answerKeyPath = parser.get<std::string>("answer_key");
    std::string outputPath = parser.get<std::string>("output");
    int workers = parser.get<int>("workers");
    std::string debugDir = parser.get<std::string>("debug_dir");
    std::string logLevel = parser.get<std::string>("log_level");
    std::string input = parser.get<std::string>("@input");

    if (!parser.check()) {
        parser.printErrors();
        return 1;
    }
    if (templatePath.empty() || input.empty()) {
        std::cerr << "omrscan: --template and an input are required\n";
        parser.printMessage();
        return 1;
    }

    try {
        omr::TuningConfig config;
        if (!configPath.empty())
            config = omr::loadConfig(configPath);
        if (workers != -1)
            config.workerCount = workers;
        if (!logLevel.empty())
            config.logLevel = logLevel;
        config.validate();

        if (!omr::log::setLevel(config.logLevel))
            throw omr::ConfigError("unknown log level '" + config.logLevel + "'");

        omr::Template tmpl = omr::Template::fromFile(templatePath);
        tmpl.validate();

        std::unique_ptr<omr::AnswerKey> answerKey;
        std::unique_ptr<omr::ScoreCalculator> scorer;
        if (!answerKeyPath.empty()) {
            answerKey = std::make_unique<omr::AnswerKey>(omr::AnswerKey::fromFile(answerKeyPath));
            scorer = std::make_unique<omr::ScoreCalculator>(*answerKey, tmpl.emptyValue());
            OMR_LOG_INFO("answer key: " << answerKey->getQuestionCount() << " question(s)");
        }

        std::vector<std::string> files = collectInputs(input);
        if (files.empty()) {
            std::cerr << "omrscan: no images found in " << input << "\n";
            return 1;
        }

        if (!debugDir.empty())
            fs::create_directories(debugDir);

        omr::BatchAggregate batch;
        omr::OpenCvImageAccessor images;
        omr::FileProcessor processor(config, batch);
        processor.setScoreCalculator(scorer.get());
        processor.setDebugDirectory(debugDir);

        omr::CsvResultSink sink(outputPath, tmpl.outputColumns(), scorer != nullptr);
        omr::BatchScheduler scheduler(processor, batch, tmpl, images, &sink);
        size_t finished = 0;
        scheduler.setCompletionListener([&](const omr::FileResult& r) {
            ++finished;
            OMR_LOG_INFO("[" << finished << "/" << files.size() << "] " << r.filePath
                         << (r.ok ? "" : " (failed)"));
        });
        scheduler.run(files, config.workerCount);

        printSummary(scheduler.summary(), outputPath);
        return scheduler.summary().failed > 0 ? 2 : 0;
    }
    catch (const std::exception& e) {
        OMR_LOG_ERROR(e.what());
        std::cerr << "omrscan: " << e.what() << "\n";
        return 1;
    }
}
