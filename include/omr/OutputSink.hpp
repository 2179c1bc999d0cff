#ifndef OMR_OUTPUT_SINK_HPP
#define OMR_OUTPUT_SINK_HPP

#include "omr/FileProcessor.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace omr {

// Receives results in input order. Calls are serialized by the scheduler.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void write(const FileResult& result) = 0;

    // Failed files; the default drops them.
    virtual void writeError(const FileResult& result) { (void)result; }
};

class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string& what)
        : std::runtime_error("Output Error: " + what) {}
};

// Results CSV plus "<stem>_errors.csv" and "<stem>_multi_marked.csv"
// next to it. Throws OutputError when a file cannot be created.
class CsvResultSink : public OutputSink {
public:
    CsvResultSink(const std::string& resultsPath, std::vector<std::string> columns, bool withScore);

    void write(const FileResult& result) override;
    void writeError(const FileResult& result) override;

private:
    std::vector<std::string> columns_;
    bool withScore_;
    std::ofstream results_;
    std::ofstream errors_;
    std::ofstream multiMarked_;

    void writeRow(std::ofstream& out, const FileResult& result);
};

// Quotes a CSV cell when it contains a separator, quote or newline.
std::string csvEscape(const std::string& cell);

}

#endif
