#include <gtest/gtest.h>

#include "omr/OutputSink.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace omr;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> readLines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

FileResult okResult(int index, const std::string& path, bool multi) {
    FileResult r;
    r.inputIndex = index;
    r.filePath = path;
    r.ok = true;
    r.isMultiMarked = multi;
    r.globalThreshold.value = 125.0;
    r.omrResponse = {{"q1", multi ? "AB" : "A"}, {"q2", "C"}};
    return r;
}

}

TEST(CsvEscape, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(csvEscape("plain"), "plain");
    EXPECT_EQ(csvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(CsvResultSink, WritesResultsErrorsAndMultiMarked) {
    fs::path dir = fs::path(::testing::TempDir()) / "omrscan_sink";
    fs::create_directories(dir);
    fs::path results = dir / "batch.csv";

    {
        CsvResultSink sink(results.string(), {"q1", "q2"}, false);
        sink.write(okResult(0, "a.png", false));
        sink.write(okResult(1, "b.png", true));

        FileResult failed;
        failed.inputIndex = 2;
        failed.filePath = "c.png";
        failed.error = FileError::ImageUnreadable;
        failed.errorMessage = ErrorMessage::format(failed.error, "c.png");
        sink.writeError(failed);
    }

    std::vector<std::string> lines = readLines(results);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "input_index,file,multi_marked,quality,fallback_fields,min_confidence,global_threshold,q1,q2");
    EXPECT_EQ(lines[1], "0,a.png,false,EXCELLENT,0,1.00,125.00,A,C");
    EXPECT_EQ(lines[2], "1,b.png,true,EXCELLENT,0,1.00,125.00,AB,C");

    std::vector<std::string> multi = readLines(dir / "batch_multi_marked.csv");
    ASSERT_EQ(multi.size(), 2u);
    EXPECT_EQ(multi[1], lines[2]);

    std::vector<std::string> errors = readLines(dir / "batch_errors.csv");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[1], "2,c.png,IMAGE_UNREADABLE,Image could not be read - c.png");
}

TEST(CsvResultSink, UnwritableLocationThrows) {
    EXPECT_THROW(CsvResultSink("/nonexistent/dir/out.csv", {}, false), OutputError);
}
