#include "omr/OutputSink.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace omr {

namespace {

void openCsv(std::ofstream& out, const fs::path& path) {
    out.open(path, std::ios::out | std::ios::trunc);
    if (!out.is_open())
        throw OutputError("cannot create " + path.string());
}

fs::path sibling(const fs::path& resultsPath, const std::string& suffix) {
    return resultsPath.parent_path() / (resultsPath.stem().string() + suffix + ".csv");
}

}

std::string csvEscape(const std::string& cell) {
    if (cell.find_first_of(",\"\n\r") == std::string::npos) return cell;
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

CsvResultSink::CsvResultSink(const std::string& resultsPath, std::vector<std::string> columns, bool withScore)
    : columns_(std::move(columns)), withScore_(withScore)
{
    fs::path path(resultsPath);
    openCsv(results_, path);
    openCsv(errors_, sibling(path, "_errors"));
    openCsv(multiMarked_, sibling(path, "_multi_marked"));

    std::ostringstream header;
    header << "input_index,file,multi_marked,quality,fallback_fields,min_confidence,global_threshold";
    if (withScore_) header << ",score";
    for (const auto& c : columns_) header << "," << csvEscape(c);
    header << "\n";

    results_ << header.str();
    multiMarked_ << header.str();
    errors_ << "input_index,file,error,reason\n";
}

void CsvResultSink::writeRow(std::ofstream& out, const FileResult& result) {
    std::ostringstream row;
    row << result.inputIndex << ","
        << csvEscape(result.filePath) << ","
        << (result.isMultiMarked ? "true" : "false") << ","
        << qualityName(result.quality.worst()) << ","
        << result.quality.fallbackFields << ","
        << std::fixed << std::setprecision(2) << result.quality.minConfidence << ","
        << result.globalThreshold.value;
    if (withScore_) {
        row << ",";
        if (result.score) row << result.score->score;
    }
    for (const auto& c : columns_) {
        auto it = result.omrResponse.find(c);
        row << "," << (it == result.omrResponse.end() ? std::string() : csvEscape(it->second));
    }
    row << "\n";

    out << row.str();
    out.flush();
}

void CsvResultSink::write(const FileResult& result) {
    writeRow(results_, result);
    if (result.isMultiMarked) writeRow(multiMarked_, result);
}

void CsvResultSink::writeError(const FileResult& result) {
    errors_ << result.inputIndex << ","
            << csvEscape(result.filePath) << ","
            << ErrorMessage::code(result.error) << ","
            << csvEscape(result.errorMessage) << "\n";
    errors_.flush();
}

}
