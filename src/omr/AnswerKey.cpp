#include "omr/AnswerKey.hpp"
#include "omr/Errors.hpp"

#include <opencv2/core.hpp>

namespace omr {

namespace {

double schemeValue(const cv::FileNode& scheme, const char* key, double fallback) {
    cv::FileNode n = scheme[key];
    if (n.empty()) return fallback;
    if (!n.isReal() && !n.isInt())
        throw ConfigError(std::string("markingScheme.") + key + " must be a number");
    return static_cast<double>(n);
}

AnswerKey parse(cv::FileStorage& fs) {
    AnswerKey key;
    cv::FileNode root = fs.root();

    cv::FileNode scheme = root["markingScheme"];
    if (!scheme.empty()) {
        AnswerKey::MarkingScheme m;
        m.correct = schemeValue(scheme, "correct", m.correct);
        m.incorrect = schemeValue(scheme, "incorrect", m.incorrect);
        m.unmarked = schemeValue(scheme, "unmarked", m.unmarked);
        key.setMarkingScheme(m);
    }

    cv::FileNode answers = root["answers"];
    if (!answers.isMap())
        throw ConfigError("answer key needs an 'answers' object");

    std::vector<AnswerKey::QuestionAnswer> list;
    for (cv::FileNodeIterator it = answers.begin(); it != answers.end(); ++it) {
        cv::FileNode n = *it;
        if (!n.isString())
            throw ConfigError("answer for '" + n.name() + "' must be a string");
        list.push_back({n.name(), static_cast<std::string>(n)});
    }
    key.loadAnswerKey(list);
    return key;
}

AnswerKey open(const std::string& source, int flags, const std::string& what) {
    try {
        cv::FileStorage fs(source, cv::FileStorage::READ | cv::FileStorage::FORMAT_JSON | flags);
        if (!fs.isOpened())
            throw ConfigError("cannot open answer key " + what);
        return parse(fs);
    } catch (const cv::Exception& e) {
        throw ConfigError("failed to parse answer key " + what + ": " + e.what());
    }
}

}

AnswerKey::AnswerKey() {}

AnswerKey AnswerKey::fromFile(const std::string& path) {
    return open(path, 0, path);
}

AnswerKey AnswerKey::fromString(const std::string& json) {
    return open(json, cv::FileStorage::MEMORY, "(inline)");
}

void AnswerKey::loadAnswerKey(const std::vector<QuestionAnswer>& answers) {
    keyMap_.clear();
    for (const auto& a : answers) {
        keyMap_[a.question] = a.answer;
    }
}

bool AnswerKey::isCorrect(const std::string& question, const std::string& answer) const {
    auto it = keyMap_.find(question);
    return it != keyMap_.end() && it->second == answer;
}

}
