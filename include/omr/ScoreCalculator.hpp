#ifndef OMR_SCORE_CALCULATOR_HPP
#define OMR_SCORE_CALCULATOR_HPP

#include "omr/AnswerKey.hpp"

#include <map>
#include <string>
#include <vector>

namespace omr {

struct QuestionVerdict {
    enum Verdict {
        Correct,
        Incorrect,
        Unmarked
    };

    std::string question;
    std::string marked;
    std::string expected;
    Verdict verdict = Unmarked;
    double delta = 0.0;
};

struct ScoreResult {
    int correct = 0;
    int wrong = 0;
    int empty = 0;
    double score = 0.0;
    std::vector<QuestionVerdict> details;   // answer key order
};

class ScoreCalculator {
public:
    // emptyValue is the template's answer for a blank field.
    ScoreCalculator(const AnswerKey& answerKey, std::string emptyValue = "");

    ScoreResult calculateScore(const std::map<std::string, std::string>& omrResponse) const;

private:
    const AnswerKey& answerKey_;
    std::string emptyValue_;
};

}

#endif
