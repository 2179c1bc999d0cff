#include "omr/ScoreCalculator.hpp"

namespace omr {

ScoreCalculator::ScoreCalculator(const AnswerKey& answerKey, std::string emptyValue)
    : answerKey_(answerKey), emptyValue_(std::move(emptyValue)) {}

ScoreResult ScoreCalculator::calculateScore(const std::map<std::string, std::string>& omrResponse) const
{
    ScoreResult result;
    const AnswerKey::MarkingScheme& scheme = answerKey_.markingScheme();

    for (const auto& [question, expected] : answerKey_.answers()) {
        QuestionVerdict v;
        v.question = question;
        v.expected = expected;

        auto it = omrResponse.find(question);
        v.marked = it == omrResponse.end() ? emptyValue_ : it->second;

        if (v.marked == emptyValue_ || v.marked.empty()) {
            v.verdict = QuestionVerdict::Unmarked;
            v.delta = scheme.unmarked;
            result.empty++;
        }
        else if (answerKey_.isCorrect(question, v.marked)) {
            v.verdict = QuestionVerdict::Correct;
            v.delta = scheme.correct;
            result.correct++;
        }
        else {
            v.verdict = QuestionVerdict::Incorrect;
            v.delta = scheme.incorrect;
            result.wrong++;
        }

        result.score += v.delta;
        result.details.push_back(v);
    }

    return result;
}

}
