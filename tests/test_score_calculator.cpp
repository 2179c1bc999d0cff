#include <gtest/gtest.h>

#include "omr/ScoreCalculator.hpp"

using namespace omr;

namespace {

AnswerKey makeKey() {
    AnswerKey key;
    key.loadAnswerKey({{"q1", "A"}, {"q2", "C"}, {"q3", "BD"}, {"q4", "B"}});
    return key;
}

}

TEST(ScoreCalculator, CountsVerdicts) {
    AnswerKey key = makeKey();
    ScoreCalculator calc(key, "-");

    ScoreResult r = calc.calculateScore({{"q1", "A"}, {"q2", "B"}, {"q3", "BD"}, {"q4", "-"}});
    EXPECT_EQ(r.correct, 2);
    EXPECT_EQ(r.wrong, 1);
    EXPECT_EQ(r.empty, 1);
    EXPECT_DOUBLE_EQ(r.score, 2.0);

    ASSERT_EQ(r.details.size(), 4u);
    EXPECT_EQ(r.details[1].question, "q2");
    EXPECT_EQ(r.details[1].verdict, QuestionVerdict::Incorrect);
    EXPECT_EQ(r.details[1].marked, "B");
    EXPECT_EQ(r.details[1].expected, "C");
}

TEST(ScoreCalculator, AppliesMarkingScheme) {
    AnswerKey key = makeKey();
    AnswerKey::MarkingScheme scheme;
    scheme.correct = 4;
    scheme.incorrect = -1;
    scheme.unmarked = 0;
    key.setMarkingScheme(scheme);
    ScoreCalculator calc(key);

    ScoreResult r = calc.calculateScore({{"q1", "A"}, {"q2", "A"}, {"q3", "B"}, {"q4", ""}});
    EXPECT_EQ(r.correct, 1);
    EXPECT_EQ(r.wrong, 2);
    EXPECT_EQ(r.empty, 1);
    EXPECT_DOUBLE_EQ(r.score, 2.0);
}

TEST(ScoreCalculator, MissingQuestionIsUnmarked) {
    AnswerKey key = makeKey();
    ScoreCalculator calc(key);

    ScoreResult r = calc.calculateScore({{"q1", "A"}, {"extra", "Z"}});
    EXPECT_EQ(r.correct, 1);
    EXPECT_EQ(r.empty, 3);
    EXPECT_EQ(r.details.size(), 4u);
}
