#ifndef OMR_ANSWER_KEY_HPP
#define OMR_ANSWER_KEY_HPP

#include <map>
#include <string>
#include <vector>

namespace omr {

class AnswerKey {
public:
    struct QuestionAnswer {
        std::string question;   // field or custom label
        std::string answer;     // e.g. "B", or "BC" for a multi-mark answer
    };

    // Points awarded per question verdict.
    struct MarkingScheme {
        double correct = 1.0;
        double incorrect = 0.0;
        double unmarked = 0.0;
    };

    AnswerKey();

    // Throws ConfigError.
    static AnswerKey fromFile(const std::string& path);
    static AnswerKey fromString(const std::string& json);

    void loadAnswerKey(const std::vector<QuestionAnswer>& answers);
    void setMarkingScheme(const MarkingScheme& scheme) { scheme_ = scheme; }

    // False for a question that is not keyed.
    bool isCorrect(const std::string& question, const std::string& answer) const;

    const MarkingScheme& markingScheme() const { return scheme_; }
    const std::map<std::string, std::string>& answers() const { return keyMap_; }
    int getQuestionCount() const { return static_cast<int>(keyMap_.size()); }

private:
    std::map<std::string, std::string> keyMap_;
    MarkingScheme scheme_;
};

}

#endif
