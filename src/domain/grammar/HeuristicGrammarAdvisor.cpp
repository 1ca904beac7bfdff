/**
 * @file HeuristicGrammarAdvisor.cpp
 * @brief Implementation of HeuristicGrammarAdvisor.
 */

#include "domain/grammar/HeuristicGrammarAdvisor.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace redliner::domain::grammar {

namespace {
    const std::vector<std::string> kImmediacyWords = {
        "immediately", "instantly", "right away", "asap", "at once",
        "without delay", "forthwith", "straight away"
    };

    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string Trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string TrailingTerminator(const std::string& sentence) {
        std::string trimmed = Trim(sentence);
        if (!trimmed.empty()) {
            char c = trimmed.back();
            if (c == '.' || c == '!' || c == '?') return std::string(1, c);
        }
        return "";
    }

    bool StartsWithVowel(const std::string& s) {
        if (s.empty()) return false;
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(s[0])));
        return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
    }
}

bool HeuristicGrammarAdvisor::IsImmediacy(const std::string& response) {
    std::string lower = ToLower(response);
    for (const auto& word : kImmediacyWords) {
        if (lower.find(word) != std::string::npos) return true;
    }
    return false;
}

GrammarVerdict HeuristicGrammarAdvisor::classify(const GrammarRequest& request) {
    std::string response = Trim(request.replacement);
    if (request.target.empty() || response.empty()) return NarrowOk{};

    std::string lowerSentence = ToLower(request.sentence);
    size_t pos = lowerSentence.find(ToLower(request.target));
    if (pos == std::string::npos) return NarrowOk{};

    if (IsImmediacy(response)) {
        // Only a duration clause that leads straight into the placeholder is dropped.
        size_t end = pos;
        while (end > 0 && std::isspace(static_cast<unsigned char>(lowerSentence[end - 1]))) --end;
        for (const std::string word : {"within", "in"}) {
            if (end == pos || end < word.size() + 1) continue;
            size_t at = end - word.size() - 1;
            if (lowerSentence.compare(at + 1, word.size(), word) != 0) continue;
            if (!std::isspace(static_cast<unsigned char>(lowerSentence[at]))) continue;

            std::string base = Trim(request.sentence.substr(0, at));
            if (base.empty()) continue;
            return NeedsSentenceRewrite{base + " " + ToLower(response) + TrailingTerminator(request.sentence)};
        }
    }

    if (StartsWithVowel(response) && pos >= 2) {
        std::string before = request.sentence.substr(0, pos);
        bool articleAtStart = before.size() == 2;
        bool articleMidSentence = before.size() > 2 && before[before.size() - 3] == ' ';
        char article = before[before.size() - 2];
        if (before.back() == ' ' && (article == 'a' || article == 'A') && (articleAtStart || articleMidSentence)) {
            std::string rewritten = before.substr(0, before.size() - 2);
            rewritten += (article == 'A') ? "An " : "an ";
            rewritten += response;
            rewritten += request.sentence.substr(pos + request.target.size());
            return NeedsSentenceRewrite{rewritten};
        }
    }

    return NarrowOk{};
}

} // namespace redliner::domain::grammar
