/**
 * @file Matcher.cpp
 * @brief Implementation of Matcher.
 */

#include "domain/matching/Matcher.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <iostream>
#include <vector>
#include "domain/Errors.hpp"

namespace redliner::domain::matching {

namespace {
    struct Segment {
        size_t position;  ///< Index into Block::runs.
        size_t textStart;
        size_t length;
    };

    struct FlatBlock {
        std::string text;
        std::vector<Segment> segments;
        std::vector<size_t> breaks; ///< Text offsets where visible opaque content sits.
    };

    FlatBlock Flatten(const Document& document, const Block& block) {
        FlatBlock flat;
        for (size_t i = 0; i < block.runs.size(); ++i) {
            const Run& r = document.run(block.runs[i]);
            if (r.breaksText()) {
                if (flat.breaks.empty() || flat.breaks.back() != flat.text.size()) {
                    flat.breaks.push_back(flat.text.size());
                }
                continue;
            }
            if (!r.isLiveText() || r.text.empty()) continue;
            flat.segments.push_back({i, flat.text.size(), r.text.size()});
            flat.text += r.text;
        }
        return flat;
    }

    bool IsWordByte(unsigned char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
    }

    bool CrossesBreak(const FlatBlock& flat, size_t start, size_t end) {
        return std::any_of(flat.breaks.begin(), flat.breaks.end(),
                           [&](size_t at) { return at > start && at < end; });
    }

    // Boundaries only matter where the match itself starts or ends on a word character.
    bool IsWholeWord(const std::string& text, size_t start, size_t end) {
        if (start > 0 && IsWordByte(text[start]) && IsWordByte(text[start - 1])) return false;
        if (end < text.size() && IsWordByte(text[end - 1]) && IsWordByte(text[end])) return false;
        return true;
    }

    size_t NextCharBoundary(const std::string& text, size_t i) {
        ++i;
        while (i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) ++i;
        return i;
    }

    std::optional<MatchSpan> MapRange(const FlatBlock& flat, BlockId block, size_t start, size_t end) {
        if (start >= end || end > flat.text.size()) return std::nullopt;

        const Segment* first = nullptr;
        const Segment* last = nullptr;
        for (const auto& seg : flat.segments) {
            if (!first && start >= seg.textStart && start < seg.textStart + seg.length) first = &seg;
            if (!last && end > seg.textStart && end <= seg.textStart + seg.length) last = &seg;
        }
        if (!first || !last) return std::nullopt;

        MatchSpan span;
        span.block = block;
        span.startRun = first->position;
        span.startOffset = start - first->textStart;
        span.endRun = last->position;
        span.endOffset = end - last->textStart;
        span.textStart = start;
        span.textEnd = end;
        return span;
    }

    // Rejects a group that repeats without bound while containing an unbounded
    // repetition itself, e.g. (a+)+ or (a*b?)*.
    void CheckNestedRepetition(const std::string& pattern) {
        std::vector<bool> groupHasUnbounded{false};
        bool previousWasUnboundedGroup = false;

        auto markUnbounded = [&](size_t at) {
            if (previousWasUnboundedGroup) {
                throw PatternRejectedError("Nested unbounded repetition at offset " + std::to_string(at) + " in: " + pattern);
            }
            groupHasUnbounded.back() = true;
            previousWasUnboundedGroup = false;
        };

        for (size_t i = 0; i < pattern.size(); ++i) {
            char c = pattern[i];
            if (c == '\\') {
                ++i;
                previousWasUnboundedGroup = false;
            } else if (c == '[') {
                size_t j = i + 1;
                if (j < pattern.size() && pattern[j] == '^') ++j;
                if (j < pattern.size() && pattern[j] == ']') ++j;
                while (j < pattern.size() && pattern[j] != ']') {
                    if (pattern[j] == '\\') ++j;
                    ++j;
                }
                i = j;
                previousWasUnboundedGroup = false;
            } else if (c == '(') {
                groupHasUnbounded.push_back(false);
                previousWasUnboundedGroup = false;
            } else if (c == ')') {
                if (groupHasUnbounded.size() < 2) {
                    throw PatternRejectedError("Unbalanced ')' in: " + pattern);
                }
                bool inner = groupHasUnbounded.back();
                groupHasUnbounded.pop_back();
                if (inner) groupHasUnbounded.back() = true;
                previousWasUnboundedGroup = inner;
            } else if (c == '*' || c == '+') {
                markUnbounded(i);
            } else if (c == '{') {
                size_t close = pattern.find('}', i);
                if (close == std::string::npos) {
                    previousWasUnboundedGroup = false;
                    continue;
                }
                std::string body = pattern.substr(i + 1, close - i - 1);
                size_t comma = body.find(',');
                if (comma != std::string::npos && comma + 1 == body.size()) {
                    markUnbounded(i);
                } else {
                    previousWasUnboundedGroup = false;
                }
                i = close;
            } else if (c == '?') {
                // Lazy modifier or optional: neither adds repetition.
            } else {
                previousWasUnboundedGroup = false;
            }
        }
    }
}

CompiledQuery Matcher::compile(const std::string& target, const MatchOptions& options) const {
    if (target.empty()) {
        throw std::invalid_argument("Match target must not be empty.");
    }

    re2::RE2::Options reOptions;
    reOptions.set_log_errors(false);
    reOptions.set_case_sensitive(options.caseSensitive);
    reOptions.set_never_capture(true);
    reOptions.set_max_mem(m_limits.maxMemory);

    if (options.isPattern) {
        if (target.size() > m_limits.maxPatternLength) {
            throw PatternRejectedError("Pattern exceeds " + std::to_string(m_limits.maxPatternLength) + " bytes.");
        }
        CheckNestedRepetition(target);
    } else {
        reOptions.set_literal(true);
    }

    auto regex = std::make_shared<re2::RE2>(target, reOptions);
    if (!regex->ok()) {
        throw PatternRejectedError("Pattern rejected (" + regex->error() + "): " + target);
    }

    CompiledQuery query;
    query.m_target = target;
    query.m_options = options;
    query.m_regex = std::move(regex);
    return query;
}

std::optional<MatchSpan> Matcher::find(const Document& document,
                                       const CompiledQuery& query,
                                       SearchCursor from) const {
    if (!query.m_regex) {
        throw std::invalid_argument("Query was not compiled.");
    }

    const auto& blocks = document.blocks();
    for (size_t bi = from.blockIndex; bi < blocks.size(); ++bi) {
        FlatBlock flat = Flatten(document, blocks[bi]);
        const std::string& text = flat.text;
        re2::StringPiece input(text);

        size_t pos = (bi == from.blockIndex) ? from.textOffset : 0;
        while (pos < text.size()) {
            re2::StringPiece hit;
            if (!query.m_regex->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &hit, 1)) break;

            size_t start = static_cast<size_t>(hit.data() - text.data());
            size_t end = start + hit.size();
            if (end == start || (query.m_options.wholeWord && !IsWholeWord(text, start, end)) ||
                CrossesBreak(flat, start, end)) {
                pos = NextCharBoundary(text, start);
                continue;
            }

            auto span = MapRange(flat, blocks[bi].id, start, end);
            if (span) return span;
            pos = NextCharBoundary(text, start);
        }
    }
    return std::nullopt;
}

std::optional<MatchSpan> Matcher::spanForRange(const Document& document,
                                               BlockId block,
                                               size_t textStart,
                                               size_t textEnd) const {
    FlatBlock flat = Flatten(document, document.block(block));
    if (CrossesBreak(flat, textStart, textEnd)) {
        std::cerr << "[Matcher] Range " << textStart << ".." << textEnd
                  << " spans content that cannot be edited in block " << block << std::endl;
        return std::nullopt;
    }
    auto span = MapRange(flat, block, textStart, textEnd);
    if (!span) {
        std::cerr << "[Matcher] Range " << textStart << ".." << textEnd
                  << " does not fit block " << block << std::endl;
    }
    return span;
}

std::pair<size_t, size_t> Matcher::SentenceBounds(const std::string& text, size_t start, size_t end) {
    auto isTerminator = [](char c) { return c == '.' || c == '!' || c == '?'; };
    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };

    size_t sentenceStart = 0;
    for (size_t i = std::min(start, text.size()); i > 1; --i) {
        if (isSpace(text[i - 1]) && isTerminator(text[i - 2])) {
            sentenceStart = i;
            break;
        }
    }
    while (sentenceStart < start && isSpace(text[sentenceStart])) ++sentenceStart;

    size_t sentenceEnd = text.size();
    for (size_t i = end; i < text.size(); ++i) {
        if (isTerminator(text[i]) && (i + 1 == text.size() || isSpace(text[i + 1]))) {
            sentenceEnd = i + 1;
            break;
        }
    }
    return {sentenceStart, sentenceEnd};
}

} // namespace redliner::domain::matching
