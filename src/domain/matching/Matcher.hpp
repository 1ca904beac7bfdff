/**
 * @file Matcher.hpp
 * @brief Locates target text in the live view of a document.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "domain/Operation.hpp"
#include "domain/document/Document.hpp"

namespace re2 {
class RE2;
}

namespace redliner::domain::matching {

/**
 * @struct MatchSpan
 * @brief A resolved location inside one block.
 *
 * Run positions index `Block::runs`. `endOffset` is exclusive and may equal the
 * length of the end run. `textStart`/`textEnd` are byte offsets in the block's
 * current text.
 */
struct MatchSpan {
    BlockId block = 0;
    size_t startRun = 0;
    size_t startOffset = 0;
    size_t endRun = 0;
    size_t endOffset = 0;
    size_t textStart = 0;
    size_t textEnd = 0;
};

/** @brief Where a search resumes: block position and byte offset in its current text. */
struct SearchCursor {
    size_t blockIndex = 0;
    size_t textOffset = 0;
};

/**
 * @class CompiledQuery
 * @brief A validated target, ready to be searched repeatedly.
 */
class CompiledQuery {
public:
    const std::string& target() const { return m_target; }
    const MatchOptions& options() const { return m_options; }

private:
    friend class Matcher;
    std::string m_target;
    MatchOptions m_options;
    std::shared_ptr<const re2::RE2> m_regex;
};

/**
 * @class Matcher
 * @brief Literal and bounded-pattern search over block text.
 *
 * Only live text is searched: text runs that are not tracked deletions. Matching
 * runs on RE2, so a search is linear in the block length whatever the pattern.
 */
class Matcher {
public:
    struct Limits {
        size_t maxPatternLength = 512;
        std::int64_t maxMemory = 1 << 20; ///< Bytes RE2 may use for one compiled pattern.
    };

    Matcher() = default;
    explicit Matcher(Limits limits) : m_limits(limits) {}

    /**
     * @brief Validates and compiles a target.
     * @throws std::invalid_argument if the target is empty.
     * @throws PatternRejectedError if a pattern is malformed, too large or admits
     * nested unbounded repetition.
     */
    CompiledQuery compile(const std::string& target, const MatchOptions& options) const;

    /** @brief First occurrence at or after `from`, in document order. */
    std::optional<MatchSpan> find(const Document& document,
                                  const CompiledQuery& query,
                                  SearchCursor from = {}) const;

    /** @brief Maps a byte range of a block's current text back to run positions. */
    std::optional<MatchSpan> spanForRange(const Document& document,
                                          BlockId block,
                                          size_t textStart,
                                          size_t textEnd) const;

    /**
     * @brief Bounds of the sentence holding [start, end) in `text`.
     *
     * A sentence ends at '.', '!' or '?' followed by whitespace or end of text.
     * The returned range includes the terminator and excludes leading whitespace.
     */
    static std::pair<size_t, size_t> SentenceBounds(const std::string& text, size_t start, size_t end);

private:
    Limits m_limits;
};

} // namespace redliner::domain::matching
