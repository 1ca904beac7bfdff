/**
 * @file RevisionWriter.cpp
 * @brief Implementation of RevisionWriter.
 */

#include "domain/revision/RevisionWriter.hpp"
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace redliner::domain::revision {

namespace {
    std::tm ToUtcTime(std::time_t tt) {
        std::tm tm = {};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        return tm;
    }

    bool OnCharBoundary(const std::string& text, size_t offset) {
        return offset >= text.size() || (static_cast<unsigned char>(text[offset]) & 0xC0) != 0x80;
    }

    size_t PositionOf(const Block& block, RunId id) {
        for (size_t i = 0; i < block.runs.size(); ++i) {
            if (block.runs[i] == id) return i;
        }
        throw std::logic_error("Run " + std::to_string(id) + " is not in block " + std::to_string(block.id));
    }
}

RevisionWriter::RevisionWriter(RevisionClock clock)
    : m_clock(clock ? std::move(clock) : RevisionClock(&RevisionWriter::UtcNow)) {}

std::string RevisionWriter::UtcNow() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToUtcTime(tt);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

void RevisionWriter::validate(const Document& document, const matching::MatchSpan& span) const {
    if (span.block >= document.blocks().size()) {
        throw std::invalid_argument("Span refers to unknown block " + std::to_string(span.block));
    }
    const Block& block = document.block(span.block);
    if (span.startRun > span.endRun || span.endRun >= block.runs.size()) {
        throw std::invalid_argument("Span run positions are out of order or out of range.");
    }

    const Run& first = document.run(block.runs[span.startRun]);
    const Run& last = document.run(block.runs[span.endRun]);
    if (!first.isLiveText() || !last.isLiveText()) {
        throw std::invalid_argument("Span must start and end on live text.");
    }
    if (span.startOffset >= first.text.size() || span.endOffset == 0 || span.endOffset > last.text.size()) {
        throw std::invalid_argument("Span offsets fall outside their runs.");
    }
    if (span.startRun == span.endRun && span.startOffset >= span.endOffset) {
        throw std::invalid_argument("Span is empty.");
    }
    if (!OnCharBoundary(first.text, span.startOffset) || !OnCharBoundary(last.text, span.endOffset)) {
        throw std::invalid_argument("Span offsets split a UTF-8 sequence.");
    }
}

std::pair<size_t, size_t> RevisionWriter::isolate(Document& document, const matching::MatchSpan& span) {
    validate(document, span);

    size_t first = span.startRun;
    size_t last = span.endRun;

    // Split the end first so the start position stays valid.
    const Run& endRun = document.run(document.block(span.block).runs[span.endRun]);
    if (span.endOffset < endRun.text.size()) {
        document.splitRun(span.block, span.endRun, span.endOffset);
    }
    if (span.startOffset > 0) {
        document.splitRun(span.block, span.startRun, span.startOffset);
        ++first;
        ++last;
    }
    return {first, last};
}

RevisionResult RevisionWriter::retractAndInsert(Document& document,
                                                const matching::MatchSpan& span,
                                                std::optional<Run> insertion,
                                                const std::string& author) {
    auto [first, last] = isolate(document, span);

    const Block& block = document.block(span.block);
    std::vector<RunId> covered(block.runs.begin() + static_cast<std::ptrdiff_t>(first),
                               block.runs.begin() + static_cast<std::ptrdiff_t>(last) + 1);
    RunId lastCovered = covered.back();
    std::string formatting = document.run(covered.front()).formatting;

    std::vector<RunId> toDelete;
    std::vector<RunId> toRetract;
    for (RunId id : covered) {
        const Run& r = document.run(id);
        if (!r.isLiveText()) continue;
        if (r.isInserted()) {
            toRetract.push_back(id);
        } else {
            toDelete.push_back(id);
        }
    }

    RevisionResult result;
    std::string now = m_clock();

    if (!toDelete.empty()) {
        RevisionTag tag{RevisionKind::Deleted, author, now, document.nextRevisionId()};
        for (RunId id : toDelete) {
            document.run(id).revision = tag;
        }
        result.deletion = tag;
        result.deletedRuns = toDelete;
    }

    if (insertion) {
        RevisionTag tag{RevisionKind::Inserted, author, now, document.nextRevisionId()};
        insertion->revision = tag;
        insertion->formatting = formatting;
        RunId id = document.insertRunAfter(span.block, PositionOf(document.block(span.block), lastCovered), *insertion);
        result.insertion = tag;
        result.insertedRuns.push_back(id);
    }

    // Retracting last keeps every position above stable until the removals.
    for (auto it = toRetract.rbegin(); it != toRetract.rend(); ++it) {
        const Block& current = document.block(span.block);
        if (current.runs.size() == 1) {
            Run& only = document.run(*it);
            only.text.clear();
            only.revision.reset();
        } else {
            document.removeRunAt(span.block, PositionOf(current, *it));
        }
        result.retractedRuns.push_back(*it);
    }
    return result;
}

RevisionResult RevisionWriter::applyReplace(Document& document,
                                            const matching::MatchSpan& span,
                                            const std::string& replacement,
                                            const std::string& author) {
    if (replacement.empty()) {
        throw std::invalid_argument("Replacement text must not be empty.");
    }
    validate(document, span);

    Run inserted;
    inserted.content = RunContent::Text;
    inserted.text = replacement;
    return retractAndInsert(document, span, inserted, author);
}

RevisionResult RevisionWriter::applyDelete(Document& document,
                                           const matching::MatchSpan& span,
                                           const std::string& author) {
    return retractAndInsert(document, span, std::nullopt, author);
}

RevisionResult RevisionWriter::applyImageReplace(Document& document,
                                                 const matching::MatchSpan& span,
                                                 const ImageRef& image,
                                                 const std::string& author) {
    if (image.resourceId.empty() || !document.findImage(image.resourceId)) {
        throw std::invalid_argument("Image run refers to an unknown resource: " + image.resourceId);
    }
    validate(document, span);

    Run inserted;
    inserted.content = RunContent::Image;
    inserted.image = image;
    return retractAndInsert(document, span, inserted, author);
}

} // namespace redliner::domain::revision
