/**
 * @file OperationInterpreter.cpp
 * @brief Implementation of OperationInterpreter.
 */

#include "application/OperationInterpreter.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include "domain/Errors.hpp"

namespace redliner::application {

using namespace redliner::domain;
using matching::MatchSpan;
using matching::SearchCursor;

namespace {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    std::string Trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    bool IsBlank(const std::string& s) {
        return Trim(s).empty();
    }
}

OperationInterpreter::OperationInterpreter(std::unique_ptr<Document> document,
                                           std::shared_ptr<grammar::GrammarAdvisor> advisor,
                                           std::shared_ptr<ImageProbe> probe,
                                           Settings settings,
                                           revision::RevisionClock clock)
    : m_document(std::move(document)),
      m_advisor(std::move(advisor)),
      m_settings(std::move(settings)),
      m_matcher(m_settings.matchLimits),
      m_writer(clock),
      m_comments(clock),
      m_images(std::move(probe), m_writer, m_settings.defaultLogoHeightMm) {
    if (!m_document) {
        throw std::invalid_argument("OperationInterpreter requires a document.");
    }
}

std::unique_ptr<Document> OperationInterpreter::releaseDocument() {
    return std::move(m_document);
}

bool OperationInterpreter::IsPlaceholder(const std::string& target) {
    std::string t = Trim(target);
    if (t.size() < 3) return false;
    char open = t.front();
    char close = t.back();
    if (!((open == '<' && close == '>') || (open == '[' && close == ']') || (open == '{' && close == '}'))) {
        return false;
    }
    // One slot, not two adjacent ones.
    return t.find(close) == t.size() - 1;
}

void OperationInterpreter::validate(const Operation& operation) const {
    if (IsBlank(operation.target)) {
        throw InvalidOperationError("Operation has no target text.");
    }
    std::visit(Overloaded{
        [](const ReplaceAction& a) {
            if (a.replacement.empty()) {
                throw InvalidOperationError("Replace operation has an empty replacement.");
            }
        },
        [](const DeleteAction&) {},
        [&](const CommentAction&) {
            if (IsBlank(operation.comment)) {
                throw InvalidOperationError("Comment operation has no comment body.");
            }
        },
        [](const ReplaceWithImageAction&) {}
    }, operation.action);
}

ExecutionReport OperationInterpreter::run(const std::vector<OperationEntry>& entries,
                                          std::function<void(std::string)> statusCallback) {
    ExecutionReport report;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (statusCallback) {
            statusCallback("Operation " + std::to_string(i + 1) + "/" + std::to_string(entries.size()) +
                           ": " + entry.action + " '" + entry.target + "'");
        }

        if (!entry.operation) {
            OperationOutcome outcome;
            outcome.index = i;
            outcome.target = entry.target;
            outcome.action = entry.action;
            outcome.status = OperationStatus::Failed;
            outcome.reason = FailureReason::InvalidOperation;
            outcome.message = entry.error;
            std::cerr << "[OperationInterpreter] #" << i << " invalid record: " << entry.error << std::endl;
            report.outcomes.push_back(std::move(outcome));
            continue;
        }
        report.outcomes.push_back(apply(i, *entry.operation));
    }

    std::cout << "[OperationInterpreter] " << report.count(OperationStatus::Applied) << " applied, "
              << report.count(OperationStatus::Skipped) << " skipped, "
              << report.count(OperationStatus::Failed) << " failed." << std::endl;
    return report;
}

OperationOutcome OperationInterpreter::apply(size_t index, const Operation& operation) {
    if (!m_document) {
        throw std::logic_error("Document was already released.");
    }

    OperationOutcome outcome;
    outcome.index = index;
    outcome.target = operation.target;
    outcome.action = ActionToString(operation.action);

    // Whole-document edits touch several places; keep a copy to roll back to.
    std::optional<Document> backup;
    if (operation.wholeDocument) backup = *m_document;

    auto fail = [&](FailureReason reason, const std::string& message) {
        if (backup) *m_document = std::move(*backup);
        outcome.status = OperationStatus::Failed;
        outcome.reason = reason;
        outcome.message = message;
        outcome.occurrences = 0;
        outcome.widened = false;
        outcome.revisions.clear();
        outcome.commentIds.clear();
        std::cerr << "[OperationInterpreter] #" << index << " " << outcome.action << " '" << operation.target
                  << "' failed: " << message << std::endl;
    };

    try {
        validate(operation);
        matching::CompiledQuery query = m_matcher.compile(operation.target, operation.match);

        std::optional<PreparedImage> image;
        if (const auto* logo = std::get_if<ReplaceWithImageAction>(&operation.action)) {
            image = m_images.prepare(*logo);
        }

        SearchCursor cursor;
        while (auto span = m_matcher.find(*m_document, query, cursor)) {
            cursor = applyAt(operation, *span, image ? &*image : nullptr, outcome);
            if (!operation.wholeDocument) break;
        }
    } catch (const PatternRejectedError& e) {
        fail(FailureReason::PatternRejected, e.what());
        return outcome;
    } catch (const InvalidOperationError& e) {
        fail(FailureReason::InvalidOperation, e.what());
        return outcome;
    } catch (const ImageDecodeError& e) {
        fail(FailureReason::ImageDecodeFailed, e.what());
        return outcome;
    } catch (const std::invalid_argument& e) {
        fail(FailureReason::InvalidOperation, e.what());
        return outcome;
    } catch (const std::exception& e) {
        fail(FailureReason::InternalError, e.what());
        return outcome;
    }

    if (outcome.occurrences > 0) {
        outcome.status = OperationStatus::Applied;
        outcome.reason = FailureReason::None;
        return outcome;
    }

    outcome.reason = FailureReason::TargetNotFound;
    bool expected = operation.skipIfAbsent || std::holds_alternative<CommentAction>(operation.action);
    if (expected) {
        outcome.status = OperationStatus::Skipped;
        if (outcome.message.empty()) outcome.message = "Target not found; nothing to do.";
        std::cout << "[OperationInterpreter] #" << index << " skipped: '" << operation.target
                  << "' not present." << std::endl;
    } else {
        outcome.status = OperationStatus::Failed;
        outcome.message = "Target not found in document.";
        std::cerr << "[OperationInterpreter] #" << index << " " << outcome.action << " target not found: '"
                  << operation.target << "'" << std::endl;
    }
    return outcome;
}

SearchCursor OperationInterpreter::applyAt(const Operation& operation,
                                           const MatchSpan& span,
                                           const PreparedImage* image,
                                           OperationOutcome& outcome) {
    return std::visit(Overloaded{
        [&](const ReplaceAction& a) -> SearchCursor {
            MatchSpan target = span;
            std::string replacement = a.replacement;
            if (widenIfNeeded(operation, target, replacement)) outcome.widened = true;

            auto result = m_writer.applyReplace(*m_document, target, replacement, m_settings.revisionAuthor);
            annotate(operation, result, outcome);
            ++outcome.occurrences;
            return SearchCursor{target.block, target.textStart + replacement.size()};
        },
        [&](const DeleteAction&) -> SearchCursor {
            auto result = m_writer.applyDelete(*m_document, span, m_settings.revisionAuthor);
            annotate(operation, result, outcome);
            ++outcome.occurrences;
            return SearchCursor{span.block, span.textStart};
        },
        [&](const CommentAction&) -> SearchCursor {
            if (!m_document->block(span.block).supportsComments()) {
                outcome.message = "Matches in headers or footers cannot carry comments.";
                std::cerr << "[OperationInterpreter] #" << outcome.index << " comment skipped in "
                          << ContainerKindToString(m_document->block(span.block).container) << std::endl;
                return SearchCursor{span.block, span.textEnd};
            }
            auto [first, last] = m_writer.isolate(*m_document, span);
            const Block& block = m_document->block(span.block);
            auto thread = m_comments.attachToRuns(*m_document, span.block, block.runs[first], block.runs[last],
                                                  operation.comment, operation.commentAuthor);
            if (thread) outcome.commentIds.push_back(thread->commentId);
            ++outcome.occurrences;
            return SearchCursor{span.block, span.textEnd};
        },
        [&](const ReplaceWithImageAction&) -> SearchCursor {
            if (!image) {
                throw std::logic_error("Image operation reached the writer without a prepared image.");
            }
            auto result = m_images.substitute(*m_document, span, *image, m_settings.revisionAuthor);
            annotate(operation, result, outcome);
            ++outcome.occurrences;
            return SearchCursor{span.block, span.textStart};
        }
    }, operation.action);
}

bool OperationInterpreter::widenIfNeeded(const Operation& operation,
                                         MatchSpan& span,
                                         std::string& replacement) {
    if (!m_advisor || operation.match.isPattern) return false;
    if (!operation.alwaysConsultGrammar && !IsPlaceholder(operation.target)) return false;

    std::string text = m_document->blockText(span.block, TextView::Current);
    auto bounds = matching::Matcher::SentenceBounds(text, span.textStart, span.textEnd);

    grammar::GrammarRequest request;
    request.target = text.substr(span.textStart, span.textEnd - span.textStart);
    request.sentence = text.substr(bounds.first, bounds.second - bounds.first);
    request.replacement = replacement;

    auto verdict = m_advisor->classify(request);
    const auto* rewrite = std::get_if<grammar::NeedsSentenceRewrite>(&verdict);
    if (!rewrite) return false;

    if (IsBlank(rewrite->rewrittenSentence)) {
        std::cerr << "[OperationInterpreter] Advisor returned an empty rewrite for '" << operation.target
                  << "'; keeping the narrow replacement." << std::endl;
        return false;
    }

    // Widen once: the sentence span is resolved again against the current runs.
    auto wide = m_matcher.spanForRange(*m_document, span.block, bounds.first, bounds.second);
    if (!wide) return false;

    span = *wide;
    replacement = rewrite->rewrittenSentence;
    std::cout << "[OperationInterpreter] Widened '" << operation.target << "' to its sentence." << std::endl;
    return true;
}

void OperationInterpreter::annotate(const Operation& operation,
                                    const revision::RevisionResult& result,
                                    OperationOutcome& outcome) {
    if (result.deletion) outcome.revisions.push_back(result.deletion->id);
    if (result.insertion) outcome.revisions.push_back(result.insertion->id);

    if (IsBlank(operation.comment)) return;
    auto anchor = revision::CommentAttacher::AnchorFor(result);
    if (!anchor) {
        std::cerr << "[OperationInterpreter] #" << outcome.index
                  << " removed only earlier insertions; no revision left to comment on." << std::endl;
        return;
    }
    auto thread = m_comments.attach(*m_document, *anchor, operation.comment, operation.commentAuthor);
    if (thread) outcome.commentIds.push_back(thread->commentId);
}

} // namespace redliner::application
