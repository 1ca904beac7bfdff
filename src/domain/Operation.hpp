/**
 * @file Operation.hpp
 * @brief Immutable edit instructions applied by the interpreter.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace redliner::domain {

/**
 * @struct MatchOptions
 * @brief How a target string is located. Defaults follow the operation list
 * convention: case-insensitive, whole-word, literal.
 */
struct MatchOptions {
    bool caseSensitive = false;
    bool wholeWord = true;
    bool isPattern = false;
};

/**
 * @struct SizeConstraint
 * @brief Requested picture extent in millimetres. Zero means "derive from aspect ratio".
 */
struct SizeConstraint {
    double widthMm = 0.0;
    double heightMm = 0.0;
};

struct ReplaceAction {
    std::string replacement;
};

struct DeleteAction {};

struct CommentAction {};

struct ReplaceWithImageAction {
    std::vector<unsigned char> imageBytes;
    std::string imageName; ///< Shown as the picture's name in the drawing properties.
    SizeConstraint size;
};

using Action = std::variant<ReplaceAction, DeleteAction, CommentAction, ReplaceWithImageAction>;

inline const char* ActionName(const ReplaceAction&) { return "replace"; }
inline const char* ActionName(const DeleteAction&) { return "delete"; }
inline const char* ActionName(const CommentAction&) { return "comment"; }
inline const char* ActionName(const ReplaceWithImageAction&) { return "replace_with_logo"; }

/// Every Action alternative needs an ActionName overload.
inline std::string ActionToString(const Action& action) {
    return std::visit([](const auto& a) { return std::string(ActionName(a)); }, action);
}

/**
 * @struct Operation
 * @brief One edit instruction.
 *
 * `comment`/`commentAuthor` annotate the change for the reviewer. For a
 * CommentAction the comment is the whole point of the operation.
 */
struct Operation {
    std::string target;
    Action action = CommentAction{};
    MatchOptions match;
    std::string comment;
    std::string commentAuthor = "policy assistant";
    bool wholeDocument = false;   ///< Apply to every occurrence, not only the first.
    bool skipIfAbsent = false;    ///< A missing target is an expected no-op.
    bool alwaysConsultGrammar = false; ///< Ask the grammar advisor even for non-placeholder targets.
};

/**
 * @struct OperationEntry
 * @brief One record of an operation list as read from disk.
 *
 * `operation` is empty when the record could not be turned into an Operation;
 * `error` then says why. `target` and `action` echo the record for reporting.
 */
struct OperationEntry {
    std::optional<Operation> operation;
    std::string target;
    std::string action;
    std::string error;
};

} // namespace redliner::domain
