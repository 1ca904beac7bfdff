/**
 * @file Run.hpp
 * @brief Value objects for the smallest formatted unit of text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace redliner::domain {

using RunId = std::uint32_t;
using BlockId = std::uint32_t;
using RevisionId = int;

enum class RevisionKind {
    Inserted,
    Deleted
};

inline std::string RevisionKindToString(RevisionKind kind) {
    switch (kind) {
        case RevisionKind::Inserted: return "inserted";
        case RevisionKind::Deleted: return "deleted";
        default: return "unknown";
    }
}

/**
 * @struct RevisionTag
 * @brief Marks a run as a tracked insertion or deletion.
 */
struct RevisionTag {
    RevisionKind kind = RevisionKind::Inserted;
    std::string author;
    std::string timestamp; ///< ISO 8601, UTC.
    RevisionId id = 0;
};

/**
 * @struct ImageRef
 * @brief Inline picture carried by an image run. Extent is in EMU (1 mm = 36000).
 */
struct ImageRef {
    std::string resourceId;
    std::int64_t widthEmu = 0;
    std::int64_t heightEmu = 0;
    std::string name;
};

enum class RunContent {
    Text,   ///< Plain text, tabs and line breaks. Matchable.
    Image,  ///< Inline picture inserted by the engine.
    Opaque  ///< Anything the engine does not edit (fields, hyperlinks, bookmarks...).
};

/**
 * @struct Run
 * @brief A span of content sharing one formatting descriptor.
 *
 * `formatting` is passed through untouched. For opaque runs it holds the
 * complete source markup of the element.
 */
struct Run {
    RunId id = 0;
    RunContent content = RunContent::Text;
    std::string text;
    std::string formatting;
    std::optional<RevisionTag> revision;
    std::optional<ImageRef> image;
    bool visible = false; ///< Opaque content that renders something (hyperlink text, field results, drawings).

    bool isDeleted() const {
        return revision && revision->kind == RevisionKind::Deleted;
    }

    bool isInserted() const {
        return revision && revision->kind == RevisionKind::Inserted;
    }

    /// Text that later operations are allowed to match.
    bool isLiveText() const {
        return content == RunContent::Text && !isDeleted();
    }

    /// Live content the matcher cannot see through; no match may span it.
    bool breaksText() const {
        if (isDeleted()) return false;
        return content == RunContent::Image || (content == RunContent::Opaque && visible);
    }
};

} // namespace redliner::domain
