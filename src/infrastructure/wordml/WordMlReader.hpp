/**
 * @file WordMlReader.hpp
 * @brief Loads a WordprocessingML document into the revision model.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/document/Document.hpp"
#include "infrastructure/wordml/WordMlPackage.hpp"

namespace redliner::infrastructure::wordml {

/**
 * @struct LoadedDocument
 * @brief The editable model plus the package it stays bound to.
 */
struct LoadedDocument {
    std::unique_ptr<WordMlPackage> package;
    std::unique_ptr<domain::Document> document;
};

/**
 * @class WordMlReader
 * @brief Builds blocks and runs from the body, table cells, headers and footers.
 *
 * Runs holding only text, tabs and line breaks become Text runs. Anything
 * else (fields, hyperlinks, drawings, existing comment markers) is kept as an
 * Opaque run carrying its source markup. Existing w:ins/w:del wrappers become
 * revision tags on their runs.
 */
class WordMlReader {
public:
    struct Options {
        bool cleanHighlighting = true; ///< Drop w:highlight and w:shd shading from run/paragraph formatting.
    };

    WordMlReader();
    explicit WordMlReader(Options options);

    /** @throws domain::SerializationError if the file is unreadable or not WordprocessingML. */
    LoadedDocument loadFile(const std::string& path) const;

    /** @throws domain::SerializationError on malformed input. */
    LoadedDocument loadString(const std::string& xml, const std::string& origin = "document") const;

private:
    struct Context;

    LoadedDocument load(XmlDocPtr xml) const;
    void readContainer(Context& ctx, xmlNodePtr container, domain::ContainerKind kind) const;
    void readParagraph(Context& ctx, xmlNodePtr paragraph, domain::ContainerKind kind) const;
    void readRun(Context& ctx, domain::BlockId block, xmlNodePtr run,
                 const std::optional<domain::RevisionTag>& tag) const;
    void appendOpaque(Context& ctx, domain::BlockId block, xmlNodePtr node,
                      const std::optional<domain::RevisionTag>& tag) const;

    static std::optional<domain::RevisionTag> TagFor(xmlNodePtr wrapper);
    static void StripHighlighting(xmlNodePtr node);
    static void NoteIdentifiers(WordMlPackage& package, xmlNodePtr node, bool commentsPart);

    Options m_options;
};

} // namespace redliner::infrastructure::wordml
