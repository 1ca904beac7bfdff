/**
 * @file WordMlWriter.hpp
 * @brief Writes the revision model back into its WordprocessingML package.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "domain/document/Document.hpp"
#include "infrastructure/wordml/WordMlPackage.hpp"

namespace redliner::infrastructure::wordml {

/**
 * @class WordMlWriter
 * @brief Regenerates edited paragraphs as w:ins/w:del markup with comment ranges.
 *
 * Paragraphs whose runs and revisions are unchanged since load are left
 * byte-identical. New comment threads go to the comments part, new pictures
 * to /word/media with an image relationship from the part that shows them.
 */
class WordMlWriter {
public:
    explicit WordMlWriter(WordMlPackage& package);

    /** @throws domain::SerializationError if the tree cannot take the generated markup. */
    void write(const domain::Document& document);

    /** @brief write() followed by serialization of the whole package. */
    std::string writeToString(const domain::Document& document);

private:
    bool isDirty(const domain::Document& document, const BoundBlock& binding) const;
    std::string paragraphMarkup(const domain::Document& document, const domain::Block& block);
    std::string runMarkup(const domain::Document& document, const domain::Block& block, const domain::Run& run);
    std::string drawingMarkup(const domain::Document& document, const domain::Block& block,
                              const domain::ImageRef& image);
    std::string imageRelationship(const domain::Document& document, const std::string& sourcePart,
                                  const std::string& resourceId);
    void writeComments(const domain::Document& document);
    void appendMarkup(xmlNodePtr parent, const std::string& markup);

    static void ClearParagraph(xmlNodePtr paragraph);

    static std::string RelativeTarget(const std::string& sourcePart, const std::string& targetPart);
    static std::string Initials(const std::string& author);

    WordMlPackage& m_package;
    std::map<int, std::vector<const domain::RevisionThread*>> m_threadsByBlock;
    std::map<std::string, std::string> m_mediaParts;                       ///< resource id -> part name
    std::map<std::pair<std::string, std::string>, std::string> m_imageRels; ///< (source part, resource) -> rId
    std::set<domain::RevisionId> m_emittedRevisions;
    domain::RevisionId m_nextFreshId = 1;
};

} // namespace redliner::infrastructure::wordml
