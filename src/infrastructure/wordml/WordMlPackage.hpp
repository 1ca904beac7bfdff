/**
 * @file WordMlPackage.hpp
 * @brief In-memory Flat OPC package (pkg:package) holding a WordprocessingML document.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/document/Run.hpp"
#include "infrastructure/wordml/XmlSupport.hpp"

namespace redliner::infrastructure::wordml {

/**
 * @struct PackagePart
 * @brief One pkg:part. `root` is the element under pkg:xmlData, null for binary parts.
 */
struct PackagePart {
    std::string name;
    std::string contentType;
    xmlNodePtr partNode = nullptr;
    xmlNodePtr root = nullptr;
};

/**
 * @struct BoundBlock
 * @brief Ties a model block to the w:p it was read from, with the run layout at load time.
 */
struct BoundBlock {
    domain::BlockId block = 0;
    xmlNodePtr paragraph = nullptr;
    std::vector<domain::RunId> loadedRuns;
    std::vector<std::optional<domain::RevisionId>> loadedRevisions;
};

/**
 * @class WordMlPackage
 * @brief Owns the package XML tree and the bookkeeping shared by reader and writer.
 *
 * Part pointers stay valid for the package's lifetime: parts are only added,
 * never removed.
 */
class WordMlPackage {
public:
    /** @throws domain::SerializationError if `doc` is not a pkg:package. */
    explicit WordMlPackage(XmlDocPtr doc);

    /** @brief Wraps a bare w:document into a new package with the minimal parts. */
    static std::unique_ptr<WordMlPackage> FromBareDocument(XmlDocPtr bare);

    xmlDocPtr xml() const { return m_doc.get(); }

    const std::vector<std::unique_ptr<PackagePart>>& parts() const { return m_parts; }
    PackagePart* findPart(const std::string& name) const;
    PackagePart* findPartByContentType(const std::string& contentType) const;

    /** @brief Main document part. @throws domain::SerializationError if absent. */
    PackagePart& mainPart() const;

    /** @brief Adds an XML part parsed from `xml`. */
    PackagePart& addXmlPart(const std::string& name, const std::string& contentType, const std::string& xml);

    /** @brief Adds a base64-encoded binary part. */
    PackagePart& addBinaryPart(const std::string& name, const std::string& contentType,
                               const std::vector<unsigned char>& bytes);

    /**
     * @brief Adds a relationship from `sourcePart`, creating its .rels part if needed.
     * @return The new relationship id ("rIdN").
     */
    std::string addRelationship(const std::string& sourcePart, const std::string& type, const std::string& target);

    /** @brief "/word/document.xml" -> "/word/_rels/document.xml.rels". */
    static std::string RelsPartName(const std::string& partName);

    /** @brief Part name unused so far, derived from `preferred` ("/word/media/image1.png"). */
    std::string uniquePartName(const std::string& preferred) const;

    // --- Block bindings ---
    void bind(BoundBlock binding) { m_bindings.push_back(std::move(binding)); }
    const std::vector<BoundBlock>& bindings() const { return m_bindings; }

    // --- Identifiers found at load time ---
    domain::RevisionId maxAnnotationId() const { return m_maxAnnotationId; }
    int maxCommentId() const { return m_maxCommentId; }
    void noteAnnotationId(long long id);
    void noteCommentId(long long id);

    /** @brief Next free wp:docPr id across all parts. */
    unsigned nextDrawingId();

    /** @brief Whole package as UTF-8 XML. */
    std::string serialize() const;

private:
    void indexParts();
    unsigned scanMaxDrawingId() const;

    XmlDocPtr m_doc;
    std::vector<std::unique_ptr<PackagePart>> m_parts;
    std::vector<BoundBlock> m_bindings;
    domain::RevisionId m_maxAnnotationId = 0;
    int m_maxCommentId = -1;
    std::optional<unsigned> m_nextDrawingId;
};

} // namespace redliner::infrastructure::wordml
