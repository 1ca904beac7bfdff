/**
 * @file XmlSupport.hpp
 * @brief Thin helpers over the libxml2 tree API.
 */

#pragma once

#include <libxml/tree.h>
#include <memory>
#include <optional>
#include <string>

namespace redliner::infrastructure::wordml {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const {
        if (doc) xmlFreeDoc(doc);
    }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

class XmlSupport {
public:
    /** @brief Element test by namespace URI and local name. */
    static bool IsElement(const xmlNode* node, const char* ns, const char* localName);

    /** @brief Attribute value. `ns` may be null for unqualified attributes. */
    static std::optional<std::string> Attribute(const xmlNode* node, const char* ns, const char* localName);

    /** @brief Concatenated text content of a node. */
    static std::string Content(const xmlNode* node);

    /** @brief Serializes one node (and its subtree) without reformatting. */
    static std::string Dump(xmlDoc* doc, xmlNode* node);

    /** @brief Escapes text for use in element content or attribute values. */
    static std::string Escape(const std::string& text);

    /** @brief Parses XML text. @throws domain::SerializationError on malformed input. */
    static XmlDocPtr ParseMemory(const std::string& xml, const std::string& origin);

    /** @brief Parses an XML file. @throws domain::SerializationError if unreadable or malformed. */
    static XmlDocPtr ParseFile(const std::string& path);

    /** @brief Strict decimal integer parse. */
    static std::optional<long long> ParseInt(const std::string& text);
};

} // namespace redliner::infrastructure::wordml
