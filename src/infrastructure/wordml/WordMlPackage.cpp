/**
 * @file WordMlPackage.cpp
 * @brief Implementation of WordMlPackage.
 */

#include "infrastructure/wordml/WordMlPackage.hpp"
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/wordml/WordMlNames.hpp"

namespace redliner::infrastructure::wordml {

namespace {
    const char* kEmptyPackage =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<?mso-application progid=\"Word.Document\"?>\n"
        "<pkg:package xmlns:pkg=\"http://schemas.microsoft.com/office/2006/xmlPackage\"/>";

    xmlNodePtr FirstElementChild(xmlNodePtr node) {
        for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE) return child;
        }
        return nullptr;
    }

    xmlNsPtr PackageNs(xmlDocPtr doc) {
        xmlNodePtr root = xmlDocGetRootElement(doc);
        xmlNsPtr ns = xmlSearchNsByHref(doc, root, BAD_CAST kPackageNs);
        if (!ns) {
            throw domain::SerializationError("Package root does not declare the package namespace.");
        }
        return ns;
    }

    /** @brief Trailing decimal number of "rId12" style ids, 0 otherwise. */
    long long NumericSuffix(const std::string& id) {
        size_t pos = id.size();
        while (pos > 0 && std::isdigit(static_cast<unsigned char>(id[pos - 1]))) --pos;
        if (pos == id.size()) return 0;
        return XmlSupport::ParseInt(id.substr(pos)).value_or(0);
    }
}

WordMlPackage::WordMlPackage(XmlDocPtr doc) : m_doc(std::move(doc)) {
    xmlNodePtr root = m_doc ? xmlDocGetRootElement(m_doc.get()) : nullptr;
    if (!XmlSupport::IsElement(root, kPackageNs, "package")) {
        throw domain::SerializationError("Input is neither a flat package nor a w:document.");
    }
    indexParts();
}

std::unique_ptr<WordMlPackage> WordMlPackage::FromBareDocument(XmlDocPtr bare) {
    xmlNodePtr bareRoot = bare ? xmlDocGetRootElement(bare.get()) : nullptr;
    if (!XmlSupport::IsElement(bareRoot, kMainNs, "document")) {
        throw domain::SerializationError("Input root is not a w:document element.");
    }

    auto package = std::make_unique<WordMlPackage>(XmlSupport::ParseMemory(kEmptyPackage, "package"));
    package->addRelationship("/", kOfficeDocumentRel, "word/document.xml");

    xmlNsPtr ns = PackageNs(package->xml());
    xmlNodePtr part = xmlNewChild(xmlDocGetRootElement(package->xml()), ns, BAD_CAST "part", nullptr);
    xmlNewNsProp(part, ns, BAD_CAST "name", BAD_CAST kMainPartName);
    xmlNewNsProp(part, ns, BAD_CAST "contentType", BAD_CAST kMainDocumentType);
    xmlNodePtr data = xmlNewChild(part, ns, BAD_CAST "xmlData", nullptr);
    xmlNodePtr copy = xmlDocCopyNode(bareRoot, package->xml(), 1);
    if (!copy) {
        throw domain::SerializationError("Out of memory while wrapping the document.");
    }
    xmlAddChild(data, copy);

    package->indexParts();
    std::cout << "[WordMlPackage] Wrapped bare w:document into a flat package." << std::endl;
    return package;
}

void WordMlPackage::indexParts() {
    m_parts.clear();
    xmlNodePtr root = xmlDocGetRootElement(m_doc.get());
    for (xmlNodePtr node = root->children; node; node = node->next) {
        if (!XmlSupport::IsElement(node, kPackageNs, "part")) continue;

        auto part = std::make_unique<PackagePart>();
        part->name = XmlSupport::Attribute(node, kPackageNs, "name").value_or("");
        part->contentType = XmlSupport::Attribute(node, kPackageNs, "contentType").value_or("");
        part->partNode = node;
        for (xmlNodePtr child = node->children; child; child = child->next) {
            if (XmlSupport::IsElement(child, kPackageNs, "xmlData")) {
                part->root = FirstElementChild(child);
                break;
            }
        }
        if (part->name.empty()) {
            std::cerr << "[WordMlPackage] Ignoring a part without a name." << std::endl;
            continue;
        }
        m_parts.push_back(std::move(part));
    }
}

PackagePart* WordMlPackage::findPart(const std::string& name) const {
    for (const auto& part : m_parts) {
        if (part->name == name) return part.get();
    }
    return nullptr;
}

PackagePart* WordMlPackage::findPartByContentType(const std::string& contentType) const {
    for (const auto& part : m_parts) {
        if (part->contentType == contentType) return part.get();
    }
    return nullptr;
}

PackagePart& WordMlPackage::mainPart() const {
    PackagePart* part = findPartByContentType(kMainDocumentType);
    if (!part) part = findPart(kMainPartName);
    if (!part || !part->root || !XmlSupport::IsElement(part->root, kMainNs, "document")) {
        throw domain::SerializationError("Package has no main document part.");
    }
    return *part;
}

PackagePart& WordMlPackage::addXmlPart(const std::string& name, const std::string& contentType, const std::string& xml) {
    if (findPart(name)) {
        throw domain::SerializationError("Package already contains part " + name);
    }
    XmlDocPtr source = XmlSupport::ParseMemory(xml, name);
    xmlNodePtr copy = xmlDocCopyNode(xmlDocGetRootElement(source.get()), m_doc.get(), 1);
    if (!copy) {
        throw domain::SerializationError("Out of memory while adding part " + name);
    }

    xmlNsPtr ns = PackageNs(m_doc.get());
    xmlNodePtr node = xmlNewChild(xmlDocGetRootElement(m_doc.get()), ns, BAD_CAST "part", nullptr);
    xmlNewNsProp(node, ns, BAD_CAST "name", BAD_CAST name.c_str());
    xmlNewNsProp(node, ns, BAD_CAST "contentType", BAD_CAST contentType.c_str());
    xmlNodePtr data = xmlNewChild(node, ns, BAD_CAST "xmlData", nullptr);
    xmlAddChild(data, copy);

    auto part = std::make_unique<PackagePart>();
    part->name = name;
    part->contentType = contentType;
    part->partNode = node;
    part->root = copy;
    m_parts.push_back(std::move(part));
    return *m_parts.back();
}

PackagePart& WordMlPackage::addBinaryPart(const std::string& name, const std::string& contentType,
                                          const std::vector<unsigned char>& bytes) {
    if (findPart(name)) {
        throw domain::SerializationError("Package already contains part " + name);
    }
    xmlNsPtr ns = PackageNs(m_doc.get());
    xmlNodePtr node = xmlNewChild(xmlDocGetRootElement(m_doc.get()), ns, BAD_CAST "part", nullptr);
    xmlNewNsProp(node, ns, BAD_CAST "name", BAD_CAST name.c_str());
    xmlNewNsProp(node, ns, BAD_CAST "contentType", BAD_CAST contentType.c_str());
    xmlNewNsProp(node, ns, BAD_CAST "compression", BAD_CAST "store");
    std::string encoded = Base64::Encode(bytes);
    xmlNewTextChild(node, ns, BAD_CAST "binaryData", BAD_CAST encoded.c_str());

    auto part = std::make_unique<PackagePart>();
    part->name = name;
    part->contentType = contentType;
    part->partNode = node;
    m_parts.push_back(std::move(part));
    return *m_parts.back();
}

std::string WordMlPackage::RelsPartName(const std::string& partName) {
    if (partName.empty() || partName == "/") return "/_rels/.rels";
    size_t slash = partName.find_last_of('/');
    std::string dir = slash == std::string::npos ? "/" : partName.substr(0, slash + 1);
    std::string file = slash == std::string::npos ? partName : partName.substr(slash + 1);
    return dir + "_rels/" + file + ".rels";
}

std::string WordMlPackage::addRelationship(const std::string& sourcePart, const std::string& type,
                                           const std::string& target) {
    std::string relsName = RelsPartName(sourcePart);
    PackagePart* rels = findPart(relsName);
    if (!rels) {
        rels = &addXmlPart(relsName, kRelationshipsType,
                           std::string("<Relationships xmlns=\"") + kRelationshipsNs + "\"/>");
    }
    if (!rels->root) {
        throw domain::SerializationError("Relationship part " + relsName + " holds no XML.");
    }

    long long maxId = 0;
    for (xmlNodePtr node = rels->root->children; node; node = node->next) {
        if (!XmlSupport::IsElement(node, kRelationshipsNs, "Relationship")) continue;
        maxId = std::max(maxId, NumericSuffix(XmlSupport::Attribute(node, nullptr, "Id").value_or("")));
    }

    std::string id = "rId" + std::to_string(maxId + 1);
    xmlNodePtr rel = xmlNewChild(rels->root, rels->root->ns, BAD_CAST "Relationship", nullptr);
    xmlNewProp(rel, BAD_CAST "Id", BAD_CAST id.c_str());
    xmlNewProp(rel, BAD_CAST "Type", BAD_CAST type.c_str());
    xmlNewProp(rel, BAD_CAST "Target", BAD_CAST target.c_str());
    return id;
}

std::string WordMlPackage::uniquePartName(const std::string& preferred) const {
    if (!findPart(preferred)) return preferred;
    size_t dot = preferred.find_last_of('.');
    size_t slash = preferred.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) dot = preferred.size();
    std::string stem = preferred.substr(0, dot);
    std::string ext = preferred.substr(dot);
    for (int n = 1;; ++n) {
        std::string candidate = stem + "_" + std::to_string(n) + ext;
        if (!findPart(candidate)) return candidate;
    }
}

void WordMlPackage::noteAnnotationId(long long id) {
    if (id > m_maxAnnotationId) m_maxAnnotationId = static_cast<domain::RevisionId>(id);
}

void WordMlPackage::noteCommentId(long long id) {
    if (id > m_maxCommentId) m_maxCommentId = static_cast<int>(id);
}

unsigned WordMlPackage::scanMaxDrawingId() const {
    unsigned maxId = 0;
    xmlXPathContextPtr context = xmlXPathNewContext(m_doc.get());
    if (!context) return maxId;
    xmlXPathRegisterNs(context, BAD_CAST "wp", BAD_CAST kWpNs);
    xmlXPathObjectPtr result = xmlXPathEvalExpression(BAD_CAST "//wp:docPr/@id", context);
    if (result && result->nodesetval) {
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            std::string value = XmlSupport::Content(result->nodesetval->nodeTab[i]);
            auto parsed = XmlSupport::ParseInt(value);
            if (parsed && *parsed > 0) maxId = std::max(maxId, static_cast<unsigned>(*parsed));
        }
    }
    if (result) xmlXPathFreeObject(result);
    xmlXPathFreeContext(context);
    return maxId;
}

unsigned WordMlPackage::nextDrawingId() {
    if (!m_nextDrawingId) m_nextDrawingId = scanMaxDrawingId() + 1;
    return (*m_nextDrawingId)++;
}

std::string WordMlPackage::serialize() const {
    xmlChar* memory = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(m_doc.get(), &memory, &size, "UTF-8", 0);
    if (!memory) {
        throw domain::SerializationError("Failed to serialize the package.");
    }
    std::string out(reinterpret_cast<const char*>(memory), static_cast<size_t>(size));
    xmlFree(memory);
    return out;
}

} // namespace redliner::infrastructure::wordml
