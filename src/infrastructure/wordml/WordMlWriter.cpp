/**
 * @file WordMlWriter.cpp
 * @brief Implementation of WordMlWriter.
 */

#include "infrastructure/wordml/WordMlWriter.hpp"
#include <libxml/parser.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <sstream>
#include "domain/Errors.hpp"
#include "infrastructure/wordml/WordMlNames.hpp"

namespace redliner::infrastructure::wordml {

using namespace redliner::domain;

namespace {
    std::string Attr(const std::string& name, const std::string& value) {
        return " " + name + "=\"" + XmlSupport::Escape(value) + "\"";
    }

    std::string RevisionAttributes(RevisionId id, const RevisionTag& tag) {
        std::string out = Attr("w:id", std::to_string(id)) + Attr("w:author", tag.author);
        if (!tag.timestamp.empty()) out += Attr("w:date", tag.timestamp);
        return out;
    }

    std::string CommentReferenceRun(int commentId) {
        return "<w:r><w:rPr><w:rStyle w:val=\"CommentReference\"/></w:rPr><w:commentReference" +
               Attr("w:id", std::to_string(commentId)) + "/></w:r>";
    }

    /** @brief w:t / w:delText pieces with tabs and breaks as their own elements. */
    std::string TextContent(const std::string& text, bool deleted) {
        const char* element = deleted ? "w:delText" : "w:t";
        std::string out;
        std::string pending;
        auto flush = [&]() {
            if (pending.empty()) return;
            out += std::string("<") + element + " xml:space=\"preserve\">" + XmlSupport::Escape(pending) + "</" +
                   element + ">";
            pending.clear();
        };
        for (char c : text) {
            if (c == '\t') {
                flush();
                out += "<w:tab/>";
            } else if (c == '\n') {
                flush();
                out += "<w:br/>";
            } else {
                pending += c;
            }
        }
        flush();
        return out;
    }
}

WordMlWriter::WordMlWriter(WordMlPackage& package) : m_package(package) {}

std::string WordMlWriter::writeToString(const Document& document) {
    write(document);
    return m_package.serialize();
}

void WordMlWriter::write(const Document& document) {
    m_threadsByBlock.clear();
    m_emittedRevisions.clear();
    for (const auto& thread : document.threads()) {
        m_threadsByBlock[static_cast<int>(thread.block)].push_back(&thread);
    }

    RevisionId highest = m_package.maxAnnotationId();
    for (const auto& block : document.blocks()) {
        for (RunId id : block.runs) {
            const auto& revision = document.run(id).revision;
            if (revision) highest = std::max(highest, revision->id);
        }
    }
    m_nextFreshId = highest + 1;

    size_t rewritten = 0;
    for (const auto& binding : m_package.bindings()) {
        if (!isDirty(document, binding)) continue;
        std::string markup = paragraphMarkup(document, document.block(binding.block));
        ClearParagraph(binding.paragraph);
        appendMarkup(binding.paragraph, markup);
        ++rewritten;
    }

    writeComments(document);
    std::cout << "[WordMlWriter] Rewrote " << rewritten << " paragraph(s), " << document.threads().size()
              << " comment(s), " << m_mediaParts.size() << " image part(s)." << std::endl;
}

bool WordMlWriter::isDirty(const Document& document, const BoundBlock& binding) const {
    const Block& block = document.block(binding.block);
    if (block.runs != binding.loadedRuns) return true;
    if (m_threadsByBlock.count(static_cast<int>(binding.block))) return true;
    for (size_t i = 0; i < block.runs.size(); ++i) {
        const auto& revision = document.run(block.runs[i]).revision;
        std::optional<RevisionId> current = revision ? std::optional<RevisionId>(revision->id) : std::nullopt;
        if (current != binding.loadedRevisions[i]) return true;
    }
    return false;
}

std::string WordMlWriter::paragraphMarkup(const Document& document, const Block& block) {
    std::set<RunId> present(block.runs.begin(), block.runs.end());
    std::vector<const RevisionThread*> threads;
    auto found = m_threadsByBlock.find(static_cast<int>(block.id));
    if (found != m_threadsByBlock.end()) threads = found->second;

    std::string out;
    std::optional<RevisionId> openRevision;
    std::string closeTag;

    auto closeWrapper = [&]() {
        if (!openRevision) return;
        out += closeTag;
        openRevision.reset();
    };
    auto commentStart = [&](const RevisionThread* thread) {
        closeWrapper();
        out += "<w:commentRangeStart" + Attr("w:id", std::to_string(thread->commentId)) + "/>";
    };
    auto commentEnd = [&](const RevisionThread* thread) {
        closeWrapper();
        out += "<w:commentRangeEnd" + Attr("w:id", std::to_string(thread->commentId)) + "/>";
        out += CommentReferenceRun(thread->commentId);
    };

    for (const auto* thread : threads) {
        if (!present.count(thread->anchorFirst)) commentStart(thread);
    }

    for (RunId id : block.runs) {
        const Run& run = document.run(id);
        for (const auto* thread : threads) {
            if (thread->anchorFirst == id) commentStart(thread);
        }

        if (run.content == RunContent::Text && run.text.empty()) {
            // Nothing visible; only the markers around it matter.
        } else {
            if (openRevision && (!run.revision || run.revision->id != *openRevision)) closeWrapper();
            if (run.revision && !openRevision) {
                RevisionId id = run.revision->id;
                if (m_emittedRevisions.count(id)) id = m_nextFreshId++;
                m_emittedRevisions.insert(id);
                const char* element = run.isDeleted() ? "w:del" : "w:ins";
                out += std::string("<") + element + RevisionAttributes(id, *run.revision) + ">";
                closeTag = std::string("</") + element + ">";
                openRevision = run.revision->id;
            }
            out += runMarkup(document, block, run);
        }

        for (const auto* thread : threads) {
            if (thread->anchorLast == id) commentEnd(thread);
        }
    }
    closeWrapper();

    for (const auto* thread : threads) {
        if (!present.count(thread->anchorLast)) commentEnd(thread);
    }
    return out;
}

std::string WordMlWriter::runMarkup(const Document& document, const Block& block, const Run& run) {
    switch (run.content) {
        case RunContent::Opaque:
            return run.formatting;
        case RunContent::Image:
            if (!run.image) {
                throw SerializationError("Image run without an image reference.");
            }
            return "<w:r>" + run.formatting + drawingMarkup(document, block, *run.image) + "</w:r>";
        case RunContent::Text:
        default:
            return "<w:r>" + run.formatting + TextContent(run.text, run.isDeleted()) + "</w:r>";
    }
}

std::string WordMlWriter::drawingMarkup(const Document& document, const Block& block, const ImageRef& image) {
    std::string relId = imageRelationship(document, block.partName, image.resourceId);
    unsigned drawingId = m_package.nextDrawingId();
    std::string cx = std::to_string(image.widthEmu);
    std::string cy = std::to_string(image.heightEmu);

    std::ostringstream xml;
    xml << "<w:drawing>"
        << "<wp:inline distT=\"0\" distB=\"0\" distL=\"0\" distR=\"0\"" << Attr("xmlns:wp", kWpNs) << ">"
        << "<wp:extent" << Attr("cx", cx) << Attr("cy", cy) << "/>"
        << "<wp:effectExtent l=\"0\" t=\"0\" r=\"0\" b=\"0\"/>"
        << "<wp:docPr" << Attr("id", std::to_string(drawingId)) << Attr("name", image.name) << "/>"
        << "<wp:cNvGraphicFramePr><a:graphicFrameLocks" << Attr("xmlns:a", kDrawingNs)
        << " noChangeAspect=\"1\"/></wp:cNvGraphicFramePr>"
        << "<a:graphic" << Attr("xmlns:a", kDrawingNs) << ">"
        << "<a:graphicData" << Attr("uri", kPictureNs) << ">"
        << "<pic:pic" << Attr("xmlns:pic", kPictureNs) << ">"
        << "<pic:nvPicPr><pic:cNvPr id=\"0\"" << Attr("name", image.name) << "/><pic:cNvPicPr/></pic:nvPicPr>"
        << "<pic:blipFill><a:blip" << Attr("xmlns:r", kOfficeRelNs) << Attr("r:embed", relId) << "/>"
        << "<a:stretch><a:fillRect/></a:stretch></pic:blipFill>"
        << "<pic:spPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext" << Attr("cx", cx) << Attr("cy", cy) << "/></a:xfrm>"
        << "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></pic:spPr>"
        << "</pic:pic></a:graphicData></a:graphic></wp:inline></w:drawing>";
    return xml.str();
}

std::string WordMlWriter::imageRelationship(const Document& document, const std::string& sourcePart,
                                            const std::string& resourceId) {
    auto key = std::make_pair(sourcePart, resourceId);
    auto cached = m_imageRels.find(key);
    if (cached != m_imageRels.end()) return cached->second;

    auto media = m_mediaParts.find(resourceId);
    if (media == m_mediaParts.end()) {
        const ImageResource* resource = document.findImage(resourceId);
        if (!resource) {
            throw SerializationError("Image run refers to unknown resource " + resourceId);
        }
        std::string name = m_package.uniquePartName("/word/media/" + resource->id + "." + resource->extension);
        m_package.addBinaryPart(name, resource->contentType, resource->bytes);
        media = m_mediaParts.emplace(resourceId, name).first;
    }

    std::string relId = m_package.addRelationship(sourcePart, kImageRel, RelativeTarget(sourcePart, media->second));
    m_imageRels.emplace(key, relId);
    return relId;
}

void WordMlWriter::writeComments(const Document& document) {
    if (document.threads().empty()) return;

    PackagePart* part = m_package.findPartByContentType(kCommentsType);
    if (!part) {
        PackagePart& main = m_package.mainPart();
        std::string name = m_package.uniquePartName(kCommentsPartName);
        part = &m_package.addXmlPart(name, kCommentsType, std::string("<w:comments") + Attr("xmlns:w", kMainNs) + "/>");
        m_package.addRelationship(main.name, kCommentsRel, RelativeTarget(main.name, name));
    }
    if (!part->root || !XmlSupport::IsElement(part->root, kMainNs, "comments")) {
        throw SerializationError("Comments part " + part->name + " is not a w:comments element.");
    }

    std::set<int> existing;
    for (xmlNodePtr node = part->root->children; node; node = node->next) {
        if (!XmlSupport::IsElement(node, kMainNs, "comment")) continue;
        auto id = XmlSupport::ParseInt(XmlSupport::Attribute(node, kMainNs, "id").value_or(""));
        if (id) existing.insert(static_cast<int>(*id));
    }

    std::string markup;
    for (const auto& thread : document.threads()) {
        if (existing.count(thread.commentId)) continue;
        markup += "<w:comment" + Attr("w:id", std::to_string(thread.commentId)) + Attr("w:author", thread.author);
        if (!thread.timestamp.empty()) markup += Attr("w:date", thread.timestamp);
        markup += Attr("w:initials", Initials(thread.author)) + ">";

        std::istringstream lines(thread.body);
        std::string line;
        bool first = true;
        while (std::getline(lines, line)) {
            markup += "<w:p><w:pPr><w:pStyle w:val=\"CommentText\"/></w:pPr>";
            if (first) {
                markup += "<w:r><w:rPr><w:rStyle w:val=\"CommentReference\"/></w:rPr><w:annotationRef/></w:r>";
                first = false;
            }
            markup += "<w:r>" + TextContent(line, false) + "</w:r></w:p>";
        }
        markup += "</w:comment>";
    }
    appendMarkup(part->root, markup);
}

void WordMlWriter::ClearParagraph(xmlNodePtr paragraph) {
    xmlNodePtr child = paragraph->children;
    while (child) {
        xmlNodePtr next = child->next;
        if (!XmlSupport::IsElement(child, kMainNs, "pPr")) {
            xmlUnlinkNode(child);
            xmlFreeNode(child);
        }
        child = next;
    }
}

void WordMlWriter::appendMarkup(xmlNodePtr parent, const std::string& markup) {
    if (markup.empty()) return;

    xmlNsPtr prefix = xmlSearchNs(parent->doc, parent, BAD_CAST "w");
    if (!prefix || !xmlStrEqual(prefix->href, BAD_CAST kMainNs)) {
        throw SerializationError("Prefix 'w' is not bound to the WordprocessingML namespace in this part.");
    }

    xmlNodePtr list = nullptr;
    xmlParserErrors status = xmlParseInNodeContext(parent, markup.data(), static_cast<int>(markup.size()),
                                                   XML_PARSE_NONET | XML_PARSE_HUGE, &list);
    if (status != XML_ERR_OK) {
        if (list) xmlFreeNodeList(list);
        throw SerializationError("Generated markup was rejected by the XML parser (code " +
                                 std::to_string(static_cast<int>(status)) + ").");
    }
    if (list) xmlAddChildList(parent, list);
}

std::string WordMlWriter::RelativeTarget(const std::string& sourcePart, const std::string& targetPart) {
    size_t slash = sourcePart.find_last_of('/');
    std::string dir = slash == std::string::npos ? "/" : sourcePart.substr(0, slash + 1);
    if (targetPart.compare(0, dir.size(), dir) == 0) return targetPart.substr(dir.size());
    return targetPart;
}

std::string WordMlWriter::Initials(const std::string& author) {
    std::string out;
    bool atWordStart = true;
    for (char c : author) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            atWordStart = true;
        } else if (atWordStart) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            atWordStart = false;
        }
    }
    return out;
}

} // namespace redliner::infrastructure::wordml
