/**
 * @file WordMlReader.cpp
 * @brief Implementation of WordMlReader.
 */

#include "infrastructure/wordml/WordMlReader.hpp"
#include <iostream>
#include <vector>
#include "domain/Errors.hpp"
#include "infrastructure/wordml/WordMlNames.hpp"

namespace redliner::infrastructure::wordml {

using namespace redliner::domain;

struct WordMlReader::Context {
    WordMlPackage& package;
    Document& document;
    std::string partName;
};

namespace {
    bool IsMain(const xmlNode* node, const char* localName) {
        return XmlSupport::IsElement(node, kMainNs, localName);
    }

    /** @brief Child elements a Text run may hold. */
    bool IsPlainRunChild(const xmlNode* child) {
        if (IsMain(child, "t") || IsMain(child, "delText") || IsMain(child, "tab") || IsMain(child, "cr") ||
            IsMain(child, "lastRenderedPageBreak")) {
            return true;
        }
        if (IsMain(child, "br")) {
            auto type = XmlSupport::Attribute(child, kMainNs, "type");
            return !type || *type == "textWrapping";
        }
        return false;
    }

    /** @brief True if the subtree draws text or an object in the rendered document. */
    bool HasVisibleContent(const xmlNode* node) {
        static const char* const kVisible[] = {"t", "tab", "br", "cr", "sym", "drawing", "pict", "object",
                                               "noBreakHyphen", "softHyphen", "ptab",
                                               "footnoteReference", "endnoteReference"};
        for (const xmlNode* child = node->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) continue;
            if (IsMain(child, "del")) continue;
            for (const char* name : kVisible) {
                if (IsMain(child, name)) return true;
            }
            if (HasVisibleContent(child)) return true;
        }
        return false;
    }
}

WordMlReader::WordMlReader() : m_options() {}

WordMlReader::WordMlReader(Options options) : m_options(options) {}

LoadedDocument WordMlReader::loadFile(const std::string& path) const {
    std::cout << "[WordMlReader] Loading " << path << std::endl;
    return load(XmlSupport::ParseFile(path));
}

LoadedDocument WordMlReader::loadString(const std::string& xml, const std::string& origin) const {
    return load(XmlSupport::ParseMemory(xml, origin));
}

LoadedDocument WordMlReader::load(XmlDocPtr xml) const {
    xmlNodePtr root = xmlDocGetRootElement(xml.get());
    LoadedDocument loaded;
    if (XmlSupport::IsElement(root, kPackageNs, "package")) {
        loaded.package = std::make_unique<WordMlPackage>(std::move(xml));
    } else if (IsMain(root, "document")) {
        loaded.package = WordMlPackage::FromBareDocument(std::move(xml));
    } else {
        throw SerializationError("Input is neither a flat package nor a w:document.");
    }
    loaded.document = std::make_unique<Document>();

    PackagePart& main = loaded.package->mainPart();
    std::vector<PackagePart*> stories;
    for (const auto& part : loaded.package->parts()) {
        if (!part->root) continue;
        bool story = part.get() == &main || part->contentType == kHeaderType || part->contentType == kFooterType;
        if (story) {
            if (m_options.cleanHighlighting) StripHighlighting(part->root);
            NoteIdentifiers(*loaded.package, part->root, false);
            if (part.get() != &main) stories.push_back(part.get());
        } else if (part->contentType == kCommentsType) {
            NoteIdentifiers(*loaded.package, part->root, true);
        }
    }

    Context ctx{*loaded.package, *loaded.document, main.name};
    xmlNodePtr body = nullptr;
    for (xmlNodePtr child = main.root->children; child; child = child->next) {
        if (IsMain(child, "body")) {
            body = child;
            break;
        }
    }
    if (!body) {
        throw SerializationError("Main document part has no w:body.");
    }
    readContainer(ctx, body, ContainerKind::BodyParagraph);

    for (PackagePart* part : stories) {
        ctx.partName = part->name;
        ContainerKind kind = part->contentType == kHeaderType ? ContainerKind::Header : ContainerKind::Footer;
        readContainer(ctx, part->root, kind);
    }

    loaded.document->seedIdentifiers(loaded.package->maxAnnotationId() + 1, loaded.package->maxCommentId() + 1);

    size_t runCount = 0;
    for (const auto& block : loaded.document->blocks()) runCount += block.runs.size();
    std::cout << "[WordMlReader] " << loaded.document->blocks().size() << " blocks, " << runCount
              << " runs, " << stories.size() << " header/footer parts." << std::endl;
    return loaded;
}

void WordMlReader::readContainer(Context& ctx, xmlNodePtr container, ContainerKind kind) const {
    for (xmlNodePtr child = container->children; child; child = child->next) {
        if (IsMain(child, "p")) {
            readParagraph(ctx, child, kind);
        } else if (IsMain(child, "tbl")) {
            ContainerKind cellKind = kind == ContainerKind::BodyParagraph ? ContainerKind::TableCell : kind;
            for (xmlNodePtr row = child->children; row; row = row->next) {
                if (!IsMain(row, "tr")) continue;
                for (xmlNodePtr cell = row->children; cell; cell = cell->next) {
                    if (IsMain(cell, "tc")) readContainer(ctx, cell, cellKind);
                }
            }
        } else if (IsMain(child, "sdt")) {
            for (xmlNodePtr inner = child->children; inner; inner = inner->next) {
                if (IsMain(inner, "sdtContent")) readContainer(ctx, inner, kind);
            }
        } else if (IsMain(child, "customXml")) {
            readContainer(ctx, child, kind);
        }
    }
}

void WordMlReader::readParagraph(Context& ctx, xmlNodePtr paragraph, ContainerKind kind) const {
    BlockId block = ctx.document.addBlock(kind, ctx.partName);

    for (xmlNodePtr child = paragraph->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE || IsMain(child, "pPr")) continue;

        if (IsMain(child, "r")) {
            readRun(ctx, block, child, std::nullopt);
        } else if (IsMain(child, "ins") || IsMain(child, "del")) {
            auto tag = TagFor(child);
            for (xmlNodePtr inner = child->children; inner; inner = inner->next) {
                if (inner->type != XML_ELEMENT_NODE) continue;
                if (IsMain(inner, "r")) {
                    readRun(ctx, block, inner, tag);
                } else {
                    appendOpaque(ctx, block, inner, tag);
                }
            }
        } else {
            appendOpaque(ctx, block, child, std::nullopt);
        }
    }

    BoundBlock binding;
    binding.block = block;
    binding.paragraph = paragraph;
    for (RunId id : ctx.document.block(block).runs) {
        binding.loadedRuns.push_back(id);
        const auto& revision = ctx.document.run(id).revision;
        binding.loadedRevisions.push_back(revision ? std::optional<RevisionId>(revision->id) : std::nullopt);
    }
    ctx.package.bind(std::move(binding));
}

void WordMlReader::readRun(Context& ctx, BlockId block, xmlNodePtr run,
                           const std::optional<RevisionTag>& tag) const {
    Run model;
    model.revision = tag;

    xmlNodePtr properties = nullptr;
    for (xmlNodePtr child = run->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        if (IsMain(child, "rPr")) {
            properties = child;
            continue;
        }
        if (!IsPlainRunChild(child)) {
            appendOpaque(ctx, block, run, tag);
            return;
        }
        if (IsMain(child, "t") || IsMain(child, "delText")) {
            model.text += XmlSupport::Content(child);
        } else if (IsMain(child, "tab")) {
            model.text += '\t';
        } else if (IsMain(child, "br") || IsMain(child, "cr")) {
            model.text += '\n';
        }
    }

    model.content = RunContent::Text;
    if (properties) model.formatting = XmlSupport::Dump(ctx.package.xml(), properties);
    ctx.document.appendRun(block, std::move(model));
}

void WordMlReader::appendOpaque(Context& ctx, BlockId block, xmlNodePtr node,
                                const std::optional<RevisionTag>& tag) const {
    Run model;
    model.content = RunContent::Opaque;
    model.formatting = XmlSupport::Dump(ctx.package.xml(), node);
    model.visible = HasVisibleContent(node);
    model.revision = tag;
    ctx.document.appendRun(block, std::move(model));
}

std::optional<RevisionTag> WordMlReader::TagFor(xmlNodePtr wrapper) {
    RevisionTag tag;
    tag.kind = IsMain(wrapper, "del") ? RevisionKind::Deleted : RevisionKind::Inserted;
    tag.author = XmlSupport::Attribute(wrapper, kMainNs, "author").value_or("");
    tag.timestamp = XmlSupport::Attribute(wrapper, kMainNs, "date").value_or("");
    auto id = XmlSupport::ParseInt(XmlSupport::Attribute(wrapper, kMainNs, "id").value_or(""));
    if (!id) {
        std::cerr << "[WordMlReader] Revision without a numeric w:id; keeping it as id 0." << std::endl;
    }
    tag.id = static_cast<RevisionId>(id.value_or(0));
    return tag;
}

void WordMlReader::StripHighlighting(xmlNodePtr node) {
    xmlNodePtr child = node->children;
    while (child) {
        xmlNodePtr next = child->next;
        if (child->type == XML_ELEMENT_NODE) {
            bool inProperties = IsMain(node, "rPr") || IsMain(node, "pPr");
            if (inProperties && (IsMain(child, "highlight") || IsMain(child, "shd"))) {
                xmlUnlinkNode(child);
                xmlFreeNode(child);
            } else {
                StripHighlighting(child);
            }
        }
        child = next;
    }
}

void WordMlReader::NoteIdentifiers(WordMlPackage& package, xmlNodePtr node, bool commentsPart) {
    if (node->type != XML_ELEMENT_NODE) return;
    if (node->ns && node->ns->href && xmlStrEqual(node->ns->href, BAD_CAST kMainNs)) {
        auto id = XmlSupport::ParseInt(XmlSupport::Attribute(node, kMainNs, "id").value_or(""));
        if (id) {
            bool commentId = (commentsPart && IsMain(node, "comment")) || IsMain(node, "commentRangeStart") ||
                             IsMain(node, "commentRangeEnd") || IsMain(node, "commentReference");
            if (commentId) {
                package.noteCommentId(*id);
            } else {
                package.noteAnnotationId(*id);
            }
        }
    }
    for (xmlNodePtr child = node->children; child; child = child->next) {
        NoteIdentifiers(package, child, commentsPart);
    }
}

} // namespace redliner::infrastructure::wordml
