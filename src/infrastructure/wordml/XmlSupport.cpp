/**
 * @file XmlSupport.cpp
 * @brief Implementation of XmlSupport.
 */

#include "infrastructure/wordml/XmlSupport.hpp"
#include <libxml/parser.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "domain/Errors.hpp"

namespace redliner::infrastructure::wordml {

namespace {
constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_HUGE;

std::string TakeXmlString(xmlChar* value) {
    if (!value) return "";
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

std::string LastParseError() {
    const xmlError* error = xmlGetLastError();
    if (!error || !error->message) return "unknown error";
    std::string message = error->message;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) message.pop_back();
    return message + " (line " + std::to_string(error->line) + ")";
}
}

bool XmlSupport::IsElement(const xmlNode* node, const char* ns, const char* localName) {
    if (!node || node->type != XML_ELEMENT_NODE) return false;
    if (std::strcmp(reinterpret_cast<const char*>(node->name), localName) != 0) return false;
    if (!ns) return node->ns == nullptr;
    return node->ns && node->ns->href && std::strcmp(reinterpret_cast<const char*>(node->ns->href), ns) == 0;
}

std::optional<std::string> XmlSupport::Attribute(const xmlNode* node, const char* ns, const char* localName) {
    if (!node) return std::nullopt;
    xmlChar* value = ns ? xmlGetNsProp(node, BAD_CAST localName, BAD_CAST ns)
                        : xmlGetNoNsProp(node, BAD_CAST localName);
    if (!value) return std::nullopt;
    return TakeXmlString(value);
}

std::string XmlSupport::Content(const xmlNode* node) {
    return TakeXmlString(xmlNodeGetContent(node));
}

std::string XmlSupport::Dump(xmlDoc* doc, xmlNode* node) {
    xmlBufferPtr buffer = xmlBufferCreate();
    if (!buffer) {
        throw domain::SerializationError("Out of memory while dumping XML node.");
    }
    xmlNodeDump(buffer, doc, node, 0, 0);
    std::string out(reinterpret_cast<const char*>(xmlBufferContent(buffer)), static_cast<size_t>(xmlBufferLength(buffer)));
    xmlBufferFree(buffer);
    return out;
}

std::string XmlSupport::Escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

XmlDocPtr XmlSupport::ParseMemory(const std::string& xml, const std::string& origin) {
    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), origin.c_str(), nullptr, kParseOptions));
    if (!doc) {
        throw domain::SerializationError("Cannot parse " + origin + ": " + LastParseError());
    }
    return doc;
}

XmlDocPtr XmlSupport::ParseFile(const std::string& path) {
    xmlResetLastError();
    XmlDocPtr doc(xmlReadFile(path.c_str(), nullptr, kParseOptions));
    if (!doc) {
        throw domain::SerializationError("Cannot read " + path + ": " + LastParseError());
    }
    return doc;
}

std::optional<long long> XmlSupport::ParseInt(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return std::nullopt;
    return value;
}

} // namespace redliner::infrastructure::wordml
