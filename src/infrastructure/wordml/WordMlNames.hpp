/**
 * @file WordMlNames.hpp
 * @brief Namespaces, content types and relationship types of WordprocessingML packages.
 */

#pragma once

namespace redliner::infrastructure::wordml {

// Namespaces
constexpr const char* kPackageNs = "http://schemas.microsoft.com/office/2006/xmlPackage";
constexpr const char* kMainNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kRelationshipsNs = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kOfficeRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kWpNs = "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
constexpr const char* kDrawingNs = "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr const char* kPictureNs = "http://schemas.openxmlformats.org/drawingml/2006/picture";

// Content types
constexpr const char* kRelationshipsType = "application/vnd.openxmlformats-package.relationships+xml";
constexpr const char* kMainDocumentType = "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
constexpr const char* kHeaderType = "application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml";
constexpr const char* kFooterType = "application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml";
constexpr const char* kCommentsType = "application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml";

// Relationship types
constexpr const char* kOfficeDocumentRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kCommentsRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
constexpr const char* kImageRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";

constexpr const char* kMainPartName = "/word/document.xml";
constexpr const char* kCommentsPartName = "/word/comments.xml";

} // namespace redliner::infrastructure::wordml
