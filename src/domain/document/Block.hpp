/**
 * @file Block.hpp
 * @brief Paragraph-level text container.
 */

#pragma once

#include <string>
#include <vector>
#include "Run.hpp"

namespace redliner::domain {

/**
 * @enum ContainerKind
 * @brief Story a block belongs to. All kinds are matched and edited the same way.
 */
enum class ContainerKind {
    BodyParagraph,
    TableCell,
    Header,
    Footer
};

inline std::string ContainerKindToString(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::BodyParagraph: return "body";
        case ContainerKind::TableCell: return "table_cell";
        case ContainerKind::Header: return "header";
        case ContainerKind::Footer: return "footer";
        default: return "unknown";
    }
}

/**
 * @struct Block
 * @brief Ordered list of runs. Run storage is owned by the Document arena.
 */
struct Block {
    BlockId id = 0;
    ContainerKind container = ContainerKind::BodyParagraph;
    std::string partName; ///< Package part the block was loaded from.
    std::vector<RunId> runs;

    bool supportsComments() const {
        return container == ContainerKind::BodyParagraph || container == ContainerKind::TableCell;
    }
};

} // namespace redliner::domain
