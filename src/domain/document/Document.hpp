/**
 * @file Document.hpp
 * @brief Aggregate root for a document under revision.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Block.hpp"
#include "RevisionThread.hpp"
#include "Run.hpp"

namespace redliner::domain {

/**
 * @struct ImageResource
 * @brief Raster bytes referenced by image runs.
 */
struct ImageResource {
    std::string id;
    std::string extension;   ///< "png" or "jpeg".
    std::string contentType; ///< MIME type of the package part.
    std::vector<unsigned char> bytes;
};

/**
 * @enum TextView
 * @brief Projection of the revision state.
 */
enum class TextView {
    Current,  ///< All revisions accepted.
    Original  ///< All revisions rejected.
};

/**
 * @class Document
 * @brief Owns blocks, the run arena, comment threads and image resources.
 *
 * Runs are addressed by stable ids. Blocks hold run ids in reading order, so
 * splitting or removing a run only rewrites the owning block's id list.
 */
class Document {
public:
    Document() = default;

    // --- Construction ---
    BlockId addBlock(ContainerKind container, std::string partName);
    RunId appendRun(BlockId blockId, Run run);

    // --- Accessors ---
    const std::vector<Block>& blocks() const { return m_blocks; }
    const Block& block(BlockId id) const;
    const Run& run(RunId id) const;
    Run& run(RunId id);
    const std::vector<RevisionThread>& threads() const { return m_threads; }
    const std::vector<ImageResource>& images() const { return m_images; }
    const ImageResource* findImage(const std::string& resourceId) const;

    // --- Structural edits (used by the revision writer) ---

    /**
     * @brief Splits the run at `runIndex` of a block at byte `offset`.
     * @return Id of the new right-hand run. The left part keeps the original id.
     * @throws std::out_of_range / std::invalid_argument on a bad position.
     */
    RunId splitRun(BlockId blockId, size_t runIndex, size_t offset);

    /** @brief Inserts a run after position `runIndex` and returns its id. */
    RunId insertRunAfter(BlockId blockId, size_t runIndex, Run run);

    /**
     * @brief Removes a run from its block. The arena slot is kept so ids stay stable.
     * Threads anchored on the run move to its neighbour.
     */
    void removeRunAt(BlockId blockId, size_t runIndex);

    // --- Identifiers ---
    RevisionId nextRevisionId() { return m_nextRevisionId++; }
    int nextCommentId() { return m_nextCommentId++; }
    void seedIdentifiers(RevisionId firstRevisionId, int firstCommentId);

    // --- Threads and resources ---
    const RevisionThread& addThread(RevisionThread thread);
    const ImageResource& addImageResource(std::vector<unsigned char> bytes,
                                          const std::string& extension,
                                          const std::string& contentType);

    /** @brief Runs carrying the given revision id, with the block that holds them. */
    std::vector<std::pair<BlockId, RunId>> runsWithRevision(RevisionId id) const;

    // --- Text projections ---
    std::string blockText(BlockId id, TextView view) const;
    std::string text(TextView view) const; ///< Blocks joined with '\n'.

private:
    Block& mutableBlock(BlockId id);

    std::vector<Block> m_blocks;
    std::vector<Run> m_runs;
    std::vector<RevisionThread> m_threads;
    std::vector<ImageResource> m_images;
    RevisionId m_nextRevisionId = 1;
    int m_nextCommentId = 0;
};

} // namespace redliner::domain
