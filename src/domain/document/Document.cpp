/**
 * @file Document.cpp
 * @brief Implementation of the Document aggregate.
 */

#include "domain/document/Document.hpp"
#include <algorithm>
#include <stdexcept>

namespace redliner::domain {

namespace {
    bool IsContinuationByte(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    bool ContributesTo(const Run& run, TextView view) {
        if (run.content != RunContent::Text) return false;
        if (view == TextView::Current) return !run.isDeleted();
        return !run.isInserted();
    }
}

BlockId Document::addBlock(ContainerKind container, std::string partName) {
    Block block;
    block.id = static_cast<BlockId>(m_blocks.size());
    block.container = container;
    block.partName = std::move(partName);
    m_blocks.push_back(std::move(block));
    return m_blocks.back().id;
}

RunId Document::appendRun(BlockId blockId, Run run) {
    Block& target = mutableBlock(blockId);
    run.id = static_cast<RunId>(m_runs.size());
    m_runs.push_back(std::move(run));
    target.runs.push_back(m_runs.back().id);
    return m_runs.back().id;
}

const Block& Document::block(BlockId id) const {
    if (id >= m_blocks.size()) {
        throw std::out_of_range("Block not found: " + std::to_string(id));
    }
    return m_blocks[id];
}

Block& Document::mutableBlock(BlockId id) {
    if (id >= m_blocks.size()) {
        throw std::out_of_range("Block not found: " + std::to_string(id));
    }
    return m_blocks[id];
}

const Run& Document::run(RunId id) const {
    if (id >= m_runs.size()) {
        throw std::out_of_range("Run not found: " + std::to_string(id));
    }
    return m_runs[id];
}

Run& Document::run(RunId id) {
    if (id >= m_runs.size()) {
        throw std::out_of_range("Run not found: " + std::to_string(id));
    }
    return m_runs[id];
}

const ImageResource* Document::findImage(const std::string& resourceId) const {
    for (const auto& image : m_images) {
        if (image.id == resourceId) return &image;
    }
    return nullptr;
}

RunId Document::splitRun(BlockId blockId, size_t runIndex, size_t offset) {
    Block& owner = mutableBlock(blockId);
    if (runIndex >= owner.runs.size()) {
        throw std::out_of_range("Run index out of range in block " + std::to_string(blockId));
    }

    RunId leftId = owner.runs[runIndex];
    const Run& left = m_runs[leftId];
    if (left.content != RunContent::Text) {
        throw std::invalid_argument("Only text runs can be split.");
    }
    if (offset == 0 || offset >= left.text.size()) {
        throw std::invalid_argument("Split offset must fall strictly inside the run.");
    }
    if (IsContinuationByte(static_cast<unsigned char>(left.text[offset]))) {
        throw std::invalid_argument("Split offset is not on a character boundary.");
    }

    Run right = left;
    right.id = static_cast<RunId>(m_runs.size());
    right.text = left.text.substr(offset);
    m_runs.push_back(std::move(right));
    m_runs[leftId].text.resize(offset);

    RunId rightId = m_runs.back().id;
    owner.runs.insert(owner.runs.begin() + static_cast<std::ptrdiff_t>(runIndex) + 1, rightId);

    // A thread ending on the split run must keep covering both halves.
    for (auto& thread : m_threads) {
        if (thread.anchorLast == leftId) thread.anchorLast = rightId;
    }
    return rightId;
}

RunId Document::insertRunAfter(BlockId blockId, size_t runIndex, Run run) {
    Block& owner = mutableBlock(blockId);
    if (runIndex >= owner.runs.size()) {
        throw std::out_of_range("Run index out of range in block " + std::to_string(blockId));
    }
    run.id = static_cast<RunId>(m_runs.size());
    m_runs.push_back(std::move(run));
    RunId id = m_runs.back().id;
    owner.runs.insert(owner.runs.begin() + static_cast<std::ptrdiff_t>(runIndex) + 1, id);
    return id;
}

void Document::removeRunAt(BlockId blockId, size_t runIndex) {
    Block& owner = mutableBlock(blockId);
    if (runIndex >= owner.runs.size()) {
        throw std::out_of_range("Run index out of range in block " + std::to_string(blockId));
    }
    if (owner.runs.size() == 1) {
        throw std::invalid_argument("Cannot remove the last run of a block.");
    }

    RunId removed = owner.runs[runIndex];
    RunId after = runIndex + 1 < owner.runs.size() ? owner.runs[runIndex + 1] : owner.runs[runIndex - 1];
    RunId before = runIndex > 0 ? owner.runs[runIndex - 1] : owner.runs[runIndex + 1];

    for (auto& thread : m_threads) {
        if (thread.anchorFirst == removed && thread.anchorLast == removed) {
            thread.anchorFirst = after;
            thread.anchorLast = after;
        } else if (thread.anchorFirst == removed) {
            thread.anchorFirst = after;
        } else if (thread.anchorLast == removed) {
            thread.anchorLast = before;
        }
    }

    owner.runs.erase(owner.runs.begin() + static_cast<std::ptrdiff_t>(runIndex));
}

void Document::seedIdentifiers(RevisionId firstRevisionId, int firstCommentId) {
    m_nextRevisionId = std::max(m_nextRevisionId, firstRevisionId);
    m_nextCommentId = std::max(m_nextCommentId, firstCommentId);
}

const RevisionThread& Document::addThread(RevisionThread thread) {
    m_threads.push_back(std::move(thread));
    return m_threads.back();
}

const ImageResource& Document::addImageResource(std::vector<unsigned char> bytes,
                                                const std::string& extension,
                                                const std::string& contentType) {
    ImageResource resource;
    resource.id = "image" + std::to_string(m_images.size() + 1);
    resource.extension = extension;
    resource.contentType = contentType;
    resource.bytes = std::move(bytes);
    m_images.push_back(std::move(resource));
    return m_images.back();
}

std::vector<std::pair<BlockId, RunId>> Document::runsWithRevision(RevisionId id) const {
    std::vector<std::pair<BlockId, RunId>> found;
    for (const auto& b : m_blocks) {
        for (RunId runId : b.runs) {
            const Run& r = m_runs[runId];
            if (r.revision && r.revision->id == id) {
                found.emplace_back(b.id, runId);
            }
        }
    }
    return found;
}

std::string Document::blockText(BlockId id, TextView view) const {
    const Block& b = block(id);
    std::string out;
    for (RunId runId : b.runs) {
        const Run& r = m_runs[runId];
        if (ContributesTo(r, view)) out += r.text;
    }
    return out;
}

std::string Document::text(TextView view) const {
    std::string out;
    for (size_t i = 0; i < m_blocks.size(); ++i) {
        if (i > 0) out += '\n';
        out += blockText(m_blocks[i].id, view);
    }
    return out;
}

} // namespace redliner::domain
