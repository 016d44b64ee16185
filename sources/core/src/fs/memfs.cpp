#include "fs/memfs.hpp"

#include <algorithm>

using namespace rvfs;

MemoryChunkSource::MemoryChunkSource(std::shared_ptr<const ByteBuffer> data, uint64_t offset, size_t chunkSize)
    : mData(std::move(data))
    , mOffset(offset)
    , mChunkSize(chunkSize)
{ }

RvfsStatus MemoryChunkSource::next(ByteBuffer *chunk) {
    uint64_t size = mData->size();
    if (mOffset >= size) {
        return RvfsStatusCompleted;
    }

    //
    // Chunks end on chunk size boundaries, so a fetch from the middle
    // of a chunk returns a shorter first chunk.
    //
    uint64_t end = std::min<uint64_t>(rounddown<uint64_t>(mOffset, mChunkSize) + mChunkSize, size);

    chunk->assign(mData->begin() + mOffset, mData->begin() + end);
    mOffset = end;

    return RvfsStatusSuccess;
}

MemoryChunkProvider::MemoryChunkProvider(MemoryVfs *vfs, VfsPath path, std::shared_ptr<const ByteBuffer> data)
    : mVfs(vfs)
    , mPath(std::move(path))
    , mData(std::move(data))
{ }

RvfsStatus MemoryChunkProvider::fetch(uint64_t offset, std::unique_ptr<IChunkSource> *source) {
    mVfs->mFetchCount += 1;

    if (mVfs->mDenied.contains(mPath)) {
        return RvfsStatusAccessDenied;
    }

    *source = std::make_unique<MemoryChunkSource>(mData, offset, mVfs->mChunkSize);
    return RvfsStatusSuccess;
}

MemoryVfs::MemoryVfs() {
    Node root {
        .stat = StatEntry { .path = VfsPath(), .type = NodeType::eFolder, .mode = 040755 },
    };

    mNodes.insert({ VfsPath(), std::move(root) });
}

RvfsStatus MemoryVfs::addNode(const VfsPath& path, Node node) {
    if (path.isRoot()) {
        return RvfsStatusAlreadyExists;
    }

    auto parent = mNodes.find(path.parent());
    if (parent == mNodes.end()) {
        return RvfsStatusNotFound;
    }

    auto& [_, folder] = *parent;
    if (!folder.stat.isFolder()) {
        return RvfsStatusTraverseNonFolder;
    }

    //
    // Insert the node before linking it into its parent, the
    // insertion fails if the path already exists.
    //
    if (!mNodes.insert({ path, std::move(node) }).second) {
        return RvfsStatusAlreadyExists;
    }

    //
    // Inserting into a flat hash map may rehash, so the parent
    // must be found again before linking.
    //
    mNodes.at(path.parent()).children.insert({ VfsString(path.name()), path });
    return RvfsStatusSuccess;
}

RvfsStatus MemoryVfs::addFolder(const VfsPath& path) {
    Node node {
        .stat = StatEntry { .path = path, .type = NodeType::eFolder, .mode = 040755 },
    };

    return addNode(path, std::move(node));
}

RvfsStatus MemoryVfs::addFile(const VfsPath& path, ByteBuffer data) {
    uint64_t size = data.size();

    Node node {
        .stat = StatEntry { .path = path, .type = NodeType::eFile, .size = size, .mode = 0100644 },
        .data = std::make_shared<const ByteBuffer>(std::move(data)),
    };

    return addNode(path, std::move(node));
}

RvfsStatus MemoryVfs::addFile(const VfsPath& path, std::string_view text) {
    ByteBuffer data(text.size());
    std::transform(text.begin(), text.end(), data.begin(), [](char c) { return std::byte(c); });

    return addFile(path, std::move(data));
}

void MemoryVfs::deny(const VfsPath& path) {
    mDenied.insert(path);
}

void MemoryVfs::allow(const VfsPath& path) {
    mDenied.erase(path);
}

RvfsStatus MemoryVfs::setChunkSize(size_t size) {
    if (size == 0) {
        return RvfsStatusInvalidInput;
    }

    mChunkSize = size;
    return RvfsStatusSuccess;
}

RvfsStatus MemoryVfs::stat(const VfsPath& path, StatEntry *entry) {
    mStatCount += 1;

    if (mDenied.contains(path)) {
        return RvfsStatusAccessDenied;
    }

    auto it = mNodes.find(path);
    if (it == mNodes.end()) {
        return RvfsStatusNotFound;
    }

    *entry = it->second.stat;
    return RvfsStatusSuccess;
}

RvfsStatus MemoryVfs::list(const VfsPath& path, std::vector<StatEntry> *children) {
    mListCount += 1;

    if (mDenied.contains(path)) {
        return RvfsStatusAccessDenied;
    }

    auto it = mNodes.find(path);
    if (it == mNodes.end()) {
        return RvfsStatusNotFound;
    }

    const Node& folder = it->second;
    if (!folder.stat.isFolder()) {
        return RvfsStatusTraverseNonFolder;
    }

    std::vector<StatEntry> result;
    result.reserve(folder.children.size());

    for (const auto& [_, child] : folder.children) {
        result.push_back(mNodes.at(child).stat);
    }

    *children = std::move(result);
    return RvfsStatusSuccess;
}

RvfsStatus MemoryVfs::refresh(const VfsPath& path, int depth) {
    if (mDenied.contains(path)) {
        return RvfsStatusAccessDenied;
    }

    if (!mNodes.contains(path)) {
        return RvfsStatusNotFound;
    }

    mRefreshRequests.push_back({ path, depth });
    return RvfsStatusSuccess;
}

RvfsStatus MemoryVfs::verifyAccess() {
    return mApproved ? RvfsStatusSuccess : RvfsStatusAccessDenied;
}

RvfsStatus MemoryVfs::content(const VfsPath& path, std::unique_ptr<IChunkProvider> *provider) {
    auto it = mNodes.find(path);
    if (it == mNodes.end()) {
        return RvfsStatusNotFound;
    }

    const Node& node = it->second;
    if (node.stat.isFolder()) {
        return RvfsStatusInvalidInput;
    }

    *provider = std::make_unique<MemoryChunkProvider>(this, path, node.data);
    return RvfsStatusSuccess;
}
