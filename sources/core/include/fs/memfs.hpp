#pragma once

#include "fs/base.hpp"

#include "util/absl.hpp"
#include "util/util.hpp"

#include <string_view>

namespace rvfs {
    class MemoryVfs;
    class MemoryChunkProvider;
    class MemoryChunkSource;

    /// @brief A refresh that was requested from a @a MemoryVfs.
    struct RefreshRequest {
        VfsPath path;
        int depth;

        friend bool operator==(const RefreshRequest&, const RefreshRequest&) = default;
    };

    class MemoryChunkSource final : public IChunkSource {
        std::shared_ptr<const ByteBuffer> mData;
        uint64_t mOffset;
        size_t mChunkSize;

    public:
        MemoryChunkSource(std::shared_ptr<const ByteBuffer> data, uint64_t offset, size_t chunkSize);

        RvfsStatus next(ByteBuffer *chunk) override;
    };

    /// @brief Serves the content of a @a MemoryVfs file.
    ///
    /// @pre The provider does not outlive the @a MemoryVfs it was created from.
    class MemoryChunkProvider final : public IChunkProvider {
        MemoryVfs *mVfs;
        VfsPath mPath;
        std::shared_ptr<const ByteBuffer> mData;

    public:
        MemoryChunkProvider(MemoryVfs *vfs, VfsPath path, std::shared_ptr<const ByteBuffer> data);

        RvfsStatus fetch(uint64_t offset, std::unique_ptr<IChunkSource> *source) override;
    };

    /// @brief An in-memory client filesystem.
    ///
    /// Children are listed in name order. Individual paths can be marked
    /// as denied to emulate missing approval.
    class MemoryVfs final : public IEntryProvider, public IContentProvider {
        struct Node {
            StatEntry stat;
            std::shared_ptr<const ByteBuffer> data;
            BTreeMap<VfsString, VfsPath> children;
        };

        FlatHashMap<VfsPath, Node> mNodes;
        FlatHashSet<VfsPath> mDenied;
        std::vector<RefreshRequest> mRefreshRequests;

        bool mApproved = true;
        size_t mChunkSize = 4096;

        uint32_t mStatCount = 0;
        uint32_t mListCount = 0;
        uint32_t mFetchCount = 0;

        RvfsStatus addNode(const VfsPath& path, Node node);

        friend class MemoryChunkProvider;

    public:
        RVFS_NOCOPY(MemoryVfs);
        RVFS_NOMOVE(MemoryVfs);

        MemoryVfs();

        /// @brief Add a folder.
        ///
        /// @retval RvfsStatusNotFound The parent folder does not exist.
        /// @retval RvfsStatusTraverseNonFolder The parent is not a folder.
        /// @retval RvfsStatusAlreadyExists The path already exists.
        RvfsStatus addFolder(const VfsPath& path);

        /// @brief Add a file with the given content.
        ///
        /// @see MemoryVfs::addFolder
        RvfsStatus addFile(const VfsPath& path, ByteBuffer data);
        RvfsStatus addFile(const VfsPath& path, std::string_view text);

        /// @brief Deny all access to a single path.
        void deny(const VfsPath& path);
        void allow(const VfsPath& path);

        /// @brief Set whether the client has approved access to its content.
        void setApproved(bool approved) { mApproved = approved; }

        /// @retval RvfsStatusInvalidInput @p size is zero.
        RvfsStatus setChunkSize(size_t size);

        uint32_t getStatCount() const { return mStatCount; }
        uint32_t getListCount() const { return mListCount; }
        uint32_t getFetchCount() const { return mFetchCount; }
        const std::vector<RefreshRequest>& getRefreshRequests() const { return mRefreshRequests; }

        RvfsStatus stat(const VfsPath& path, StatEntry *entry) override;
        RvfsStatus list(const VfsPath& path, std::vector<StatEntry> *children) override;
        RvfsStatus refresh(const VfsPath& path, int depth) override;

        RvfsStatus verifyAccess() override;
        RvfsStatus content(const VfsPath& path, std::unique_ptr<IChunkProvider> *provider) override;
    };
}
