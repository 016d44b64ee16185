#pragma once

#include <rvfs/status.h>

#include "fs/path.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/// @brief Remote Virtual File System.
///
/// Read only access to the filesystem of a remote client, exposed only
/// through entry metadata lookups and chunked content fetches.
namespace rvfs {
    using ByteBuffer = std::vector<std::byte>;

    struct ReadRequest {
        void *begin;
        void *end;

        uintptr_t size() const { return (std::byte*)end - (std::byte*)begin; }
    };

    struct ReadResult {
        uint64_t read;
    };

    enum class NodeType {
        eNone,
        eFile,
        eFolder,
    };

    /// @brief Metadata describing a single path on the client.
    struct StatEntry {
        VfsPath path;
        NodeType type = NodeType::eNone;

        /// @brief Size of the file content in bytes.
        uint64_t size = 0;

        /// @brief Unix permission and type bits as reported by the client.
        uint32_t mode = 0;

        /// @brief Timestamps in seconds since the unix epoch.
        int64_t accessTime = 0;
        int64_t modifyTime = 0;
        int64_t changeTime = 0;

        bool isFolder() const { return type == NodeType::eFolder; }

        friend bool operator==(const StatEntry&, const StatEntry&) = default;
    };

    /// @brief A finite sequence of content chunks starting at a fixed offset.
    ///
    /// Sources may be released before they are exhausted. Once exhausted
    /// a source keeps reporting @a RvfsStatusCompleted.
    class IChunkSource {
    public:
        virtual ~IChunkSource() = default;

        /// @brief Get the next chunk of content.
        ///
        /// @param chunk The chunk, never empty on success.
        ///
        /// @retval RvfsStatusSuccess The chunk has been filled.
        /// @retval RvfsStatusCompleted There is no more content.
        ///
        /// @return The status of the operation.
        virtual RvfsStatus next(ByteBuffer *chunk) = 0;
    };

    /// @brief Creates chunk sources over the content of a single file.
    class IChunkProvider {
    public:
        virtual ~IChunkProvider() = default;

        /// @brief Begin fetching content at an offset.
        ///
        /// Each call creates an independent source.
        ///
        /// @param offset The offset of the first byte of the first chunk.
        /// @param source The created source.
        ///
        /// @return The status of the operation.
        virtual RvfsStatus fetch(uint64_t offset, std::unique_ptr<IChunkSource> *source) = 0;
    };

    /// @brief Resolves paths on the client to their metadata.
    class IEntryProvider {
    public:
        virtual ~IEntryProvider() = default;

        /// @brief Get the metadata for a path.
        ///
        /// @retval RvfsStatusAccessDenied The client has not granted access.
        virtual RvfsStatus stat(const VfsPath& path, StatEntry *entry) = 0;

        /// @brief Get the immediate children of a folder.
        ///
        /// @param path The folder to list.
        /// @param children The children, in provider order.
        ///
        /// @retval RvfsStatusAccessDenied The client has not granted access.
        virtual RvfsStatus list(const VfsPath& path, std::vector<StatEntry> *children) = 0;

        /// @brief Ask the client to resynchronize its metadata for a path.
        ///
        /// @param path The path to refresh.
        /// @param depth The number of levels to refresh, 1 refreshes only @p path.
        virtual RvfsStatus refresh(const VfsPath&, int) { return RvfsStatusNotSupported; }
    };

    /// @brief Grants access to file content on the client.
    class IContentProvider {
    public:
        virtual ~IContentProvider() = default;

        /// @brief Check that the client has granted access to its content.
        ///
        /// @retval RvfsStatusAccessDenied The client has not granted access.
        virtual RvfsStatus verifyAccess() = 0;

        /// @brief Get the chunk provider for a file.
        ///
        /// @param path The file to read.
        /// @param provider The chunk provider for the content of @p path.
        virtual RvfsStatus content(const VfsPath& path, std::unique_ptr<IChunkProvider> *provider) = 0;
    };
}
