#pragma once

#include "fs/config.hpp"
#include "fs/stream.hpp"
#include "fs/walker.hpp"

#include <optional>

namespace rvfs {
    /// @brief A request that was refused because the client has not approved access.
    struct ApprovalFailure {
        /// @brief The client that refused the request.
        ClientId client;

        /// @brief The resource in the remote vfs, for example "fs/os/etc/hosts".
        VfsString resource;
    };

    /// @brief Read only access to the filesystem of one client.
    ///
    /// Access denied failures reported by the providers are surfaced as
    /// @a RvfsStatusApprovalMissing, the refused resource is available from
    /// @a VfsClient::lastApprovalFailure.
    ///
    /// The providers are bound to the namespace named by @a VfsConfig::pathPrefix
    /// and are always called with client paths.
    class VfsClient {
        VfsConfig mConfig;
        IEntryProvider *mEntries;
        IContentProvider *mContent;
        DirectoryWalker mWalker;
        std::optional<ApprovalFailure> mApprovalFailure;

        VfsClient(VfsConfig config, IEntryProvider *entries, IContentProvider *content);

        RvfsStatus approvalMissing(const VfsPath& path);

    public:
        RVFS_NOCOPY(VfsClient);
        RVFS_NOMOVE(VfsClient);

        /// @brief Create a client.
        ///
        /// Applies the configured log level to the global log queue.
        ///
        /// @param config The client configuration.
        /// @param entries The provider used for listing and refreshing.
        /// @param content The provider used for opening files.
        /// @param client The created client.
        ///
        /// @retval RvfsStatusInvalidInput The configuration is invalid or a provider is missing.
        static RvfsStatus create(VfsConfig config, IEntryProvider *entries, IContentProvider *content, std::unique_ptr<VfsClient> *client);

        /// @brief List the contents of a folder.
        ///
        /// @see DirectoryWalker::list
        ///
        /// @retval RvfsStatusApprovalMissing The client has not approved access to a listed path.
        /// @retval RvfsStatusTraverseNonFolder @p path is not a folder.
        RvfsStatus list(const VfsPath& path, int depth, std::vector<StatEntry> *entries);

        /// @brief List the contents of a folder to the configured default depth.
        RvfsStatus list(const VfsPath& path, std::vector<StatEntry> *entries);

        /// @brief Ask the client to resynchronize a path.
        ///
        /// @retval RvfsStatusApprovalMissing The client has not approved access to @p path.
        RvfsStatus refresh(const VfsPath& path, int depth = 1);

        /// @brief Open a file for reading.
        ///
        /// @param path The file to open.
        /// @param stream The opened stream, content is fetched on the first read.
        ///
        /// @retval RvfsStatusApprovalMissing The client has not approved access to its content.
        RvfsStatus open(const VfsPath& path, std::unique_ptr<IReadStream> *stream);

        const ClientId& clientId() const { return mConfig.clientId; }
        const VfsConfig& config() const { return mConfig; }

        /// @brief The most recent request that failed for lack of approval.
        const std::optional<ApprovalFailure>& lastApprovalFailure() const { return mApprovalFailure; }
    };
}
