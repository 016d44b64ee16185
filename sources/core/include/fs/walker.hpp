#pragma once

#include "fs/base.hpp"

namespace rvfs {
    /// @brief The failure that aborted a walk.
    struct WalkFailure {
        RvfsStatus status = RvfsStatusSuccess;

        /// @brief The path being resolved or listed when the failure occurred.
        VfsPath path;
    };

    /// @brief Depth bounded recursive listing over an entry provider.
    ///
    /// The walker keeps no state between calls.
    class DirectoryWalker {
        IEntryProvider *mProvider;

        RvfsStatus walk(const VfsPath& path, int depth, std::vector<StatEntry> *entries, WalkFailure *failure);

    public:
        DirectoryWalker(IEntryProvider *provider);

        /// @brief List the contents of a folder.
        ///
        /// Entries are ordered with the immediate children of @p path first, followed by
        /// the descendants of each child in provider order. Children that turn out not to
        /// be folders are skipped when descending, any other failure aborts the listing.
        ///
        /// @param path The folder to list.
        /// @param depth The number of levels to list, 1 lists only the immediate children.
        /// @param entries The listed entries.
        /// @param failure Details of the failure, only set when the listing fails.
        ///
        /// @retval RvfsStatusTraverseNonFolder @p path is not a folder.
        /// @retval RvfsStatusAccessDenied The provider denied access to a path.
        ///
        /// @return The status of the list operation.
        RvfsStatus list(const VfsPath& path, int depth, std::vector<StatEntry> *entries, WalkFailure *failure = nullptr);

        /// @brief Ask the provider to resynchronize a path.
        ///
        /// @param path The path to refresh.
        /// @param depth The number of levels to refresh, values below 1 refresh only @p path.
        ///
        /// @return The status of the refresh operation.
        RvfsStatus refresh(const VfsPath& path, int depth);
    };
}
