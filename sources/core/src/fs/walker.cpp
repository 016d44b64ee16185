#include "fs/walker.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

#include <algorithm>
#include <iterator>

using namespace rvfs;

static RvfsStatus SetFailure(WalkFailure *failure, RvfsStatus status, const VfsPath& path) {
    if (failure != nullptr) {
        failure->status = status;
        failure->path = path;
    }

    return status;
}

DirectoryWalker::DirectoryWalker(IEntryProvider *provider)
    : mProvider(provider)
{
    RVFS_ASSERT(mProvider != nullptr);
}

RvfsStatus DirectoryWalker::walk(const VfsPath& path, int depth, std::vector<StatEntry> *entries, WalkFailure *failure) {
    if (depth < 1) {
        return RvfsStatusSuccess;
    }

    StatEntry entry;
    if (RvfsStatus status = mProvider->stat(path, &entry)) {
        return SetFailure(failure, status, path);
    }

    if (!entry.isFolder()) {
        return SetFailure(failure, RvfsStatusTraverseNonFolder, path);
    }

    std::vector<StatEntry> children;
    if (RvfsStatus status = mProvider->list(path, &children)) {
        return SetFailure(failure, status, path);
    }

    //
    // Descendants are gathered separately so that all of the
    // immediate children come before any of their contents.
    //
    std::vector<StatEntry> descendants;
    if (depth > 1) {
        for (const StatEntry& child : children) {
            //
            // Each child reports into its own record, an absorbed
            // failure must not leak out of a successful listing.
            //
            WalkFailure childFailure;
            RvfsStatus status = walk(child.path, depth - 1, &descendants, &childFailure);
            if (status == RvfsStatusTraverseNonFolder) {
                continue;
            }

            if (RVFS_ERROR(status)) {
                return SetFailure(failure, childFailure.status, childFailure.path);
            }
        }
    }

    entries->insert(entries->end(), std::make_move_iterator(children.begin()), std::make_move_iterator(children.end()));
    entries->insert(entries->end(), std::make_move_iterator(descendants.begin()), std::make_move_iterator(descendants.end()));

    return RvfsStatusSuccess;
}

RvfsStatus DirectoryWalker::list(const VfsPath& path, int depth, std::vector<StatEntry> *entries, WalkFailure *failure) {
    std::vector<StatEntry> result;
    if (RvfsStatus status = walk(path, depth, &result, failure)) {
        VfsLog.dbgf("Failed to list '", path, "': ", RvfsStatusId(status));
        return status;
    }

    *entries = std::move(result);
    return RvfsStatusSuccess;
}

RvfsStatus DirectoryWalker::refresh(const VfsPath& path, int depth) {
    return mProvider->refresh(path, std::max(depth, 1));
}
