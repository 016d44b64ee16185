#include "fs/vfs.hpp"

#include "logger/categories.hpp"

using namespace rvfs;

namespace {
    RvfsStatus TranslateAccess(RvfsStatus status) {
        return (status == RvfsStatusAccessDenied) ? RvfsStatusApprovalMissing : status;
    }

    class ApprovalChunkSource final : public IChunkSource {
        std::unique_ptr<IChunkSource> mSource;
        const ApprovalFailure *mIdentity;

    public:
        ApprovalChunkSource(std::unique_ptr<IChunkSource> source, const ApprovalFailure *identity)
            : mSource(std::move(source))
            , mIdentity(identity)
        { }

        RvfsStatus next(ByteBuffer *chunk) override {
            RvfsStatus status = mSource->next(chunk);
            if (status == RvfsStatusAccessDenied) {
                VfsLog.warnf("Approval missing for '", mIdentity->resource, "' on ", mIdentity->client);
            }

            return TranslateAccess(status);
        }
    };

    /// @brief Surfaces access denied content fetches as missing approval.
    class ApprovalChunkProvider final : public IChunkProvider {
        std::unique_ptr<IChunkProvider> mProvider;
        ApprovalFailure mIdentity;

    public:
        ApprovalChunkProvider(std::unique_ptr<IChunkProvider> provider, ApprovalFailure identity)
            : mProvider(std::move(provider))
            , mIdentity(std::move(identity))
        { }

        RvfsStatus fetch(uint64_t offset, std::unique_ptr<IChunkSource> *source) override {
            std::unique_ptr<IChunkSource> inner;
            if (RvfsStatus status = mProvider->fetch(offset, &inner)) {
                if (status == RvfsStatusAccessDenied) {
                    VfsLog.warnf("Approval missing for '", mIdentity.resource, "' on ", mIdentity.client);
                }

                return TranslateAccess(status);
            }

            *source = std::make_unique<ApprovalChunkSource>(std::move(inner), &mIdentity);
            return RvfsStatusSuccess;
        }
    };
}

VfsClient::VfsClient(VfsConfig config, IEntryProvider *entries, IContentProvider *content)
    : mConfig(std::move(config))
    , mEntries(entries)
    , mContent(content)
    , mWalker(entries)
{ }

RvfsStatus VfsClient::create(VfsConfig config, IEntryProvider *entries, IContentProvider *content, std::unique_ptr<VfsClient> *client) {
    if (entries == nullptr || content == nullptr) {
        return RvfsStatusInvalidInput;
    }

    if (RvfsStatus status = config.verify()) {
        VfsLog.warnf("Invalid client configuration: ", RvfsStatusId(status));
        return status;
    }

    LogQueue::getGlobalQueue().setLevel(config.logLevel);

    client->reset(new VfsClient(std::move(config), entries, content));
    return RvfsStatusSuccess;
}

RvfsStatus VfsClient::approvalMissing(const VfsPath& path) {
    ApprovalFailure failure {
        .client = mConfig.clientId,
        .resource = GetVfsPath(mConfig.pathPrefix, path),
    };

    VfsLog.warnf("Approval missing for '", failure.resource, "' on ", failure.client);

    mApprovalFailure = std::move(failure);
    return RvfsStatusApprovalMissing;
}

RvfsStatus VfsClient::list(const VfsPath& path, int depth, std::vector<StatEntry> *entries) {
    WalkFailure failure;
    if (RvfsStatus status = mWalker.list(path, depth, entries, &failure)) {
        if (status == RvfsStatusAccessDenied) {
            return approvalMissing(failure.path);
        }

        return status;
    }

    return RvfsStatusSuccess;
}

RvfsStatus VfsClient::list(const VfsPath& path, std::vector<StatEntry> *entries) {
    return list(path, mConfig.defaultDepth, entries);
}

RvfsStatus VfsClient::refresh(const VfsPath& path, int depth) {
    VfsLog.dbgf("Refreshing '", GetVfsPath(mConfig.pathPrefix, path), "' to depth ", depth);

    if (RvfsStatus status = mWalker.refresh(path, depth)) {
        if (status == RvfsStatusAccessDenied) {
            return approvalMissing(path);
        }

        return status;
    }

    return RvfsStatusSuccess;
}

RvfsStatus VfsClient::open(const VfsPath& path, std::unique_ptr<IReadStream> *stream) {
    if (RvfsStatus status = mContent->verifyAccess()) {
        if (status == RvfsStatusAccessDenied) {
            return approvalMissing(path);
        }

        return status;
    }

    std::unique_ptr<IChunkProvider> content;
    if (RvfsStatus status = mContent->content(path, &content)) {
        if (status == RvfsStatusAccessDenied) {
            return approvalMissing(path);
        }

        return status;
    }

    ApprovalFailure identity {
        .client = mConfig.clientId,
        .resource = GetVfsPath(mConfig.pathPrefix, path),
    };

    auto provider = std::make_unique<ApprovalChunkProvider>(std::move(content), std::move(identity));
    *stream = std::make_unique<BufferedStream>(std::move(provider));
    return RvfsStatusSuccess;
}
