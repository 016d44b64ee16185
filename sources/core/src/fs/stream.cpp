#include "fs/stream.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

#include <algorithm>
#include <cstring>

using namespace rvfs;

bool StreamState::verify() const {
    if (cursor > buffer.size()) {
        return false;
    }

    if (cursor > position) {
        return false;
    }

    if (eof && !isBufferEmpty()) {
        return false;
    }

    if (closed && (source != nullptr || !buffer.empty())) {
        return false;
    }

    return true;
}

BufferedStream::BufferedStream(std::unique_ptr<IChunkProvider> provider)
    : mProvider(std::move(provider))
{
    RVFS_ASSERT(mProvider != nullptr);
}

void BufferedStream::checkState() const {
    RVFS_CHECK(mState.verify(), "Stream state is inconsistent");
}

RvfsStatus BufferedStream::loadBuffer() {
    if (mState.eof) {
        return RvfsStatusSuccess;
    }

    //
    // A seek outside of the buffer drops the source, the replacement
    // is only fetched once content is needed again. The buffer is empty
    // at this point so the origin of the new source is the current position.
    //
    if (mState.source == nullptr) {
        StreamLog.dbgf("Fetching content at offset ", mState.position);

        std::unique_ptr<IChunkSource> source;
        if (RvfsStatus status = mProvider->fetch(mState.position, &source)) {
            StreamLog.warnf("Failed to fetch content at offset ", mState.position, ": ", RvfsStatusId(status));
            return status;
        }

        mState.source = std::move(source);
        mState.buffer.clear();
        mState.cursor = 0;
    }

    ByteBuffer chunk;
    RvfsStatus status = mState.source->next(&chunk);
    switch (status) {
    case RvfsStatusSuccess:
        if (chunk.empty()) {
            StreamLog.warnf("Chunk source produced an empty chunk at offset ", mState.position);
            return RvfsStatusInvalidData;
        }

        mState.buffer = std::move(chunk);
        mState.cursor = 0;
        return RvfsStatusSuccess;

    case RvfsStatusCompleted:
        //
        // The exhausted source is kept so that a seek to the current
        // position followed by a read does not fetch again.
        //
        mState.buffer.clear();
        mState.cursor = 0;
        mState.eof = true;
        return RvfsStatusSuccess;

    default:
        return status;
    }
}

void BufferedStream::consume(size_t count, ByteBuffer *data) {
    auto front = mState.buffer.begin() + mState.cursor;
    data->insert(data->end(), front, front + count);

    mState.cursor += count;
    mState.position += count;
}

RvfsStatus BufferedStream::readFromBuffer(int64_t size, ByteBuffer *data) {
    if (mState.isBufferEmpty()) {
        if (RvfsStatus status = loadBuffer()) {
            return status;
        }
    }

    size_t available = mState.available();
    size_t count = (size < 0) ? available : std::min<size_t>(size, available);

    consume(count, data);
    return RvfsStatusSuccess;
}

RvfsStatus BufferedStream::read(int64_t size, ByteBuffer *data) {
    if (mState.closed) {
        return RvfsStatusInvalidHandle;
    }

    data->clear();

    while (!mState.eof && (size < 0 || data->size() < uint64_t(size))) {
        int64_t remaining = (size < 0) ? kReadAll : size - int64_t(data->size());
        if (RvfsStatus status = readFromBuffer(remaining, data)) {
            checkState();
            return status;
        }
    }

    checkState();
    return RvfsStatusSuccess;
}

RvfsStatus BufferedStream::readChunk(int64_t size, ByteBuffer *data) {
    if (mState.closed) {
        return RvfsStatusInvalidHandle;
    }

    data->clear();

    if (size == 0) {
        return RvfsStatusSuccess;
    }

    //
    // Only an empty buffer may be refilled, and only once. A buffer
    // with unread bytes satisfies the read on its own even if that
    // leaves it short.
    //
    if (mState.isBufferEmpty()) {
        if (mState.eof) {
            return RvfsStatusSuccess;
        }

        if (RvfsStatus status = loadBuffer()) {
            checkState();
            return status;
        }
    }

    size_t available = mState.available();
    size_t count = (size < 0) ? available : std::min<size_t>(size, available);
    consume(count, data);

    checkState();
    return RvfsStatusSuccess;
}

RvfsStatus BufferedStream::readInto(ReadRequest request, ReadResult *result) {
    ByteBuffer data;
    if (RvfsStatus status = readChunk(request.size(), &data)) {
        return status;
    }

    if (!data.empty()) {
        std::memcpy(request.begin, data.data(), data.size());
    }

    result->read = data.size();
    return RvfsStatusSuccess;
}

RvfsStatus BufferedStream::seek(int64_t offset, SeekOrigin origin, uint64_t *position) {
    if (mState.closed) {
        return RvfsStatusInvalidHandle;
    }

    int64_t target = 0;
    switch (origin) {
    case SeekOrigin::eBegin:
        target = offset;
        break;
    case SeekOrigin::eCurrent:
        if (__builtin_add_overflow(int64_t(mState.position), offset, &target)) {
            return RvfsStatusInvalidInput;
        }
        break;
    default:
        StreamLog.warnf("Unsupported seek origin ", int(origin));
        return RvfsStatusNotSupported;
    }

    if (target < 0) {
        return RvfsStatusInvalidInput;
    }

    uint64_t newPosition = uint64_t(target);

    //
    // Both ends of the buffer are inclusive, seeking to the end of
    // the buffer keeps the source so the next read continues from it.
    //
    if (mState.bufferStart() <= newPosition && newPosition <= mState.bufferEnd()) {
        mState.cursor = size_t(newPosition - mState.bufferStart());
        mState.position = newPosition;
    } else {
        mState.source.reset();
        mState.buffer.clear();
        mState.cursor = 0;
        mState.position = newPosition;
    }

    mState.eof = false;

    checkState();

    *position = mState.position;
    return RvfsStatusSuccess;
}

uint64_t BufferedStream::tell() const {
    return mState.position;
}

void BufferedStream::close() {
    mState.closed = true;
    mState.eof = false;
    mState.source.reset();
    mState.buffer.clear();
    mState.buffer.shrink_to_fit();
    mState.cursor = 0;

    checkState();
}

bool BufferedStream::isClosed() const {
    return mState.closed;
}
