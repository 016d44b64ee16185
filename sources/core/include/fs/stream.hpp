#pragma once

#include "fs/base.hpp"

#include "util/util.hpp"

namespace rvfs {
    enum class SeekOrigin {
        eBegin,
        eCurrent,
        eEnd,
    };

    /// @brief Passed as a read size to read until the end of the content.
    static constexpr int64_t kReadAll = -1;

    /// @brief A readable, positioned stream of bytes.
    ///
    /// Streams are not internally synchronized, each reader must use its own stream.
    class IReadStream {
    public:
        virtual ~IReadStream() = default;

        /// @brief Read up to @p size bytes, fetching as many chunks as needed.
        ///
        /// @param size The number of bytes to read, or @a kReadAll.
        /// @param data The bytes read, fewer than @p size only at the end of the content.
        ///             On failure this holds the bytes consumed before the failure.
        ///
        /// @retval RvfsStatusInvalidHandle The stream has been closed.
        ///
        /// @return The status of the read operation.
        virtual RvfsStatus read(int64_t size, ByteBuffer *data) = 0;

        /// @brief Read up to @p size bytes from at most one chunk.
        ///
        /// @param size The maximum number of bytes to read, or @a kReadAll.
        /// @param data The bytes read.
        ///
        /// @retval RvfsStatusInvalidHandle The stream has been closed.
        ///
        /// @return The status of the read operation.
        virtual RvfsStatus readChunk(int64_t size, ByteBuffer *data) = 0;

        /// @brief Read from at most one chunk into a caller provided buffer.
        virtual RvfsStatus readInto(ReadRequest request, ReadResult *result) = 0;

        /// @brief Move the stream position.
        ///
        /// @param offset The offset relative to @p origin.
        /// @param origin The point to seek relative to.
        /// @param position The new absolute position.
        ///
        /// @retval RvfsStatusInvalidHandle The stream has been closed.
        /// @retval RvfsStatusNotSupported The stream does not support @p origin.
        /// @retval RvfsStatusInvalidInput The resulting position would be negative or does not fit in 64 bits.
        ///
        /// @return The status of the seek operation.
        virtual RvfsStatus seek(int64_t offset, SeekOrigin origin, uint64_t *position) = 0;

        /// @brief The offset of the next byte that will be read.
        ///
        /// Remains valid after the stream has been closed.
        virtual uint64_t tell() const = 0;

        /// @brief Release the resources held by the stream.
        ///
        /// Closing a closed stream has no effect.
        virtual void close() = 0;

        virtual bool isClosed() const = 0;

        virtual bool canRead() const { return true; }
        virtual bool canSeek() const { return false; }
        virtual bool canWrite() const { return false; }

        virtual RvfsStatus write(const void *, size_t, size_t *) { return RvfsStatusNotSupported; }
        virtual RvfsStatus truncate(uint64_t) { return RvfsStatusNotSupported; }
        virtual RvfsStatus flush() { return RvfsStatusSuccess; }
    };

    /// @brief The complete mutable state of a @a BufferedStream.
    struct StreamState {
        /// @brief Offset of the next byte to be returned.
        uint64_t position = 0;

        /// @brief The most recently fetched chunk.
        ByteBuffer buffer;

        /// @brief Index of the next unread byte in @a buffer.
        size_t cursor = 0;

        /// @brief The live chunk source, positioned after the end of @a buffer.
        std::unique_ptr<IChunkSource> source;

        /// @brief The source has been exhausted and the buffer is drained.
        bool eof = false;

        bool closed = false;

        uint64_t bufferStart() const { return position - cursor; }
        uint64_t bufferEnd() const { return bufferStart() + buffer.size(); }
        size_t available() const { return buffer.size() - cursor; }
        bool isBufferEmpty() const { return cursor == buffer.size(); }

        /// @brief Check that the state is consistent.
        bool verify() const;
    };

    /// @brief A seekable stream over chunked remote content.
    ///
    /// Seeks that land inside the current buffer reuse it, all other seeks
    /// drop the buffer and defer fetching until the next read.
    class BufferedStream final : public IReadStream {
        std::unique_ptr<IChunkProvider> mProvider;
        StreamState mState;

        RvfsStatus loadBuffer();
        RvfsStatus readFromBuffer(int64_t size, ByteBuffer *data);
        void consume(size_t count, ByteBuffer *data);
        void checkState() const;

    public:
        RVFS_NOCOPY(BufferedStream);
        RVFS_NOMOVE(BufferedStream);

        /// @brief Create a stream over a chunk provider.
        ///
        /// No content is fetched until the first read.
        BufferedStream(std::unique_ptr<IChunkProvider> provider);

        RvfsStatus read(int64_t size, ByteBuffer *data) override;
        RvfsStatus readChunk(int64_t size, ByteBuffer *data) override;
        RvfsStatus readInto(ReadRequest request, ReadResult *result) override;
        RvfsStatus seek(int64_t offset, SeekOrigin origin, uint64_t *position) override;
        uint64_t tell() const override;
        void close() override;
        bool isClosed() const override;

        bool canSeek() const override { return true; }

        const StreamState& state() const { return mState; }
    };
}
