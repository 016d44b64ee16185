#include <gtest/gtest.h>
#include <cstdint>

#include "fs/stream.hpp"

#include "test/fs/fs_test.hpp"

using namespace rvfs;

static constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyz";

class BufferedStreamTest : public testing::Test {
public:
    static constexpr size_t kChunkSize = 4;

    ChunkLog log;
    BufferedStream stream{std::make_unique<CountingChunkProvider>(kAlphabet, kChunkSize, &log)};

    std::string Read(int64_t size) {
        ByteBuffer data;
        RvfsStatus status = stream.read(size, &data);
        EXPECT_EQ(status, RvfsStatusSuccess);
        return ToString(data);
    }

    std::string ReadChunk(int64_t size) {
        ByteBuffer data;
        RvfsStatus status = stream.readChunk(size, &data);
        EXPECT_EQ(status, RvfsStatusSuccess);
        return ToString(data);
    }

    uint64_t Seek(int64_t offset, SeekOrigin origin = SeekOrigin::eBegin) {
        uint64_t position = 0;
        RvfsStatus status = stream.seek(offset, origin, &position);
        EXPECT_EQ(status, RvfsStatusSuccess);
        return position;
    }

    void TearDown() override {
        EXPECT_TRUE(stream.state().verify());
    }
};

TEST_F(BufferedStreamTest, Construct) {
    ASSERT_EQ(stream.tell(), 0);
    ASSERT_TRUE(log.fetches.empty());
    ASSERT_FALSE(stream.isClosed());
}

TEST_F(BufferedStreamTest, ReadAll) {
    ASSERT_EQ(Read(kReadAll), kAlphabet);
    ASSERT_EQ(stream.tell(), kAlphabet.size());
    ASSERT_EQ(log.fetches, std::vector<uint64_t>{0});
}

TEST_F(BufferedStreamTest, ReadAcrossChunks) {
    ASSERT_EQ(Read(10), "abcdefghij");
    ASSERT_EQ(stream.tell(), 10);
    ASSERT_EQ(log.fetches.size(), 1);
    ASSERT_EQ(log.chunks, 3);
}

TEST_F(BufferedStreamTest, ReadPastEnd) {
    Seek(20);
    ASSERT_EQ(Read(100), "uvwxyz");
    ASSERT_EQ(stream.tell(), 26);
    ASSERT_EQ(Read(1), "");
    ASSERT_EQ(stream.tell(), 26);
}

TEST_F(BufferedStreamTest, ReadZero) {
    ASSERT_EQ(Read(0), "");
    ASSERT_TRUE(log.fetches.empty());
}

TEST_F(BufferedStreamTest, ReadChunkRefillsEmptyBufferOnce) {
    ASSERT_EQ(ReadChunk(10), "abcd");
    ASSERT_EQ(log.chunks, 1);
    ASSERT_EQ(stream.tell(), 4);
}

TEST_F(BufferedStreamTest, ReadChunkDrainsBufferWithoutRefill) {
    ASSERT_EQ(Read(1), "a");
    ASSERT_EQ(log.chunks, 1);

    ASSERT_EQ(ReadChunk(10), "bcd");
    ASSERT_EQ(log.chunks, 1);

    ASSERT_EQ(ReadChunk(2), "ef");
    ASSERT_EQ(log.chunks, 2);
    ASSERT_EQ(stream.tell(), 6);
}

TEST_F(BufferedStreamTest, ReadChunkAll) {
    ASSERT_EQ(Read(1), "a");
    ASSERT_EQ(ReadChunk(kReadAll), "bcd");
    ASSERT_EQ(ReadChunk(kReadAll), "efgh");
}

TEST_F(BufferedStreamTest, ReadChunkAtEnd) {
    Read(kReadAll);
    ASSERT_EQ(ReadChunk(10), "");
    ASSERT_EQ(stream.tell(), 26);
}

TEST_F(BufferedStreamTest, ReadInto) {
    char buffer[8]{};
    ReadRequest request { .begin = buffer, .end = buffer + sizeof(buffer) };
    ReadResult result{};

    RvfsStatus status = stream.readInto(request, &result);
    ASSERT_EQ(status, RvfsStatusSuccess);
    ASSERT_EQ(result.read, 4);
    ASSERT_EQ(std::string_view(buffer, result.read), "abcd");
}

TEST_F(BufferedStreamTest, SeekWithinBuffer) {
    ASSERT_EQ(Read(2), "ab");

    ASSERT_EQ(Seek(0), 0);
    ASSERT_EQ(Seek(3), 3);
    ASSERT_EQ(log.fetches.size(), 1);

    ASSERT_EQ(Read(2), "de");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST_F(BufferedStreamTest, SeekBackwardWithinBuffer) {
    ASSERT_EQ(Read(3), "abc");
    ASSERT_EQ(Seek(1), 1);
    ASSERT_EQ(Read(2), "bc");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST_F(BufferedStreamTest, SeekToBufferEnd) {
    ASSERT_EQ(Read(2), "ab");

    // The end of the buffer is part of the buffer range.
    ASSERT_EQ(Seek(4), 4);
    ASSERT_EQ(log.fetches.size(), 1);

    ASSERT_EQ(stream.state().cursor, stream.state().buffer.size());

    ASSERT_EQ(Read(1), "e");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST_F(BufferedStreamTest, SeekOutsideBufferIsLazy) {
    ASSERT_EQ(Read(2), "ab");

    ASSERT_EQ(Seek(10), 10);
    ASSERT_EQ(log.fetches.size(), 1);
    ASSERT_EQ(stream.tell(), 10);

    ASSERT_EQ(Read(3), "klm");
    ASSERT_EQ(log.fetches, (std::vector<uint64_t>{0, 10}));
}

TEST_F(BufferedStreamTest, SeekPastBufferEnd) {
    ASSERT_EQ(Read(2), "ab");

    ASSERT_EQ(Seek(5), 5);
    ASSERT_EQ(Read(1), "f");
    ASSERT_EQ(log.fetches, (std::vector<uint64_t>{0, 5}));
}

TEST_F(BufferedStreamTest, SeekBeforeBuffer) {
    ASSERT_EQ(Read(6), "abcdef");

    ASSERT_EQ(Seek(1), 1);
    ASSERT_EQ(Read(2), "bc");
    ASSERT_EQ(log.fetches, (std::vector<uint64_t>{0, 1}));
}

TEST_F(BufferedStreamTest, RepeatedSeeksOutsideFetchOnce) {
    Seek(10);
    Seek(20);
    Seek(15);
    ASSERT_TRUE(log.fetches.empty());

    ASSERT_EQ(Read(1), "p");
    ASSERT_EQ(log.fetches, std::vector<uint64_t>{15});
}

TEST_F(BufferedStreamTest, SeekBeforeFirstRead) {
    ASSERT_EQ(Seek(0), 0);
    ASSERT_TRUE(log.fetches.empty());

    ASSERT_EQ(Read(1), "a");
    ASSERT_EQ(log.fetches, std::vector<uint64_t>{0});
}

TEST_F(BufferedStreamTest, SeekCurrent) {
    ASSERT_EQ(Read(2), "ab");
    ASSERT_EQ(Seek(1, SeekOrigin::eCurrent), 3);
    ASSERT_EQ(Seek(-2, SeekOrigin::eCurrent), 1);
    ASSERT_EQ(Read(1), "b");
}

TEST_F(BufferedStreamTest, SeekNegative) {
    uint64_t position = 0;
    ASSERT_EQ(stream.seek(-1, SeekOrigin::eBegin, &position), RvfsStatusInvalidInput);
    ASSERT_EQ(stream.seek(-1, SeekOrigin::eCurrent, &position), RvfsStatusInvalidInput);
    ASSERT_EQ(stream.tell(), 0);
}

TEST_F(BufferedStreamTest, SeekCurrentOverflow) {
    ASSERT_EQ(Read(2), "ab");

    uint64_t position = 0;
    ASSERT_EQ(stream.seek(INT64_MAX, SeekOrigin::eCurrent, &position), RvfsStatusInvalidInput);
    ASSERT_EQ(stream.tell(), 2);

    ASSERT_EQ(Read(2), "cd");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST_F(BufferedStreamTest, SeekEndNotSupported) {
    uint64_t position = 0;
    ASSERT_EQ(stream.seek(0, SeekOrigin::eEnd, &position), RvfsStatusNotSupported);
}

TEST_F(BufferedStreamTest, SeekRestartsAfterEnd) {
    ASSERT_EQ(Read(kReadAll), kAlphabet);

    ASSERT_EQ(Seek(0), 0);
    ASSERT_EQ(Read(3), "abc");
    ASSERT_EQ(log.fetches, (std::vector<uint64_t>{0, 0}));
}

TEST_F(BufferedStreamTest, SeekToPositionAtEnd) {
    ASSERT_EQ(Read(kReadAll), kAlphabet);

    ASSERT_EQ(Seek(26), 26);
    ASSERT_EQ(Read(kReadAll), "");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST_F(BufferedStreamTest, Close) {
    ASSERT_EQ(Read(3), "abc");

    stream.close();
    ASSERT_TRUE(stream.isClosed());

    ByteBuffer data;
    uint64_t position = 0;
    ASSERT_EQ(stream.read(1, &data), RvfsStatusInvalidHandle);
    ASSERT_EQ(stream.readChunk(1, &data), RvfsStatusInvalidHandle);
    ASSERT_EQ(stream.seek(0, SeekOrigin::eBegin, &position), RvfsStatusInvalidHandle);

    ASSERT_EQ(stream.tell(), 3);

    stream.close();
    ASSERT_TRUE(stream.isClosed());
    ASSERT_TRUE(stream.state().source == nullptr);
}

TEST_F(BufferedStreamTest, WriteNotSupported) {
    size_t written = 0;
    ASSERT_EQ(stream.write("a", 1, &written), RvfsStatusNotSupported);
    ASSERT_EQ(stream.truncate(0), RvfsStatusNotSupported);

    ASSERT_TRUE(stream.canRead());
    ASSERT_TRUE(stream.canSeek());
    ASSERT_FALSE(stream.canWrite());
}

TEST_F(BufferedStreamTest, FetchFailure) {
    log.fetchFailure = RvfsStatusAccessDenied;

    ByteBuffer data;
    ASSERT_EQ(stream.read(3, &data), RvfsStatusAccessDenied);
    ASSERT_TRUE(data.empty());
    ASSERT_EQ(stream.tell(), 0);

    ASSERT_EQ(Read(3), "abc");
    ASSERT_EQ(log.fetches, (std::vector<uint64_t>{0, 0}));
}

TEST_F(BufferedStreamTest, ChunkFailureKeepsConsumedBytes) {
    ASSERT_EQ(Read(2), "ab");

    log.nextFailure = RvfsStatusNotFound;

    ByteBuffer data;
    ASSERT_EQ(stream.read(4, &data), RvfsStatusNotFound);
    ASSERT_EQ(ToString(data), "cd");
    ASSERT_EQ(stream.tell(), 4);

    ASSERT_EQ(Read(2), "ef");
    ASSERT_EQ(log.fetches.size(), 1);
}

TEST(BufferedStreamEmptyChunkTest, InvalidData) {
    BufferedStream stream{std::make_unique<EmptyChunkProvider>()};

    ByteBuffer data;
    ASSERT_EQ(stream.read(1, &data), RvfsStatusInvalidData);
    ASSERT_TRUE(stream.state().verify());
}

TEST(BufferedStreamSplitTest, SplitReadsMatchSingleRead) {
    for (size_t chunkSize : { 1, 3, 4, 7, 26, 64 }) {
        for (int64_t split = 0; split <= 28; split++) {
            ChunkLog splitLog;
            BufferedStream splitStream{std::make_unique<CountingChunkProvider>(kAlphabet, chunkSize, &splitLog)};

            ByteBuffer first;
            ByteBuffer second;
            ASSERT_EQ(splitStream.read(split, &first), RvfsStatusSuccess);
            ASSERT_EQ(splitStream.read(28 - split, &second), RvfsStatusSuccess);

            ChunkLog wholeLog;
            BufferedStream wholeStream{std::make_unique<CountingChunkProvider>(kAlphabet, chunkSize, &wholeLog)};

            ByteBuffer whole;
            ASSERT_EQ(wholeStream.read(28, &whole), RvfsStatusSuccess);

            ASSERT_EQ(ToString(first) + ToString(second), ToString(whole))
                << "chunk size " << chunkSize << " split " << split;
        }
    }
}
