/**
 * @file frame_protocol_test.cpp
 * @brief Unit tests for the session frame writer and reader
 *
 * Tests round trips, exact wire layout, truncation at every offset,
 * malformed preambles and writer-side framing enforcement. Everything runs
 * over MemoryStream; no sockets or files.
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/FrameProtocol.h"
#include "quicksend/TransportStream.h"
#include "quicksend/config.h"
#include <gtest/gtest.h>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

using namespace QuickSend;

namespace {

struct TestEntry {
    std::string path;
    std::string content;
};

void appendU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void appendU64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void appendString(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

std::vector<uint8_t> preamble(uint8_t version, uint32_t count, const std::string& hint) {
    std::vector<uint8_t> out = {'s', 'f', '-', version};
    appendU32(out, count);
    appendU32(out, static_cast<uint32_t>(hint.size()));
    appendString(out, hint);
    return out;
}

/**
 * @brief Encode entries with FrameWriter; boundaries receives every offset
 *        at which a new record (entry or end marker) starts
 */
std::vector<uint8_t> encodeSession(const std::vector<TestEntry>& entries,
                                   const std::string& hint,
                                   std::set<size_t>* boundaries = nullptr) {
    MemoryStream stream;
    FrameWriter writer(stream);
    TransferError error;

    SessionHeader header;
    header.entryCount = static_cast<uint32_t>(entries.size());
    header.prefixHint = hint;
    EXPECT_TRUE(writer.writeSessionHeader(header, error)) << error.toString();
    if (boundaries) boundaries->insert(stream.data().size());

    for (const auto& e : entries) {
        FileEntry entry;
        entry.path = e.path;
        entry.size = e.content.size();
        EXPECT_TRUE(writer.writeEntryHeader(entry, error)) << error.toString();
        EXPECT_TRUE(writer.writeContent(reinterpret_cast<const uint8_t*>(e.content.data()),
                                        e.content.size(), error)) << error.toString();
        if (boundaries) boundaries->insert(stream.data().size());
    }

    EXPECT_TRUE(writer.writeEndOfStream(error)) << error.toString();
    return stream.data();
}

/**
 * @brief Decode a whole session; chunkSize bounds every content read
 */
bool decodeSession(TransportStream& stream, SessionHeader& header,
                   std::vector<TestEntry>& entries, TransferError& error,
                   size_t chunkSize = 7) {
    FrameReader reader(stream);
    if (!reader.readSessionHeader(header, error)) {
        return false;
    }

    std::vector<uint8_t> buffer(chunkSize);
    while (true) {
        FileEntry entry;
        bool endOfStream = false;
        if (!reader.nextEntry(entry, endOfStream, error)) {
            return false;
        }
        if (endOfStream) {
            return true;
        }

        TestEntry decoded;
        decoded.path = entry.path;
        while (reader.remainingContent() > 0) {
            size_t bytesRead = 0;
            if (!reader.readContent(buffer.data(), buffer.size(), bytesRead, error)) {
                return false;
            }
            EXPECT_LE(bytesRead, chunkSize);
            decoded.content.append(reinterpret_cast<const char*>(buffer.data()), bytesRead);
        }
        EXPECT_EQ(decoded.content.size(), entry.size);
        entries.push_back(decoded);
    }
}

}  // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Test fixture with a representative entry set
 */
class FrameProtocolTest : public ::testing::Test {
protected:
    std::vector<TestEntry> sample;

    void SetUp() override {
        sample = {
            {"a.txt", "foo"},
            {"sub/b.txt", ""},
            {"/abs/path/with space/c.bin", std::string("\x00\x01\xff\xfe binary", 11)},
            {"C:\\Users\\x\\d.txt", std::string(100, 'z')},
        };
    }
};

//=============================================================================
// Round Trip Tests
//=============================================================================

/**
 * @test A session with zero entries round-trips
 */
TEST_F(FrameProtocolTest, ZeroEntriesRoundTrip) {
    MemoryStream stream(encodeSession({}, ""));

    SessionHeader header;
    std::vector<TestEntry> decoded;
    TransferError error;
    ASSERT_TRUE(decodeSession(stream, header, decoded, error)) << error.toString();

    EXPECT_EQ(header.entryCount, 0u);
    EXPECT_TRUE(header.prefixHint.empty());
    EXPECT_TRUE(decoded.empty());
    EXPECT_EQ(stream.remaining(), 0u);
}

/**
 * @test Paths, sizes and contents come back identical and in order
 */
TEST_F(FrameProtocolTest, MultipleEntriesRoundTrip) {
    MemoryStream stream(encodeSession(sample, "hint/"));

    SessionHeader header;
    std::vector<TestEntry> decoded;
    TransferError error;
    ASSERT_TRUE(decodeSession(stream, header, decoded, error)) << error.toString();

    EXPECT_EQ(header.version, PROTOCOL_VERSION);
    EXPECT_EQ(header.entryCount, sample.size());
    EXPECT_EQ(header.prefixHint, "hint/");
    ASSERT_EQ(decoded.size(), sample.size());
    for (size_t i = 0; i < sample.size(); ++i) {
        EXPECT_EQ(decoded[i].path, sample[i].path) << "entry " << i;
        EXPECT_EQ(decoded[i].content, sample[i].content) << "entry " << i;
    }
}

/**
 * @test Content larger than the read buffer is delivered in bounded chunks
 */
TEST_F(FrameProtocolTest, LargeContentReadInChunks) {
    std::string big(10000, '\0');
    for (size_t i = 0; i < big.size(); ++i) {
        big[i] = static_cast<char>(i * 31);
    }
    MemoryStream stream(encodeSession({{"big.bin", big}}, ""));

    SessionHeader header;
    std::vector<TestEntry> decoded;
    TransferError error;
    ASSERT_TRUE(decodeSession(stream, header, decoded, error, 4096)) << error.toString();
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].content, big);
}

//=============================================================================
// Wire Layout Tests
//=============================================================================

/**
 * @test Encoded bytes match the documented big-endian layout exactly
 */
TEST_F(FrameProtocolTest, WireLayoutIsBigEndian) {
    std::vector<uint8_t> expected = preamble(PROTOCOL_VERSION, 1, "p/");
    appendU32(expected, 5);
    appendString(expected, "a.txt");
    appendU64(expected, 3);
    appendString(expected, "foo");
    appendU32(expected, 0xFFFFFFFFu);

    EXPECT_EQ(encodeSession({{"a.txt", "foo"}}, "p/"), expected);
}

//=============================================================================
// Truncation Tests
//=============================================================================

/**
 * @test Cutting the stream at any offset fails; CONNECTION exactly at record
 *       boundaries (before the end marker), FRAMING inside any field
 */
TEST_F(FrameProtocolTest, TruncationAtEveryOffset) {
    std::set<size_t> boundaries;
    const std::vector<uint8_t> full = encodeSession(sample, "", &boundaries);
    boundaries.insert(0);  // Nothing at all received

    for (size_t cut = 0; cut < full.size(); ++cut) {
        MemoryStream stream(std::vector<uint8_t>(full.begin(), full.begin() + cut));

        SessionHeader header;
        std::vector<TestEntry> decoded;
        TransferError error;
        ASSERT_FALSE(decodeSession(stream, header, decoded, error)) << "cut at " << cut;

        if (boundaries.count(cut) != 0) {
            EXPECT_EQ(error.kind, ErrorKind::CONNECTION) << "cut at " << cut << ": " << error.toString();
        } else {
            EXPECT_EQ(error.kind, ErrorKind::FRAMING) << "cut at " << cut << ": " << error.toString();
        }
    }
}

/**
 * @test A transport failure in the middle of content is a connection error
 */
TEST_F(FrameProtocolTest, TransportFailureIsConnectionError) {
    std::vector<uint8_t> data = encodeSession({{"x.bin", std::string(50, 'x')}}, "");
    MemoryStream stream(data);
    stream.setReadFailureAt(data.size() - 20);

    SessionHeader header;
    std::vector<TestEntry> decoded;
    TransferError error;
    EXPECT_FALSE(decodeSession(stream, header, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::CONNECTION);
}

//=============================================================================
// Malformed Input Tests
//=============================================================================

TEST_F(FrameProtocolTest, BadMagicRejected) {
    std::vector<uint8_t> data = preamble(PROTOCOL_VERSION, 0, "");
    data[0] = 'X';
    appendU32(data, 0xFFFFFFFFu);
    MemoryStream stream(data);

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    EXPECT_FALSE(reader.readSessionHeader(header, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

TEST_F(FrameProtocolTest, UnsupportedVersionRejected) {
    std::vector<uint8_t> data = preamble(3, 0, "");
    appendU32(data, 0xFFFFFFFFu);
    MemoryStream stream(data);

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    EXPECT_FALSE(reader.readSessionHeader(header, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
    EXPECT_NE(error.message.find("version"), std::string::npos);
}

/**
 * @test An oversized path length fails before any path byte is read
 */
TEST_F(FrameProtocolTest, OversizedPathRejected) {
    std::vector<uint8_t> data = preamble(PROTOCOL_VERSION, 1, "");
    appendU32(data, MAX_PATH_BYTES + 1);
    MemoryStream stream(data);

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    ASSERT_TRUE(reader.readSessionHeader(header, error));

    FileEntry entry;
    bool endOfStream = false;
    EXPECT_FALSE(reader.nextEntry(entry, endOfStream, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

TEST_F(FrameProtocolTest, OversizedHintRejected) {
    std::vector<uint8_t> data = {'s', 'f', '-', PROTOCOL_VERSION};
    appendU32(data, 2);
    appendU32(data, MAX_PATH_BYTES + 1);
    MemoryStream stream(data);

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    EXPECT_FALSE(reader.readSessionHeader(header, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

/**
 * @test End marker after fewer entries than announced is a framing error
 */
TEST_F(FrameProtocolTest, EntryCountMismatchRejected) {
    std::vector<uint8_t> data = preamble(PROTOCOL_VERSION, 2, "");
    appendU32(data, 1);
    appendString(data, "a");
    appendU64(data, 0);
    appendU32(data, 0xFFFFFFFFu);
    MemoryStream stream(data);

    SessionHeader header;
    std::vector<TestEntry> decoded;
    TransferError error;
    EXPECT_FALSE(decodeSession(stream, header, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
    EXPECT_EQ(decoded.size(), 1u);
}

/**
 * @test A record beyond the announced count is refused before it is returned
 */
TEST_F(FrameProtocolTest, ExtraEntryRejectedBeforeDecode) {
    std::vector<uint8_t> data = preamble(PROTOCOL_VERSION, 1, "");
    appendU32(data, 1);
    appendString(data, "a");
    appendU64(data, 0);
    appendU32(data, 1);
    appendString(data, "b");
    appendU64(data, 0);
    appendU32(data, 0xFFFFFFFFu);
    MemoryStream stream(data);

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    ASSERT_TRUE(reader.readSessionHeader(header, error)) << error.toString();

    FileEntry entry;
    bool endOfStream = false;
    ASSERT_TRUE(reader.nextEntry(entry, endOfStream, error)) << error.toString();
    EXPECT_EQ(entry.path, "a");

    FileEntry extra;
    EXPECT_FALSE(reader.nextEntry(extra, endOfStream, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
    EXPECT_FALSE(endOfStream);
    EXPECT_TRUE(extra.path.empty());
    EXPECT_EQ(reader.entriesRead(), 1u);
}

/**
 * @test Asking for the next entry before draining content is refused
 */
TEST_F(FrameProtocolTest, NextEntryRequiresDrainedContent) {
    MemoryStream stream(encodeSession({{"a", "abc"}, {"b", "d"}}, ""));

    FrameReader reader(stream);
    SessionHeader header;
    TransferError error;
    ASSERT_TRUE(reader.readSessionHeader(header, error));

    FileEntry entry;
    bool endOfStream = false;
    ASSERT_TRUE(reader.nextEntry(entry, endOfStream, error));
    EXPECT_FALSE(reader.nextEntry(entry, endOfStream, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

//=============================================================================
// Writer Enforcement Tests
//=============================================================================

/**
 * @test Content beyond the declared length is refused without touching the stream
 */
TEST_F(FrameProtocolTest, WriterRejectsExcessContent) {
    MemoryStream stream;
    FrameWriter writer(stream);
    TransferError error;

    SessionHeader header;
    header.entryCount = 1;
    ASSERT_TRUE(writer.writeSessionHeader(header, error));
    ASSERT_TRUE(writer.writeEntryHeader({"a", 2}, error));

    const size_t before = stream.data().size();
    const uint8_t data[3] = {1, 2, 3};
    EXPECT_FALSE(writer.writeContent(data, sizeof(data), error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
    EXPECT_EQ(stream.data().size(), before);
}

TEST_F(FrameProtocolTest, WriterRejectsEntryBeforeContentComplete) {
    MemoryStream stream;
    FrameWriter writer(stream);
    TransferError error;

    SessionHeader header;
    header.entryCount = 2;
    ASSERT_TRUE(writer.writeSessionHeader(header, error));
    ASSERT_TRUE(writer.writeEntryHeader({"a", 2}, error));

    EXPECT_FALSE(writer.writeEntryHeader({"b", 0}, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);

    error.clear();
    EXPECT_FALSE(writer.writeEndOfStream(error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

TEST_F(FrameProtocolTest, WriterRejectsEntryCountMismatch) {
    MemoryStream stream;
    FrameWriter writer(stream);
    TransferError error;

    SessionHeader header;
    header.entryCount = 2;
    ASSERT_TRUE(writer.writeSessionHeader(header, error));
    ASSERT_TRUE(writer.writeEntryHeader({"a", 0}, error));

    EXPECT_FALSE(writer.writeEndOfStream(error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
}

TEST_F(FrameProtocolTest, WriterRejectsEntryWithoutHeader) {
    MemoryStream stream;
    FrameWriter writer(stream);
    TransferError error;

    EXPECT_FALSE(writer.writeEntryHeader({"a", 0}, error));
    EXPECT_EQ(error.kind, ErrorKind::FRAMING);
    EXPECT_TRUE(stream.data().empty());
}

/**
 * @test A failing transport surfaces as a connection error
 */
TEST_F(FrameProtocolTest, WriterSendFailureIsConnectionError) {
    MemoryStream stream;
    stream.setWriteLimit(30);
    FrameWriter writer(stream);
    TransferError error;

    SessionHeader header;
    header.entryCount = 1;
    ASSERT_TRUE(writer.writeSessionHeader(header, error));
    ASSERT_TRUE(writer.writeEntryHeader({"a", 64}, error));

    std::vector<uint8_t> content(64, 0xAB);
    EXPECT_FALSE(writer.writeContent(content.data(), content.size(), error));
    EXPECT_EQ(error.kind, ErrorKind::CONNECTION);
}
