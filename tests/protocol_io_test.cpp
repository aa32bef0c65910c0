// ============================================================
// protocol_io_test.cpp -- Wire codec tests
// ============================================================

#include "../common/protocol_io.hpp"
#include "../common/read_buffer.hpp"
#include "../common/write_buffer.hpp"
#include "../common/errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

//=============================================================================
// Encoding
//=============================================================================

TEST(ProtocolEncodeTest, StringIsU16BigEndianLengthThenBytes) {
    std::vector<u8> out;
    proto::put_string(out, "abc");
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0], 0x00);
    EXPECT_EQ(out[1], 0x03);
    EXPECT_EQ(std::string(out.begin() + 2, out.end()), "abc");
}

TEST(ProtocolEncodeTest, U64IsBigEndian) {
    std::vector<u8> out;
    proto::put_u64(out, 0x0102030405060708ull);
    std::vector<u8> expected = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(out, expected);
}

TEST(ProtocolEncodeTest, OverlongStringRejected) {
    std::vector<u8> out;
    std::string max(MAX_WIRE_STRING_LEN, 'x');
    EXPECT_NO_THROW(proto::put_string(out, max));
    EXPECT_THROW(proto::put_string(out, max + "x"), std::length_error);
}

TEST(ProtocolEncodeTest, HeaderLayout) {
    FileRecordHeader h;
    h.digest       = "d";
    h.name         = "n.txt";
    h.payload_size = 300;
    auto bytes = proto::encode_record_header(h);

    std::vector<u8> expected = {0, 1, 'd', 0, 5, 'n', '.', 't', 'x', 't',
                                0, 0, 0, 0, 0, 0, 1, 44};
    EXPECT_EQ(bytes, expected);
}

/**
 * @test The terminator carries no payloadSize field
 */
TEST(ProtocolEncodeTest, TerminatorHasNoSizeField) {
    auto bytes = proto::encode_terminator();
    std::vector<u8> expected = {0, 0, 0, 0};
    EXPECT_EQ(bytes, expected);
}

//=============================================================================
// Decoding over a real socket
//=============================================================================

class ProtocolSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto p = test_util::connected_pair();
        client_ = std::move(p.first);
        server_ = std::move(p.second);
    }

    // Send raw bytes from a background thread, optionally one byte at a time
    std::thread send_async(std::vector<u8> bytes, bool trickle = false, bool close_after = true) {
        return std::thread([this, bytes = std::move(bytes), trickle, close_after]() {
            if (trickle) {
                for (u8 b : bytes) {
                    client_.send_all(&b, 1);
                }
            } else if (!bytes.empty()) {
                client_.send_all(bytes.data(), bytes.size());
            }
            if (close_after) client_.shutdown_write();
        });
    }

    TcpSocket client_;
    TcpSocket server_;
};

TEST_F(ProtocolSocketTest, RecordRoundTripAcrossManySmallReads) {
    auto payload = test_util::random_bytes(20000, 11);
    FileRecordHeader h;
    h.digest       = std::string(64, 'a');
    h.name         = "big.bin";
    h.payload_size = payload.size();

    std::thread writer([&]() {
        TcpWriteBuffer out(client_);
        u64 chunks = proto::write_record(out, h, payload.data());
        EXPECT_EQ(chunks, 3u);   // 8192 + 8192 + 3616
        proto::write_terminator(out);
        out.flush();
        client_.shutdown_write();
    });

    // Tiny buffer: every field arrives in several pieces
    TcpReadBuffer in(server_, 7);
    FileRecordHeader got;
    ASSERT_EQ(proto::read_record_header(in, got), proto::HeaderStatus::OK);
    EXPECT_EQ(got.digest, h.digest);
    EXPECT_EQ(got.name, h.name);
    ASSERT_EQ(got.payload_size, payload.size());

    std::vector<u8> body(got.payload_size);
    in.read_exact(body.data(), body.size(), "payload");
    EXPECT_EQ(body, payload);

    FileRecordHeader term;
    EXPECT_EQ(proto::read_record_header(in, term), proto::HeaderStatus::TERMINATOR);
    EXPECT_TRUE(term.is_terminator());
    EXPECT_EQ(term.payload_size, 0u);

    FileRecordHeader after;
    EXPECT_EQ(proto::read_record_header(in, after), proto::HeaderStatus::PEER_CLOSED);
    writer.join();
}

TEST_F(ProtocolSocketTest, TrickledHeaderIsReassembled) {
    FileRecordHeader h;
    h.digest       = "abc";
    h.name         = "dir/file.txt";
    h.payload_size = 0;
    auto t = send_async(proto::encode_record_header(h), true);

    TcpReadBuffer in(server_);
    FileRecordHeader got;
    ASSERT_EQ(proto::read_record_header(in, got), proto::HeaderStatus::OK);
    EXPECT_EQ(got.digest, "abc");
    EXPECT_EQ(got.name, "dir/file.txt");
    EXPECT_EQ(got.payload_size, 0u);
    t.join();
}

TEST_F(ProtocolSocketTest, TerminatorWithAnyDigest) {
    FileRecordHeader h;
    h.digest = "ignored";
    auto t = send_async(proto::encode_record_header(h));

    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_EQ(proto::read_record_header(in, got), proto::HeaderStatus::TERMINATOR);
    t.join();
}

TEST_F(ProtocolSocketTest, CleanCloseBeforeHeaderIsPeerClosed) {
    auto t = send_async({});
    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_EQ(proto::read_record_header(in, got), proto::HeaderStatus::PEER_CLOSED);
    t.join();
}

TEST_F(ProtocolSocketTest, CloseInsideHeaderIsUnexpectedEof) {
    FileRecordHeader h;
    h.digest       = std::string(64, 'f');
    h.name         = "x";
    h.payload_size = 10;
    auto bytes = proto::encode_record_header(h);
    bytes.resize(bytes.size() - 3);   // cut inside payloadSize
    auto t = send_async(bytes);

    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_THROW(proto::read_record_header(in, got), UnexpectedEof);
    t.join();
}

TEST_F(ProtocolSocketTest, CloseAfterOneLengthByteIsUnexpectedEof) {
    auto t = send_async({0x00});
    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_THROW(proto::read_record_header(in, got), UnexpectedEof);
    t.join();
}

TEST_F(ProtocolSocketTest, ShortPayloadIsUnexpectedEof) {
    auto t = send_async(test_util::random_bytes(100));
    TcpReadBuffer in(server_);
    std::vector<u8> body(200);
    EXPECT_THROW(in.read_exact(body.data(), body.size(), "payload"), UnexpectedEof);
    t.join();
}

TEST_F(ProtocolSocketTest, OversizedPayloadIsProtocolError) {
    FileRecordHeader h;
    h.digest       = "d";
    h.name         = "huge";
    h.payload_size = 1ull << 40;
    auto t = send_async(proto::encode_record_header(h));

    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_THROW(proto::read_record_header(in, got, 1024 * 1024), ProtocolError);
    t.join();
}

TEST_F(ProtocolSocketTest, IdleTimeoutRaisesReadTimeout) {
    server_.set_recv_timeout_ms(100);
    TcpReadBuffer in(server_);
    FileRecordHeader got;
    EXPECT_THROW(proto::read_record_header(in, got), ReadTimeout);
}

TEST(ProtocolWriteTest, WriteRecordRejectsTerminatorHeader) {
    auto p = test_util::connected_pair();
    TcpWriteBuffer out(p.first);
    FileRecordHeader h;
    EXPECT_THROW(proto::write_record(out, h, nullptr), std::invalid_argument);
}
