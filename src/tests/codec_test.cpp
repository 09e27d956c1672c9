#include <gtest/gtest.h>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include "codec/record_codec.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::codec;

class RecordCodecTest : public ::testing::Test {
protected:
    history::HistoryRecord record;

    void SetUp() override {
        test::init_test_logging();
        record = test::make_record("laptop:alice", 1619353000, "git commit -m \"wip\"");
        record.exit = 1;
        record.duration = 42000000;
    }

    // Copies only the cleartext fields, as decryption does
    history::HistoryRecord metadata_only() const {
        history::HistoryRecord decoded;
        decoded.id = record.id;
        decoded.timestamp = record.timestamp;
        decoded.hostname = record.hostname;
        return decoded;
    }
};

TEST_F(RecordCodecTest, PayloadRoundTrip) {
    const auto bytes = RecordCodec::encode_payload(record);

    auto decoded = metadata_only();
    RecordCodec::decode_payload(bytes, decoded);
    EXPECT_EQ(decoded, record);
}

TEST_F(RecordCodecTest, EmptyAndUnicodeFields) {
    record.command = "echo 'héllo wörld' \xF0\x9F\x98\x80";
    record.cwd = "";
    record.session = "";
    record.exit = -1;
    record.duration = -1;

    auto decoded = metadata_only();
    RecordCodec::decode_payload(RecordCodec::encode_payload(record), decoded);
    EXPECT_EQ(decoded, record);
}

TEST_F(RecordCodecTest, PayloadLayoutIsBigEndian) {
    record.command = "ab";
    record.cwd = "";
    record.session = "";
    record.exit = 1;
    record.duration = 2;

    const auto bytes = RecordCodec::encode_payload(record);
    // version + (4 + 2) + 4 + 4 + 8 + 8
    ASSERT_EQ(bytes.size(), 1u + 6u + 4u + 4u + 8u + 8u);
    EXPECT_EQ(bytes[0], RecordCodec::FORMAT_VERSION);
    EXPECT_EQ(bytes[1], 0);
    EXPECT_EQ(bytes[4], 2);
    EXPECT_EQ(bytes[5], 'a');
    EXPECT_EQ(bytes[6], 'b');
    EXPECT_EQ(bytes[bytes.size() - 9], 1);
    EXPECT_EQ(bytes.back(), 2);
}

TEST_F(RecordCodecTest, RejectsUnknownVersion) {
    auto bytes = RecordCodec::encode_payload(record);
    bytes[0] = RecordCodec::FORMAT_VERSION + 1;

    auto decoded = metadata_only();
    EXPECT_THROW(RecordCodec::decode_payload(bytes, decoded), CodecError);
}

TEST_F(RecordCodecTest, RejectsTruncatedPayload) {
    const auto bytes = RecordCodec::encode_payload(record);

    for (std::size_t size : {std::size_t{0}, std::size_t{1}, std::size_t{5}, bytes.size() - 1}) {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(size));
        auto decoded = metadata_only();
        EXPECT_THROW(RecordCodec::decode_payload(truncated, decoded), CodecError) << "size " << size;
    }
}

TEST_F(RecordCodecTest, RejectsOversizedLengthPrefix) {
    auto bytes = RecordCodec::encode_payload(record);
    const uint32_t huge = boost::endian::native_to_big(uint32_t{0x7fffffff});
    std::memcpy(&bytes[1], &huge, sizeof(huge));

    auto decoded = metadata_only();
    EXPECT_THROW(RecordCodec::decode_payload(bytes, decoded), CodecError);
}

TEST_F(RecordCodecTest, RejectsTrailingBytes) {
    auto bytes = RecordCodec::encode_payload(record);
    bytes.push_back(0);

    auto decoded = metadata_only();
    EXPECT_THROW(RecordCodec::decode_payload(bytes, decoded), CodecError);
}

TEST_F(RecordCodecTest, MetadataDependsOnEveryField) {
    const auto base = RecordCodec::encode_metadata(record.id, record.timestamp, record.hostname);

    EXPECT_NE(base, RecordCodec::encode_metadata(history::uuid_v4(), record.timestamp, record.hostname));
    EXPECT_NE(base, RecordCodec::encode_metadata(record.id, record.timestamp + std::chrono::nanoseconds(1),
                                                 record.hostname));
    EXPECT_NE(base, RecordCodec::encode_metadata(record.id, record.timestamp, "desktop:alice"));
    EXPECT_EQ(base, RecordCodec::encode_metadata(record.id, record.timestamp, record.hostname));
}
