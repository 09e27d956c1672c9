#ifndef HISTVAULT_CODEC_RECORD_CODEC_HPP
#define HISTVAULT_CODEC_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "history/history.hpp"
#include "codec/codec_error.hpp"

namespace histvault::codec {

/*
 * Compact binary form of a record, used as the plaintext that gets encrypted.
 *
 * Payload layout (all integers big endian):
 *   u8  version
 *   u32 command length, command bytes
 *   u32 cwd length,     cwd bytes
 *   u32 session length, session bytes
 *   i64 exit
 *   i64 duration
 *
 * Metadata layout, used as associated data:
 *   u8  version
 *   u32 id length,       id bytes
 *   i64 timestamp (nanoseconds since epoch)
 *   u32 hostname length, hostname bytes
 */
class RecordCodec {
public:
  static constexpr uint8_t FORMAT_VERSION = 1;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes the payload fields of a record
  static std::vector<uint8_t> encode_payload(const history::HistoryRecord& record);
  // Fills the payload fields of record from bytes; id, timestamp and hostname are untouched
  static void decode_payload(const std::vector<uint8_t>& bytes, history::HistoryRecord& record);
  // Serializes the cleartext metadata (id, timestamp, hostname)
  static std::vector<uint8_t> encode_metadata(const std::string& id, history::Timestamp timestamp,
                                              const std::string& hostname);

private:
  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size);
  static void write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input, std::size_t remaining);
  static void write_int64(std::ostream& output, int64_t value);
  static int64_t read_int64(std::istream& input);

  static std::vector<uint8_t> to_bytes(const std::string& buffer);
};

} // namespace histvault::codec

#endif // HISTVAULT_CODEC_RECORD_CODEC_HPP
