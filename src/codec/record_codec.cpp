#include "codec/record_codec.hpp"
#include <boost/log/trivial.hpp>
#include <limits>
#include <sstream>

namespace histvault::codec {

//==============================================
// SERIALIZATION
//==============================================

std::vector<uint8_t> RecordCodec::encode_payload(const history::HistoryRecord& record) {
  std::stringstream output;

  write_bytes(output, &FORMAT_VERSION, sizeof(FORMAT_VERSION));
  write_string(output, record.command);
  write_string(output, record.cwd);
  write_string(output, record.session);
  write_int64(output, record.exit);
  write_int64(output, record.duration);

  auto bytes = to_bytes(output.str());
  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded payload of record " << record.id
                           << " into " << bytes.size() << " bytes";
  return bytes;
}

std::vector<uint8_t> RecordCodec::encode_metadata(const std::string& id, history::Timestamp timestamp,
                                                  const std::string& hostname) {
  std::stringstream output;

  write_bytes(output, &FORMAT_VERSION, sizeof(FORMAT_VERSION));
  write_string(output, id);
  write_int64(output, history::to_nanos(timestamp));
  write_string(output, hostname);

  return to_bytes(output.str());
}

//==============================================
// DESERIALIZATION
//==============================================

void RecordCodec::decode_payload(const std::vector<uint8_t>& bytes, history::HistoryRecord& record) {
  std::stringstream input(std::string(bytes.begin(), bytes.end()));
  const std::size_t total = bytes.size();

  uint8_t version = 0;
  read_bytes(input, &version, sizeof(version));
  if (version != FORMAT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unsupported payload version: " << static_cast<int>(version);
    throw CodecError("Unsupported payload version " + std::to_string(version));
  }

  auto remaining = [&]() {
    return total - static_cast<std::size_t>(input.tellg());
  };

  record.command = read_string(input, remaining());
  record.cwd = read_string(input, remaining());
  record.session = read_string(input, remaining());
  record.exit = read_int64(input);
  record.duration = read_int64(input);

  if (input.peek() != std::char_traits<char>::eof()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Trailing bytes after payload of record " << record.id;
    throw CodecError("Trailing bytes after payload");
  }
}

//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Failed to write to output stream");
  }
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Failed to read from input stream");
  }
}

void RecordCodec::write_string(std::ostream& output, const std::string& value) {
  if (value.size() > std::numeric_limits<uint32_t>::max()) {
    throw CodecError("Field of " + std::to_string(value.size()) + " bytes exceeds length prefix");
  }
  // Write length in network byte order, then the raw bytes
  uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  if (!value.empty()) {
    write_bytes(output, value.data(), value.size());
  }
}

std::string RecordCodec::read_string(std::istream& input, std::size_t remaining) {
  uint32_t network_length = 0;
  read_bytes(input, &network_length, sizeof(network_length));
  const uint32_t length = boost::endian::big_to_native(network_length);

  if (length > remaining - sizeof(network_length)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Field length " << length << " exceeds remaining input";
    throw CodecError("Field length exceeds input");
  }

  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, value.data(), length);
  }
  return value;
}

void RecordCodec::write_int64(std::ostream& output, int64_t value) {
  int64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

int64_t RecordCodec::read_int64(std::istream& input) {
  int64_t network_value = 0;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

std::vector<uint8_t> RecordCodec::to_bytes(const std::string& buffer) {
  return std::vector<uint8_t>(buffer.begin(), buffer.end());
}

} // namespace histvault::codec
