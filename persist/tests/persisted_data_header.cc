#include <squall/persist/persisted_data_header.h>
#include <squall/persist/persist_exception.h>
#include <squall/varint/varint_stream.h>
#include <squall/io/stream.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <vector>
#include "hacks.h"
#include "UnitTest++/UnitTest++.h"

using namespace squall::persist;
using squall::time_point;
using squall::varint::varint_bytevector_ostream;
using squall::varint::varint_bytespan_istream;

namespace {


/* Refuses every write. */
class rejecting_writer
: public squall::io::stream_writer
{
 public:
  std::size_t write(const void*, std::size_t) override { return 0; }
  void close() override {}
};

/* Keeps up to limit bytes, then refuses further writes. */
class short_writer
: public squall::io::stream_writer
{
 public:
  explicit short_writer(std::size_t limit) : limit_(limit) {}

  std::size_t write(const void* buf, std::size_t len) override {
    const std::size_t wlen = std::min(len, limit_ - data.size());
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(buf);
    data.insert(data.end(), p, p + wlen);
    return wlen;
  }

  void close() override {}

  std::vector<std::uint8_t> data;

 private:
  std::size_t limit_;
};

auto requests_header() -> persisted_data_header {
  return persisted_data_header(
      "requests",
      time_point("2015-01-01T00:00:00Z"),
      time_point("2015-01-01T00:01:00Z"),
      persisted_data_type::hit_count,
      { persisted_data_source("agent1") },
      dimension_set(),
      42);
}

const std::vector<std::uint8_t> REQUESTS_BYTES = make_byte_vector({
    8, 'r', 'e', 'q', 'u', 'e', 's', 't', 's', // name
    0x80, 0xc0, 0xd5, 0xac, 0xd4, 0x52, // start time
    0xc0, 0xe9, 0xdc, 0xac, 0xd4, 0x52, // end time
    0x00, // data type: HitCount
    0x02, // 1 source
    6, 'a', 'g', 'e', 'n', 't', '1', 0x00, // source: agent1, unknown status
    0x00, // no dimensions
    42 // data count
});


} /* namespace <anonymous> */

TEST(encode_requests) {
  varint_bytevector_ostream<> out;
  const std::uint64_t size = requests_header().encode(out);

  CHECK_EQUAL(33u, size);
  CHECK_EQUAL(REQUESTS_BYTES.size(), out.size());
  CHECK_ARRAY_EQUAL(REQUESTS_BYTES, out.as_vector(), REQUESTS_BYTES.size());
  CHECK_EQUAL(size, requests_header().serialized_size());
}

TEST(decode_requests) {
  varint_bytespan_istream in = varint_bytespan_istream(REQUESTS_BYTES);
  const auto decoded = persisted_data_header::decode(in);

  CHECK_EQUAL(33u, decoded.serialized_size);
  CHECK_EQUAL(requests_header(), decoded.header);
  CHECK_EQUAL("requests", decoded.header.name());
  CHECK_EQUAL(time_point("2015-01-01T00:00:00Z"), decoded.header.start_time());
  CHECK_EQUAL(time_point("2015-01-01T00:01:00Z"), decoded.header.end_time());
  CHECK(decoded.header.data_type() == persisted_data_type::hit_count);
  CHECK_EQUAL(1u, decoded.header.sources().size());
  CHECK_EQUAL("agent1", decoded.header.sources().front().name());
  CHECK_EQUAL(true, decoded.header.dimensions().empty());
  CHECK_EQUAL(42u, decoded.header.data_count());
  CHECK_EQUAL(true, in.at_end());
}

TEST(round_trip) {
  const persisted_data_header hdr = persisted_data_header(
      "latency",
      time_point(-5000),
      time_point(1420070400123ll),
      persisted_data_type::variable_encoded_histogram,
      {
        persisted_data_source("web01", persisted_data_source_status::available),
        persisted_data_source("web02", persisted_data_source_status::partial)
      },
      dimension_set({ "host", "endpoint", "status" }),
      0xffffffffu);

  varint_bytevector_ostream<> out;
  const std::uint64_t written = hdr.encode(out);

  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());
  const auto decoded = persisted_data_header::decode(in);

  CHECK_EQUAL(hdr, decoded.header);
  CHECK_EQUAL(written, decoded.serialized_size);
  CHECK_EQUAL(out.size(), decoded.serialized_size);
  CHECK_EQUAL(written, hdr.serialized_size());
}

TEST(encoding_is_deterministic) {
  varint_bytevector_ostream<> first, second;
  requests_header().encode(first);

  varint_bytespan_istream in = varint_bytespan_istream(first.as_vector());
  persisted_data_header::decode(in).header.encode(second);

  CHECK_EQUAL(first.size(), second.size());
  CHECK_ARRAY_EQUAL(first.as_vector(), second.as_vector(), first.size());
}

TEST(source_order_preserved) {
  const persisted_data_header::source_list sources = {
    persisted_data_source("C"),
    persisted_data_source("A"),
    persisted_data_source("B")
  };
  const persisted_data_header hdr = persisted_data_header(
      "m", time_point(0), time_point(0), persisted_data_type::hit_count,
      sources, dimension_set(), 0);

  varint_bytevector_ostream<> out;
  hdr.encode(out);
  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());

  CHECK_EQUAL(sources, persisted_data_header::decode(in).header.sources());
}

TEST(sources_are_copied) {
  persisted_data_header::source_list sources = {
    persisted_data_source("agent1")
  };
  const persisted_data_header hdr = persisted_data_header(
      "m", time_point(0), time_point(0), persisted_data_type::hit_count,
      sources, dimension_set(), 0);
  sources.push_back(persisted_data_source("agent2"));

  CHECK_EQUAL(1u, hdr.sources().size());
}

TEST(unknown_data_type_decodes_as_unknown) {
  const persisted_data_header hdr = persisted_data_header(
      "future", time_point(0), time_point(0),
      static_cast<persisted_data_type>(7),
      {}, dimension_set(), 3);

  varint_bytevector_ostream<> out;
  hdr.encode(out);
  CHECK_EQUAL(14u, out.as_vector().at(1 + 6 + 1 + 1)); // ordinal 7, zig-zag

  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());
  const auto decoded = persisted_data_header::decode(in);
  CHECK(decoded.header.data_type() == persisted_data_type::unknown);
  CHECK_EQUAL(3u, decoded.header.data_count());
  CHECK_EQUAL(out.size(), decoded.serialized_size);
}

TEST(end_before_start_accepted) {
  const persisted_data_header hdr = persisted_data_header(
      "backwards", time_point(1000), time_point(0),
      persisted_data_type::hit_count, {}, dimension_set(), 0);

  varint_bytevector_ostream<> out;
  hdr.encode(out);
  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());

  CHECK_EQUAL(hdr, persisted_data_header::decode(in).header);
}

TEST(truncated_decode_fails) {
  // Every proper prefix ends inside some field.
  for (std::size_t len = 0; len < REQUESTS_BYTES.size(); ++len) {
    varint_bytespan_istream in =
        varint_bytespan_istream(REQUESTS_BYTES.data(), len);
    CHECK_THROW(persisted_data_header::decode(in),
        squall::varint::varint_stream_end);
  }
}

TEST(truncated_in_dimension_set) {
  const persisted_data_header hdr = persisted_data_header(
      "m", time_point(0), time_point(0), persisted_data_type::hit_count,
      {}, dimension_set({ "host" }), 1);
  varint_bytevector_ostream<> out;
  hdr.encode(out);

  // Drop the data count and the last character of the dimension name.
  varint_bytespan_istream in =
      varint_bytespan_istream(out.data(), out.size() - 2);
  CHECK_THROW(persisted_data_header::decode(in),
      squall::varint::varint_stream_end);
}

TEST(negative_source_count) {
  const auto data = make_byte_vector({
      0, // name
      0, 0, // start, end
      0, // data type
      0x01, // -1 sources
      0, 0
  });
  varint_bytespan_istream in = varint_bytespan_istream(data);

  CHECK_THROW(persisted_data_header::decode(in),
      squall::varint::varint_exception);
}

TEST(nested_failure_propagates) {
  const auto data = make_byte_vector({
      0, // name
      0, 0, // start, end
      0, // data type
      0, // no sources
      0x04, 1, 'x', 1, 'x', // duplicate dimension
      0
  });
  varint_bytespan_istream in = varint_bytespan_istream(data);

  CHECK_THROW(persisted_data_header::decode(in), persist_exception);
}

TEST(payload_follows_header) {
  varint_bytevector_ostream<> out;
  out.put_string("preamble");
  const std::uint64_t header_size = requests_header().encode(out);
  for (std::uint32_t i = 0; i < requests_header().data_count(); ++i)
    out.put_varuint32(i * 1000u);

  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());
  in.get_string();
  const std::uint64_t header_offset = in.bytes_read();
  const auto decoded = persisted_data_header::decode(in);

  CHECK_EQUAL(header_size, decoded.serialized_size);
  CHECK_EQUAL(header_offset + decoded.serialized_size, in.bytes_read());
  for (std::uint32_t i = 0; i < decoded.header.data_count(); ++i)
    CHECK_EQUAL(i * 1000u, in.get_varuint32());
  CHECK_EQUAL(true, in.at_end());
}

TEST(rejected_encode) {
  auto out = squall::varint::varint_stream_writer<rejecting_writer>(
      rejecting_writer());

  CHECK_THROW(requests_header().encode(out), squall::varint::varint_exception);
  CHECK_EQUAL(0u, out.bytes_written());
}

TEST(partially_accepted_encode) {
  auto out = squall::varint::varint_stream_writer<short_writer>(
      short_writer(5));

  CHECK_THROW(requests_header().encode(out), squall::varint::varint_exception);
  CHECK_EQUAL(5u, out.underlying().data.size());
  CHECK_EQUAL(out.underlying().data.size(), out.bytes_written());
  CHECK_ARRAY_EQUAL(REQUESTS_BYTES, out.underlying().data, 5);
}

TEST(timestamps_outside_calendar) {
  const persisted_data_header hdr = persisted_data_header(
      "far", time_point(253402300800000ll),
      time_point(std::numeric_limits<std::int64_t>::max()),
      persisted_data_type::hit_count, {}, dimension_set(), 1);

  varint_bytevector_ostream<> out;
  hdr.encode(out);
  varint_bytespan_istream in = varint_bytespan_istream(out.as_vector());
  const auto decoded = persisted_data_header::decode(in);
  CHECK_EQUAL(hdr, decoded.header);

  std::ostringstream oss;
  oss << decoded.header;
  CHECK_EQUAL(
      "far [@253402300800000ms, @9223372036854775807ms] HitCount"
      " sources=[] dimensions={} count=1",
      oss.str());
}

TEST(print) {
  std::ostringstream oss;
  oss << requests_header();
  CHECK_EQUAL(
      "requests [2015-01-01T00:00:00Z, 2015-01-01T00:01:00Z] HitCount"
      " sources=[agent1(Unknown)] dimensions={} count=42",
      oss.str());
}

int main() {
  return UnitTest::RunAllTests();
}
