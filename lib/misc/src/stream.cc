#include <squall/io/stream.h>

namespace squall {
namespace io {


stream_reader::~stream_reader() noexcept {}

stream_writer::~stream_writer() noexcept {}


}} /* namespace squall::io */
