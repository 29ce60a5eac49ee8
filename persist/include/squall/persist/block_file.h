#ifndef SQUALL_PERSIST_BLOCK_FILE_H
#define SQUALL_PERSIST_BLOCK_FILE_H

///\file
///\ingroup persist

#include <squall/persist/persist_export_.h>
#include <squall/persist/persisted_data_header.h>
#include <squall/io/fd.h>

namespace squall {
namespace persist {


///\brief A header read from a block file, and where its payload starts.
struct header_location {
  persisted_data_header header;
  io::fd::offset_type header_offset;
  ///\brief Offset of the first payload element, directly after the header.
  io::fd::offset_type payload_offset;
};

/**
 * \brief Read the block header at \p off in \p file.
 * \throw varint::varint_stream_end if the file ends inside the header.
 */
squall_persist_export_
auto read_header(const io::fd& file, io::fd::offset_type off = 0)
-> header_location;

/**
 * \brief Write \p hdr at \p off in \p file.
 *
 * If the write fails, any bytes it added past the original end of file
 * are removed again by truncating the file to its original size.
 * Bytes it overwrote inside the original file are not restored.
 *
 * \return the offset at which the payload is to be written.
 */
squall_persist_export_
auto write_header(io::fd& file, io::fd::offset_type off,
    const persisted_data_header& hdr)
-> io::fd::offset_type;


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_BLOCK_FILE_H */
