#pragma once

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    class memory_reader;

    // Decodes the record at the reader's position and leaves the reader
    // just past its CRC. Error messages use the reader's offset, so the
    // same routine serves standalone decoding and whole-file parsing.
    chunk read_chunk(memory_reader& in, const parse_options& options);

}
