#ifndef BRUSHKIT_BRUSHKIT_HPP_
#define BRUSHKIT_BRUSHKIT_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/types.hpp>
#include <brushkit/byte_cursor.hpp>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/parameter_value.hpp>
#include <brushkit/brush.hpp>
#include <brushkit/rle.hpp>
#include <brushkit/descriptor.hpp>
#include <brushkit/boundary_scan.hpp>
#include <brushkit/containers.hpp>
#include <brushkit/png.hpp>
#include <brushkit/codec.hpp>
#include <brushkit/formats/gbr.hpp>
#include <brushkit/formats/abr.hpp>
#include <brushkit/formats/abr_legacy.hpp>
#include <brushkit/formats/brushset.hpp>
#include <brushkit/formats/sut.hpp>

namespace brushkit {

// All public API is included via the headers above.
// See:
//   - types.hpp:           decode_error, decode_result, decode_options, format_version
//   - pixel_matrix.hpp:    pixel_matrix
//   - parameter_value.hpp: parameter_value, parameter_map, unit_float
//   - brush.hpp:           brush_sample, parsed_brush_file
//   - descriptor.hpp:      Photoshop action descriptor parser
//   - boundary_scan.hpp:   find_embedded_image()
//   - containers.hpp:      archive, property list, table and bitmap provider interfaces
//   - png.hpp:             png_bitmap_decoder, encode_png(), save_png()
//   - codec.hpp:           decoder, decoder_registry, parse(), format_for_extension()
//   - formats/*.hpp:       Individual brush formats

} // namespace brushkit

#endif // BRUSHKIT_BRUSHKIT_HPP_
