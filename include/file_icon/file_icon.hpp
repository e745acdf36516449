#ifndef FILE_ICON_FILE_ICON_HPP_
#define FILE_ICON_FILE_ICON_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/surface.hpp>
#include <file_icon/raw_bitmap.hpp>
#include <file_icon/icon_source.hpp>
#include <file_icon/metrics.hpp>
#include <file_icon/log.hpp>
#include <file_icon/base64.hpp>
#include <file_icon/extractor.hpp>
#include <file_icon/codecs/png.hpp>
#include <file_icon/sources/file_source.hpp>
#include <file_icon/sources/shell_source.hpp>

namespace file_icon {

// All public API is included via the headers above.
// See:
//   - types.hpp:      icon_size, output_format, extract_error, extract_result, extract_options
//   - surface.hpp:    surface interface, pixel_buffer
//   - raw_bitmap.hpp: raw_bitmap, convert_bitmap()
//   - icon_source.hpp: icon_source / icon_handle interfaces, make_default_source()
//   - extractor.hpp:  icon_extractor, encoded_image, extract()
//   - metrics.hpp:    metrics_sink, counting_metrics
//   - log.hpp:        leveled logging with a replaceable sink
//   - base64.hpp:     base64 and data URL encoding
//   - codecs/png.hpp: PNG encode/decode (lodepng)
//   - sources/*.hpp:  Windows shell source, portable ICO/executable source

} // namespace file_icon

#endif // FILE_ICON_FILE_ICON_HPP_
