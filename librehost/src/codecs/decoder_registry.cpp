#include "../../include/image_codec.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/raster_decoders.hpp"
#include <algorithm>
#include <array>

namespace rehost {

const IImageDecoder* find_decoder(const std::string_view mime) {
    // decoders are stateless, one shared instance each
    static const JpegDecoder jpeg;
    static const PngDecoder png;
    static const GifDecoder gif;
    static const WebpDecoder webp;
    static const TiffDecoder tiff;
    static const std::array<const IImageDecoder*, 5> decoders = {&jpeg, &png, &gif, &webp, &tiff};

    for (const auto* decoder : decoders) {
        const auto mimes = decoder->get_supported_mime_types();
        if (std::ranges::find(mimes, mime) != mimes.end()) {
            return decoder;
        }
    }
    return nullptr;
}

} // namespace rehost
