#include "../../include/zopflipng_optimizer.hpp"
#include "../../include/logger.hpp"
#include <zopflipng_lib.h>
#include <stdexcept>
#include <vector>

namespace rehost {

Bytes ZopfliPngOptimizer::optimize(const std::span<const std::uint8_t> png) const {
    ZopfliPNGOptions opts;
    opts.lossy_transparent = false;
    opts.lossy_8bit = false;
    opts.use_zopfli = true;
    opts.num_iterations = iterations_;
    opts.num_iterations_large = iterations_large_;
    opts.keepchunks.clear();

    const std::vector<unsigned char> origpng(png.begin(), png.end());
    std::vector<unsigned char> resultpng;
    if (const int rc = ZopfliPNGOptimize(origpng, opts, false, &resultpng); rc != 0) {
        throw std::runtime_error("ZopfliPNGOptimize failed with code " + std::to_string(rc));
    }

    if (Logger::enabled(LogLevel::Debug)) {
        Logger::log(LogLevel::Debug,
                    "ZopfliPNG: " + std::to_string(origpng.size()) + " -> " + std::to_string(resultpng.size()) + " bytes",
                    "zopflipng_optimizer");
    }
    return Bytes(resultpng.begin(), resultpng.end());
}

} // namespace rehost
