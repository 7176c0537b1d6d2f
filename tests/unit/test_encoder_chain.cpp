#include <catch2/catch_test_macros.hpp>
#include "../../librehost/include/encoder_chain.hpp"
#include "../../librehost/include/encoder_registry.hpp"
#include "../../librehost/include/errors.hpp"
#include "../../librehost/include/mime_detector.hpp"
#include "test_images.hpp"
#include <stdexcept>

using namespace rehost;

namespace {

// Passes the 2x2 availability probe, fails on real images
class FlakyEncoder final : public IImageEncoder {
public:
    explicit FlakyEncoder(const OutputFormat format) : format_(format) {}
    [[nodiscard]] std::string_view get_name() const noexcept override { return "FlakyEncoder"; }
    [[nodiscard]] OutputFormat get_output_format() const noexcept override { return format_; }
    [[nodiscard]] Bytes encode(const RasterImage& image) const override {
        if (image.width > 2) throw std::runtime_error("encoder crashed");
        return {0x01};
    }
private:
    OutputFormat format_;
};

class BrokenEncoder final : public IImageEncoder {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "BrokenEncoder"; }
    [[nodiscard]] OutputFormat get_output_format() const noexcept override { return OutputFormat::PNG; }
    [[nodiscard]] Bytes encode(const RasterImage&) const override {
        throw std::runtime_error("not installed");
    }
};

// Echoes the registry's probe image, then misbehaves as scripted
class ScriptedOptimizer final : public IPngOptimizer {
public:
    enum class Mode { Shrink, Grow, Empty, Throw };
    explicit ScriptedOptimizer(const Mode mode) : mode_(mode) {}
    [[nodiscard]] std::string_view get_name() const noexcept override { return "ScriptedOptimizer"; }
    [[nodiscard]] Bytes optimize(const std::span<const std::uint8_t> png) const override {
        if (!probed_) {
            probed_ = true;
            return {png.begin(), png.end()};
        }
        switch (mode_) {
            case Mode::Shrink: return {png.begin(), png.begin() + 50};
            case Mode::Grow: {
                Bytes out(png.begin(), png.end());
                out.resize(out.size() + 10);
                return out;
            }
            case Mode::Empty: return {};
            case Mode::Throw: break;
        }
        throw std::runtime_error("optimizer crashed");
    }
private:
    Mode mode_;
    mutable bool probed_ = false;
};

ProcessingDecision decision_for(const std::string& mime, const int w, const int h,
                                const OutputFormat format, const int tw = 0, const int th = 0) {
    ProcessingDecision d;
    d.source_mime = mime;
    d.source_width = w;
    d.source_height = h;
    d.target_width = tw > 0 ? tw : w;
    d.target_height = th > 0 ? th : h;
    d.needs_resize = tw > 0;
    d.output_format = format;
    d.has_meaningful_transparency = format == OutputFormat::PNG;
    return d;
}

EncoderFactories jpeg_factories(std::vector<EncoderFactory> jpeg) {
    EncoderFactories f;
    f[OutputFormat::JPEG] = std::move(jpeg);
    f[OutputFormat::PNG] = {[] { return std::make_unique<PngEncoder>(); }};
    return f;
}

} // namespace

TEST_CASE("Registry drops encoders that fail the probe", "[EncoderRegistry]") {
    EncoderFactories factories;
    factories[OutputFormat::PNG] = {
        [] { return std::make_unique<BrokenEncoder>(); },
        [] { return std::make_unique<PngEncoder>(); }
    };
    const EncoderRegistry registry(factories, {});

    REQUIRE(registry.encoders_for(OutputFormat::PNG).size() == 1);
    REQUIRE(registry.encoders_for(OutputFormat::PNG).front()->get_name() == "PngEncoder");
    REQUIRE(registry.encoders_for(OutputFormat::JPEG).empty());
}

TEST_CASE("Default registry provides JPEG and PNG encoders", "[EncoderRegistry]") {
    EncoderConfig config;
    config.png_optimize = false;
    const EncoderRegistry registry(config);

    REQUIRE(registry.encoders_for(OutputFormat::JPEG).size() == 2);
    REQUIRE(registry.encoders_for(OutputFormat::PNG).size() == 1);
    REQUIRE(registry.png_optimizers().empty());
}

TEST_CASE("Pass-through returns the input unchanged", "[EncoderChain]") {
    const EncoderRegistry registry(jpeg_factories({}), {});
    const EncoderChain chain(registry);
    const Bytes png = png_bytes(solid_raster(10, 10, 1, 2, 3));

    ProcessingDecision d = decision_for("image/png", 10, 10, OutputFormat::PNG);
    d.pass_through = true;
    const EncodedImage out = chain.encode(png, d);

    REQUIRE(out.bytes == png);
    REQUIRE(out.mime == "image/png");
    REQUIRE(out.width == 10);
    REQUIRE(out.height == 10);
}

TEST_CASE("Pass-through of corrupt bytes fails", "[EncoderChain]") {
    const EncoderRegistry registry(jpeg_factories({}), {});
    const EncoderChain chain(registry);
    Bytes png = png_bytes(gradient_raster(16, 16));
    png.resize(png.size() / 2);

    ProcessingDecision d = decision_for("image/png", 16, 16, OutputFormat::PNG);
    d.pass_through = true;
    try {
        (void)chain.encode(png, d);
        FAIL("corrupt pass-through accepted");
    } catch (const RehostError& e) {
        REQUIRE(e.kind() == ErrorKind::EncodingFailed);
    }
}

TEST_CASE("JPEG encoding falls back in priority order", "[EncoderChain]") {
    const EncoderRegistry registry(jpeg_factories({
        [] { return std::make_unique<FlakyEncoder>(OutputFormat::JPEG); },
        [] { return std::make_unique<JpegEncoder>("BaselineJpegEncoder", 85, false, true); }
    }), {});
    REQUIRE(registry.encoders_for(OutputFormat::JPEG).size() == 2);

    const EncoderChain chain(registry);
    const Bytes png = png_bytes(gradient_raster(64, 32));
    const EncodedImage out = chain.encode(png, decision_for("image/png", 64, 32, OutputFormat::JPEG));

    REQUIRE(out.mime == "image/jpeg");
    REQUIRE(MimeDetector::detect_by_signature(out.bytes) == "image/jpeg");
    REQUIRE(out.width == 64);
    REQUIRE(out.height == 32);
}

TEST_CASE("Resizing honours the decision", "[EncoderChain]") {
    const EncoderRegistry registry(jpeg_factories({
        [] { return std::make_unique<JpegEncoder>("ProgressiveJpegEncoder", 92, true, false); }
    }), {});
    const EncoderChain chain(registry);
    const Bytes jpeg = jpeg_bytes(gradient_raster(200, 100));

    const EncodedImage out = chain.encode(jpeg, decision_for("image/jpeg", 200, 100, OutputFormat::JPEG, 64, 32));

    REQUIRE(out.mime == "image/jpeg");
    REQUIRE(out.width == 64);
    REQUIRE(out.height == 32);
}

TEST_CASE("All JPEG encoders failing stores the pre-encode bytes", "[EncoderChain]") {
    const EncoderRegistry registry(jpeg_factories({
        [] { return std::make_unique<FlakyEncoder>(OutputFormat::JPEG); }
    }), {});
    const EncoderChain chain(registry);
    const Bytes png = png_bytes(gradient_raster(40, 40));

    SECTION("Not resized: the input itself") {
        const EncodedImage out = chain.encode(png, decision_for("image/png", 40, 40, OutputFormat::JPEG));
        REQUIRE(out.bytes == png);
        REQUIRE(out.mime == "image/png");
    }

    SECTION("Resized: a lossless PNG of the resized raster") {
        const EncodedImage out = chain.encode(png, decision_for("image/png", 40, 40, OutputFormat::JPEG, 20, 20));
        REQUIRE(out.mime == "image/png");
        REQUIRE(out.width == 20);
        REQUIRE(out.height == 20);
        REQUIRE(MimeDetector::detect_by_signature(out.bytes) == "image/png");
    }
}

TEST_CASE("No PNG encoder means EncodingFailed", "[EncoderChain]") {
    EncoderFactories factories;
    factories[OutputFormat::PNG] = {[] { return std::make_unique<BrokenEncoder>(); }};
    const EncoderRegistry registry(factories, {});
    const EncoderChain chain(registry);
    const Bytes png = png_bytes(solid_raster(8, 8, 0, 0, 0, 100));

    try {
        (void)chain.encode(png, decision_for("image/png", 8, 8, OutputFormat::PNG));
        FAIL("encode succeeded without PNG encoders");
    } catch (const RehostError& e) {
        REQUIRE(e.kind() == ErrorKind::EncodingFailed);
    }
}

TEST_CASE("PNG optimizer output is kept only when smaller", "[EncoderChain]") {
    const Bytes png = png_bytes(gradient_raster(48, 48));
    REQUIRE(png.size() > 50);
    const ProcessingDecision d = decision_for("image/png", 48, 48, OutputFormat::PNG);
    const Bytes plain = PngEncoder().encode(gradient_raster(48, 48));

    auto run = [&](const ScriptedOptimizer::Mode mode) {
        const EncoderRegistry registry(jpeg_factories({}), {
            [mode] { return std::make_unique<ScriptedOptimizer>(mode); }
        });
        REQUIRE(registry.png_optimizers().size() == 1);
        return EncoderChain(registry).encode(png, d);
    };

    SECTION("Smaller result wins") {
        const EncodedImage out = run(ScriptedOptimizer::Mode::Shrink);
        REQUIRE(out.bytes.size() == 50);
        REQUIRE(out.mime == "image/png");
    }

    SECTION("Larger result is discarded") {
        REQUIRE(run(ScriptedOptimizer::Mode::Grow).bytes == plain);
    }

    SECTION("Empty result is discarded") {
        REQUIRE(run(ScriptedOptimizer::Mode::Empty).bytes == plain);
    }

    SECTION("Crash is absorbed") {
        REQUIRE(run(ScriptedOptimizer::Mode::Throw).bytes == plain);
    }
}
