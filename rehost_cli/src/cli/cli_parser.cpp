#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <map>

namespace {

// accepts https URLs, data URIs and readable files
struct BatchInputValidator : CLI::Validator {
    BatchInputValidator() {
        name_ = "BatchInput";
        func_ = [](const std::string& str) {
            if (str.starts_with("https://") || str.starts_with("http://") || str.starts_with("data:")) {
                return std::string();
            }
            if (!std::filesystem::is_regular_file(str)) {
                return "Batch input '" + str + "' is neither a URL, a data URI nor a file.";
            }
            return std::string(); // ok
        };
    }
};

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");
    app.set_config("--config", "", "Read options from an INI or TOML file.");
    app.require_subcommand(1);

    // --- Output and logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to a file.");

    app.add_flag("--pretty", settings.pretty,
                 "Indent the JSON output.");

    // --- Decider ---
    auto& decider = settings.pipeline.decider;
    app.add_option("--max-edge", decider.max_edge, "Longest allowed image edge in pixels.")
        ->envname("REHOST_MAX_EDGE")
        ->default_val(decider.max_edge)
        ->check(CLI::PositiveNumber);
    app.add_option("--max-pixels", decider.max_pixels, "Refuse images with more pixels than this.")
        ->envname("REHOST_MAX_PIXELS")
        ->default_val(decider.max_pixels)
        ->check(CLI::PositiveNumber);
    app.add_option("--resize-threshold", decider.resize_byte_threshold,
                   "Inputs larger than this many bytes are re-encoded at reduced size.")
        ->envname("REHOST_RESIZE_THRESHOLD")
        ->default_val(decider.resize_byte_threshold);
    app.add_option("--passthrough-threshold", decider.passthrough_byte_threshold,
                   "JPEG/PNG inputs below this many bytes are stored unchanged (0 disables).")
        ->envname("REHOST_PASSTHROUGH_THRESHOLD")
        ->default_val(decider.passthrough_byte_threshold);
    app.add_option("--alpha-samples", decider.transparency_sample_target,
                   "Approximate number of pixels sampled for transparency.")
        ->default_val(decider.transparency_sample_target)
        ->check(CLI::PositiveNumber);

    // --- Encoders ---
    auto& encoder = settings.pipeline.encoder;
    app.add_option("--jpeg-quality", encoder.jpeg_quality, "Quality of the progressive JPEG encoder.")
        ->envname("JPEG_QUALITY")
        ->default_val(encoder.jpeg_quality)
        ->check(CLI::Range(1, 100));
    app.add_option("--jpeg-fallback-quality", encoder.jpeg_fallback_quality,
                   "Quality of the baseline JPEG fallback encoder.")
        ->default_val(encoder.jpeg_fallback_quality)
        ->check(CLI::Range(1, 100));
    app.add_option("--jpeg-progressive", encoder.jpeg_progressive, "Emit progressive JPEG scans.")
        ->envname("JPEG_PROGRESSIVE")
        ->default_val(encoder.jpeg_progressive);
    app.add_flag("--no-progressive{false}", encoder.jpeg_progressive,
                 "Emit baseline scans from the primary JPEG encoder.");
    app.add_flag("--no-png-optimize{false}", encoder.png_optimize,
                 "Skip the lossless ZopfliPNG pass.");
    app.add_option("--zopfli-iterations", encoder.zopfli_iterations, "ZopfliPNG iterations.")
        ->default_val(encoder.zopfli_iterations)
        ->check(CLI::PositiveNumber);

    // --- Fetch ---
    auto& fetch = settings.pipeline.fetch;
    app.add_option("--connect-timeout", settings.connect_timeout_s, "Connection timeout in seconds.")
        ->default_val(settings.connect_timeout_s)
        ->check(CLI::PositiveNumber);
    app.add_option("--request-timeout", settings.request_timeout_s, "Overall request timeout in seconds.")
        ->default_val(settings.request_timeout_s)
        ->check(CLI::PositiveNumber);
    app.add_option("--max-fetch-bytes", fetch.max_fetch_bytes, "Byte cap of remote fetches.")
        ->default_val(fetch.max_fetch_bytes);
    app.add_option("--max-redirects", fetch.max_redirects, "Redirect hops followed per fetch.")
        ->default_val(fetch.max_redirects)
        ->check(CLI::NonNegativeNumber);

    // --- HTML and batch ---
    auto& html = settings.pipeline.html;
    app.add_option("--max-batch", settings.pipeline.max_batch_size, "Maximum number of batch inputs.")
        ->default_val(settings.pipeline.max_batch_size)
        ->check(CLI::PositiveNumber);
    app.add_option("--max-html-bytes", html.max_html_bytes, "Largest accepted HTML document.")
        ->default_val(html.max_html_bytes);
    app.add_option("--image-workers", html.image_workers, "Images of one document processed concurrently.")
        ->default_val(html.image_workers)
        ->check(CLI::PositiveNumber);
    app.add_option("--asset-host", html.extra_asset_hosts,
                   "Host whose images are already rehosted. (Can be used multiple times).");

    // --- Storage ---
    app.add_option("--store", settings.store, "Object store: 's3' (default), 'fs' or 'memory'.")
        ->default_val(StoreKind::S3)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, StoreKind>{
                {"s3", StoreKind::S3},
                {"fs", StoreKind::Filesystem},
                {"memory", StoreKind::Memory}
            }, CLI::ignore_case));
    app.add_option("--public-base-url", settings.public_base_url, "Base URL the stored objects are served from.")
        ->envname("R2_PUBLIC_BASE_URL");
    app.add_option("--s3-endpoint", settings.s3.endpoint, "S3-compatible endpoint URL.")
        ->envname("R2_S3_ENDPOINT");
    app.add_option("--s3-bucket", settings.s3.bucket, "Bucket name.")
        ->envname("R2_BUCKET")
        ->default_val(settings.s3.bucket);
    app.add_option("--s3-access-key", settings.s3.access_key_id, "Access key id.")
        ->envname("R2_ACCESS_KEY_ID");
    app.add_option("--s3-secret-key", settings.s3.secret_access_key, "Secret access key.")
        ->envname("R2_SECRET_ACCESS_KEY");
    app.add_option("--s3-region", settings.s3.region, "Signing region.")
        ->default_val(settings.s3.region);
    app.add_option("--fs-root", settings.fs_root, "Root directory of the filesystem store.");

    // --- Subcommands ---
    auto* url_cmd = app.add_subcommand("url", "Rehost the image at an https URL.");
    url_cmd->add_option("url", settings.source, "https:// URL")->required();
    url_cmd->callback([&settings]() { settings.command = Command::Url; });

    auto* data_cmd = app.add_subcommand("data-uri", "Rehost the image of a data: URI.");
    data_cmd->add_option("uri", settings.source, "data:[mediatype][;base64],<data>")->required();
    data_cmd->callback([&settings]() { settings.command = Command::DataUri; });

    auto* file_cmd = app.add_subcommand("file", "Rehost a local image file.");
    file_cmd->add_option("path", settings.file, "Image file (use '-' for stdin)")
        ->required()
        ->check([](const std::string& str) {
            if (str == "-") return std::string();
            if (!std::filesystem::is_regular_file(str)) return "Input file '" + str + "' not found.";
            return std::string(); // ok
        });
    file_cmd->add_option("--content-type", settings.content_type, "Declared MIME type (default: sniffed).");
    file_cmd->callback([&settings]() { settings.command = Command::File; });

    auto* batch_cmd = app.add_subcommand("batch", "Rehost several inputs; stops at the first failure.");
    batch_cmd->add_option("inputs", settings.batch_inputs, "URLs, data URIs or files")
        ->required()
        ->check(BatchInputValidator());
    batch_cmd->callback([&settings]() { settings.command = Command::Batch; });

    auto* html_cmd = app.add_subcommand("html", "Rehost the images of an HTML document and make it Gmail-safe.");
    html_cmd->add_option("path", settings.html_input, "HTML file (use '-' for stdin)")
        ->required()
        ->check([](const std::string& str) {
            if (str == "-") return std::string();
            if (!std::filesystem::is_regular_file(str)) return "Input file '" + str + "' not found.";
            return std::string(); // ok
        });
    html_cmd->add_option("-o,--output", settings.html_output,
                         "Write the rewritten HTML to PATH instead of the JSON output.");
    html_cmd->callback([&settings]() { settings.command = Command::Html; });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        settings.pipeline.fetch.connect_timeout = std::chrono::seconds(settings.connect_timeout_s);
        settings.pipeline.fetch.request_timeout = std::chrono::seconds(settings.request_timeout_s);
        settings.s3.connect_timeout = settings.pipeline.fetch.connect_timeout;
        settings.s3.request_timeout = settings.pipeline.fetch.request_timeout;

        if (settings.pipeline.decider.passthrough_byte_threshold > settings.pipeline.decider.resize_byte_threshold) {
            throw CLI::ValidationError("--passthrough-threshold cannot exceed --resize-threshold.");
        }

        switch (settings.store) {
            case StoreKind::S3:
                if (settings.s3.endpoint.empty() || settings.s3.access_key_id.empty() ||
                    settings.s3.secret_access_key.empty()) {
                    throw CLI::ValidationError(
                        "The s3 store needs --s3-endpoint, --s3-access-key and --s3-secret-key.");
                }
                if (settings.public_base_url.empty()) {
                    throw CLI::ValidationError("Option '--public-base-url' is required for the s3 store.");
                }
                settings.s3.public_base_url = settings.public_base_url;
                break;
            case StoreKind::Filesystem:
                if (settings.fs_root.empty()) {
                    throw CLI::ValidationError("Option '--fs-root' is required for the fs store.");
                }
                if (settings.public_base_url.empty()) {
                    settings.public_base_url = "file://" + std::filesystem::absolute(settings.fs_root).string();
                }
                break;
            case StoreKind::Memory:
                if (settings.public_base_url.empty()) {
                    settings.public_base_url = "https://assets.invalid";
                }
                break;
        }
    });
}
