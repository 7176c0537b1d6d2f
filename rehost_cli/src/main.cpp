#include <atomic>
#include <csignal>
#include <iostream>
#include <iterator>
#include <memory>
#include <stop_token>
#include <string>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "cli/cli_parser.hpp"
#include "report/json_report.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../librehost/include/errors.hpp"
#include "../../librehost/include/file_utils.hpp"
#include "../../librehost/include/filesystem_object_store.hpp"
#include "../../librehost/include/logger.hpp"
#include "../../librehost/include/memory_object_store.hpp"
#include "../../librehost/include/rehost.hpp"
#include "../../librehost/include/s3_object_store.hpp"

using namespace rehost;

static std::atomic<bool> interrupted{false};
static std::stop_source g_stop;

// handle ctrl+c or termination signals
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        g_stop.request_stop();
    }
}

namespace {

Bytes read_stdin() {
    std::cin >> std::noskipws;
    const std::string data{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    return {data.begin(), data.end()};
}

Bytes load_input(const std::filesystem::path& path, const std::size_t max_bytes) {
    if (path == "-") {
        Bytes data = read_stdin();
        if (data.size() > max_bytes) {
            throw RehostError(ErrorKind::PayloadTooLarge,
                              "stdin input exceeds " + std::to_string(max_bytes) + " bytes");
        }
        return data;
    }
    std::error_code ec;
    if (const auto size = std::filesystem::file_size(path, ec); !ec && size > max_bytes) {
        throw RehostError(ErrorKind::PayloadTooLarge,
                          path.string() + " exceeds " + std::to_string(max_bytes) + " bytes");
    }
    try {
        return read_file(path, max_bytes);
    } catch (const std::runtime_error& e) {
        throw RehostError(ErrorKind::InvalidSource, e.what());
    }
}

SourceDescriptor to_source(const std::string& input, const std::size_t max_bytes) {
    if (input.starts_with("data:")) return SourceDescriptor::data_uri(input);
    if (input.starts_with("https://") || input.starts_with("http://")) return SourceDescriptor::url(input);
    return SourceDescriptor::raw(load_input(input, max_bytes));
}

std::shared_ptr<IObjectStore> make_store(const Settings& settings) {
    switch (settings.store) {
        case StoreKind::S3:
            return std::make_shared<S3ObjectStore>(settings.s3);
        case StoreKind::Filesystem:
            return std::make_shared<FilesystemObjectStore>(settings.fs_root, settings.public_base_url);
        case StoreKind::Memory:
            return std::make_shared<MemoryObjectStore>(settings.public_base_url);
    }
    throw std::invalid_argument("unknown store kind");
}

nlohmann::json run(Rehost& rehost, const Settings& settings) {
    const std::stop_token stop = g_stop.get_token();
    const std::size_t max_bytes = settings.pipeline.fetch.max_fetch_bytes;

    switch (settings.command) {
        case Command::Url:
            return asset_to_json(rehost.process_from_url(settings.source, stop));
        case Command::DataUri:
            return asset_to_json(rehost.process_from_data_uri(settings.source, stop));
        case Command::File:
            return asset_to_json(rehost.process_from_bytes(load_input(settings.file, max_bytes),
                                                           settings.content_type, stop));
        case Command::Batch: {
            std::vector<SourceDescriptor> sources;
            sources.reserve(settings.batch_inputs.size());
            for (const auto& input : settings.batch_inputs) {
                sources.push_back(to_source(input, max_bytes));
            }
            return assets_to_json(rehost.process_batch(sources, stop));
        }
        case Command::Html: {
            const Bytes raw = load_input(settings.html_input, settings.pipeline.html.max_html_bytes);
            const std::string html(raw.begin(), raw.end());
            const TransformResult result = rehost.transform_html(html, stop);
            if (!settings.html_output.empty()) {
                write_file_atomic(settings.html_output,
                                  {reinterpret_cast<const std::uint8_t*>(result.html.data()), result.html.size()});
                return transform_to_json(result, false);
            }
            return transform_to_json(result);
        }
    }
    throw RehostError(ErrorKind::InvalidRequest, "no command given");
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"rehost: rehost images onto a content-addressed store and make HTML Gmail-safe."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // the file gets every level; "NONE" parses to nullopt and disables the console
    Logger::clear_sinks();
    const auto console_level = Logger::string_to_level(settings.log_level);
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << "Cannot open log file " << settings.log_file << std::endl;
            return 2;
        }
        Logger::add_sink(std::move(fileSink));
        Logger::set_level(LogLevel::Debug);
    } else {
        Logger::set_level(console_level.value_or(LogLevel::Error));
    }
    if (console_level) {
        Logger::add_sink(std::make_unique<ConsoleLogSink>(*console_level));
    }

    const int indent = settings.pretty ? 2 : -1;

    std::unique_ptr<Rehost> rehost;
    try {
        rehost = std::make_unique<Rehost>(make_store(settings), settings.pipeline);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Configuration error: ") + e.what(), "main");
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    try {
        std::cout << run(*rehost, settings).dump(indent) << std::endl;
    } catch (const RehostError& e) {
        Logger::log(LogLevel::Error, std::string(to_string(e.kind())) + ": " + e.what(), "main");
        std::cout << error_to_json(e).dump(indent) << std::endl;
        return interrupted.load() ? 130 : 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return 0;
}
