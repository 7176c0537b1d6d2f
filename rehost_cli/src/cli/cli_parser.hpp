#ifndef REHOST_CLI_PARSER_HPP
#define REHOST_CLI_PARSER_HPP

#include "../../../librehost/include/config.hpp"
#include "../../../librehost/include/s3_object_store.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    Url,
    DataUri,
    File,
    Batch,
    Html
};

enum class StoreKind {
    S3,
    Filesystem,
    Memory   ///< Nothing is persisted; useful to preview results
};

struct Settings {
    Command command = Command::Url;

    std::string log_level = "ERROR";
    std::string log_file;
    bool pretty = false;

    rehost::PipelineConfig pipeline;
    int connect_timeout_s = 10;
    int request_timeout_s = 30;

    StoreKind store = StoreKind::S3;
    std::string public_base_url;
    rehost::S3Config s3;
    std::filesystem::path fs_root;

    // subcommand arguments
    std::string source;                  ///< url / data-uri argument
    std::filesystem::path file;          ///< file argument ('-' for stdin)
    std::string content_type;            ///< declared type for 'file'
    std::vector<std::string> batch_inputs;
    std::filesystem::path html_input;    ///< html argument ('-' for stdin)
    std::filesystem::path html_output;   ///< write the rewritten HTML here instead of the JSON "html" field
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options and environment bindings.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // REHOST_CLI_PARSER_HPP
