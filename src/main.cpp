#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <crow/logging.h>

#include "cli_commands.hpp"

using namespace asftoken;

namespace {

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

} // namespace

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("asftoken");

    program.add_argument("-c", "--config")
        .help("Path to the asftoken.yaml configuration file")
        .default_value(std::string("asftoken.yaml"));

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("warning"));

    program.add_argument("--offline")
        .help("Do not consult the component registry when validating or scanning")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser generate_command("generate");
    generate_command.add_description("Generate a new token for an allocated component");
    generate_command.add_argument("component")
        .help("Component namespace (3-6 lowercase letters)");

    argparse::ArgumentParser validate_command("validate");
    validate_command.add_description("Validate a token and print its details as JSON");
    validate_command.add_argument("token")
        .help("Token to validate");

    argparse::ArgumentParser scan_command("scan");
    scan_command.add_description("Scan text for leaked tokens");
    scan_command.add_argument("file")
        .help("File to scan, or - for standard input")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string("-"));

    argparse::ArgumentParser fingerprint_command("fingerprint");
    fingerprint_command.add_description("Print the SHA3-256 fingerprint of a token");
    fingerprint_command.add_argument("token")
        .help("Token to fingerprint");

    argparse::ArgumentParser pattern_command("pattern");
    pattern_command.add_description("Print the published detection pattern");

    program.add_subparser(generate_command);
    program.add_subparser(validate_command);
    program.add_subparser(scan_command);
    program.add_subparser(fingerprint_command);
    program.add_subparser(pattern_command);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return kExitFailure;
    }

    set_log_level(program.get<std::string>("--log-level"));
    bool offline = program.get<bool>("--offline");

    try {
        if (program.is_subcommand_used(pattern_command)) {
            return runPattern(std::cout);
        }
        if (program.is_subcommand_used(fingerprint_command)) {
            return runFingerprint(fingerprint_command.get<std::string>("token"), std::cout);
        }

        TokenConfig config = loadCommandConfig(program.get<std::string>("--config"));

        if (program.is_subcommand_used(generate_command)) {
            return runGenerate(config, generate_command.get<std::string>("component"),
                               std::make_shared<OpenSslEntropySource>(), std::cout);
        }
        if (program.is_subcommand_used(validate_command)) {
            return runValidate(config, offline, validate_command.get<std::string>("token"), std::cout);
        }
        if (program.is_subcommand_used(scan_command)) {
            std::string text = readCommandInput(scan_command.get<std::string>("file"), std::cin);
            return runScan(config, offline, text, std::cout);
        }
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << e.what();
        return kExitFailure;
    }

    std::cerr << program;
    return kExitFailure;
}
