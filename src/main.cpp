#include "codec/error_codec.hpp"
#include "codec/json_text.hpp"
#include "codec/result_codec.hpp"
#include "codec/type_registry.hpp"
#include "config/settings.hpp"
#include "core/log.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "http/problem_details.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <string>
#include <typeinfo>

static void print_usage() {
    std::cout << "verdict_inspect v0.1.0\n"
              << "Decode and check serialized errors and results\n\n"
              << "Usage:\n"
              << "  verdict_inspect [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Lua settings script\n"
              << "  --error <path>     Decode an Error payload ('-' for stdin)\n"
              << "  --result <path>    Decode a Result payload ('-' for stdin)\n"
              << "  --help             Show this help message\n";
}

struct Options {
    verdict::fs::path config_file;
    std::string error_file;
    std::string result_file;
};

static Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error") == 0 && i + 1 < argc) {
            options.error_file = argv[++i];
        } else if (std::strcmp(argv[i], "--result") == 0 && i + 1 < argc) {
            options.result_file = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            print_usage();
            std::exit(2);
        }
    }

    return options;
}

static verdict::Result<std::string> read_input(const std::string& source) {
    std::ostringstream text;
    if (source == "-") {
        text << std::cin.rdbuf();
        return text.str();
    }

    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        return verdict::Error::not_found("Failed to open file: " + source);
    }
    text << file.rdbuf();
    return text.str();
}

static void describe(const verdict::Error& error, int indent) {
    auto entry = verdict::codec::TypeRegistry::global().find_error(typeid(error));
    std::cout << "variant:     " << (entry ? entry->tag : "<unregistered>") << "\n"
              << "code:        " << error.code().to_string() << "\n"
              << "description: " << error.description() << "\n"
              << "problem:     "
              << verdict::codec::to_text(
                     verdict::http::to_problem_details(error).to_json(), indent)
              << "\n";
}

/// Decode text as an Error (or Result when as_result) and report it.
static verdict::Result<void> inspect(const std::string& text, bool as_result,
                                     int indent) {
    namespace codec = verdict::codec;
    try {
        Json::Value payload = codec::parse(text);
        if (!as_result) {
            verdict::ErrorPtr error = codec::ErrorCodec().decode_error(payload);
            describe(*error, indent);
            std::cout << codec::to_text(codec::ErrorCodec().encode(*error), indent)
                      << "\n";
            return {};
        }

        auto result = codec::decode_result<Json::Value>(payload);
        if (result.is_success()) {
            std::cout << "success:     " << codec::to_text(result.value(), indent)
                      << "\n";
        } else {
            describe(*result.error(), indent);
        }
        std::cout << codec::serialize(result, indent) << "\n";
        return {};
    } catch (const codec::DecodeError& ex) {
        return verdict::Error::validation(ex.what());
    } catch (const codec::EncodeError& ex) {
        return verdict::Error::validation(ex.what());
    }
}

int main(int argc, char* argv[]) {
    verdict::log::init();

    Options options = parse_args(argc, argv);

    verdict::config::Settings settings;
    if (!options.config_file.empty()) {
        auto loaded = verdict::config::load_settings(options.config_file);
        if (!loaded) {
            spdlog::error("Settings: {}", loaded.error()->description());
            return 1;
        }
        settings = loaded.value();
        verdict::log::init(settings.log_level, settings.log_file);
    }

    if (options.error_file.empty() && options.result_file.empty()) {
        print_usage();
        return 2;
    }

    const bool as_result = !options.result_file.empty();
    auto outcome =
        read_input(as_result ? options.result_file : options.error_file)
            .bind([&](const std::string& text) {
                return inspect(text, as_result, settings.json_indent);
            });

    return outcome.match(
        [] { return 0; },
        [](const verdict::ErrorPtr& error) {
            spdlog::error("{}: {}", error->code().to_string(),
                          error->description());
            return 1;
        });
}
