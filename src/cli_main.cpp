#include <cxxopts.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ras/Accessor.hpp"
#include "ras/CliArgs.hpp"
#include "ras/Converter.hpp"
#include "ras/Errors.hpp"
#include "ras/Loader.hpp"
#include "ras/Serializer.hpp"

#ifndef RAS_VERSION
#define RAS_VERSION "unknown"
#endif

using nlohmann::json;
using namespace ras;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("ras-cli", "Query and convert RAS list files");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "Path to RAS file", cxxopts::value<std::string>())
            ("to", "Conversion target format", cxxopts::value<std::string>()->default_value("json"))
            ("o,out", "Output file for convert", cxxopts::value<std::string>())
            ("indent", "JSON indentation (negative for compact)", cxxopts::value<int>()->default_value("4"))
            ("t,show-type", "Print the value kind after `get` results")
            ("version", "Show version")
            ("h,help", "Show help");

        // Command + its arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("version")) {
            std::cout << "ras-cli " << RAS_VERSION << "\n";
            return 0;
        }
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get LIST RECORD FIELD [-t] | dump [--indent N] | convert [--to json] --out FILE | fmt\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        if (!result.count("file")) {
            std::cerr << "Error: --file must be provided for `" << cmd << "`\n";
            return 1;
        }
        const std::string file = result["file"].as<std::string>();
        const int indent = result["indent"].as<int>();

        // GET
        if (cmd == "get") {
            if (cmdv.size() < 4) {
                std::cerr << "Error: insufficient arguments for command 'get'\n";
                return 1;
            }
            ParsedStore store = load_file(file);
            const Value& v = ras::get(store, cmdv[1],
                                      parse_index(cmdv[2], "record"),
                                      parse_index(cmdv[3], "field"));
            std::cout << json(v).dump();
            if (result.count("show-type")) {
                std::cout << " (" << type_name(v) << ")";
            }
            std::cout << "\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << dump_json(load_file(file), indent) << "\n";
            return 0;
        }

        // CONVERT
        if (cmd == "convert") {
            if (!result.count("out")) {
                std::cerr << "Error: --out must be provided for `convert`\n";
                return 1;
            }
            const std::string to = result["to"].as<std::string>();
            const std::string out = result["out"].as<std::string>();
            ConvertOptions opts;
            opts.indent = indent;
            convert(file, to, out, opts);
            std::cout << "Successfully converted '" << file << "' to JSON and saved to '"
                      << out << "'.\n";
            return 0;
        }

        // FMT
        if (cmd == "fmt") {
            std::cout << to_ras_string(load_file(file));
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const RasError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
