#ifndef CMDLINE_20200817_H
#define CMDLINE_20200817_H

#include "util/Schema.h"

#include <argparse.hpp>
#include <toml.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace redist {

/**
 * @brief Reads the configuration file named by the positional argument configPar and applies
 * command line overrides (--key value) of scalar entries
 *
 * Errors are printed to out; std::nullopt is returned on error.
 */
template <typename T>
std::optional<T>
readFromConfigurationFileAndCmdLine(TableSchema<T> const& schema, argparse::ArgumentParser& program,
                                    int argc, char* argv[], std::ostream& out,
                                    std::string_view configPar = "config") {
    schema.cmd_line_args([&program](std::string_view key, std::string_view help) {
        program.add_argument("--" + std::string(key)).help(std::string(help));
    });

    try {
        program.parse_args(argc, argv);
    } catch (std::runtime_error& err) {
        out << err.what() << std::endl;
        out << program;
        return std::nullopt;
    }

    auto configFile = program.get<std::string>(std::string(configPar));
    toml::table rawCfg;
    try {
        rawCfg = toml::parse_file(configFile);
    } catch (toml::parse_error const& err) {
        out << "Parsing of " << configFile << " failed:" << std::endl << err << std::endl;
        return std::nullopt;
    }

    T cfg;
    try {
        cfg = schema.translate(rawCfg);
        schema.cmd_line_args([&cfg, &program, &schema](std::string_view key, std::string_view) {
            if (auto val = program.present("--" + std::string(key))) {
                schema.set(cfg, key, *val);
            }
        });
    } catch (std::runtime_error const& e) {
        out << "Error in configuration file" << std::endl
            << "---------------------------" << std::endl
            << e.what() << std::endl
            << std::endl
            << "You provided" << std::endl
            << "------------" << std::endl
            << rawCfg << std::endl
            << std::endl
            << "Schema" << std::endl
            << "------" << std::endl
            << schema << std::endl;
        return std::nullopt;
    }
    return std::make_optional(cfg);
}

} // namespace redist

#endif // CMDLINE_20200817_H
