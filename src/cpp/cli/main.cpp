/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Commands.hpp"
#include "ksuid/cli/Config.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    using namespace ksuid;

    CLI::App app{"ksuid - generate and inspect K-sortable unique identifiers"};
    app.require_subcommand(0, 1);

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "XML configuration file")
        ->check(CLI::ExistingFile);

    std::optional<std::string> logLevel;
    app.add_option("--log-level", logLevel, "Logging threshold")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    std::optional<size_t> count;
    app.add_option("-n,--count", count, "Number of ids to generate")
        ->check(CLI::PositiveNumber);

    const std::map<std::string, cli::Format> formats{
        {"base62", cli::Format::base62}, {"hex", cli::Format::hex}};
    std::optional<cli::Format> format;
    app.add_option("--format", format, "Output format of generated ids")
        ->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));

    CLI::App* inspect = app.add_subcommand("inspect", "Print the components of existing ids");

    std::vector<std::string> ids;
    inspect->add_option("ids", ids, "Base62 (27 chars) or Hex (40 chars) ids")->required();

    bool json{};
    inspect->add_flag("--json", json, "Print one JSON object per id");

    bool utc{};
    inspect->add_flag("--utc", utc, "Render times in UTC instead of the local time zone");

    CLI11_PARSE(app, argc, argv);

    auto logger = cli::makeLogger(spdlog::level::info);
    spdlog::set_default_logger(logger);

    cli::Config config;
    try {
        if (!configFile.empty()) {
            config = cli::Config::fromFile(configFile);
        }
    }
    catch (const std::exception& exc) {
        logger->critical("{}", exc.what());
        return cli::kExitFailure;
    }

    if (logLevel) {
        config.log().level = spdlog::level::from_str(*logLevel);
    }
    if (count) {
        config.generate().count = *count;
    }
    if (format) {
        config.generate().format = *format;
    }
    config.inspect().json = config.inspect().json || json;
    config.inspect().utc = config.inspect().utc || utc;

    logger->set_level(config.log().level);

    if (inspect->parsed()) {
        return cli::runInspect(ids, config.inspect(), std::cout, *logger);
    }

    RandomPayloadSource source;
    return cli::runGenerate(config.generate(), source, std::cout, *logger);
}

//-------------------------------------------------------------------------
