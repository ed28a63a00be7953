/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Config.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

GenerateConfig GenerateConfig::fromXML(pugi::xml_node node)
{
    static constexpr GenerateConfig defaults{};

    auto formatFallback = [] {
        spdlog::warn(
            "Unknown or missing attribute 'format', falling back to '{}'", defaults.format);
        return std::make_optional(defaults.format);
    };

    auto readCount = [node] {
        pugi::xml_attribute attr = node.attribute("count");
        if (!attr) return defaults.count;
        const long long value = attr.as_llong();
        if (value <= 0) {
            spdlog::warn(
                "Invalid attribute 'count' '{}', falling back to '{}'",
                attr.as_string(),
                defaults.count);
            return defaults.count;
        }
        return static_cast<size_t>(value);
    };

    return GenerateConfig{
        .count = readCount(),
        .format = node.attribute("format")
            ? magic_enum::enum_cast<Format>(node.attribute("format").as_string())
                .or_else(formatFallback).value()
            : defaults.format
    };
}

//-------------------------------------------------------------------------

InspectConfig InspectConfig::fromXML(pugi::xml_node node)
{
    return InspectConfig{
        .utc = node.attribute("utc").as_bool(),
        .json = node.attribute("json").as_bool()
    };
}

//-------------------------------------------------------------------------

LogConfig LogConfig::fromXML(pugi::xml_node node)
{
    static constexpr LogConfig defaults{};

    pugi::xml_attribute attr = node.attribute("level");
    if (!attr) return defaults;

    const std::string_view name = attr.as_string();
    const auto level = spdlog::level::from_str(std::string{name});
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn(
            "Unknown log level '{}', falling back to '{}'",
            name,
            spdlog::level::to_string_view(defaults.level));
        return defaults;
    }
    return LogConfig{.level = level};
}

//-------------------------------------------------------------------------

Config::Config(GenerateConfig generate, InspectConfig inspect, LogConfig log) noexcept
    : m_generate{generate}, m_inspect{inspect}, m_log{log}
{}

//-------------------------------------------------------------------------

Config Config::fromXML(pugi::xml_node node)
{
    return Config{
        GenerateConfig::fromXML(node.child("Generate")),
        InspectConfig::fromXML(node.child("Inspect")),
        LogConfig::fromXML(node.child("Log"))};
}

//-------------------------------------------------------------------------

Config Config::fromFile(const std::filesystem::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result parseResult = doc.load_file(path.c_str());
    if (!parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse XML from '{}': {}", ctx, path.c_str(), parseResult.description())};
    }

    pugi::xml_node root = doc.child("Ksuid");
    if (!root) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing root element 'Ksuid' in '{}'", ctx, path.c_str())};
    }

    return fromXML(root);
}

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------
