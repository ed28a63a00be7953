/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <utility>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

enum class Format { base62, hex };

//-------------------------------------------------------------------------

struct GenerateConfig
{
    size_t count{1};
    Format format{Format::base62};

    [[nodiscard]] static GenerateConfig fromXML(pugi::xml_node node);
};

struct InspectConfig
{
    bool utc{};
    bool json{};

    [[nodiscard]] static InspectConfig fromXML(pugi::xml_node node);
};

struct LogConfig
{
    spdlog::level::level_enum level{spdlog::level::info};

    [[nodiscard]] static LogConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

/**
 * Settings of the command-line tool. Read from an XML document of the form
 *
 *   <Ksuid>
 *     <Generate count="3" format="hex"/>
 *     <Inspect utc="true" json="false"/>
 *     <Log level="debug"/>
 *   </Ksuid>
 *
 * where every element and attribute is optional.
 */
class Config
{
public:
    Config() noexcept = default;
    Config(GenerateConfig generate, InspectConfig inspect, LogConfig log) noexcept;

    [[nodiscard]] auto&& generate(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_generate);
    }

    [[nodiscard]] auto&& inspect(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_inspect);
    }

    [[nodiscard]] auto&& log(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_log);
    }

    [[nodiscard]] static Config fromXML(pugi::xml_node node);
    [[nodiscard]] static Config fromFile(const std::filesystem::path& path);

private:
    GenerateConfig m_generate;
    InspectConfig m_inspect;
    LogConfig m_log;
};

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<ksuid::cli::Format>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(ksuid::cli::Format format, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(format));
    }
};

//-------------------------------------------------------------------------
