/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ksuid/cli/Commands.hpp"

#include "ksuid/cli/Inspection.hpp"
#include "ksuid/common/constants.hpp"

#include <fmt/ostream.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <utility>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

Expected<Ksuid> parseAny(std::string_view str)
{
    switch (str.size()) {
        case kBase62Length:
            return Ksuid::fromBase62(str);
        case kHexLength:
            return Ksuid::fromHex(str);
        default:
            return std::unexpected{Error{
                .code = ErrorCode::INVALID_LENGTH,
                .message = fmt::format(
                    "KSUID must be {} (Base62) or {} (Hex) long, got {}",
                    kBase62Length,
                    kHexLength,
                    str.size())
            }};
    }
}

//-------------------------------------------------------------------------

int runGenerate(
    const GenerateConfig& config,
    PayloadSource& source,
    std::ostream& out,
    spdlog::logger& logger,
    Clock clock)
{
    logger.debug("Generating {} id(s) in {} format", config.count, config.format);

    Generator generator{source, std::move(clock)};
    for (size_t i = 0; i < config.count; ++i) {
        const auto id = generator.next();
        if (!id) {
            logger.error("Generation failed after {} id(s): {}", i, id.error());
            out.flush();
            return kExitFailure;
        }
        if (config.format == Format::hex) {
            fmt::print(out, "{:x}\n", *id);
        } else {
            fmt::print(out, "{}\n", *id);
        }
    }
    out.flush();

    return kExitSuccess;
}

//-------------------------------------------------------------------------

int runInspect(
    std::span<const std::string> ids,
    const InspectConfig& config,
    std::ostream& out,
    spdlog::logger& logger)
{
    size_t failures{};

    for (const std::string& str : ids) {
        const auto id = parseAny(str);
        if (!id) {
            logger.error("Cannot inspect '{}': {}", str, id.error());
            ++failures;
            continue;
        }

        const Inspection inspection{*id, config.utc};
        if (config.json) {
            fmt::print(out, "{}\n", json::jsonSerializable2str(inspection));
        } else {
            fmt::print(out, "{}", inspection);
        }
    }
    out.flush();

    if (failures > 0) {
        logger.warn("{} of {} id(s) could not be inspected", failures, ids.size());
        return kExitFailure;
    }
    return kExitSuccess;
}

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> makeLogger(spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(
        "ksuid", std::make_shared<spdlog::sinks::stderr_sink_st>());
    logger->set_level(level);
    logger->set_pattern("[%n] [%l] %v");
    return logger;
}

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------
