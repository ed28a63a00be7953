/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ksuid/cli/Config.hpp"
#include "ksuid/core/Generator.hpp"
#include "ksuid/core/Ksuid.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace ksuid::cli
{

//-------------------------------------------------------------------------

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;

//-------------------------------------------------------------------------

/**
 * Parse an id given on the command line, choosing the codec by length:
 * 27 characters are read as Base62, 40 as Hex.
 */
[[nodiscard]] Expected<Ksuid> parseAny(std::string_view str);

// Writes config.count ids, one per line, printing each as it is generated.
// Returns the process exit code.
[[nodiscard]] int runGenerate(
    const GenerateConfig& config,
    PayloadSource& source,
    std::ostream& out,
    spdlog::logger& logger,
    Clock clock = systemNow);

/**
 * Writes an inspection report for each of the given ids. Ids that fail to
 * parse are logged and skipped; the exit code is non-zero if any did.
 */
[[nodiscard]] int runInspect(
    std::span<const std::string> ids,
    const InspectConfig& config,
    std::ostream& out,
    spdlog::logger& logger);

[[nodiscard]] std::shared_ptr<spdlog::logger> makeLogger(spdlog::level::level_enum level);

//-------------------------------------------------------------------------

}  // namespace ksuid::cli

//-------------------------------------------------------------------------
