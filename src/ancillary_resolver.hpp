#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <string>

#include <asio.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "native.h"
#include "config.hpp"
#include "utils.hpp"
#include "crypto.hpp"
#include "event_layout.hpp"
#include "scanner.hpp"
#include "chain.hpp"
#include "parse_error.hpp"
#include "kv_parser.hpp"
#include "extract.hpp"
#include "vote.hpp"
#include "commit.hpp"
#include "cmd.hpp"

namespace avr
{
    static constexpr std::uint32_t MAJOR_VERSION = 0;
    static constexpr std::uint32_t MINOR_VERSION = 1;
    static constexpr std::uint32_t PATCH_VERSION = 0;
}
