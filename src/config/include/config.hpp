#pragma once
#include <filesystem>

namespace avr::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;

        // optional chain table overriding the built-in endpoints
        std::filesystem::path chains_path;
    };
}
