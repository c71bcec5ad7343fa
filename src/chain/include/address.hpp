#pragma once

#include <optional>
#include <cstdint>
#include <string>


#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace avr::chain
{
    using Address = evmc::address;

    /**
     * @brief Parses a 20-byte address written as 40 hex digits.
     *
     * The 0x prefix is optional; ancillary data stores addresses without it.
     */
    std::optional<chain::Address> parseAddress(const std::string & value);

    // lowercase, 0x-prefixed
    std::string addressToHex(const chain::Address & address);
}
