#include "address.hpp"

#include <evmc/hex.hpp>

#include "utils.hpp"

namespace avr::chain
{
    std::optional<chain::Address> parseAddress(const std::string & value)
    {
        const std::string prefixed = utils::withHexPrefix(utils::trim(value));
        if(prefixed.size() != 2 + 40)
        {
            return std::nullopt;
        }

        // evmc only skips a lowercase 0x
        return evmc::from_hex<chain::Address>("0x" + prefixed.substr(2));
    }

    std::string addressToHex(const chain::Address & address)
    {
        return utils::withHexPrefix(evmc::hex(evmc::bytes_view{address.bytes, sizeof(address.bytes)}));
    }
}
