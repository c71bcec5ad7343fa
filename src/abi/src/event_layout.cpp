#include "event_layout.hpp"

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "decode_abi.hpp"
#include "math.hpp"

namespace avr::abi
{
    const std::vector<EventLayout> & knownLayouts()
    {
        static const std::vector<EventLayout> layouts{
            EventLayout{
                .name = "PriceRequestAdded",
                .fields = {AbiType::BYTES32, AbiType::UINT256, AbiType::BYTES}
            },
            EventLayout{
                .name = "TimedBytes",
                .fields = {AbiType::UINT256, AbiType::BYTES}
            },
            EventLayout{
                .name = "RequestPrice",
                .fields = {AbiType::BYTES32, AbiType::UINT256, AbiType::BYTES, AbiType::ADDRESS, AbiType::UINT256, AbiType::UINT256}
            },
            EventLayout{
                .name = "DisputePrice",
                .fields = {AbiType::BYTES32, AbiType::UINT256, AbiType::BYTES, AbiType::INT256}
            }
        };
        return layouts;
    }

    std::string layoutSignature(const EventLayout & layout)
    {
        std::string signature = "(";
        for(std::size_t i = 0; i < layout.fields.size(); ++i)
        {
            if(i > 0)
            {
                signature += ",";
            }
            signature += std::format("{}", layout.fields[i]);
        }
        signature += ")";
        return signature;
    }

    std::optional<std::vector<std::uint8_t>> decodeLayoutBytes(const EventLayout & layout, const std::uint8_t* data, std::size_t data_size)
    {
        if(data == nullptr || layout.fields.empty())
        {
            return std::nullopt;
        }

        const std::size_t head_size = layout.fields.size() * 32;
        if(data_size < head_size)
        {
            return std::nullopt;
        }

        std::optional<std::size_t> bytes_offset;
        for(std::size_t i = 0; i < layout.fields.size(); ++i)
        {
            const std::size_t word_offset = i * 32;
            switch(layout.fields[i])
            {
                case AbiType::ADDRESS:
                    if(!utils::isAbiAddressWord(data, data_size, word_offset))
                    {
                        return std::nullopt;
                    }
                    break;

                case AbiType::BYTES:
                    if(!bytes_offset)
                    {
                        bytes_offset = utils::readWordAsSizeT(data, data_size, word_offset);
                        if(!bytes_offset)
                        {
                            return std::nullopt;
                        }
                    }
                    break;

                default:
                    break;
            }
        }

        if(!bytes_offset)
        {
            return std::nullopt;
        }

        return utils::decodeAbiBytes(data, data_size, *bytes_offset);
    }

    std::optional<std::vector<std::uint8_t>> decodeLayoutBytes(const EventLayout & layout, const std::vector<std::uint8_t> & data)
    {
        return decodeLayoutBytes(layout, data.data(), data.size());
    }

    std::optional<std::vector<std::uint8_t>> tryKnownLayouts(const std::vector<std::uint8_t> & data, const std::string & target_hash)
    {
        for(const EventLayout & layout : knownLayouts())
        {
            auto bytes_res = decodeLayoutBytes(layout, data);
            if(!bytes_res)
            {
                continue;
            }

            if(crypto::hashMatches(*bytes_res, target_hash))
            {
                spdlog::debug("Ancillary data matched {}{} layout ({} bytes)", layout.name, layoutSignature(layout), bytes_res->size());
                return bytes_res;
            }
        }

        return std::nullopt;
    }
}
