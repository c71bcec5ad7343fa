#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "parse_error.hpp"

namespace avr::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string help;
    };

    /**
     * @brief Minimal command line parser.
     *
     * Zero-argument flags are stored as bool, others as std::vector<int> or
     * std::vector<std::string> depending on their type. Tokens that are not
     * flags are collected as positional arguments.
     */
    class ArgParser
    {
    public:
        using Value = std::variant<bool, std::vector<int>, std::vector<std::string>>;

        void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help);

        parse::Result<void> parse(int argc, const char * const argv[]);

        template<class T>
        std::optional<T> getArg(const std::string & name) const
        {
            const auto it = _values.find(name);
            if(it == _values.end())
            {
                return std::nullopt;
            }

            if(const T * value = std::get_if<T>(&it->second))
            {
                return *value;
            }
            return std::nullopt;
        }

        const std::vector<std::string> & positional() const noexcept;

        std::string constructHelpMessage() const;

    private:
        const CommandLineArgDef * _findDef(const std::string & name) const;

        std::vector<CommandLineArgDef> _defs;
        absl::flat_hash_map<std::string, Value> _values;
        std::vector<std::string> _positional;
    };
}
