#include "cmd.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <utility>

namespace avr::cmd
{
    namespace
    {
        bool _isFlag(const std::string & token)
        {
            return token.size() > 1 && token[0] == '-' && !(token[1] >= '0' && token[1] <= '9');
        }

        std::string _placeholder(const CommandLineArgDef & def)
        {
            switch(def.nargs)
            {
                case CommandLineArgDef::NArgs::Zero:
                    return "";
                case CommandLineArgDef::NArgs::One:
                    return def.type == CommandLineArgDef::Type::Int ? " <int>" : " <value>";
                case CommandLineArgDef::NArgs::Many:
                    return def.type == CommandLineArgDef::Type::Int ? " <int>..." : " <value>...";
            }
            return "";
        }
    }

    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help)
    {
        _defs.push_back(CommandLineArgDef{
            .name = std::move(name),
            .nargs = nargs,
            .type = type,
            .help = std::move(help)
        });
    }

    const CommandLineArgDef * ArgParser::_findDef(const std::string & name) const
    {
        const auto it = std::ranges::find(_defs, name, &CommandLineArgDef::name);
        return it == _defs.end() ? nullptr : &(*it);
    }

    parse::Result<void> ArgParser::parse(int argc, const char * const argv[])
    {
        _values.clear();
        _positional.clear();

        bool options_ended = false;
        for(int i = 1; i < argc; ++i)
        {
            const std::string token = argv[i];

            if(options_ended || !_isFlag(token))
            {
                _positional.push_back(token);
                continue;
            }

            if(token == "--")
            {
                options_ended = true;
                continue;
            }

            const CommandLineArgDef * def = _findDef(token);
            if(def == nullptr)
            {
                return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("Unknown argument {}", token)});
            }

            if(def->nargs == CommandLineArgDef::NArgs::Zero)
            {
                _values.insert_or_assign(def->name, Value{true});
                continue;
            }

            std::vector<std::string> raw_values;
            while(i + 1 < argc)
            {
                const std::string next = argv[i + 1];
                if(!raw_values.empty() && (def->nargs == CommandLineArgDef::NArgs::One || _isFlag(next)))
                {
                    break;
                }
                raw_values.push_back(next);
                ++i;
            }

            if(raw_values.empty())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::MISSING_FIELD, std::format("Argument {} expects a value", token)});
            }

            if(def->type == CommandLineArgDef::Type::Int)
            {
                std::vector<int> ints;
                for(const std::string & raw : raw_values)
                {
                    int value = 0;
                    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
                    if(ec == std::errc::result_out_of_range)
                    {
                        return std::unexpected(parse::Error{parse::Error::Kind::OUT_OF_RANGE, std::format("Argument {} value {} is out of range", token, raw)});
                    }
                    if(ec != std::errc{} || ptr != raw.data() + raw.size())
                    {
                        return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, std::format("Argument {} expects an integer, got {}", token, raw)});
                    }
                    ints.push_back(value);
                }
                _values.insert_or_assign(def->name, Value{std::move(ints)});
            }
            else
            {
                _values.insert_or_assign(def->name, Value{std::move(raw_values)});
            }
        }
        return {};
    }

    const std::vector<std::string> & ArgParser::positional() const noexcept
    {
        return _positional;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::size_t width = 0;
        for(const CommandLineArgDef & def : _defs)
        {
            width = std::max(width, def.name.size() + _placeholder(def).size());
        }

        std::string message = "Options:\n";
        for(const CommandLineArgDef & def : _defs)
        {
            message += std::format("  {:<{}}  {}\n", def.name + _placeholder(def), width, def.help);
        }
        return message;
    }
}
