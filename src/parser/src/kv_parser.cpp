#include "kv_parser.hpp"

#include <regex>

#include "utils.hpp"

namespace avr::parse
{
    ParsedKV parseAncillaryKV(const std::string & text)
    {
        static const std::regex kv_regex(R"re(([a-zA-Z][a-zA-Z0-9_]*):"([^"]+)"|([a-zA-Z][a-zA-Z0-9_]*):([^,\s]+))re");

        ParsedKV result;
        for(auto it = std::sregex_iterator(text.begin(), text.end(), kv_regex); it != std::sregex_iterator(); ++it)
        {
            const std::smatch & match = *it;
            const bool quoted = match[1].matched;

            const std::string key = quoted ? match[1].str() : match[3].str();
            const std::string value = utils::trim(quoted ? match[2].str() : match[4].str());

            if(key.empty() || value.empty())
            {
                continue;
            }
            result.insert_or_assign(key, value);
        }
        return result;
    }
}
