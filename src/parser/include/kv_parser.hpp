#pragma once

#include <string>

#include <absl/container/flat_hash_map.h>

namespace avr::parse
{
    using ParsedKV = absl::flat_hash_map<std::string, std::string>;

    /**
     * @brief Tokenizes `key:"quoted value"` and `key:value` pairs.
     *
     * Keys start with a letter and contain letters, digits or underscores.
     * Unquoted values end at the next comma or whitespace. Values are trimmed,
     * empty ones dropped, and a repeated key keeps its last value.
     */
    ParsedKV parseAncillaryKV(const std::string & text);
}
