#pragma once
#include <optional>
#include <string>
#include <uuid/uuid.h>

// Random (v4) UUID in lower-case canonical form.
inline std::string GenerateUuid()
{
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

// Canonical lower-case form of a UUID given in any case, or nullopt when the text is not a UUID.
inline std::optional<std::string> NormalizeUuid(const std::string &text)
{
    uuid_t raw;
    if (uuid_parse(text.c_str(), raw) != 0) return std::nullopt;
    char canonical[37];
    uuid_unparse_lower(raw, canonical);
    return std::string(canonical);
}
