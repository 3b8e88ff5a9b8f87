// File: JsonText.hpp
#ifndef JSON_TEXT_HPP
#define JSON_TEXT_HPP

#include <string>

namespace json { class JSON; }

namespace IncidentFetching {

    /**
     * @brief Grammar check run before json::JSON::Load. Load reports syntax errors only
     *        on stderr and returns a partial document; truncated strings make it read past
     *        the end of the input. Only text accepted here is handed to it.
     * @return true if text is exactly one JSON value, optionally surrounded by whitespace.
     *         Exponents with an explicit '+' sign are rejected (Load does not read them).
     */
    bool isWellFormedJson(const std::string& text);

    /**
     * @brief Raw text of a String value. json::JSON::ToString() returns the value
     *        re-escaped for output; this undoes that escaping. \\uXXXX sequences from the
     *        source are kept as written.
     */
    std::string stringValue(const json::JSON& value);

} // namespace IncidentFetching

#endif // JSON_TEXT_HPP
