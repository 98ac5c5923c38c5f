#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace warden::json
{

    /**
     * Deterministic JSON serialization used for event hashing.
     *
     * Output is byte-stable across implementations:
     * - object keys sorted by UTF-8 byte order
     * - no insignificant whitespace
     * - minimal string escaping (quote, backslash, control characters)
     * - integers in plain decimal
     * - floats in shortest round-trip form using ECMAScript Number formatting
     *
     * NaN, infinities and strings that are not valid UTF-8 have no canonical
     * form and are rejected.
     */
    class Canonicalizer
    {
    public:
        /**
         * Canonicalize a JSON value
         * @return canonical text, or InvalidInput for non-finite numbers and
         *         malformed UTF-8
         */
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /** Format a finite double the way ECMAScript Number::toString does */
        static std::string format_double(double value);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);
        static Result<void> serialize_string(const std::string &str, std::string &output);
        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output);
        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output);
    };

    /**
     * Well-formed UTF-8 per RFC 3629: no overlong forms, no surrogates,
     * nothing above U+10FFFF.
     */
    bool is_valid_utf8(std::string_view text);

} // namespace warden::json
