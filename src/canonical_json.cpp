#include "warden/canonical_json.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace warden::json
{

    Result<std::string> Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output); !res)
            return std::unexpected(res.error());
        return output;
    }

    std::string Canonicalizer::format_double(double value)
    {
        if (value == 0.0)
            return "0";

        // Shortest round-trip digits, e.g. "1.2345e+02"
        std::array<char, 64> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(),
                                       std::abs(value), std::chars_format::scientific);
        std::string sci(buf.data(), end);

        auto e_pos = sci.find('e');
        std::string digits;
        for (std::size_t i = 0; i < e_pos; ++i)
        {
            if (sci[i] != '.')
                digits += sci[i];
        }
        while (digits.size() > 1 && digits.back() == '0')
            digits.pop_back();

        int exponent = std::stoi(sci.substr(e_pos + 1));
        int k = static_cast<int>(digits.size());
        int n = exponent + 1;

        std::string out = value < 0 ? "-" : "";
        if (k <= n && n <= 21)
        {
            out += digits;
            out.append(static_cast<std::size_t>(n - k), '0');
        }
        else if (0 < n && n <= 21)
        {
            out += digits.substr(0, static_cast<std::size_t>(n));
            out += '.';
            out += digits.substr(static_cast<std::size_t>(n));
        }
        else if (-6 < n && n <= 0)
        {
            out += "0.";
            out.append(static_cast<std::size_t>(-n), '0');
            out += digits;
        }
        else
        {
            out += digits[0];
            if (k > 1)
            {
                out += '.';
                out += digits.substr(1);
            }
            out += 'e';
            out += (n - 1) >= 0 ? "+" : "-";
            out += std::to_string(std::abs(n - 1));
        }
        return out;
    }

    Result<void> Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
            output += std::to_string(value.get<std::int64_t>());
            return {};

        case nlohmann::json::value_t::number_unsigned:
            output += std::to_string(value.get<std::uint64_t>());
            return {};

        case nlohmann::json::value_t::number_float:
        {
            double d = value.get<double>();
            if (!std::isfinite(d))
            {
                return std::unexpected(WardenError::invalid_input(
                    "non-finite number has no canonical form"));
            }
            output += format_double(d);
            return {};
        }

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output);

        default:
            return std::unexpected(WardenError::invalid_input(
                "binary or discarded JSON values cannot be canonicalized"));
        }
    }

    Result<void> Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        if (!is_valid_utf8(str))
            return std::unexpected(WardenError::invalid_input("string is not valid UTF-8"));

        output += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                    output += std::format("\\u{:04x}", static_cast<int>(ch));
                else
                    output += static_cast<char>(ch);
                break;
            }
        }
        output += '"';
        return {};
    }

    Result<void> Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output)
    {
        std::vector<const std::string *> keys;
        keys.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
            keys.push_back(&it.key());

        // std::string comparison is byte-wise, which is UTF-8 code point order
        std::sort(keys.begin(), keys.end(),
                  [](const std::string *a, const std::string *b)
                  { return *a < *b; });

        output += '{';
        bool first = true;
        for (const auto *key : keys)
        {
            if (!first)
                output += ',';
            first = false;

            if (auto res = serialize_string(*key, output); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(obj.at(*key), output); !res)
                return res;
        }
        output += '}';
        return {};
    }

    Result<void> Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output)
    {
        output += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
                output += ',';
            first = false;
            if (auto res = serialize_value(item, output); !res)
                return res;
        }
        output += ']';
        return {};
    }

    bool is_valid_utf8(std::string_view text)
    {
        std::size_t i = 0;
        while (i < text.size())
        {
            auto lead = static_cast<unsigned char>(text[i]);
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF)
                length = 2;
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                if (lead == 0xE0)
                    lo = 0xA0;
                else if (lead == 0xED)
                    hi = 0x9F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                if (lead == 0xF0)
                    lo = 0x90;
                else if (lead == 0xF4)
                    hi = 0x8F;
            }
            else
                return false;

            if (text.size() - i < length)
                return false;

            // Only the first continuation byte has a narrowed range
            auto second = static_cast<unsigned char>(text[i + 1]);
            if (second < lo || second > hi)
                return false;
            for (std::size_t k = 2; k < length; ++k)
            {
                auto cont = static_cast<unsigned char>(text[i + k]);
                if (cont < 0x80 || cont > 0xBF)
                    return false;
            }
            i += length;
        }
        return true;
    }

} // namespace warden::json
