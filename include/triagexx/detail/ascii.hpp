#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace triagexx
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view s, std::string_view prefix) noexcept
    {
        return s.size() >= prefix.size() && iequals_ascii(s.substr(0, prefix.size()), prefix);
    }

    [[nodiscard]] inline std::string to_lower_ascii(std::string_view sv)
    {
        std::string out(sv);
        for (char& c : out)
            c = ascii_tolower(c);
        return out;
    }

    [[nodiscard]] constexpr bool is_ascii_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_ascii_space(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_ascii_space(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        sv = trim_view(sv);
        return std::string(sv);
    }

    // Runs of ASCII whitespace (including line breaks) become a single space.
    [[nodiscard]] inline std::string collapse_whitespace(std::string_view sv)
    {
        std::string out;
        out.reserve(sv.size());
        bool pending_space = false;
        for (char ch : trim_view(sv))
        {
            if (is_ascii_space(ch))
            {
                pending_space = true;
                continue;
            }
            if (pending_space)
                out += ' ';
            pending_space = false;
            out += ch;
        }
        return out;
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // Loose addr-spec check: one '@' with non-empty local part and domain, no whitespace.
    [[nodiscard]] inline bool looks_like_address(std::string_view addr) noexcept
    {
        const auto at = addr.find('@');
        if (at == std::string_view::npos || at == 0 || at + 1 >= addr.size())
            return false;
        if (addr.find('@', at + 1) != std::string_view::npos)
            return false;
        for (char ch : addr)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            if (is_ascii_space(ch) || c < 33 || c == 127 || ch == '<' || ch == '>')
                return false;
        }
        return true;
    }

    // Canonical identifier form: non-alphanumeric runs become '_', upper case, no edge underscores.
    [[nodiscard]] inline std::string to_screaming_snake(std::string_view sv)
    {
        std::string out;
        out.reserve(sv.size());
        bool pending_sep = false;
        for (char ch : sv)
        {
            if (!is_ascii_alnum(ch))
            {
                pending_sep = true;
                continue;
            }
            if (pending_sep && !out.empty())
                out += '_';
            pending_sep = false;
            out += ascii_toupper(ch);
        }
        return out;
    }
}
}
