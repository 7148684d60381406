#include "symbol_codec.hpp"

#include <cctype>

static std::string lower(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static std::string upper(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

static bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::pair<std::string, std::string> SymbolCodec::split(const std::string &canonical)
{
    const std::string c = upper(canonical);
    for (const char *quote : {"USDT", "USDC", "USD"})
    {
        if (ends_with(c, quote))
            return {c.substr(0, c.size() - std::string(quote).size()), quote};
    }
    if (c.size() <= 3)
        return {c, ""};
    return {c.substr(0, c.size() - 3), c.substr(c.size() - 3)};
}

std::string SymbolCodec::to_venue(const std::string &venue, const std::string &c)
{
    const std::string venue_lc = lower(venue);

    if (venue_lc == "okx")
    {
        auto [base, quote] = split(c);
        if (quote.empty())
            return upper(c);
        return base + "-" + quote;
    }
    else if (venue_lc == "binance")
    {
        return lower(c);
    }
    return c;
}

std::string SymbolCodec::to_canonical(const std::string &venue, const std::string &v)
{
    const std::string venue_lc = lower(venue);

    if (venue_lc == "okx")
    {
        std::string c;
        c.reserve(v.size());
        for (char ch : v)
            if (ch != '-')
                c.push_back(ch);
        return upper(c);
    }
    return upper(v);
}
