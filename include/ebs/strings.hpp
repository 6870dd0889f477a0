// Small string helpers shared by the front-end and runtime.
#pragma once
#include <string>
#include <string_view>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cmath>

namespace ebs
{

    inline std::string to_lower(std::string_view s)
    {
        std::string out(s);
        for (auto &c : out)
            c = (char)std::tolower((unsigned char)c);
        return out;
    }

    inline std::string to_upper(std::string_view s)
    {
        std::string out(s);
        for (auto &c : out)
            c = (char)std::toupper((unsigned char)c);
        return out;
    }

    inline bool iequals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
            if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
                return false;
        return true;
    }

    // Shortest "%g" rendering that reads back to the same double; always carries
    // a '.' or exponent so the text lexes as a floating literal again.
    inline std::string format_double(double d)
    {
        if (std::isnan(d))
            return "nan";
        if (std::isinf(d))
            return d < 0 ? "-inf" : "inf";
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%.15g", d);
        if (std::strtod(buf, nullptr) != d)
            std::snprintf(buf, sizeof(buf), "%.17g", d);
        std::string s(buf);
        if (s.find_first_of(".eE") == std::string::npos)
            s += ".0";
        return s;
    }

} // namespace ebs
