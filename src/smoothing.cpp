#include "smoothing.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

double Smoothing::smooth(uint32_t n, std::complex<double> z,
                         std::complex<double> z_prev) const
{
    if (type == SmoothingType::None)
        return static_cast<double>(n);

    const double mag2 = std::norm(z);
    if (n == 0 || mag2 <= escape_radius_squared())
        return static_cast<double>(n);   // escaped at once, or never escaped

    const double log_r     = std::log(radius);
    const double log_power = std::log(power);
    const double prev_mag2 = std::norm(z_prev);

    // Fraction of the last step spent below the radius, measured in
    // log-log space where each step multiplies log|z| by roughly `power`.
    double frac;
    if (prev_mag2 > 1.0) {
        const double log_prev = std::log(prev_mag2) * 0.5;
        frac = std::log(log_r / log_prev) / log_power;
    } else {
        // log|z_prev| <= 0 has no log-log distance; use the final overshoot.
        const double log_z = std::log(mag2) * 0.5;
        frac = 1.0 - std::log(log_z / log_r) / log_power;
    }
    frac = std::max(0.0, std::min(1.0, frac));

    return static_cast<double>(n - 1) + frac;
}

std::string Smoothing::to_string() const
{
    if (type == SmoothingType::None)
        return "None";
    char buf[96];
    std::snprintf(buf, sizeof(buf), "LogarithmicDistance(%g, %g)", radius, power);
    return buf;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
static std::string trim(const std::string& s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string to_lower(std::string s)
{
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static double parse_component(const std::string& text, const char* what)
{
    const std::string t = trim(text);
    size_t used = 0;
    double v;
    try {
        v = std::stod(t, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid smoothing ") + what +
                                    ": '" + t + "'");
    }
    if (used != t.size() || !std::isfinite(v))
        throw std::invalid_argument(std::string("invalid smoothing ") + what +
                                    ": '" + t + "'");
    return v;
}

Smoothing parse_smoothing(const std::string& text)
{
    const std::string t    = trim(text);
    const size_t      open = t.find('(');
    const std::string name = to_lower(trim(t.substr(0, open)));

    if (open == std::string::npos) {
        if (name == "none")
            return Smoothing::none();
        throw std::invalid_argument("unknown smoothing '" + t +
                                    "' (expected None or LogarithmicDistance(r, p))");
    }

    if (name != "logarithmicdistance")
        throw std::invalid_argument("unknown smoothing '" + t + "'");
    if (t.back() != ')')
        throw std::invalid_argument("missing ')' in smoothing '" + t + "'");

    const std::string args  = t.substr(open + 1, t.size() - open - 2);
    const size_t      comma = args.find(',');
    if (comma == std::string::npos || args.find(',', comma + 1) != std::string::npos)
        throw std::invalid_argument("LogarithmicDistance takes two arguments: '" + t + "'");

    const double radius = parse_component(args.substr(0, comma), "radius");
    const double power  = parse_component(args.substr(comma + 1), "power");
    if (radius <= 1.0)
        throw std::invalid_argument("smoothing radius must be greater than 1");
    if (power <= 1.0)
        throw std::invalid_argument("smoothing power must be greater than 1");

    return Smoothing::logarithmic_distance(radius, power);
}
