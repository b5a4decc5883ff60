#include "path.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

// ---------------------------------------------------------------------------
// Path building
// ---------------------------------------------------------------------------
void Path::move_to(PathPoint p)
{
    verb_list.push_back(PathVerb::MoveTo);
    point_list.push_back(p);
    current       = p;
    subpath_start = p;
    in_subpath    = true;
}

void Path::ensure_subpath()
{
    if (!in_subpath) move_to(current);
}

void Path::line_to(PathPoint p)
{
    ensure_subpath();
    verb_list.push_back(PathVerb::LineTo);
    point_list.push_back(p);
    current = p;
}

void Path::quad_to(PathPoint c, PathPoint p)
{
    ensure_subpath();
    verb_list.push_back(PathVerb::QuadTo);
    point_list.push_back(c);
    point_list.push_back(p);
    current = p;
}

void Path::cubic_to(PathPoint c1, PathPoint c2, PathPoint p)
{
    ensure_subpath();
    verb_list.push_back(PathVerb::CubicTo);
    point_list.push_back(c1);
    point_list.push_back(c2);
    point_list.push_back(p);
    current = p;
}

void Path::close()
{
    if (!in_subpath) return;
    verb_list.push_back(PathVerb::Close);
    current    = subpath_start;
    in_subpath = false;
}

// Endpoint to center parameterization (SVG 1.1 appendix F.6.5), then one
// cubic per quarter turn or less.
void Path::arc_to(double rx, double ry, double x_axis_rotation_deg,
                  bool large_arc, bool sweep, PathPoint p)
{
    const PathPoint p0 = current;
    if (p0 == p) return;

    rx = std::abs(rx);
    ry = std::abs(ry);
    if (rx == 0.0 || ry == 0.0) {
        line_to(p);
        return;
    }

    const double phi   = x_axis_rotation_deg * M_PI / 180.0;
    const double cos_p = std::cos(phi);
    const double sin_p = std::sin(phi);

    const double dx2 = (p0.x - p.x) * 0.5;
    const double dy2 = (p0.y - p.y) * 0.5;
    const double x1  =  cos_p * dx2 + sin_p * dy2;
    const double y1  = -sin_p * dx2 + cos_p * dy2;

    // Scale up radii that cannot span the endpoints.
    const double lambda = (x1 * x1) / (rx * rx) + (y1 * y1) / (ry * ry);
    if (lambda > 1.0) {
        const double s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }

    const double rx2 = rx * rx, ry2 = ry * ry;
    const double num = rx2 * ry2 - rx2 * y1 * y1 - ry2 * x1 * x1;
    const double den = rx2 * y1 * y1 + ry2 * x1 * x1;
    const double coef = (large_arc != sweep ? 1.0 : -1.0) *
                        std::sqrt(std::max(0.0, num / den));
    const double cxp =  coef * rx * y1 / ry;
    const double cyp = -coef * ry * x1 / rx;
    const double cx  = cos_p * cxp - sin_p * cyp + (p0.x + p.x) * 0.5;
    const double cy  = sin_p * cxp + cos_p * cyp + (p0.y + p.y) * 0.5;

    auto angle = [](double ux, double uy, double vx, double vy) {
        return std::atan2(ux * vy - uy * vx, ux * vx + uy * vy);
    };
    const double ux = (x1 - cxp) / rx, uy = (y1 - cyp) / ry;
    const double vx = (-x1 - cxp) / rx, vy = (-y1 - cyp) / ry;

    const double theta1 = angle(1.0, 0.0, ux, uy);
    double       dtheta = angle(ux, uy, vx, vy);
    if (!sweep && dtheta > 0.0) dtheta -= 2.0 * M_PI;
    if (sweep && dtheta < 0.0)  dtheta += 2.0 * M_PI;

    const int    segments = std::max(1, static_cast<int>(std::ceil(std::abs(dtheta) / (M_PI * 0.5) - 1e-9)));
    const double delta    = dtheta / segments;
    const double t        = 4.0 / 3.0 * std::tan(delta * 0.25);

    auto on_arc = [&](double a) {
        return PathPoint{cx + rx * std::cos(a) * cos_p - ry * std::sin(a) * sin_p,
                         cy + rx * std::cos(a) * sin_p + ry * std::sin(a) * cos_p};
    };
    auto tangent = [&](double a) {
        return PathPoint{-rx * std::sin(a) * cos_p - ry * std::cos(a) * sin_p,
                         -rx * std::sin(a) * sin_p + ry * std::cos(a) * cos_p};
    };

    for (int i = 0; i < segments; ++i) {
        const double    a1 = theta1 + i * delta;
        const double    a2 = a1 + delta;
        const PathPoint e1 = on_arc(a1);
        const PathPoint e2 = (i == segments - 1) ? p : on_arc(a2);
        const PathPoint d1 = tangent(a1);
        const PathPoint d2 = tangent(a2);
        cubic_to({e1.x + t * d1.x, e1.y + t * d1.y},
                 {e2.x - t * d2.x, e2.y - t * d2.y},
                 e2);
    }
}

// ---------------------------------------------------------------------------
// SVG path data parsing
// ---------------------------------------------------------------------------
namespace {

class PathTokenizer {
public:
    explicit PathTokenizer(const std::string& s) : src(s) {}

    size_t pos = 0;

    void skip_separators()
    {
        while (pos < src.size() &&
               (std::isspace(static_cast<unsigned char>(src[pos])) || src[pos] == ','))
            ++pos;
    }

    bool done()
    {
        skip_separators();
        return pos >= src.size();
    }

    char peek() const { return src[pos]; }

    bool next_is_number()
    {
        skip_separators();
        if (pos >= src.size()) return false;
        const char c = src[pos];
        return std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    }

    double number()
    {
        skip_separators();
        const size_t start = pos;
        size_t i = pos;
        auto digits = [&] {
            const size_t from = i;
            while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            return i > from;
        };

        if (i < src.size() && (src[i] == '+' || src[i] == '-')) ++i;
        bool mantissa = digits();
        if (i < src.size() && src[i] == '.') {
            ++i;
            mantissa = digits() || mantissa;
        }
        if (!mantissa)
            throw PathParseError(start, "expected a number");

        if (i < src.size() && (src[i] == 'e' || src[i] == 'E')) {
            size_t j = i + 1;
            if (j < src.size() && (src[j] == '+' || src[j] == '-')) ++j;
            if (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) {
                i = j;
                digits();
            }
        }

        const std::string text = src.substr(start, i - start);
        const double value = std::strtod(text.c_str(), nullptr);
        if (!std::isfinite(value))
            throw PathParseError(start, "number out of range");
        pos = i;
        return value;
    }

    // Arc flags are single characters and may run into the next token.
    bool flag()
    {
        skip_separators();
        if (pos < src.size() && (src[pos] == '0' || src[pos] == '1'))
            return src[pos++] == '1';
        throw PathParseError(pos, "expected an arc flag (0 or 1)");
    }

private:
    const std::string& src;
};

bool is_command(char c)
{
    switch (c) {
        case 'M': case 'm': case 'L': case 'l': case 'H': case 'h':
        case 'V': case 'v': case 'C': case 'c': case 'S': case 's':
        case 'Q': case 'q': case 'T': case 't': case 'A': case 'a':
        case 'Z': case 'z':
            return true;
        default:
            return false;
    }
}

PathPoint reflect(PathPoint ctrl, PathPoint about)
{
    return {2.0 * about.x - ctrl.x, 2.0 * about.y - ctrl.y};
}

} // namespace

Path parse_svg_path(const std::string& data)
{
    Path          path;
    PathTokenizer tok(data);

    char      cmd       = 0;
    char      last_kind = 0;   // 'C' or 'Q' when the previous segment was a curve
    PathPoint last_ctrl;

    while (!tok.done()) {
        const size_t at = tok.pos;
        const char   c  = tok.peek();

        if (std::isalpha(static_cast<unsigned char>(c))) {
            if (!is_command(c))
                throw PathParseError(at, std::string("unknown path command '") + c + "'");
            cmd = c;
            ++tok.pos;
        } else if (cmd == 0 || cmd == 'Z' || cmd == 'z') {
            throw PathParseError(at, "expected a path command");
        }

        if (path.empty() && cmd != 'M' && cmd != 'm')
            throw PathParseError(at, "path data must begin with a moveto");

        const bool      rel = std::islower(static_cast<unsigned char>(cmd)) != 0;
        const PathPoint cur = path.current_point();
        auto point = [&] {
            const double x = tok.number();
            const double y = tok.number();
            return rel ? PathPoint{cur.x + x, cur.y + y} : PathPoint{x, y};
        };

        char kind = 0;
        switch (std::toupper(static_cast<unsigned char>(cmd))) {
            case 'M':
                path.move_to(point());
                cmd = rel ? 'l' : 'L';   // further pairs are implicit linetos
                break;
            case 'L':
                path.line_to(point());
                break;
            case 'H': {
                const double x = tok.number();
                path.line_to({rel ? cur.x + x : x, cur.y});
                break;
            }
            case 'V': {
                const double y = tok.number();
                path.line_to({cur.x, rel ? cur.y + y : y});
                break;
            }
            case 'C': {
                const PathPoint c1 = point();
                const PathPoint c2 = point();
                const PathPoint p  = point();
                path.cubic_to(c1, c2, p);
                last_ctrl = c2;
                kind      = 'C';
                break;
            }
            case 'S': {
                const PathPoint c1 = (last_kind == 'C') ? reflect(last_ctrl, cur) : cur;
                const PathPoint c2 = point();
                const PathPoint p  = point();
                path.cubic_to(c1, c2, p);
                last_ctrl = c2;
                kind      = 'C';
                break;
            }
            case 'Q': {
                const PathPoint c1 = point();
                const PathPoint p  = point();
                path.quad_to(c1, p);
                last_ctrl = c1;
                kind      = 'Q';
                break;
            }
            case 'T': {
                const PathPoint c1 = (last_kind == 'Q') ? reflect(last_ctrl, cur) : cur;
                const PathPoint p  = point();
                path.quad_to(c1, p);
                last_ctrl = c1;
                kind      = 'Q';
                break;
            }
            case 'A': {
                const double rx    = tok.number();
                const double ry    = tok.number();
                const double rot   = tok.number();
                const bool   large = tok.flag();
                const bool   sweep = tok.flag();
                path.arc_to(rx, ry, rot, large, sweep, point());
                break;
            }
            case 'Z':
                path.close();
                break;
        }
        last_kind = kind;

        // A command letter must be followed by its arguments; after that,
        // more argument groups repeat the command.
        if (cmd != 'Z' && cmd != 'z' && !tok.done() && !tok.next_is_number() &&
            !std::isalpha(static_cast<unsigned char>(tok.peek())))
            throw PathParseError(tok.pos, "unexpected character");
    }

    return path;
}
