#include "path_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace masterplan::geometry {

namespace {

constexpr double kPi          = 3.14159265358979323846;
constexpr int    kMaxSegments = 1024;

bool IsCommand(char c) {
  switch (c) {
    case 'M': case 'm': case 'L': case 'l': case 'H': case 'h': case 'V': case 'v':
    case 'C': case 'c': case 'S': case 's': case 'Q': case 'q': case 'T': case 't':
    case 'A': case 'a': case 'Z': case 'z':
      return true;
    default:
      return false;
  }
}

/*
  Cursor over the path string. Numbers go through strtod so that things
  like "nan" are parsed and then rejected as non-finite rather than
  reported as a syntax error.
*/
class Scanner {
 public:
  explicit Scanner(std::string_view text) : text_(text) {
  }

  void SkipSeparators() {
    while (pos_ < text_.size() && (std::isspace(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == ',')) {
      ++pos_;
    }
  }

  bool AtEnd() {
    SkipSeparators();
    return pos_ >= text_.size();
  }

  bool PeekCommand(char* out) {
    SkipSeparators();
    if (pos_ < text_.size() && IsCommand(text_[pos_])) {
      *out = text_[pos_];
      return true;
    }
    return false;
  }

  void Advance() {
    ++pos_;
  }

  // True when a number (not a command) follows.
  bool HasNumber() {
    SkipSeparators();
    return pos_ < text_.size() && !IsCommand(text_[pos_]);
  }

  double Number() {
    SkipSeparators();
    if (pos_ >= text_.size()) {
      throw util::GeometryError("path data ends where a number was expected");
    }

    // strtod needs a terminated buffer; no SVG number is longer than this
    const std::string run(text_.substr(pos_, 64));

    char*        stop  = nullptr;
    const double value = std::strtod(run.c_str(), &stop);
    if (stop == run.c_str()) {
      throw util::GeometryError("invalid number in path data at offset " + std::to_string(pos_));
    }
    if (!std::isfinite(value)) {
      throw util::GeometryError("non-finite coordinate in path data at offset " + std::to_string(pos_));
    }
    pos_ += static_cast<size_t>(stop - run.c_str());
    return value;
  }

  // Arc flags may be written without separators ("a5 5 0 10 20 20").
  bool Flag() {
    SkipSeparators();
    if (pos_ < text_.size() && (text_[pos_] == '0' || text_[pos_] == '1')) {
      return text_[pos_++] == '1';
    }
    throw util::GeometryError("invalid arc flag in path data at offset " + std::to_string(pos_));
  }

 private:
  std::string_view text_;
  size_t           pos_ = 0;
};

double Distance(const Point& a, const Point& b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

int SegmentsFor(double deviation_bound, double tolerance) {
  if (deviation_bound <= 0.0) return 1;
  const double n = std::ceil(std::sqrt(deviation_bound / tolerance));
  return static_cast<int>(std::clamp(n, 1.0, static_cast<double>(kMaxSegments)));
}

void FlattenQuadratic(Ring& ring, const Point& p0, const Point& p1, const Point& p2, double tolerance) {
  // |B''| = 2|p0 - 2p1 + p2|; chord error <= |B''| / (8 n^2)
  const double ddx = p0.x - 2 * p1.x + p2.x;
  const double ddy = p0.y - 2 * p1.y + p2.y;
  const int    n   = SegmentsFor(std::hypot(ddx, ddy) / 4.0, tolerance);
  for (int i = 1; i <= n; ++i) {
    const double t  = static_cast<double>(i) / n;
    const double mt = 1.0 - t;
    ring.push_back({mt * mt * p0.x + 2 * mt * t * p1.x + t * t * p2.x, mt * mt * p0.y + 2 * mt * t * p1.y + t * t * p2.y});
  }
}

void FlattenCubic(Ring& ring, const Point& p0, const Point& p1, const Point& p2, const Point& p3, double tolerance) {
  // |B''| <= 6 max(|p0 - 2p1 + p2|, |p1 - 2p2 + p3|)
  const double d1 = std::hypot(p0.x - 2 * p1.x + p2.x, p0.y - 2 * p1.y + p2.y);
  const double d2 = std::hypot(p1.x - 2 * p2.x + p3.x, p1.y - 2 * p2.y + p3.y);
  const int    n  = SegmentsFor(0.75 * std::max(d1, d2), tolerance);
  for (int i = 1; i <= n; ++i) {
    const double t  = static_cast<double>(i) / n;
    const double mt = 1.0 - t;
    const double a = mt * mt * mt, b = 3 * mt * mt * t, c = 3 * mt * t * t, e = t * t * t;
    ring.push_back({a * p0.x + b * p1.x + c * p2.x + e * p3.x, a * p0.y + b * p1.y + c * p2.y + e * p3.y});
  }
}

double VectorAngle(double ux, double uy, double vx, double vy) {
  const double dot = ux * vx + uy * vy;
  const double len = std::hypot(ux, uy) * std::hypot(vx, vy);
  double       a   = std::acos(std::clamp(dot / len, -1.0, 1.0));
  if (ux * vy - uy * vx < 0) a = -a;
  return a;
}

// Endpoint → centre parameterisation, SVG 1.1 implementation notes F.6.5.
void FlattenArc(Ring& ring, const Point& p0, double rx, double ry, double rotation_deg, bool large_arc, bool sweep, const Point& p1,
                double tolerance) {
  if (Distance(p0, p1) == 0.0) return;
  rx = std::fabs(rx);
  ry = std::fabs(ry);
  if (rx == 0.0 || ry == 0.0) {
    ring.push_back(p1);
    return;
  }

  const double phi  = rotation_deg * kPi / 180.0;
  const double cphi = std::cos(phi), sphi = std::sin(phi);

  const double dx2 = (p0.x - p1.x) / 2.0, dy2 = (p0.y - p1.y) / 2.0;
  const double x1p = cphi * dx2 + sphi * dy2;
  const double y1p = -sphi * dx2 + cphi * dy2;

  // scale radii up when they cannot span the endpoints
  const double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
  if (lambda > 1.0) {
    rx *= std::sqrt(lambda);
    ry *= std::sqrt(lambda);
  }

  const double num  = rx * rx * ry * ry - rx * rx * y1p * y1p - ry * ry * x1p * x1p;
  const double den  = rx * rx * y1p * y1p + ry * ry * x1p * x1p;
  double       coef = std::sqrt(std::max(0.0, num / den));
  if (large_arc == sweep) coef = -coef;

  const double cxp = coef * rx * y1p / ry;
  const double cyp = -coef * ry * x1p / rx;
  const double cx  = cphi * cxp - sphi * cyp + (p0.x + p1.x) / 2.0;
  const double cy  = sphi * cxp + cphi * cyp + (p0.y + p1.y) / 2.0;

  const double theta1 = VectorAngle(1, 0, (x1p - cxp) / rx, (y1p - cyp) / ry);
  double       dtheta = VectorAngle((x1p - cxp) / rx, (y1p - cyp) / ry, (-x1p - cxp) / rx, (-y1p - cyp) / ry);
  if (!sweep && dtheta > 0) dtheta -= 2 * kPi;
  if (sweep && dtheta < 0) dtheta += 2 * kPi;

  // chord of angle s on radius r deviates r(1 - cos(s/2))
  const double r    = std::max(rx, ry);
  double       step = tolerance >= r ? kPi / 2 : 2 * std::acos(1.0 - tolerance / r);
  int          n    = static_cast<int>(std::clamp(std::ceil(std::fabs(dtheta) / step), 1.0, static_cast<double>(kMaxSegments)));

  for (int i = 1; i < n; ++i) {
    const double t = theta1 + dtheta * i / n;
    const double x = rx * std::cos(t), y = ry * std::sin(t);
    ring.push_back({cphi * x - sphi * y + cx, sphi * x + cphi * y + cy});
  }
  ring.push_back(p1);
}

} // namespace

std::vector<Ring> ParsePathData(std::string_view d, double tolerance) {
  if (!(tolerance > 0.0)) {
    throw util::ValidationError("curve tolerance must be positive");
  }

  Scanner           in(d);
  std::vector<Ring> rings;
  Point             current{0, 0};
  Point             start{0, 0};
  Point             last_control{0, 0};
  char              previous = 0;
  char              command  = 0;

  auto ring = [&]() -> Ring& {
    if (rings.empty()) {
      rings.push_back({current});
    }
    return rings.back();
  };

  while (!in.AtEnd()) {
    char next = 0;
    if (in.PeekCommand(&next)) {
      command = next;
      in.Advance();
    } else if (command == 0) {
      throw util::GeometryError("path data must start with a moveto");
    } else if (command == 'M') {
      command = 'L'; // implicit lineto after moveto
    } else if (command == 'm') {
      command = 'l';
    } else if (command == 'Z' || command == 'z') {
      throw util::GeometryError("unexpected number after closepath");
    }

    const bool rel = std::islower(static_cast<unsigned char>(command));
    const auto abs = [&](double x, double y) { return rel ? Point{current.x + x, current.y + y} : Point{x, y}; };

    switch (command) {
      case 'M':
      case 'm': {
        const double x = in.Number();
        const double y = in.Number();
        current        = abs(x, y);
        start          = current;
        rings.push_back({current});
        break;
      }
      case 'L':
      case 'l': {
        const double x = in.Number();
        const double y = in.Number();
        current        = abs(x, y);
        ring().push_back(current);
        break;
      }
      case 'H':
      case 'h': {
        const double x = in.Number();
        current.x      = rel ? current.x + x : x;
        ring().push_back(current);
        break;
      }
      case 'V':
      case 'v': {
        const double y = in.Number();
        current.y      = rel ? current.y + y : y;
        ring().push_back(current);
        break;
      }
      case 'C':
      case 'c': {
        const double x1 = in.Number(), y1 = in.Number();
        const double x2 = in.Number(), y2 = in.Number();
        const double x  = in.Number(), y = in.Number();
        const Point  c1 = abs(x1, y1), c2 = abs(x2, y2), end = abs(x, y);
        FlattenCubic(ring(), current, c1, c2, end, tolerance);
        last_control = c2;
        current      = end;
        break;
      }
      case 'S':
      case 's': {
        const double x2 = in.Number(), y2 = in.Number();
        const double x  = in.Number(), y = in.Number();
        const bool   follows = previous == 'C' || previous == 'c' || previous == 'S' || previous == 's';
        const Point  c1      = follows ? Point{2 * current.x - last_control.x, 2 * current.y - last_control.y} : current;
        const Point  c2 = abs(x2, y2), end = abs(x, y);
        FlattenCubic(ring(), current, c1, c2, end, tolerance);
        last_control = c2;
        current      = end;
        break;
      }
      case 'Q':
      case 'q': {
        const double x1 = in.Number(), y1 = in.Number();
        const double x  = in.Number(), y = in.Number();
        const Point  c = abs(x1, y1), end = abs(x, y);
        FlattenQuadratic(ring(), current, c, end, tolerance);
        last_control = c;
        current      = end;
        break;
      }
      case 'T':
      case 't': {
        const double x = in.Number(), y = in.Number();
        const bool   follows = previous == 'Q' || previous == 'q' || previous == 'T' || previous == 't';
        const Point  c       = follows ? Point{2 * current.x - last_control.x, 2 * current.y - last_control.y} : current;
        const Point  end     = abs(x, y);
        FlattenQuadratic(ring(), current, c, end, tolerance);
        last_control = c;
        current      = end;
        break;
      }
      case 'A':
      case 'a': {
        const double rx    = in.Number();
        const double ry    = in.Number();
        const double angle = in.Number();
        const bool   large = in.Flag();
        const bool   sweep = in.Flag();
        const double x = in.Number(), y = in.Number();
        const Point  end = abs(x, y);
        FlattenArc(ring(), current, rx, ry, angle, large, sweep, end, tolerance);
        current = end;
        break;
      }
      case 'Z':
      case 'z': {
        // ring is closed implicitly; the next segment starts at the subpath start
        current = start;
        if (in.HasNumber()) {
          throw util::GeometryError("unexpected number after closepath");
        }
        char peek = 0;
        if (!in.AtEnd() && in.PeekCommand(&peek) && peek != 'M' && peek != 'm') {
          rings.push_back({current});
        }
        break;
      }
      default:
        throw util::GeometryError(std::string("unsupported path command '") + command + "'");
    }
    previous = command;
  }

  rings.erase(std::remove_if(rings.begin(), rings.end(), [](const Ring& r) { return r.empty(); }), rings.end());
  if (rings.empty()) {
    throw util::GeometryError("path data has no coordinates");
  }
  return rings;
}

std::vector<Point> ParsePointList(std::string_view points) {
  Scanner            in(points);
  std::vector<Point> out;
  while (!in.AtEnd()) {
    if (char c = 0; in.PeekCommand(&c)) {
      throw util::GeometryError(std::string("unexpected '") + c + "' in point list");
    }
    const double x = in.Number();
    if (in.AtEnd()) {
      throw util::GeometryError("point list has an odd number of coordinates");
    }
    const double y = in.Number();
    out.push_back({x, y});
  }
  if (out.empty()) {
    throw util::GeometryError("point list is empty");
  }
  return out;
}

} // namespace masterplan::geometry
