#include "RasterSurface.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace turtlescript {

namespace {

// Standard 16-colour CGA/EGA palette
constexpr Rgba PALETTE[16] = {
    {0,   0,   0,   255}, // 0  Black
    {0,   0,   170, 255}, // 1  Blue
    {0,   170, 0,   255}, // 2  Green
    {0,   170, 170, 255}, // 3  Cyan
    {170, 0,   0,   255}, // 4  Red
    {170, 0,   170, 255}, // 5  Magenta
    {170, 85,  0,   255}, // 6  Brown
    {170, 170, 170, 255}, // 7  Light Gray
    {85,  85,  85,  255}, // 8  Dark Gray
    {85,  85,  255, 255}, // 9  Light Blue
    {85,  255, 85,  255}, // 10 Light Green
    {85,  255, 255, 255}, // 11 Light Cyan
    {255, 85,  85,  255}, // 12 Light Red
    {255, 85,  255, 255}, // 13 Light Magenta
    {255, 255, 85,  255}, // 14 Yellow
    {255, 255, 255, 255}  // 15 White
};

const std::unordered_map<std::string, Rgba>& namedColors() {
    static const std::unordered_map<std::string, Rgba> names = {
        {"black", {0, 0, 0, 255}},       {"k", {0, 0, 0, 255}},
        {"white", {255, 255, 255, 255}}, {"w", {255, 255, 255, 255}},
        {"red", {255, 0, 0, 255}},       {"r", {255, 0, 0, 255}},
        {"green", {0, 128, 0, 255}},     {"g", {0, 128, 0, 255}},
        {"blue", {0, 0, 255, 255}},      {"b", {0, 0, 255, 255}},
        {"yellow", {255, 255, 0, 255}},  {"y", {255, 255, 0, 255}},
        {"cyan", {0, 255, 255, 255}},    {"c", {0, 255, 255, 255}},
        {"magenta", {255, 0, 255, 255}}, {"m", {255, 0, 255, 255}},
        {"orange", {255, 165, 0, 255}},
        {"purple", {128, 0, 128, 255}},
        {"pink", {255, 192, 203, 255}},
        {"brown", {165, 42, 42, 255}},
        {"gray", {128, 128, 128, 255}},  {"grey", {128, 128, 128, 255}},
        {"lime", {0, 255, 0, 255}},
        {"navy", {0, 0, 128, 255}},
    };
    return names;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr double kPi = 3.14159265358979323846;
constexpr int kArcSegments = 64;

// Past this radius circles are sampled per row and column instead of walked point by point.
constexpr int kMidpointRadiusLimit = 4096;
// Brushes wider than this are filled as shapes rather than stamped per pixel.
constexpr int kThickBrushRadius = 4;
constexpr int kPixelLimit = 1 << 24;

// Saturating conversion; NaN maps to lo.
int clampToInt(double v, int lo, int hi) {
    if (!(v > lo)) return lo;
    if (!(v < hi)) return hi;
    return static_cast<int>(v);
}

bool isFinitePoint(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// Liang-Barsky. Only moves an endpoint when it lies outside the box.
bool clipSegment(double& x1, double& y1, double& x2, double& y2,
                 double xmin, double ymin, double xmax, double ymax) {
    const double dx = x2 - x1;
    const double dy = y2 - y1;
    if (!std::isfinite(dx) || !std::isfinite(dy)) return false;

    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {x1 - xmin, xmax - x1, y1 - ymin, ymax - y1};
    double t0 = 0.0;
    double t1 = 1.0;
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;
            continue;
        }
        double t = q[i] / p[i];
        if (p[i] < 0.0) {
            if (t > t1) return false;
            t0 = std::max(t0, t);
        } else {
            if (t < t0) return false;
            t1 = std::min(t1, t);
        }
    }

    const double sx = x1;
    const double sy = y1;
    if (t1 < 1.0) {
        x2 = sx + t1 * dx;
        y2 = sy + t1 * dy;
    }
    if (t0 > 0.0) {
        x1 = sx + t0 * dx;
        y1 = sy + t0 * dy;
    }
    return true;
}

} // namespace

RasterSurface::RasterSurface(int width, int height)
    : width_(std::max(1, width)), height_(std::max(1, height)),
      pixels_(static_cast<size_t>(width_) * height_ * 4) {
    clear();
}

std::optional<Rgba> RasterSurface::parseColor(const std::string& text) {
    if (text.empty()) return std::nullopt;

    if (text[0] == '#') {
        if (text.size() != 7) return std::nullopt;
        int v[6];
        for (int i = 0; i < 6; ++i) {
            v[i] = hexDigit(text[i + 1]);
            if (v[i] < 0) return std::nullopt;
        }
        return Rgba{static_cast<uint8_t>(v[0] * 16 + v[1]), static_cast<uint8_t>(v[2] * 16 + v[3]),
                    static_cast<uint8_t>(v[4] * 16 + v[5]), 255};
    }

    if (std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        if (text.size() > 2) return std::nullopt;
        int index = std::stoi(text);
        if (index < 0 || index > 15) return std::nullopt;
        return PALETTE[index];
    }

    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    const auto& names = namedColors();
    auto it = names.find(lower);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

// ---- State ----

void RasterSurface::moveTo(double x, double y) {
    current_ = {x, y};
}

void RasterSurface::lineTo(double x, double y) {
    Point target{x, y};
    if (penDown_) drawSegment(current_, target, penColor_);
    current_ = target;
}

void RasterSurface::setPenDown(bool down) {
    penDown_ = down;
}

void RasterSurface::setColor(const std::string& color) {
    auto parsed = parseColor(color);
    if (!parsed) {
        std::cerr << "[RasterSurface] Unknown colour '" << color << "', keeping current pen colour" << std::endl;
        return;
    }
    penColor_ = *parsed;
}

void RasterSurface::setWidth(double width) {
    penWidth_ = std::max(0.1, width);
}

void RasterSurface::setFill(bool enabled) {
    fill_ = enabled;
}

void RasterSurface::clear() {
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = BACKGROUND.r;
        pixels_[i + 1] = BACKGROUND.g;
        pixels_[i + 2] = BACKGROUND.b;
        pixels_[i + 3] = BACKGROUND.a;
    }
}

void RasterSurface::resetState() {
    current_ = {0.0, 0.0};
    penDown_ = true;
    penColor_ = DEFAULT_PEN;
    penWidth_ = 1.0;
    fill_ = false;
}

void RasterSurface::present() {
    if (presentCallback_) presentCallback_(*this);
}

// ---- Shapes ----

void RasterSurface::drawCircle(double radius, std::optional<double> cx, std::optional<double> cy) {
    Point centre{cx.value_or(current_.x), cy.value_or(current_.y)};
    if (!isFinitePoint(centre) || !std::isfinite(radius)) return;

    const double px = std::round(width_ / 2.0 + centre.x);
    const double py = std::round(height_ / 2.0 - centre.y);
    const double r = std::round(std::fabs(radius));
    const int brush = brushRadius();

    double reach = r + brush + 1.0;
    if (px + reach < 0 || px - reach >= width_ || py + reach < 0 || py - reach >= height_) return;

    if (fill_) fillRing(px, py, 0.0, r, penColor_);
    if (brush > kThickBrushRadius) {
        fillRing(px, py, std::max(0.0, r - brush), r + brush, penColor_);
    } else if (r <= kMidpointRadiusLimit) {
        drawCircleMidpoint(static_cast<int>(px), static_cast<int>(py), static_cast<int>(r), penColor_);
    } else {
        drawCircleSampled(px, py, r, penColor_);
    }
}

void RasterSurface::drawRectangle(double width, double height, std::optional<double> x, std::optional<double> y) {
    Point corner{x.value_or(current_.x), y.value_or(current_.y)};
    std::vector<Point> corners = {
        corner,
        {corner.x + width, corner.y},
        {corner.x + width, corner.y + height},
        {corner.x, corner.y + height},
    };
    if (fill_) fillPolygon(corners, penColor_);
    for (size_t i = 0; i < corners.size(); ++i) {
        drawSegment(corners[i], corners[(i + 1) % corners.size()], penColor_);
    }
}

void RasterSurface::drawLine(double x1, double y1, double x2, double y2) {
    drawSegment({x1, y1}, {x2, y2}, penColor_);
}

void RasterSurface::drawPolygon(const std::vector<Point>& points) {
    if (points.empty()) return;
    if (fill_ && points.size() >= 3) fillPolygon(points, penColor_);
    for (size_t i = 0; i < points.size(); ++i) {
        drawSegment(points[i], points[(i + 1) % points.size()], penColor_);
    }
}

void RasterSurface::drawArc(double width, double height, double angleDegrees,
                            std::optional<double> cx, std::optional<double> cy) {
    const Point centre{cx.value_or(current_.x), cy.value_or(current_.y)};
    const double a = width / 2.0;
    const double b = height / 2.0;
    const double rot = angleDegrees * kPi / 180.0;
    const double cosR = std::cos(rot);
    const double sinR = std::sin(rot);

    auto pointAt = [&](double t) {
        double ex = a * std::cos(t);
        double ey = b * std::sin(t);
        return Point{centre.x + ex * cosR - ey * sinR, centre.y + ex * sinR + ey * cosR};
    };

    Point prev = pointAt(0.0);
    for (int i = 1; i <= kArcSegments; ++i) {
        Point next = pointAt(kPi * i / kArcSegments);
        drawSegment(prev, next, penColor_);
        prev = next;
    }
}

// ---- Pixels ----

std::pair<int, int> RasterSurface::toPixel(double x, double y) const {
    return {clampToInt(std::round(width_ / 2.0 + x), -kPixelLimit, kPixelLimit),
            clampToInt(std::round(height_ / 2.0 - y), -kPixelLimit, kPixelLimit)};
}

bool RasterSurface::isValidCoordinate(int px, int py) const {
    return px >= 0 && px < width_ && py >= 0 && py < height_;
}

Rgba RasterSurface::getPixel(int px, int py) const {
    if (!isValidCoordinate(px, py)) return BACKGROUND;
    size_t i = (static_cast<size_t>(py) * width_ + px) * 4;
    return {pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
}

Rgba RasterSurface::getPixelAt(double x, double y) const {
    auto [px, py] = toPixel(x, y);
    return getPixel(px, py);
}

void RasterSurface::plotPixel(int px, int py, Rgba color) {
    if (!isValidCoordinate(px, py)) return;
    size_t i = (static_cast<size_t>(py) * width_ + px) * 4;
    pixels_[i] = color.r;
    pixels_[i + 1] = color.g;
    pixels_[i + 2] = color.b;
    pixels_[i + 3] = color.a;
}

// Half the pen width in pixels, capped at the canvas diagonal.
int RasterSurface::brushRadius() const {
    const double limit = std::ceil(std::hypot(width_, height_));
    return static_cast<int>(std::min(penWidth_ / 2.0, limit));
}

// Round brush of the pen width centred on the pixel. Callers keep the centre
// within a brush radius of the canvas.
void RasterSurface::plotBrush(int px, int py, Rgba color) {
    const int r = brushRadius();
    if (r <= 0) {
        plotPixel(px, py, color);
        return;
    }
    const int64_t rr = static_cast<int64_t>(r) * r;
    for (int dy = -r; dy <= r; ++dy) {
        int row = py + dy;
        if (row < 0 || row >= height_) continue;
        int64_t rem = rr - static_cast<int64_t>(dy) * dy;
        double half = std::floor(std::sqrt(static_cast<double>(rem)));
        drawHorizontalSpan(px - half, px + half, row, color);
    }
}

void RasterSurface::plotBrushAt(double px, double py, Rgba color) {
    const double reach = brushRadius() + 1.0;
    if (!(px > -reach && px < width_ + reach && py > -reach && py < height_ + reach)) return;
    plotBrush(static_cast<int>(std::round(px)), static_cast<int>(std::round(py)), color);
}

void RasterSurface::drawSegment(Point from, Point to, Rgba color) {
    if (!isFinitePoint(from) || !isFinitePoint(to)) return;

    double x1 = width_ / 2.0 + from.x;
    double y1 = height_ / 2.0 - from.y;
    double x2 = width_ / 2.0 + to.x;
    double y2 = height_ / 2.0 - to.y;

    const int brush = brushRadius();
    const double margin = brush + 1.0;
    if (!clipSegment(x1, y1, x2, y2, -margin, -margin, width_ - 1 + margin, height_ - 1 + margin)) return;

    if (brush > kThickBrushRadius) {
        drawThickSegment(x1, y1, x2, y2, brush, color);
        return;
    }
    drawLineBresenham(static_cast<int>(std::round(x1)), static_cast<int>(std::round(y1)),
                      static_cast<int>(std::round(x2)), static_cast<int>(std::round(y2)), color);
}

// Wide pens: the segment's rectangle plus round caps at both ends.
void RasterSurface::drawThickSegment(double x1, double y1, double x2, double y2, int radius, Rgba color) {
    const double len = std::hypot(x2 - x1, y2 - y1);
    if (len > 0.0) {
        const double nx = -(y2 - y1) / len * radius;
        const double ny = (x2 - x1) / len * radius;
        fillPixelPolygon({{x1 + nx, y1 + ny}, {x2 + nx, y2 + ny}, {x2 - nx, y2 - ny}, {x1 - nx, y1 - ny}},
                         color);
    }
    fillRing(std::round(x1), std::round(y1), 0.0, radius, color);
    fillRing(std::round(x2), std::round(y2), 0.0, radius, color);
}

void RasterSurface::drawLineBresenham(int x1, int y1, int x2, int y2, Rgba color) {
    int dx = std::abs(x2 - x1);
    int dy = std::abs(y2 - y1);
    int sx = (x1 < x2) ? 1 : -1;
    int sy = (y1 < y2) ? 1 : -1;
    int err = dx - dy;

    int x = x1, y = y1;

    while (true) {
        plotBrush(x, y, color);

        if (x == x2 && y == y2) break;

        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
}

void RasterSurface::drawCircleMidpoint(int cx, int cy, int radius, Rgba color) {
    int x = 0;
    int y = radius;
    int d = 1 - radius;

    auto plotCirclePoints = [&](int x, int y) {
        // 8-way symmetry
        plotBrush(cx + x, cy + y, color);
        plotBrush(cx - x, cy + y, color);
        plotBrush(cx + x, cy - y, color);
        plotBrush(cx - x, cy - y, color);
        plotBrush(cx + y, cy + x, color);
        plotBrush(cx - y, cy + x, color);
        plotBrush(cx + y, cy - x, color);
        plotBrush(cx - y, cy - x, color);
    };

    plotCirclePoints(x, y);

    while (x < y) {
        x++;
        if (d < 0) {
            d += 2 * x + 1;
        } else {
            y--;
            d += 2 * (x - y) + 1;
        }
        plotCirclePoints(x, y);
    }
}

// Outline of a circle too large to walk: one sample per pixel row and column near the canvas.
void RasterSurface::drawCircleSampled(double cx, double cy, double radius, Rgba color) {
    const int reach = brushRadius() + 1;
    const double rr = radius * radius;
    for (int row = -reach; row < height_ + reach; ++row) {
        double dy = row - cy;
        if (std::fabs(dy) > radius) continue;
        double half = std::sqrt(rr - dy * dy);
        plotBrushAt(cx - half, row, color);
        plotBrushAt(cx + half, row, color);
    }
    for (int col = -reach; col < width_ + reach; ++col) {
        double dx = col - cx;
        if (std::fabs(dx) > radius) continue;
        double half = std::sqrt(rr - dx * dx);
        plotBrushAt(col, cy - half, color);
        plotBrushAt(col, cy + half, color);
    }
}

// Pixels between two concentric circles, clipped row by row; inner 0 gives a disc.
void RasterSurface::fillRing(double cx, double cy, double inner, double outer, Rgba color) {
    const int rowStart = clampToInt(std::ceil(cy - outer), 0, height_);
    const int rowEnd = clampToInt(std::floor(cy + outer), -1, height_ - 1);
    for (int row = rowStart; row <= rowEnd; ++row) {
        double dy = row - cy;
        double outerHalf = std::floor(std::sqrt(std::max(0.0, outer * outer - dy * dy)));
        if (std::fabs(dy) < inner) {
            double innerHalf = std::ceil(std::sqrt(inner * inner - dy * dy));
            drawHorizontalSpan(cx - outerHalf, cx - innerHalf, row, color);
            drawHorizontalSpan(cx + innerHalf, cx + outerHalf, row, color);
        } else {
            drawHorizontalSpan(cx - outerHalf, cx + outerHalf, row, color);
        }
    }
}

void RasterSurface::drawHorizontalSpan(double x1, double x2, int py, Rgba color) {
    if (py < 0 || py >= height_) return;
    if (x1 > x2) std::swap(x1, x2);
    const int from = clampToInt(x1, 0, width_);
    const int to = clampToInt(x2, -1, width_ - 1);
    for (int x = from; x <= to; ++x) plotPixel(x, py, color);
}

void RasterSurface::fillPolygon(const std::vector<Point>& points, Rgba color) {
    std::vector<std::pair<double, double>> pix;
    pix.reserve(points.size());
    for (const auto& p : points) {
        if (!isFinitePoint(p)) return;
        pix.emplace_back(width_ / 2.0 + p.x, height_ / 2.0 - p.y);
    }
    fillPixelPolygon(pix, color);
}

// Even-odd rule in pixel space, sampling each pixel row through its centre.
void RasterSurface::fillPixelPolygon(const std::vector<std::pair<double, double>>& pix, Rgba color) {
    if (pix.size() < 3) return;
    double minY = pix[0].second, maxY = pix[0].second;
    for (const auto& p : pix) {
        minY = std::min(minY, p.second);
        maxY = std::max(maxY, p.second);
    }

    const int rowStart = clampToInt(std::floor(minY), 0, height_);
    const int rowEnd = clampToInt(std::ceil(maxY), -1, height_ - 1);
    std::vector<double> xs;

    for (int row = rowStart; row <= rowEnd; ++row) {
        double sy = row + 0.5;
        xs.clear();
        for (size_t i = 0; i < pix.size(); ++i) {
            auto [ax, ay] = pix[i];
            auto [bx, by] = pix[(i + 1) % pix.size()];
            if ((ay <= sy && by > sy) || (by <= sy && ay > sy)) {
                xs.push_back(ax + (sy - ay) * (bx - ax) / (by - ay));
            }
        }
        std::sort(xs.begin(), xs.end());
        for (size_t i = 0; i + 1 < xs.size(); i += 2) {
            double from = std::ceil(xs[i] - 0.5);
            double to = std::floor(xs[i + 1] - 0.5);
            if (from <= to) drawHorizontalSpan(from, to, row, color);
        }
    }
}

// ---- Export ----

void RasterSurface::writePPM(std::ostream& out) const {
    out << "P6\n" << width_ << ' ' << height_ << "\n255\n";
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        out.put(static_cast<char>(pixels_[i]));
        out.put(static_cast<char>(pixels_[i + 1]));
        out.put(static_cast<char>(pixels_[i + 2]));
    }
}

bool RasterSurface::savePPM(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "[RasterSurface] Cannot open '" << path << "' for writing" << std::endl;
        return false;
    }
    writePPM(file);
    return static_cast<bool>(file);
}

} // namespace turtlescript
