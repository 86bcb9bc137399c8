#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "DrawingSurface.hpp"

namespace turtlescript {

struct Rgba {
    uint8_t r, g, b, a;

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

/**
 * RasterSurface - software RGBA canvas
 *
 * World origin sits at the centre of the canvas with y pointing up; pixels
 * are stored row-major from the top row down. Lines use Bresenham stamped
 * with a round brush of the pen width, circles use the midpoint algorithm
 * and polygons are filled with an even-odd scanline pass. Segments are
 * clipped to the canvas in world precision before any pixel is touched, and
 * non-finite coordinates draw nothing.
 */
class RasterSurface : public DrawingSurface {
public:
    using PresentCallback = std::function<void(const RasterSurface&)>;

    static constexpr Rgba BACKGROUND = {255, 255, 255, 255};
    static constexpr Rgba DEFAULT_PEN = {0, 0, 0, 255};

    explicit RasterSurface(int width = 800, int height = 600);

    // DrawingSurface
    void moveTo(double x, double y) override;
    void lineTo(double x, double y) override;
    void setPenDown(bool down) override;
    void setColor(const std::string& color) override;
    void setWidth(double width) override;
    void setFill(bool enabled) override;
    void drawCircle(double radius, std::optional<double> cx, std::optional<double> cy) override;
    void drawRectangle(double width, double height, std::optional<double> x, std::optional<double> y) override;
    void drawLine(double x1, double y1, double x2, double y2) override;
    void drawPolygon(const std::vector<Point>& points) override;
    void drawArc(double width, double height, double angleDegrees,
                 std::optional<double> cx, std::optional<double> cy) override;
    void clear() override;
    void resetState() override;
    void present() override;

    void setPresentCallback(PresentCallback cb) { presentCallback_ = std::move(cb); }

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    Rgba getPixel(int px, int py) const;
    Rgba getPixelAt(double x, double y) const;
    std::pair<int, int> toPixel(double x, double y) const;
    bool isValidCoordinate(int px, int py) const;

    Point getCurrentPoint() const { return current_; }
    Rgba getPenColor() const { return penColor_; }
    double getPenWidth() const { return penWidth_; }
    bool isPenDown() const { return penDown_; }
    bool isFillEnabled() const { return fill_; }

    // Binary PPM (P6); alpha is dropped.
    void writePPM(std::ostream& out) const;
    bool savePPM(const std::string& path) const;

    // Colour name, CGA palette index "0".."15", or "#rrggbb".
    static std::optional<Rgba> parseColor(const std::string& text);

private:
    int width_;
    int height_;
    std::vector<uint8_t> pixels_;

    Point current_;
    bool penDown_{true};
    Rgba penColor_{DEFAULT_PEN};
    double penWidth_{1.0};
    bool fill_{false};

    PresentCallback presentCallback_;

    int brushRadius() const;
    void plotPixel(int px, int py, Rgba color);
    void plotBrush(int px, int py, Rgba color);
    void plotBrushAt(double px, double py, Rgba color);
    void drawSegment(Point from, Point to, Rgba color);
    void drawThickSegment(double x1, double y1, double x2, double y2, int radius, Rgba color);
    void drawLineBresenham(int x1, int y1, int x2, int y2, Rgba color);
    void drawCircleMidpoint(int cx, int cy, int radius, Rgba color);
    void drawCircleSampled(double cx, double cy, double radius, Rgba color);
    void fillRing(double cx, double cy, double inner, double outer, Rgba color);
    void fillPolygon(const std::vector<Point>& points, Rgba color);
    void fillPixelPolygon(const std::vector<std::pair<double, double>>& pix, Rgba color);
    void drawHorizontalSpan(double x1, double x2, int py, Rgba color);
};

} // namespace turtlescript
