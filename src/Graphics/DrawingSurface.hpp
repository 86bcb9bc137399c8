#pragma once

#include <optional>
#include <string>
#include <vector>

namespace turtlescript {

// World coordinates: origin at the canvas centre, y grows upwards.
struct Point {
    double x{0.0};
    double y{0.0};

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

/**
 * DrawingSurface - rendering capability consumed by the interpreter
 *
 * The interpreter owns the turtle state and only ever pushes commands here;
 * it never reads anything back. Shapes without an explicit position are drawn
 * at the surface's current point (the last moveTo/lineTo target).
 */
class DrawingSurface {
public:
    virtual ~DrawingSurface() = default;

    virtual void moveTo(double x, double y) = 0;
    virtual void lineTo(double x, double y) = 0;
    virtual void setPenDown(bool down) = 0;
    virtual void setColor(const std::string& color) = 0;
    virtual void setWidth(double width) = 0;
    virtual void setFill(bool enabled) = 0;

    virtual void drawCircle(double radius, std::optional<double> cx, std::optional<double> cy) = 0;
    virtual void drawRectangle(double width, double height, std::optional<double> x, std::optional<double> y) = 0;
    virtual void drawLine(double x1, double y1, double x2, double y2) = 0;
    virtual void drawPolygon(const std::vector<Point>& points) = 0;
    // Upper half of an ellipse rotated by angleDegrees, centred on (cx, cy) or the current point.
    virtual void drawArc(double width, double height, double angleDegrees,
                         std::optional<double> cx, std::optional<double> cy) = 0;

    virtual void clear() = 0;
    virtual void resetState() = 0;
    virtual void present() = 0;
};

} // namespace turtlescript
