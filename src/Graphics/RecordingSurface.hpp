#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "DrawingSurface.hpp"

namespace turtlescript {

enum class DrawOp : uint8_t {
    MoveTo,
    LineTo,
    SetPenDown,
    SetColor,
    SetWidth,
    SetFill,
    DrawCircle,
    DrawRectangle,
    DrawLine,
    DrawPolygon,
    DrawArc,
    Clear,
    ResetState,
    Present
};

const char* drawOpName(DrawOp op);

struct DrawCall {
    DrawOp op;
    std::vector<double> args; // numeric arguments in declaration order; polygon points flattened
    std::string text;         // setColor
    bool flag{false};         // setPenDown / setFill
};

// e.g. "lineTo(0, 100)", "setColor(red)", "drawCircle(50)"
std::string formatDrawCall(const DrawCall& call);

// Keeps every call in order. Optional shape arguments are recorded only when given.
class RecordingSurface : public DrawingSurface {
public:
    using Listener = std::function<void(const DrawCall&)>;

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

    const std::vector<DrawCall>& calls() const { return calls_; }
    size_t count(DrawOp op) const;
    const DrawCall* last(DrawOp op) const;
    void clearRecording() { calls_.clear(); }

    void setListener(Listener listener) { listener_ = std::move(listener); }

private:
    std::vector<DrawCall> calls_;
    Listener listener_;

    void record(DrawCall call);
};

} // namespace turtlescript
