#include "RecordingSurface.hpp"

#include <sstream>
#include "../Runtime/Value.hpp"

namespace turtlescript {

const char* drawOpName(DrawOp op) {
    switch (op) {
        case DrawOp::MoveTo: return "moveTo";
        case DrawOp::LineTo: return "lineTo";
        case DrawOp::SetPenDown: return "setPenDown";
        case DrawOp::SetColor: return "setColor";
        case DrawOp::SetWidth: return "setWidth";
        case DrawOp::SetFill: return "setFill";
        case DrawOp::DrawCircle: return "drawCircle";
        case DrawOp::DrawRectangle: return "drawRectangle";
        case DrawOp::DrawLine: return "drawLine";
        case DrawOp::DrawPolygon: return "drawPolygon";
        case DrawOp::DrawArc: return "drawArc";
        case DrawOp::Clear: return "clear";
        case DrawOp::ResetState: return "resetState";
        case DrawOp::Present: return "present";
    }
    return "unknown";
}

std::string formatDrawCall(const DrawCall& call) {
    std::ostringstream out;
    out << drawOpName(call.op) << '(';
    switch (call.op) {
        case DrawOp::SetColor:
            out << call.text;
            break;
        case DrawOp::SetPenDown:
        case DrawOp::SetFill:
            out << (call.flag ? "true" : "false");
            break;
        default:
            for (size_t i = 0; i < call.args.size(); ++i) {
                if (i) out << ", ";
                out << formatValue(Number{call.args[i]});
            }
            break;
    }
    out << ')';
    return out.str();
}

void RecordingSurface::record(DrawCall call) {
    calls_.push_back(std::move(call));
    if (listener_) listener_(calls_.back());
}

void RecordingSurface::moveTo(double x, double y) {
    record({DrawOp::MoveTo, {x, y}, "", false});
}

void RecordingSurface::lineTo(double x, double y) {
    record({DrawOp::LineTo, {x, y}, "", false});
}

void RecordingSurface::setPenDown(bool down) {
    record({DrawOp::SetPenDown, {}, "", down});
}

void RecordingSurface::setColor(const std::string& color) {
    record({DrawOp::SetColor, {}, color, false});
}

void RecordingSurface::setWidth(double width) {
    record({DrawOp::SetWidth, {width}, "", false});
}

void RecordingSurface::setFill(bool enabled) {
    record({DrawOp::SetFill, {}, "", enabled});
}

void RecordingSurface::drawCircle(double radius, std::optional<double> cx, std::optional<double> cy) {
    DrawCall call{DrawOp::DrawCircle, {radius}, "", false};
    if (cx && cy) {
        call.args.push_back(*cx);
        call.args.push_back(*cy);
    }
    record(std::move(call));
}

void RecordingSurface::drawRectangle(double width, double height, std::optional<double> x, std::optional<double> y) {
    DrawCall call{DrawOp::DrawRectangle, {width, height}, "", false};
    if (x && y) {
        call.args.push_back(*x);
        call.args.push_back(*y);
    }
    record(std::move(call));
}

void RecordingSurface::drawLine(double x1, double y1, double x2, double y2) {
    record({DrawOp::DrawLine, {x1, y1, x2, y2}, "", false});
}

void RecordingSurface::drawPolygon(const std::vector<Point>& points) {
    DrawCall call{DrawOp::DrawPolygon, {}, "", false};
    for (const auto& p : points) {
        call.args.push_back(p.x);
        call.args.push_back(p.y);
    }
    record(std::move(call));
}

void RecordingSurface::drawArc(double width, double height, double angleDegrees,
                               std::optional<double> cx, std::optional<double> cy) {
    DrawCall call{DrawOp::DrawArc, {width, height, angleDegrees}, "", false};
    if (cx && cy) {
        call.args.push_back(*cx);
        call.args.push_back(*cy);
    }
    record(std::move(call));
}

void RecordingSurface::clear() {
    record({DrawOp::Clear, {}, "", false});
}

void RecordingSurface::resetState() {
    record({DrawOp::ResetState, {}, "", false});
}

void RecordingSurface::present() {
    record({DrawOp::Present, {}, "", false});
}

size_t RecordingSurface::count(DrawOp op) const {
    size_t n = 0;
    for (const auto& c : calls_) {
        if (c.op == op) ++n;
    }
    return n;
}

const DrawCall* RecordingSurface::last(DrawOp op) const {
    for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
        if (it->op == op) return &*it;
    }
    return nullptr;
}

} // namespace turtlescript
