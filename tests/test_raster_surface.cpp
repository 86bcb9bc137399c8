#include <catch2/catch_all.hpp>
#include "../src/Graphics/RasterSurface.hpp"
#include <limits>
#include <sstream>

using namespace turtlescript;

namespace {

const Rgba WHITE = {255, 255, 255, 255};
const Rgba BLACK = {0, 0, 0, 255};
const Rgba RED = {255, 0, 0, 255};

size_t countNonBackground(const RasterSurface& s) {
    size_t n = 0;
    for (int y = 0; y < s.getHeight(); ++y) {
        for (int x = 0; x < s.getWidth(); ++x) {
            if (s.getPixel(x, y) != RasterSurface::BACKGROUND) ++n;
        }
    }
    return n;
}

} // namespace

TEST_CASE("RasterSurface - Initial State", "[graphics][raster]") {
    RasterSurface surface(100, 80);

    REQUIRE(surface.getWidth() == 100);
    REQUIRE(surface.getHeight() == 80);
    REQUIRE(surface.pixels().size() == 100u * 80u * 4u);
    REQUIRE(countNonBackground(surface) == 0);
    REQUIRE(surface.getPenColor() == BLACK);
    REQUIRE(surface.isPenDown());
    REQUIRE_FALSE(surface.isFillEnabled());

    SECTION("World origin is the canvas centre, y up") {
        REQUIRE(surface.toPixel(0, 0) == std::make_pair(50, 40));
        REQUIRE(surface.toPixel(10, 10) == std::make_pair(60, 30));
        REQUIRE(surface.toPixel(-50, -40) == std::make_pair(0, 80));
    }

    SECTION("Out of range reads return the background") {
        REQUIRE_FALSE(surface.isValidCoordinate(-1, 0));
        REQUIRE_FALSE(surface.isValidCoordinate(100, 0));
        REQUIRE(surface.getPixel(500, 500) == WHITE);
    }
}

TEST_CASE("RasterSurface - Lines", "[graphics][raster]") {
    RasterSurface surface(100, 100);

    SECTION("lineTo draws with the pen down") {
        surface.lineTo(10, 0);
        REQUIRE(surface.getPixelAt(0, 0) == BLACK);
        REQUIRE(surface.getPixelAt(5, 0) == BLACK);
        REQUIRE(surface.getPixelAt(10, 0) == BLACK);
        REQUIRE(surface.getPixelAt(5, 5) == WHITE);
        REQUIRE(countNonBackground(surface) == 11);
        REQUIRE(surface.getCurrentPoint() == Point{10, 0});
    }

    SECTION("moveTo never draws") {
        surface.moveTo(20, 20);
        REQUIRE(countNonBackground(surface) == 0);
        REQUIRE(surface.getCurrentPoint() == Point{20, 20});
    }

    SECTION("Pen up suppresses lineTo but still moves") {
        surface.setPenDown(false);
        surface.lineTo(0, 30);
        REQUIRE(countNonBackground(surface) == 0);
        REQUIRE(surface.getCurrentPoint() == Point{0, 30});
    }

    SECTION("drawLine ignores the current point") {
        surface.drawLine(-20, 10, -20, 20);
        REQUIRE(surface.getPixelAt(-20, 15) == BLACK);
        REQUIRE(surface.getCurrentPoint() == Point{0, 0});
    }

    SECTION("Wide pens stamp a round brush") {
        surface.setWidth(5);
        surface.drawLine(-10, 0, 10, 0);
        REQUIRE(surface.getPixelAt(0, 2) == BLACK);
        REQUIRE(surface.getPixelAt(0, -2) == BLACK);
        REQUIRE(surface.getPixelAt(0, 4) == WHITE);
    }

    SECTION("Very wide pens fill the stroke with round caps") {
        surface.setWidth(20);
        surface.drawLine(-10, 0, 10, 0);
        REQUIRE(surface.getPixelAt(0, 9) == BLACK);
        REQUIRE(surface.getPixelAt(0, -9) == BLACK);
        REQUIRE(surface.getPixelAt(0, 12) == WHITE);
        REQUIRE(surface.getPixelAt(-18, 0) == BLACK);
        REQUIRE(surface.getPixelAt(-22, 0) == WHITE);
    }

    SECTION("Width is clamped to a small positive value") {
        surface.setWidth(0);
        REQUIRE(surface.getPenWidth() == Catch::Approx(0.1));
        surface.setWidth(-3);
        REQUIRE(surface.getPenWidth() == Catch::Approx(0.1));
    }

    SECTION("Lines leaving the canvas are clipped") {
        surface.lineTo(1000, 0);
        REQUIRE(surface.getPixel(99, 50) == BLACK);
        REQUIRE(countNonBackground(surface) == 50);
    }
}

TEST_CASE("RasterSurface - Colours", "[graphics][raster]") {
    SECTION("Named, hex and palette colours") {
        REQUIRE(RasterSurface::parseColor("red") == RED);
        REQUIRE(RasterSurface::parseColor("RED") == RED);
        REQUIRE(RasterSurface::parseColor("r") == RED);
        REQUIRE(RasterSurface::parseColor("grey") == RasterSurface::parseColor("gray"));
        REQUIRE(RasterSurface::parseColor("#00ff80") == Rgba{0, 255, 128, 255});
        REQUIRE(RasterSurface::parseColor("#FFFFFF") == WHITE);
        REQUIRE(RasterSurface::parseColor("4") == Rgba{170, 0, 0, 255});
        REQUIRE(RasterSurface::parseColor("15") == WHITE);
    }

    SECTION("Unknown colours") {
        REQUIRE_FALSE(RasterSurface::parseColor("chartreuse").has_value());
        REQUIRE_FALSE(RasterSurface::parseColor("16").has_value());
        REQUIRE_FALSE(RasterSurface::parseColor("#12").has_value());
        REQUIRE_FALSE(RasterSurface::parseColor("#gg0000").has_value());
        REQUIRE_FALSE(RasterSurface::parseColor("").has_value());
    }

    SECTION("setColor changes the pen; unknown names keep it") {
        RasterSurface surface(50, 50);
        surface.setColor("red");
        REQUIRE(surface.getPenColor() == RED);
        surface.setColor("no-such-colour");
        REQUIRE(surface.getPenColor() == RED);
        surface.lineTo(0, 10);
        REQUIRE(surface.getPixelAt(0, 5) == RED);
    }
}

TEST_CASE("RasterSurface - Shapes", "[graphics][raster]") {
    RasterSurface surface(100, 100);

    SECTION("Circle outline around the current point") {
        surface.drawCircle(10, std::nullopt, std::nullopt);
        REQUIRE(surface.getPixelAt(10, 0) == BLACK);
        REQUIRE(surface.getPixelAt(-10, 0) == BLACK);
        REQUIRE(surface.getPixelAt(0, 10) == BLACK);
        REQUIRE(surface.getPixelAt(0, -10) == BLACK);
        REQUIRE(surface.getPixelAt(0, 0) == WHITE);
    }

    SECTION("Filled circle at an explicit centre") {
        surface.setFill(true);
        surface.drawCircle(5, 20.0, 20.0);
        REQUIRE(surface.getPixelAt(20, 20) == BLACK);
        REQUIRE(surface.getPixelAt(22, 21) == BLACK);
        REQUIRE(surface.getPixelAt(0, 0) == WHITE);
        REQUIRE(surface.getCurrentPoint() == Point{0, 0});
    }

    SECTION("Rectangle from the given corner") {
        surface.drawRectangle(20, 10, -10.0, -5.0);
        REQUIRE(surface.getPixelAt(-10, -5) == BLACK);
        REQUIRE(surface.getPixelAt(10, 5) == BLACK);
        REQUIRE(surface.getPixelAt(0, 5) == BLACK);
        REQUIRE(surface.getPixelAt(0, 0) == WHITE);
    }

    SECTION("Filled rectangle") {
        surface.setFill(true);
        surface.drawRectangle(20, 10, -10.0, -5.0);
        REQUIRE(surface.getPixelAt(0, 0) == BLACK);
        REQUIRE(surface.getPixelAt(0, 20) == WHITE);
    }

    SECTION("Polygon outline is closed") {
        surface.drawPolygon({{0, 0}, {20, 0}, {20, 20}});
        REQUIRE(surface.getPixelAt(10, 0) == BLACK);
        REQUIRE(surface.getPixelAt(20, 10) == BLACK);
        REQUIRE(surface.getPixelAt(10, 10) == BLACK); // closing edge
        REQUIRE(surface.getPixelAt(15, 5) == WHITE);
    }

    SECTION("Filled polygon") {
        surface.setFill(true);
        surface.drawPolygon({{0, 0}, {20, 0}, {20, 20}});
        REQUIRE(surface.getPixelAt(15, 5) == BLACK);
        REQUIRE(surface.getPixelAt(5, 15) == WHITE);
    }

    SECTION("Arc is the upper half of an ellipse") {
        surface.drawArc(40, 20, 0, std::nullopt, std::nullopt);
        REQUIRE(surface.getPixelAt(20, 0) == BLACK);
        REQUIRE(surface.getPixelAt(-20, 0) == BLACK);
        REQUIRE(surface.getPixelAt(0, 10) == BLACK);
        REQUIRE(surface.getPixelAt(0, -10) == WHITE);
    }

    SECTION("Rotated arc") {
        surface.drawArc(40, 20, 90, std::nullopt, std::nullopt);
        REQUIRE(surface.getPixelAt(0, 20) == BLACK);
        REQUIRE(surface.getPixelAt(-10, 0) == BLACK);
        REQUIRE(surface.getPixelAt(10, 0) == WHITE);
    }

    SECTION("Arc around an explicit centre") {
        surface.drawArc(40, 20, 0, 20.0, 20.0);
        REQUIRE(surface.getPixelAt(0, 20) == BLACK);
        REQUIRE(surface.getPixelAt(40, 20) == BLACK);
        REQUIRE(surface.getPixelAt(20, 30) == BLACK);
        REQUIRE(surface.getPixelAt(20, 0) == WHITE);
        REQUIRE(surface.getCurrentPoint() == Point{0, 0});
    }
}

TEST_CASE("RasterSurface - Extreme Coordinates", "[graphics][raster]") {
    RasterSurface surface(100, 100);
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("Filled circle far larger than the canvas covers it") {
        surface.setFill(true);
        surface.drawCircle(50000, std::nullopt, std::nullopt);
        REQUIRE(countNonBackground(surface) == 10000);
    }

    SECTION("Huge pen width paints the whole canvas") {
        surface.setWidth(200000);
        surface.lineTo(10, 0);
        REQUIRE(countNonBackground(surface) == 10000);
    }

    SECTION("Very long line is clipped to the visible part") {
        surface.lineTo(0, 1e10);
        REQUIRE(countNonBackground(surface) == 51);
        REQUIRE(surface.getPixelAt(0, 49) == BLACK);
        REQUIRE(surface.getCurrentPoint() == Point{0, 1e10});
    }

    SECTION("Outline of a huge circle crossing the canvas") {
        surface.drawCircle(10000, 0.0, -10000.0);
        REQUIRE(surface.getPixelAt(0, 0) == BLACK);
        REQUIRE(surface.getPixelAt(-40, 0) == BLACK);
        REQUIRE(surface.getPixelAt(0, 10) == WHITE);
    }

    SECTION("Filled polygon with huge vertices") {
        surface.setFill(true);
        surface.drawPolygon({{-1e12, -1e12}, {1e12, -1e12}, {0, 1e12}});
        REQUIRE(countNonBackground(surface) == 10000);
    }

    SECTION("Non-finite coordinates draw nothing") {
        surface.lineTo(inf, 0);
        surface.moveTo(0, 0);
        surface.lineTo(nan, nan);
        surface.moveTo(0, 0);
        surface.drawLine(-inf, 0, inf, 0);
        surface.drawCircle(nan, std::nullopt, std::nullopt);
        surface.drawCircle(10, inf, 0.0);
        surface.setFill(true);
        surface.drawRectangle(10, 10, inf, 0.0);
        surface.drawPolygon({{0, nan}, {10, nan}, {nan, 10}});
        REQUIRE(countNonBackground(surface) == 0);
    }
}

TEST_CASE("RasterSurface - Clear, Reset and Present", "[graphics][raster]") {
    RasterSurface surface(60, 60);
    surface.setColor("blue");
    surface.setWidth(3);
    surface.setFill(true);
    surface.setPenDown(false);
    surface.moveTo(5, 5);

    SECTION("clear wipes pixels but keeps the pen") {
        surface.setPenDown(true);
        surface.lineTo(20, 20);
        REQUIRE(countNonBackground(surface) > 0);
        surface.clear();
        REQUIRE(countNonBackground(surface) == 0);
        REQUIRE(surface.getPenColor() == Rgba{0, 0, 255, 255});
    }

    SECTION("resetState restores the pen but keeps pixels") {
        surface.drawLine(0, 0, 10, 0);
        size_t drawn = countNonBackground(surface);
        surface.resetState();
        REQUIRE(surface.getPenColor() == BLACK);
        REQUIRE(surface.getPenWidth() == 1.0);
        REQUIRE(surface.isPenDown());
        REQUIRE_FALSE(surface.isFillEnabled());
        REQUIRE(surface.getCurrentPoint() == Point{0, 0});
        REQUIRE(countNonBackground(surface) == drawn);
    }

    SECTION("present invokes the callback") {
        int presented = 0;
        surface.setPresentCallback([&](const RasterSurface& s) {
            REQUIRE(&s == &surface);
            ++presented;
        });
        surface.present();
        surface.present();
        REQUIRE(presented == 2);
    }
}

TEST_CASE("RasterSurface - PPM Export", "[graphics][raster]") {
    RasterSurface surface(4, 3);
    surface.setColor("red");
    surface.drawLine(-2, 1.5, -2, 1.5); // top-left pixel

    std::ostringstream out;
    surface.writePPM(out);
    std::string data = out.str();

    const std::string header = "P6\n4 3\n255\n";
    REQUIRE(data.size() == header.size() + 4 * 3 * 3);
    REQUIRE(data.compare(0, header.size(), header) == 0);
    REQUIRE(static_cast<unsigned char>(data[header.size()]) == 255);
    REQUIRE(static_cast<unsigned char>(data[header.size() + 1]) == 0);
    REQUIRE(static_cast<unsigned char>(data[header.size() + 3]) == 255); // next pixel is white

    SECTION("Saving to an unwritable path fails") {
        REQUIRE_FALSE(surface.savePPM("/nonexistent-dir/out.ppm"));
    }
}
