#include "Value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace turtlescript {

static std::string formatNumber(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    std::ostringstream oss;
    if (std::trunc(d) == d && std::fabs(d) < 1e15) {
        oss << static_cast<long long>(d);
    } else {
        oss << std::setprecision(15) << d;
    }
    return oss.str();
}

std::string formatValue(const Value& v) {
    return std::visit([](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Number>) return formatNumber(x.v);
        else if constexpr (std::is_same_v<T, Str>) return x.v;
        else if constexpr (std::is_same_v<T, Bool>) return x.v ? "true" : "false";
        else return "none";
    }, v);
}

std::string reprValue(const Value& v) {
    if (const auto* s = std::get_if<Str>(&v)) {
        std::string out = "\"";
        for (char c : s->v) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default: out += c; break;
            }
        }
        out += '"';
        return out;
    }
    return formatValue(v);
}

} // namespace turtlescript
