#include <diagram_render/number_format.hpp>
#include <cmath>
#include <cstdio>

namespace diagram_render {

std::string format_number(double value) {
    const double rounded = std::round(value * 100.0) / 100.0;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", rounded == 0.0 ? 0.0 : rounded);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

} // namespace diagram_render
