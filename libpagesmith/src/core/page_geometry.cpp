#include "../../include/page_geometry.hpp"
#include <cmath>
#include <cstdio>

namespace pagesmith {

double round_points(const double value) {
    return std::round(value * 1000.0) / 1000.0;
}

std::string format_points(const double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", round_points(value));
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

PageGeometry compute_page_size(const double dpi_x, const double dpi_y,
                               const int width_px, const int height_px,
                               const std::optional<PageSize> &expected) {
    double adjust_x = 72.0 / dpi_x;
    double adjust_y = 72.0 / dpi_y;
    if (!std::isfinite(adjust_x) || !std::isfinite(adjust_y) || adjust_x <= 0 || adjust_y <= 0) {
        adjust_x = kFallbackAdjust;
        adjust_y = kFallbackAdjust;
    }

    double width = width_px * adjust_x;
    double height = height_px * adjust_y;

    if (expected && expected->width > 0 && expected->height > 0) {
        const double implied_x = width_px / expected->width;
        const double implied_y = height_px / expected->height;
        if (std::abs(implied_x - dpi_x) <= kSnapTolerance && std::abs(implied_y - dpi_y) <= kSnapTolerance) {
            width = expected->width * 72.0;
            height = expected->height * 72.0;
        }
    }
    return {round_points(width), round_points(height)};
}

} // namespace pagesmith
