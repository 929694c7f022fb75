#ifndef PAGESMITH_PAGE_GEOMETRY_HPP
#define PAGESMITH_PAGE_GEOMETRY_HPP

#include "page_image.hpp"
#include <optional>
#include <string>

namespace pagesmith {

    /// @brief Page box size in PDF points, already rounded to 3 decimals.
    struct PageGeometry {
        double width = 0.0;
        double height = 0.0;
    };

    /// @brief Points per pixel used when the image reports no usable resolution (96 dpi).
    inline constexpr double kFallbackAdjust = 0.75;

    /// @brief Largest DPI difference that still snaps to the expected page size.
    inline constexpr double kSnapTolerance = 1.0;

    /**
     * @brief Computes the page box of an image page.
     *
     * @param dpi_x,dpi_y Native resolution of the image.
     * @param width_px,height_px Pixel size of the image.
     * @param expected Expected physical size in inches, if any. When the
     *        resolution it implies is within kSnapTolerance of the native one
     *        on both axes the page takes exactly that size.
     */
    PageGeometry compute_page_size(double dpi_x, double dpi_y,
                                   int width_px, int height_px,
                                   const std::optional<PageSize> &expected = std::nullopt);

    /// @brief Rounds to 3 decimal places.
    double round_points(double value);

    /**
     * @brief Formats a coordinate with the precision used for every page box
     * and image matrix written by the library ("%.3f", trailing zeros removed).
     */
    std::string format_points(double value);

} // namespace pagesmith

#endif // PAGESMITH_PAGE_GEOMETRY_HPP
