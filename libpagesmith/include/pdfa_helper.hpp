/**
 * @file pdfa_helper.hpp
 * @brief Archival (PDF/A) pieces added to a generated document.
 */

#ifndef PAGESMITH_PDFA_HELPER_HPP
#define PAGESMITH_PDFA_HELPER_HPP

#include "export_params.hpp"
#include <qpdf/QPDF.hh>
#include <cstdint>
#include <string>
#include <vector>

namespace pagesmith::pdfa {

    /// @brief Output condition written with the output intent.
    inline constexpr const char *kOutputCondition = "sRGB IEC61966-2.1";

    /**
     * @brief Builds a compact ICC v2 display profile for sRGB (D50 primaries,
     * gamma 2.2 curves).
     */
    std::vector<std::uint8_t> srgb_icc_profile();

    /**
     * @brief XMP packet describing the document.
     * @param create_date,modify_date ISO 8601 timestamps.
     */
    std::string xmp_metadata(const PdfMetadata &metadata, PdfCompat compat,
                             const std::string &producer,
                             const std::string &create_date,
                             const std::string &modify_date);

    /// @brief Escapes the XML special characters of @p text.
    std::string xml_escape(const std::string &text);

    /**
     * @brief Adds the sRGB output intent and the XMP metadata stream to the catalog.
     * Does nothing for PdfCompat::Default.
     */
    void apply(QPDF &pdf, PdfCompat compat, const PdfMetadata &metadata,
               const std::string &producer,
               const std::string &create_date, const std::string &modify_date);

} // namespace pagesmith::pdfa

#endif // PAGESMITH_PDFA_HELPER_HPP
