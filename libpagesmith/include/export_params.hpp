/**
 * @file export_params.hpp
 * @brief Parameters of one export: compatibility, encryption, metadata and OCR.
 */

#ifndef PAGESMITH_EXPORT_PARAMS_HPP
#define PAGESMITH_EXPORT_PARAMS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace pagesmith {

    /// @brief PDF flavour of the output document.
    enum class PdfCompat {
        Default,
        PdfA1B,
        PdfA2B,
        PdfA3B,
        PdfA3U
    };

    /// @brief True for every PDF/A flavour.
    constexpr bool is_archival(const PdfCompat compat) noexcept { return compat != PdfCompat::Default; }

    /// @brief PDF/A part number (1, 2 or 3), 0 for Default.
    int pdfa_part(PdfCompat compat) noexcept;

    /// @brief PDF/A conformance level ("B" or "U"), empty for Default.
    std::string_view pdfa_conformance(PdfCompat compat) noexcept;

    std::string_view to_string(PdfCompat compat) noexcept;

    /**
     * @brief Parses "default", "pdfa-1b", "pdfa-2b", "pdfa-3b" or "pdfa-3u".
     * @return std::nullopt for unknown names.
     */
    std::optional<PdfCompat> parse_compat(std::string_view name);

    /**
     * @brief Password protection of the output.
     *
     * Protection is applied only when `encrypt` is set and at least one of the
     * passwords is non-empty. The allow_* flags map to the PDF permission bits.
     */
    struct PdfEncryption {
        bool encrypt = false;
        std::string owner_password;
        std::string user_password;
        bool allow_content_copying_for_accessibility = true;
        bool allow_annotations = true;
        bool allow_document_assembly = true;
        bool allow_content_copying = true;
        bool allow_form_filling = true;
        bool allow_full_quality_printing = true;
        bool allow_document_modification = true;
        bool allow_printing = true;

        [[nodiscard]] bool enabled() const noexcept {
            return encrypt && (!owner_password.empty() || !user_password.empty());
        }

        /// @brief Password that unlocks the document for editing.
        [[nodiscard]] const std::string &edit_password() const noexcept {
            return owner_password.empty() ? user_password : owner_password;
        }
    };

    /// @brief Document information dictionary entries.
    struct PdfMetadata {
        std::string title;
        std::string author;
        std::string subject;
        std::string keywords;
        std::string creator;
    };

    struct PdfExportParams {
        PdfCompat compat = PdfCompat::Default;
        PdfEncryption encryption;
        PdfMetadata metadata;
    };

    enum class OcrMode {
        Fast,
        Best
    };

    /// @brief Scheduling class of an OCR request. Foreground requests run first.
    enum class OcrPriority {
        Foreground,
        Background
    };

    struct OcrParams {
        std::string language_code = "eng";
        OcrMode mode = OcrMode::Fast;
        OcrPriority priority = OcrPriority::Foreground;

        /// @brief Part of the OCR cache key. Priority does not change the result.
        [[nodiscard]] std::string cache_key() const {
            return language_code + (mode == OcrMode::Best ? "|best" : "|fast");
        }
    };

} // namespace pagesmith

#endif // PAGESMITH_EXPORT_PARAMS_HPP
