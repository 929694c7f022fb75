/**
 * @file tesseract_ocr_engine.hpp
 * @brief IOcrEngine backed by Tesseract and Leptonica.
 */

#ifndef PAGESMITH_TESSERACT_OCR_ENGINE_HPP
#define PAGESMITH_TESSERACT_OCR_ENGINE_HPP

#include "ocr_engine.hpp"
#include <filesystem>

namespace pagesmith {

    /**
     * @brief Word level recognition with Tesseract.
     *
     * Each recognize() call creates its own TessBaseAPI, so calls from
     * several OCR workers do not share engine state.
     */
    class TesseractOcrEngine final : public IOcrEngine {
    public:
        /// @param tessdata_dir Directory with *.traineddata; empty uses Tesseract's default.
        explicit TesseractOcrEngine(std::filesystem::path tessdata_dir = {});

        [[nodiscard]] std::string identity() const override;

        [[nodiscard]] bool is_available(const OcrParams &params, std::string &reason) const override;

        std::optional<OcrResult> recognize(const std::filesystem::path &image_file,
                                           const OcrParams &params,
                                           std::stop_token cancel) override;

    private:
        std::filesystem::path tessdata_dir_;
    };

} // namespace pagesmith

#endif // PAGESMITH_TESSERACT_OCR_ENGINE_HPP
