/**
 * @file ocr_engine.hpp
 * @brief Interface of an OCR engine consumed by the exporter.
 */

#ifndef PAGESMITH_OCR_ENGINE_HPP
#define PAGESMITH_OCR_ENGINE_HPP

#include "export_params.hpp"
#include "ocr_result.hpp"
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace pagesmith {

    /**
     * @brief Recognizes the text of an image file.
     *
     * Implementations must be safe to call from several threads at once.
     */
    class IOcrEngine {
    public:
        virtual ~IOcrEngine() = default;

        /// @brief Identifies the engine and its configuration in cache keys.
        [[nodiscard]] virtual std::string identity() const = 0;

        /**
         * @brief Checks whether the engine can run with these parameters
         * (library present, language data installed).
         * @param reason Receives a human readable reason when returning false.
         */
        [[nodiscard]] virtual bool is_available(const OcrParams &params, std::string &reason) const = 0;

        /**
         * @brief Runs recognition on a JPEG or PNG file.
         * @param cancel Stops recognition early; the call then returns std::nullopt.
         * @return The recognized words, or std::nullopt on failure or cancellation.
         */
        virtual std::optional<OcrResult> recognize(const std::filesystem::path &image_file,
                                                   const OcrParams &params,
                                                   std::stop_token cancel) = 0;
    };

} // namespace pagesmith

#endif // PAGESMITH_OCR_ENGINE_HPP
