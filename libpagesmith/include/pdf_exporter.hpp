/**
 * @file pdf_exporter.hpp
 * @brief Turns an ordered list of page images into one PDF.
 */

#ifndef PAGESMITH_PDF_EXPORTER_HPP
#define PAGESMITH_PDF_EXPORTER_HPP

#include "embedder.hpp"
#include "event_bus.hpp"
#include "export_params.hpp"
#include "generated_document.hpp"
#include "ocr_engine.hpp"
#include "ocr_request_queue.hpp"
#include "page_image.hpp"
#include "source_pdf.hpp"
#include "truetype_font.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stop_token>
#include <vector>

namespace pagesmith {

    /**
     * @brief Collaborators shared by exports.
     *
     * Everything is optional: without an engine OCR requests are reported
     * as unavailable, a missing queue is created on demand and a missing
     * font is looked up through fontconfig the first time text is needed.
     */
    struct ExportContext {
        std::filesystem::path temp_dir;                 ///< Empty: <system temp>/pagesmith
        std::shared_ptr<IOcrEngine> ocr_engine;
        std::shared_ptr<OcrRequestQueue> ocr_queue;
        std::shared_ptr<const TrueTypeFont> font;
        std::filesystem::path font_path;                ///< Used when font is null
        unsigned threads = 0;                           ///< 0: hardware concurrency
        EventBus *events = nullptr;
    };

    /**
     * @brief Working record of one page during an export.
     */
    struct PageExportState {
        std::size_t index = 0;
        const PageImage *image = nullptr;
        GeneratedDocument::PageHandle handle = 0;
        std::unique_ptr<IEmbedder> embedder;
        std::optional<OcrResult> ocr_result;
        bool needs_ocr = false;                         ///< Passthrough pages only
        std::unique_ptr<SourceDocument> source;         ///< Open while probing and rasterizing
    };

    /**
     * @brief PDF exporter.
     *
     * @details Image pages run through Render, Init OCR, Wait for OCR and
     * Write on a worker pool and are drawn into a GeneratedDocument. A page
     * waiting for OCR is parked off the pool until its result arrives.
     * Passthrough pages (untransformed PDF pages) are probed for existing
     * text, recognized when they have none, and swapped into the
     * serialized document at the end. Both groups are processed
     * concurrently. Output page order always equals input order.
     */
    class PdfExporter {
    public:
        explicit PdfExporter(ExportContext context = {});

        /**
         * @brief Exports to a file. The file is written to a temporary
         * sibling first and only renamed into place on success.
         * @return false if cancelled; the destination is not touched.
         * @throws std::runtime_error (or NoEmbeddableFontError) on failure.
         */
        bool export_pdf(const std::filesystem::path &output,
                        const std::vector<PageImage> &images,
                        const PdfExportParams &params,
                        const std::optional<OcrParams> &ocr = std::nullopt,
                        std::stop_token stop = {});

        /**
         * @brief Exports to a stream.
         * @return false if cancelled; nothing is written in that case.
         */
        bool export_pdf(std::ostream &out,
                        const std::vector<PageImage> &images,
                        const PdfExportParams &params,
                        const std::optional<OcrParams> &ocr = std::nullopt,
                        std::stop_token stop = {});

    private:
        std::optional<OcrParams> check_ocr(const std::optional<OcrParams> &ocr);
        std::shared_ptr<const TrueTypeFont> ocr_font();
        void start_ocr(PageExportState &state, const OcrParams &ocr, std::stop_token stop,
                       std::function<void()> resume);

        template <typename Event>
        void publish(const Event &event) {
            if (context_.events) context_.events->publish(event);
        }

        ExportContext context_;
        std::mutex setup_mtx_;   ///< Guards lazy creation of the queue and font
    };

} // namespace pagesmith

#endif // PAGESMITH_PDF_EXPORTER_HPP
