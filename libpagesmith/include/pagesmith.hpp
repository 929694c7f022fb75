/**
 * @file pagesmith.hpp
 * @brief Public API for the pagesmith library.
 */

#ifndef PAGESMITH_HPP
#define PAGESMITH_HPP

#include "export_params.hpp"
#include "ocr_engine.hpp"
#include "page_image.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace pagesmith {

/**
 * @brief Interface for receiving progress and status events of an export.
 */
struct PagesmithObserver {
    virtual ~PagesmithObserver() = default;

    virtual void onExportStart(std::size_t total_pages, std::size_t passthrough_pages) {}

    virtual void onProgress(std::size_t done, std::size_t total) {}

    virtual void onOcrUnavailable(const std::string& reason) {}

    virtual void onComplete(std::size_t pages, std::size_t output_size) {}

    virtual void onCancelled(std::size_t done, std::size_t total) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the pagesmith library.
 *
 * @details Wraps the export pipeline into a simple, blocking API.
 * Uses PIMPL idiom to hide internal dependencies. OCR results are cached
 * for the lifetime of the object, so exporting the same pages twice only
 * recognizes them once.
 */
class Pagesmith {
public:
    Pagesmith();
    ~Pagesmith();

    Pagesmith(const Pagesmith&) = delete;
    Pagesmith& operator=(const Pagesmith&) = delete;
    Pagesmith(Pagesmith&&) noexcept;
    Pagesmith& operator=(Pagesmith&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Set the number of worker threads to use.
     * Default: hardware concurrency.
     */
    Pagesmith& threads(unsigned val);

    /**
     * @brief Set the PDF flavour.
     * Default: PdfCompat::Default.
     */
    Pagesmith& compat(PdfCompat val);

    /// @brief Password protection. Ignored for PDF/A output.
    Pagesmith& encryption(const PdfEncryption& val);

    Pagesmith& metadata(const PdfMetadata& val);

    /**
     * @brief Enable the OCR text layer.
     * Default: disabled.
     */
    Pagesmith& ocr(const OcrParams& params);

    /// @brief Disable the OCR text layer.
    Pagesmith& noOcr();

    /// @brief Directory with Tesseract language data. Default: Tesseract's own.
    Pagesmith& tessdata(const std::filesystem::path& dir);

    /**
     * @brief Use a custom OCR engine instead of Tesseract.
     */
    Pagesmith& ocrEngine(std::shared_ptr<IOcrEngine> engine);

    /**
     * @brief TrueType font for the text layer.
     * Default: looked up through fontconfig.
     */
    Pagesmith& fontPath(const std::filesystem::path& path);

    /// @brief Directory for OCR input files. Default: <system temp>/pagesmith.
    Pagesmith& tempDirectory(const std::filesystem::path& dir);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(PagesmithObserver* observer);

    // --- Execution ---

    /**
     * @brief Exports the pages to a PDF file. Blocks until completion.
     * @return false if stop() was called; the file is then left untouched.
     */
    bool exportPdf(const std::vector<PageImage>& pages, const std::filesystem::path& output);

    /// @brief Exports the pages to a stream.
    bool exportPdf(const std::vector<PageImage>& pages, std::ostream& out);

    // --- Control ---

    /**
     * @brief Requests cancellation. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pagesmith

#endif // PAGESMITH_HPP
