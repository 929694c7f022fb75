#ifndef PAGESMITH_EVENTS_HPP
#define PAGESMITH_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace pagesmith {

/**
 * @brief Events published by PdfExporter through an EventBus.
 *
 * Plain data carriers: progress counters, lifecycle notifications and
 * non-fatal degradations the caller may want to surface.
 */

/// @brief Emitted once before any page is processed.
struct ExportStartEvent {
    std::size_t total_pages = 0;
    std::size_t passthrough_pages = 0; ///< Pages imported as PDF page objects
    bool ocr_enabled = false;          ///< False when OCR was not requested or is unavailable
};

/**
 * @brief Emitted with (0, total) at start and after every page written to
 * the generated document. `done` never decreases.
 */
struct ExportProgressEvent {
    std::size_t done = 0;
    std::size_t total = 0;
};

/// @brief Emitted when a requested OCR pass cannot run for the export.
struct OcrUnavailableEvent {
    std::string reason;
};

/// @brief Emitted after the output has been written.
struct ExportCompleteEvent {
    std::size_t pages = 0;
    std::size_t output_size = 0;           ///< Bytes written
    std::chrono::milliseconds duration{0};
};

/// @brief Emitted when an export stops because cancellation was requested.
struct ExportCancelledEvent {
    std::size_t done = 0;  ///< Pages written before the stop
    std::size_t total = 0;
};

} // namespace pagesmith

#endif // PAGESMITH_EVENTS_HPP
