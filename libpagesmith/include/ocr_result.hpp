#ifndef PAGESMITH_OCR_RESULT_HPP
#define PAGESMITH_OCR_RESULT_HPP

#include <string>
#include <vector>

namespace pagesmith {

    /// @brief Axis aligned rectangle, top-left origin.
    struct Rect {
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    /// @brief One recognized word. Bounds are in pixels of the OCR input image.
    struct OcrTextElement {
        Rect bounds;
        std::string text;          ///< UTF-8
        bool right_to_left = false;
    };

    struct OcrResult {
        std::vector<OcrTextElement> elements;
        int page_width = 0;        ///< Pixel size of the image the boxes refer to
        int page_height = 0;
    };

} // namespace pagesmith

#endif // PAGESMITH_OCR_RESULT_HPP
