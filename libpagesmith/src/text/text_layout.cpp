#include "../../include/text_layout.hpp"
#include "../../include/logger.hpp"
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace pagesmith {

namespace {

    // BreakIterator instances are not thread-safe; one per thread
    icu::BreakIterator &character_iterator() {
        thread_local std::unique_ptr<icu::BreakIterator> iterator = [] {
            UErrorCode status = U_ZERO_ERROR;
            std::unique_ptr<icu::BreakIterator> it(
                icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
            if (U_FAILURE(status) || !it) {
                throw std::runtime_error(std::string("ICU character break iterator: ") + u_errorName(status));
            }
            return it;
        }();
        return *iterator;
    }

} // namespace

Rect scale_bounds(const Rect &bounds, const double scale_x, const double scale_y) {
    return {bounds.x * scale_x, bounds.y * scale_y, bounds.width * scale_x, bounds.height * scale_y};
}

int fit_font_size(const std::string_view text, const Rect &box, const TextMeasurer &measurer) {
    const int guess = std::max(1, static_cast<int>(box.height));
    const double measured = measurer.text_width(text, guess);
    if (!(measured > 0.0)) {
        return guess;
    }
    const double adjusted = std::floor(guess * (box.width / measured));
    if (!std::isfinite(adjusted)) {
        return guess;
    }
    return std::max(1, static_cast<int>(adjusted));
}

std::optional<TextPlacement> layout_text_element(const OcrTextElement &element,
                                                 const double scale_x, const double scale_y,
                                                 const TextMeasurer &measurer) {
    if (element.text.empty()) {
        return std::nullopt;
    }
    const Rect box = scale_bounds(element.bounds, scale_x, scale_y);
    const int size = fit_font_size(element.text, box, measurer);
    if (size > kMaxDashFontSize && (element.text == "-" || element.text == "_")) {
        return std::nullopt;
    }

    TextPlacement p;
    p.font_size = size;
    p.width = measurer.text_width(element.text, size);
    p.height = measurer.text_height(size);
    p.ascent = measurer.ascent(size);
    p.x = box.x + (box.width - p.width) / 2;
    p.y = box.y + (box.height - p.height) / 2;
    p.text = element.right_to_left ? reverse_graphemes(element.text) : element.text;
    return p;
}

std::vector<TextPlacement> layout_ocr_text(const OcrResult &result,
                                           const double page_width, const double page_height,
                                           const TextMeasurer &measurer) {
    std::vector<TextPlacement> out;
    if (result.page_width <= 0 || result.page_height <= 0) {
        Logger::log(LogLevel::Warning, "OCR result without page size, text layer skipped", "text_layout");
        return out;
    }
    const double scale_x = page_width / result.page_width;
    const double scale_y = page_height / result.page_height;
    out.reserve(result.elements.size());
    for (const auto &element : result.elements) {
        if (auto placement = layout_text_element(element, scale_x, scale_y, measurer)) {
            out.push_back(std::move(*placement));
        }
    }
    return out;
}

std::vector<std::string> grapheme_clusters(const std::string_view utf8) {
    std::vector<std::string> clusters;
    const icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    auto &it = character_iterator();
    it.setText(text);
    int32_t start = it.first();
    for (int32_t end = it.next(); end != icu::BreakIterator::DONE; start = end, end = it.next()) {
        std::string cluster;
        text.tempSubStringBetween(start, end).toUTF8String(cluster);
        clusters.push_back(std::move(cluster));
    }
    return clusters;
}

std::string reverse_graphemes(const std::string_view utf8) {
    const auto clusters = grapheme_clusters(utf8);
    std::string out;
    out.reserve(utf8.size());
    for (auto it = clusters.rbegin(); it != clusters.rend(); ++it) {
        out += *it;
    }
    return out;
}

} // namespace pagesmith
