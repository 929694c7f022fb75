#ifndef PAGESMITH_PAGE_CLASSIFIER_HPP
#define PAGESMITH_PAGE_CLASSIFIER_HPP

#include "page_image.hpp"
#include <cstddef>
#include <vector>

namespace pagesmith {

    enum class PageKind {
        ToRender,     ///< Drawn into the generated document from pixels
        Passthrough   ///< Imported as an existing PDF page object
    };

    /// @brief A page and its position in the output.
    struct PageSlot {
        std::size_t index = 0;
        PageKind kind = PageKind::ToRender;
    };

    /// @brief Input pages split by kind; both lists keep input order.
    struct ClassifiedPages {
        std::vector<PageSlot> to_render;
        std::vector<PageSlot> passthrough;
    };

    /// @brief True for an untransformed page whose content is a PDF.
    [[nodiscard]] bool is_passthrough_eligible(const PageImage &page);

    /// @brief Splits @p pages into render-required and passthrough slots.
    [[nodiscard]] ClassifiedPages classify_pages(const std::vector<PageImage> &pages);

} // namespace pagesmith

#endif // PAGESMITH_PAGE_CLASSIFIER_HPP
