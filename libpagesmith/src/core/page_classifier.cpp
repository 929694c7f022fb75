#include "../../include/page_classifier.hpp"

namespace pagesmith {

bool is_passthrough_eligible(const PageImage &page) {
    return page.is_pdf() && !page.transformed();
}

ClassifiedPages classify_pages(const std::vector<PageImage> &pages) {
    ClassifiedPages out;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (is_passthrough_eligible(pages[i])) {
            out.passthrough.push_back({i, PageKind::Passthrough});
        } else {
            out.to_render.push_back({i, PageKind::ToRender});
        }
    }
    return out;
}

} // namespace pagesmith
