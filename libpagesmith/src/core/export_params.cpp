#include "../../include/export_params.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace pagesmith {

int pdfa_part(const PdfCompat compat) noexcept {
    switch (compat) {
        case PdfCompat::PdfA1B: return 1;
        case PdfCompat::PdfA2B: return 2;
        case PdfCompat::PdfA3B:
        case PdfCompat::PdfA3U: return 3;
        case PdfCompat::Default: break;
    }
    return 0;
}

std::string_view pdfa_conformance(const PdfCompat compat) noexcept {
    switch (compat) {
        case PdfCompat::PdfA1B:
        case PdfCompat::PdfA2B:
        case PdfCompat::PdfA3B: return "B";
        case PdfCompat::PdfA3U: return "U";
        case PdfCompat::Default: break;
    }
    return "";
}

std::string_view to_string(const PdfCompat compat) noexcept {
    switch (compat) {
        case PdfCompat::Default: return "default";
        case PdfCompat::PdfA1B:  return "pdfa-1b";
        case PdfCompat::PdfA2B:  return "pdfa-2b";
        case PdfCompat::PdfA3B:  return "pdfa-3b";
        case PdfCompat::PdfA3U:  return "pdfa-3u";
    }
    return "default";
}

std::optional<PdfCompat> parse_compat(const std::string_view name) {
    std::string n(name);
    std::ranges::transform(n, n.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::erase(n, '/');
    if (n == "default" || n == "pdf") return PdfCompat::Default;
    if (n == "pdfa-1b" || n == "pdfa1b") return PdfCompat::PdfA1B;
    if (n == "pdfa-2b" || n == "pdfa2b") return PdfCompat::PdfA2B;
    if (n == "pdfa-3b" || n == "pdfa3b") return PdfCompat::PdfA3B;
    if (n == "pdfa-3u" || n == "pdfa3u") return PdfCompat::PdfA3U;
    return std::nullopt;
}

} // namespace pagesmith
