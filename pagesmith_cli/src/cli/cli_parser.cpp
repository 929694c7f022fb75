#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <thread>

namespace {

const std::map<std::string, pagesmith::PageSize> kNamedSizes = {
    {"a4", {210.0 / 25.4, 297.0 / 25.4}},
    {"a5", {148.0 / 25.4, 210.0 / 25.4}},
    {"letter", {8.5, 11.0}},
    {"legal", {8.5, 14.0}},
};

// helper for validating page size strings
struct PageSizeValidator : CLI::Validator {
    PageSizeValidator() {
        name_ = "PageSize";
        func_ = [](const std::string& str) {
            if (!parse_page_size(str)) {
                return std::string("Invalid page size: '") + str +
                       "'. Must be one of: a4, a5, letter, legal, or WxH in inches.";
            }
            return std::string(); // ok
        };
    }
};

} // namespace

std::optional<pagesmith::PageSize> parse_page_size(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (const auto it = kNamedSizes.find(lower); it != kNamedSizes.end()) {
        return it->second;
    }
    const auto x = lower.find('x');
    if (x == std::string::npos) return std::nullopt;

    const std::string w = lower.substr(0, x);
    const std::string h = lower.substr(x + 1);
    char* end_w = nullptr;
    char* end_h = nullptr;
    const double width = std::strtod(w.c_str(), &end_w);
    const double height = std::strtod(h.c_str(), &end_h);
    if (w.empty() || h.empty() || *end_w != '\0' || *end_h != '\0' || !(width > 0.0) || !(height > 0.0)) {
        return std::nullopt;
    }
    return pagesmith::PageSize{width, height};
}

pagesmith::PdfEncryption Settings::encryption() const {
    pagesmith::PdfEncryption enc;
    enc.encrypt = !owner_password.empty() || !user_password.empty();
    enc.owner_password = owner_password;
    enc.user_password = user_password;
    enc.allow_printing = !no_print;
    enc.allow_full_quality_printing = !no_print && !no_full_quality_print;
    enc.allow_content_copying = !no_copy;
    enc.allow_content_copying_for_accessibility = !no_accessibility_copy;
    enc.allow_annotations = !no_annotations;
    enc.allow_document_assembly = !no_assembly;
    enc.allow_form_filling = !no_form_filling;
    enc.allow_document_modification = !no_modify;
    return enc;
}

pagesmith::ImageMetadata Settings::image_metadata() const {
    pagesmith::ImageMetadata meta;
    meta.bit_depth = bit_depth;
    meta.lossless = lossless;
    if (!page_size.empty()) {
        meta.page_size = parse_page_size(page_size);
    }
    return meta;
}

std::optional<pagesmith::OcrParams> Settings::ocr() const {
    if (ocr_lang.empty()) return std::nullopt;
    pagesmith::OcrParams params;
    params.language_code = ocr_lang;
    params.mode = ocr_mode;
    params.priority = pagesmith::OcrPriority::Foreground;
    return params;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Output ---
    app.add_option("-o,--output", settings.output_path, "Output PDF file.")
        ->required();

    app.add_option("--compat", settings.compat, "PDF flavour: default, pdfa-1b, pdfa-2b, pdfa-3b, pdfa-3u.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, pagesmith::PdfCompat>{
                {"default", pagesmith::PdfCompat::Default},
                {"pdfa-1b", pagesmith::PdfCompat::PdfA1B},
                {"pdfa-2b", pagesmith::PdfCompat::PdfA2B},
                {"pdfa-3b", pagesmith::PdfCompat::PdfA3B},
                {"pdfa-3u", pagesmith::PdfCompat::PdfA3U}
            }, CLI::ignore_case));

    app.add_option("--title", settings.metadata.title, "Document title.");
    app.add_option("--author", settings.metadata.author, "Document author.");
    app.add_option("--subject", settings.metadata.subject, "Document subject.");
    app.add_option("--keywords", settings.metadata.keywords, "Document keywords.");
    app.add_option("--creator", settings.metadata.creator, "Creating application (default: pagesmith).");

    // --- Encryption ---
    app.add_option("--owner-password", settings.owner_password, "Owner password; enables encryption.");
    app.add_option("--user-password", settings.user_password, "Password required to open the document.");
    app.add_flag("--no-print", settings.no_print, "Forbid printing.");
    app.add_flag("--no-full-quality-print", settings.no_full_quality_print, "Allow low quality printing only.");
    app.add_flag("--no-copy", settings.no_copy, "Forbid copying content.");
    app.add_flag("--no-accessibility-copy", settings.no_accessibility_copy,
                 "Forbid copying content for accessibility.");
    app.add_flag("--no-annotations", settings.no_annotations, "Forbid adding annotations.");
    app.add_flag("--no-assembly", settings.no_assembly, "Forbid inserting, rotating or deleting pages.");
    app.add_flag("--no-form-filling", settings.no_form_filling, "Forbid filling in forms.");
    app.add_flag("--no-modify", settings.no_modify, "Forbid other modifications.");

    // --- OCR ---
    app.add_option("--ocr-lang", settings.ocr_lang,
                   "Add an invisible text layer recognized in LANG (e.g. eng, deu+fra).");
    app.add_option("--ocr-mode", settings.ocr_mode, "OCR mode: 'fast' (default) or 'best'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, pagesmith::OcrMode>{
                {"fast", pagesmith::OcrMode::Fast},
                {"best", pagesmith::OcrMode::Best}
            }, CLI::ignore_case));
    app.add_option("--tessdata", settings.tessdata, "Directory with Tesseract language data.")
        ->check(CLI::ExistingDirectory);
    app.add_option("--font", settings.font_path, "TrueType font for the text layer.")
        ->check(CLI::ExistingFile);

    // --- Images ---
    app.add_flag("--lossless", settings.lossless, "Never re-encode page images as JPEG.");
    app.add_option("--bit-depth", settings.bit_depth, "Colour depth: 'color' (default), 'gray' or 'bw'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, pagesmith::BitDepth>{
                {"color", pagesmith::BitDepth::Color},
                {"gray", pagesmith::BitDepth::Grayscale},
                {"bw", pagesmith::BitDepth::BlackAndWhite}
            }, CLI::ignore_case));
    app.add_option("--page-size", settings.page_size,
                   "Expected page size (a4, a5, letter, legal or WxH in inches).")
        ->check(PageSizeValidator());

    // --- Runtime ---
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for page encoding.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--temp-dir", settings.temp_dir, "Directory for temporary OCR input files.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "Page images (JPEG, PNG) and PDF files, in page order.")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        for (const auto& path : settings.inputs) {
            const auto ext = pagesmith::lowercase_extension(path);
            if (ext != ".pdf" && ext != ".jpg" && ext != ".jpeg" && ext != ".png") {
                throw CLI::ValidationError("Unsupported input type: " + path.string());
            }
        }
        if (pagesmith::is_archival(settings.compat) &&
            (!settings.owner_password.empty() || !settings.user_password.empty())) {
            throw CLI::ValidationError("PDF/A output cannot be encrypted.");
        }
        std::transform(settings.log_level.begin(), settings.log_level.end(), settings.log_level.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    });
}
