#ifndef PAGESMITH_CLI_PARSER_HPP
#define PAGESMITH_CLI_PARSER_HPP

#include "../../../libpagesmith/include/export_params.hpp"
#include "../../../libpagesmith/include/page_image.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool lossless = false;

    // permissions, all granted unless switched off
    bool no_print = false;
    bool no_full_quality_print = false;
    bool no_copy = false;
    bool no_accessibility_copy = false;
    bool no_annotations = false;
    bool no_assembly = false;
    bool no_form_filling = false;
    bool no_modify = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path temp_dir;

    pagesmith::PdfCompat compat = pagesmith::PdfCompat::Default;
    pagesmith::PdfMetadata metadata;
    std::string owner_password;
    std::string user_password;

    std::string ocr_lang;   ///< Empty disables OCR
    pagesmith::OcrMode ocr_mode = pagesmith::OcrMode::Fast;
    std::filesystem::path tessdata;
    std::filesystem::path font_path;

    pagesmith::BitDepth bit_depth = pagesmith::BitDepth::Color;
    std::string page_size;

    std::vector<std::filesystem::path> inputs;

    [[nodiscard]] pagesmith::PdfEncryption encryption() const;
    [[nodiscard]] pagesmith::ImageMetadata image_metadata() const;
    [[nodiscard]] std::optional<pagesmith::OcrParams> ocr() const;
};

/**
 * @brief Parses "a4", "a5", "letter", "legal" or "<width>x<height>" (inches).
 * @return std::nullopt for anything else.
 */
std::optional<pagesmith::PageSize> parse_page_size(const std::string& text);

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // PAGESMITH_CLI_PARSER_HPP
