#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/interrupt_watcher.hpp"
#include "../../libpagesmith/include/pagesmith.hpp"
#include "../../libpagesmith/include/logger.hpp"
#include "../../libpagesmith/include/source_pdf.hpp"
#include "../../libpagesmith/include/truetype_font.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << " pages)"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace pagesmith;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the export is stopped by an InterruptWatcher
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII metadata may be problematic.",
                "LocaleInit");
}

// one page per image file, one page per page of a PDF
std::vector<PageImage> collect_pages(const Settings& settings) {
    std::vector<PageImage> pages;
    const auto meta = settings.image_metadata();
    for (const auto& input : settings.inputs) {
        if (lowercase_extension(input) == ".pdf") {
            const SourceDocument doc(input);
            const int count = doc.page_count();
            Logger::log(LogLevel::Debug, input.string() + ": " + std::to_string(count) + " page(s)", "main");
            for (int i = 0; i < count; ++i) {
                pages.push_back(PageImage::from_pdf_page(input, i, meta));
            }
        } else {
            pages.push_back(PageImage::from_file(input, meta));
        }
    }
    return pages;
}

class CliObserver final : public PagesmithObserver {
public:
    explicit CliObserver(const bool quiet) : quiet_(quiet), start_(std::chrono::steady_clock::now()) {}

    void onExportStart(const std::size_t total_pages, const std::size_t passthrough_pages) override {
        if (!quiet_ && passthrough_pages > 0) {
            std::cerr << CYAN << passthrough_pages << " of " << total_pages
                      << " page(s) copied from PDF sources" << RESET << std::endl;
        }
    }

    void onProgress(const std::size_t done, const std::size_t total) override {
        if (quiet_) return;
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        print_progress_bar(done, total, elapsed);
    }

    void onOcrUnavailable(const std::string& reason) override {
        std::cerr << YELLOW << "\nOCR unavailable, exporting without text layer: " << reason << RESET << std::endl;
    }

    void onComplete(const std::size_t pages, const std::size_t output_size) override {
        if (quiet_) return;
        std::cerr << GREEN << "\n[DONE] " << pages << " page(s), " << output_size << " bytes" << RESET << std::endl;
    }

    void onCancelled(const std::size_t done, const std::size_t total) override {
        std::cerr << CYAN << "\n[INTERRUPT] Stopped after " << done << "/" << total
                  << " page(s); no output written." << RESET << std::endl;
    }

private:
    bool quiet_;
    std::chrono::steady_clock::time_point start_;
};

int main(int argc, char* argv[]) {

    CLI::App app{"pagesmith: turn page images and PDFs into one searchable PDF."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }
    {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->enabled = settings.log_level != "NONE";
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }
    init_utf8_locale();

    try {
        const auto pages = collect_pages(settings);
        if (pages.empty()) {
            Logger::log(LogLevel::Error, "No pages to export.", "main");
            return 1;
        }

        Pagesmith pagesmith;
        pagesmith.threads(settings.num_threads)
                 .compat(settings.compat)
                 .encryption(settings.encryption())
                 .metadata(settings.metadata)
                 .tessdata(settings.tessdata)
                 .fontPath(settings.font_path)
                 .tempDirectory(settings.temp_dir);
        if (const auto ocr = settings.ocr()) {
            pagesmith.ocr(*ocr);
        }

        CliObserver observer(settings.quiet);
        pagesmith.setObserver(&observer);

        if (interrupted.load()) {
            return 130;
        }
        bool ok = false;
        {
            InterruptWatcher watcher(interrupted, [&pagesmith] { pagesmith.stop(); });
            ok = pagesmith.exportPdf(pages, settings.output_path);
        }

        if (!ok || interrupted.load()) {
            return 130; // standard exit code for SIGINT
        }
        if (!settings.quiet) {
            std::cerr << "Wrote " << settings.output_path.string() << std::endl;
        }
        return 0;
    } catch (const NoEmbeddableFontError& e) {
        Logger::log(LogLevel::Error, std::string(e.what()) + " (use --font to choose one)", "main");
        return 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 1;
    }
}
