#include "../../include/pdf_exporter.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/page_classifier.hpp"
#include "../../include/page_geometry.hpp"
#include "../../include/passthrough_merger.hpp"
#include "../../include/pipeline.hpp"
#include "../../include/text_layout.hpp"
#include "../../include/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace pagesmith {

namespace {

    using StatePtr = PageExportState *;
    using Step = Pipeline<StatePtr>::Step;
    using SuspendingStep = Pipeline<StatePtr>::SuspendingStep;

    // releases every embedder and source document once, on all exit paths
    struct ReleaseGuard {
        std::vector<std::unique_ptr<PageExportState>> &states;

        ~ReleaseGuard() {
            for (const auto &s : states) {
                if (s->embedder) {
                    s->embedder->release();
                    s->embedder.reset();
                }
                s->source.reset();
            }
        }
    };

    struct CountingStream {
        std::ostream &out;
        std::size_t written = 0;

        void write(const std::vector<std::uint8_t> &data) {
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out) {
                throw std::runtime_error("Failed to write PDF output");
            }
            written += data.size();
        }
    };

} // namespace

PdfExporter::PdfExporter(ExportContext context) : context_(std::move(context)) {
    if (context_.temp_dir.empty()) {
        context_.temp_dir = std::filesystem::temp_directory_path() / "pagesmith";
    }
}

std::optional<OcrParams> PdfExporter::check_ocr(const std::optional<OcrParams> &ocr) {
    if (!ocr) return std::nullopt;

    std::string reason;
    if (!context_.ocr_engine) {
        reason = "no OCR engine configured";
    } else if (!context_.ocr_engine->is_available(*ocr, reason) && reason.empty()) {
        reason = "OCR engine not available for language " + ocr->language_code;
    }
    if (!reason.empty()) {
        Logger::log(LogLevel::Error, "OCR skipped: " + reason, "pdf_exporter");
        publish(OcrUnavailableEvent{reason});
        return std::nullopt;
    }

    std::lock_guard lock(setup_mtx_);
    if (!context_.ocr_queue) {
        context_.ocr_queue = std::make_shared<OcrRequestQueue>();
    }
    return ocr;
}

std::shared_ptr<const TrueTypeFont> PdfExporter::ocr_font() {
    std::lock_guard lock(setup_mtx_);
    if (!context_.font) {
        context_.font = TrueTypeFont::load_default(context_.font_path);
        Logger::log(LogLevel::Info, "OCR text font: " + context_.font->path().string(), "pdf_exporter");
    }
    return context_.font;
}

void PdfExporter::start_ocr(PageExportState &state, const OcrParams &ocr, const std::stop_token stop,
                            std::function<void()> resume) {
    if (!state.embedder) {
        resume();
        return;
    }
    auto &queue = *context_.ocr_queue;
    TempFile file;
    if (!queue.has_cached_result(*context_.ocr_engine, *state.image, ocr)) {
        file = TempFile(make_temp_path(context_.temp_dir, state.embedder->stream_extension()));
        std::ofstream out(file.path(), std::ios::binary);
        if (!out) {
            throw std::runtime_error("Cannot create OCR input " + file.path().string());
        }
        state.embedder->copy_to_stream(out);
        out.close();
        if (!out) {
            throw std::runtime_error("Cannot write OCR input " + file.path().string());
        }
    }
    // the result is stored before the chain moves on to the next step
    queue.enqueue(context_.ocr_engine, *state.image, std::move(file), ocr, stop,
                  [s = &state, resume = std::move(resume)](const std::optional<OcrResult> &result) {
                      s->ocr_result = result;
                      resume();
                  });
}

bool PdfExporter::export_pdf(const std::filesystem::path &output,
                             const std::vector<PageImage> &images,
                             const PdfExportParams &params,
                             const std::optional<OcrParams> &ocr,
                             const std::stop_token stop) {
    ensure_parent_dir_exists(output);
    const auto dir = output.has_parent_path() ? output.parent_path() : std::filesystem::path(".");
    TempFile temp(make_temp_path(dir, ".part"));
    {
        std::ofstream out(temp.path(), std::ios::binary);
        if (!out) {
            throw std::runtime_error("Cannot create " + temp.path().string());
        }
        if (!export_pdf(out, images, params, ocr, stop)) {
            return false;
        }
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to write " + temp.path().string());
        }
    }
    commit_temp_file(temp.path(), output);
    temp.release();
    Logger::log(LogLevel::Info, "Wrote " + output.string(), "pdf_exporter");
    return true;
}

bool PdfExporter::export_pdf(std::ostream &out,
                             const std::vector<PageImage> &images,
                             const PdfExportParams &params,
                             const std::optional<OcrParams> &ocr_request,
                             const std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t total = images.size();
    if (total == 0) {
        throw std::invalid_argument("No pages to export");
    }

    const auto classified = classify_pages(images);
    const auto ocr = check_ocr(ocr_request);
    std::shared_ptr<const TrueTypeFont> font;
    if (ocr) font = ocr_font();

    GeneratedDocument doc(total, params.compat, font);

    std::vector<std::unique_ptr<PageExportState>> states;
    states.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        auto state = std::make_unique<PageExportState>();
        state->index = i;
        state->image = &images[i];
        state->handle = doc.page_handle(i);
        states.push_back(std::move(state));
    }
    ReleaseGuard release_guard{states};

    publish(ExportStartEvent{total, classified.passthrough.size(), ocr.has_value()});
    publish(ExportProgressEvent{0, total});
    Logger::log(LogLevel::Info,
                "Exporting " + std::to_string(total) + " page(s), " + std::to_string(classified.passthrough.size()) +
                " passthrough" + (ocr ? ", OCR " + ocr->language_code : std::string()),
                "pdf_exporter");

    std::mutex progress_mtx;
    std::size_t done = 0;

    // --- stages ---

    const Step render = [](StatePtr s, std::stop_token) {
        s->embedder = select_embedder(*s->image);
        return s;
    };
    // init OCR and wait for it: the page leaves the pool until the result arrives
    const SuspendingStep ocr_page = [this, &ocr](StatePtr &s, const std::stop_token st,
                                                 Pipeline<StatePtr>::Resume resume) {
        start_ocr(*s, *ocr, st, std::move(resume));
    };
    const Step write = [&](StatePtr s, std::stop_token) {
        auto &embedder = *s->embedder;
        embedder.prepare_for_export(s->image->metadata());
        const auto geometry = compute_page_size(embedder.dpi_x(), embedder.dpi_y(),
                                                embedder.width(), embedder.height(),
                                                s->image->metadata().page_size);
        std::vector<TextPlacement> text;
        if (s->ocr_result && font) {
            text = layout_ocr_text(*s->ocr_result, geometry.width, geometry.height, *font);
        }
        const auto image = embedder.pdf_image(doc.flattens_alpha());
        {
            auto writer = doc.writer();
            writer.draw_page(s->handle, image, geometry, text);
        }
        embedder.release();
        s->embedder.reset();

        std::lock_guard lock(progress_mtx);
        publish(ExportProgressEvent{++done, total});
        return s;
    };
    const Step probe = [](StatePtr s, std::stop_token) {
        try {
            s->source = SourceDocument::open(*s->image);
            s->needs_ocr = !s->source->has_text(s->image->pdf_page_index());
        } catch (const std::exception &e) {
            Logger::log(LogLevel::Warning, "Cannot read text of " + s->image->describe() + ": " + e.what(),
                        "pdf_exporter");
            s->needs_ocr = true;
        }
        if (!s->needs_ocr) {
            s->source.reset();
        }
        return s;
    };
    const Step rasterize = [](StatePtr s, std::stop_token) {
        try {
            s->embedder = select_embedder(*s->image, s->source.get());
        } catch (const std::exception &e) {
            Logger::log(LogLevel::Error, "Cannot rasterize " + s->image->describe() + " for OCR: " + e.what(),
                        "pdf_exporter");
        }
        s->source.reset();
        return s;
    };

    ThreadPool pool(context_.threads == 0 ? std::thread::hardware_concurrency() : context_.threads);

    // --- image pages ---

    std::vector<StatePtr> render_states;
    for (const auto &slot : classified.to_render) render_states.push_back(states[slot.index].get());
    auto image_pipeline = Pipeline<StatePtr>::over(std::move(render_states)).step(render);
    if (ocr) image_pipeline.suspend(ocr_page);
    auto image_run = image_pipeline.step(write).run(pool, stop);

    // --- passthrough pages ---

    std::vector<PassthroughPage> passthrough;
    if (!classified.passthrough.empty()) {
        std::vector<StatePtr> pass_states;
        for (const auto &slot : classified.passthrough) pass_states.push_back(states[slot.index].get());

        if (ocr) {
            auto probed = Pipeline<StatePtr>::over(std::move(pass_states)).step(probe).run(pool, stop).get();
            std::vector<StatePtr> to_ocr;
            for (const auto s : probed) {
                if (s->needs_ocr) to_ocr.push_back(s);
            }
            Logger::log(LogLevel::Debug,
                        std::to_string(to_ocr.size()) + " of " + std::to_string(probed.size()) +
                        " passthrough page(s) need OCR", "pdf_exporter");
            Pipeline<StatePtr>::over(std::move(to_ocr))
                .step(rasterize).suspend(ocr_page)
                .run(pool, stop).get();
        }
        for (const auto &slot : classified.passthrough) {
            auto &s = *states[slot.index];
            if (s.embedder) {
                s.embedder->release();
                s.embedder.reset();
            }
            passthrough.push_back(PassthroughPage{s.index, s.image, std::move(s.ocr_result)});
        }
    }

    image_run.get();

    if (stop.stop_requested()) {
        Logger::log(LogLevel::Info, "Export cancelled", "pdf_exporter");
        std::lock_guard lock(progress_mtx);
        publish(ExportCancelledEvent{done, total});
        return false;
    }

    auto generated = doc.finalize(params);

    if (stop.stop_requested()) {
        std::lock_guard lock(progress_mtx);
        publish(ExportCancelledEvent{done, total});
        return false;
    }

    std::size_t written = 0;
    if (passthrough.empty()) {
        CountingStream counting{out};
        counting.write(generated);
        written = counting.written;
    } else {
        const auto before = out.tellp();
        if (!merge_passthrough_pages(std::move(generated), std::move(passthrough), params, font, out, stop)) {
            std::lock_guard lock(progress_mtx);
            publish(ExportCancelledEvent{done, total});
            return false;
        }
        const auto after = out.tellp();
        if (before != std::streampos(-1) && after != std::streampos(-1)) {
            written = static_cast<std::size_t>(after - before);
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    publish(ExportCompleteEvent{total, written, elapsed});
    Logger::log(LogLevel::Info,
                "Exported " + std::to_string(total) + " page(s) in " + std::to_string(elapsed.count()) + " ms",
                "pdf_exporter");
    return true;
}

} // namespace pagesmith
