/**
 * @file pagesmith.cpp
 * @brief Implementation of the public Pagesmith API.
 */

#include "../../include/pagesmith.hpp"

#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/ocr_request_queue.hpp"
#include "../../include/pdf_exporter.hpp"
#include "../../include/tesseract_ocr_engine.hpp"

#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace pagesmith {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    PagesmithObserver* observer_;
public:
    explicit BridgeLogSink(PagesmithObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct Pagesmith::Impl {
    PdfExportParams params;
    std::optional<OcrParams> ocrParams;
    std::filesystem::path tessdataDir;
    std::filesystem::path fontPath;
    std::filesystem::path tempDir;
    unsigned numThreads = std::thread::hardware_concurrency();

    std::shared_ptr<IOcrEngine> engine;
    std::shared_ptr<OcrRequestQueue> ocrQueue = std::make_shared<OcrRequestQueue>();

    PagesmithObserver* observer = nullptr;

    std::mutex stopMutex;
    std::optional<std::stop_source> current;

    Impl() {
        if (numThreads == 0) numThreads = 1;
    }

    void setupEventBridging(EventBus& bus) {
        if (!observer) return;

        bus.subscribe<ExportStartEvent>([this](const ExportStartEvent& e) {
            observer->onExportStart(e.total_pages, e.passthrough_pages);
        });

        bus.subscribe<ExportProgressEvent>([this](const ExportProgressEvent& e) {
            observer->onProgress(e.done, e.total);
        });

        bus.subscribe<OcrUnavailableEvent>([this](const OcrUnavailableEvent& e) {
            observer->onOcrUnavailable(e.reason);
        });

        bus.subscribe<ExportCompleteEvent>([this](const ExportCompleteEvent& e) {
            observer->onComplete(e.pages, e.output_size);
        });

        bus.subscribe<ExportCancelledEvent>([this](const ExportCancelledEvent& e) {
            observer->onCancelled(e.done, e.total);
        });
    }

    std::shared_ptr<IOcrEngine> ocrEngine() {
        if (!engine && ocrParams) {
            engine = std::make_shared<TesseractOcrEngine>(tessdataDir);
        }
        return engine;
    }

    std::stop_token begin() {
        std::lock_guard lock(stopMutex);
        current.emplace();
        return current->get_token();
    }

    void end() {
        std::lock_guard lock(stopMutex);
        current.reset();
    }

    // runs one export with the observer attached to the bus and the log
    template <typename Output>
    bool run(const std::vector<PageImage>& pages, Output&& out) {
        EventBus bus;
        setupEventBridging(bus);

        std::optional<std::size_t> sinkId;
        if (observer) {
            sinkId = Logger::add_sink(std::make_unique<BridgeLogSink>(observer));
        }
        struct SinkGuard {
            std::optional<std::size_t>& id;
            ~SinkGuard() { if (id) Logger::remove_sink(*id); }
        } sinkGuard{sinkId};

        ExportContext context;
        context.temp_dir = tempDir;
        context.ocr_engine = ocrEngine();
        context.ocr_queue = ocrQueue;
        context.font_path = fontPath;
        context.threads = numThreads;
        context.events = &bus;
        PdfExporter exporter(std::move(context));

        const auto token = begin();
        try {
            const bool ok = exporter.export_pdf(out, pages, params, ocrParams, token);
            end();
            return ok;
        } catch (...) {
            end();
            throw;
        }
    }
};

Pagesmith::Pagesmith() : impl_(std::make_unique<Impl>()) {}

Pagesmith::~Pagesmith() {
    if (impl_) stop();
}

Pagesmith::Pagesmith(Pagesmith&&) noexcept = default;
Pagesmith& Pagesmith::operator=(Pagesmith&&) noexcept = default;

Pagesmith& Pagesmith::threads(const unsigned val) {
    impl_->numThreads = val > 0 ? val : std::thread::hardware_concurrency();
    if (impl_->numThreads == 0) impl_->numThreads = 1;
    return *this;
}

Pagesmith& Pagesmith::compat(const PdfCompat val) {
    impl_->params.compat = val;
    return *this;
}

Pagesmith& Pagesmith::encryption(const PdfEncryption& val) {
    impl_->params.encryption = val;
    return *this;
}

Pagesmith& Pagesmith::metadata(const PdfMetadata& val) {
    impl_->params.metadata = val;
    return *this;
}

Pagesmith& Pagesmith::ocr(const OcrParams& params) {
    impl_->ocrParams = params;
    return *this;
}

Pagesmith& Pagesmith::noOcr() {
    impl_->ocrParams.reset();
    return *this;
}

Pagesmith& Pagesmith::tessdata(const std::filesystem::path& dir) {
    impl_->tessdataDir = dir;
    impl_->engine.reset();
    return *this;
}

Pagesmith& Pagesmith::ocrEngine(std::shared_ptr<IOcrEngine> engine) {
    impl_->engine = std::move(engine);
    return *this;
}

Pagesmith& Pagesmith::fontPath(const std::filesystem::path& path) {
    impl_->fontPath = path;
    return *this;
}

Pagesmith& Pagesmith::tempDirectory(const std::filesystem::path& dir) {
    impl_->tempDir = dir;
    return *this;
}

void Pagesmith::setObserver(PagesmithObserver* observer) {
    impl_->observer = observer;
}

bool Pagesmith::exportPdf(const std::vector<PageImage>& pages, const std::filesystem::path& output) {
    return impl_->run(pages, output);
}

bool Pagesmith::exportPdf(const std::vector<PageImage>& pages, std::ostream& out) {
    return impl_->run(pages, out);
}

void Pagesmith::stop() {
    std::lock_guard lock(impl_->stopMutex);
    if (impl_->current) {
        impl_->current->request_stop();
    }
}

} // namespace pagesmith
