#include "../../include/tesseract_ocr_engine.hpp"
#include "../../include/logger.hpp"
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>
#include <leptonica/allheaders.h>
#include <memory>
#include <string>

namespace pagesmith {

namespace {

    struct PixDeleter {
        void operator()(Pix *pix) const { if (pix) pixDestroy(&pix); }
    };
    using unique_PIX = std::unique_ptr<Pix, PixDeleter>;

    struct TextDeleter {
        void operator()(const char *text) const { delete[] text; }
    };

    // ETEXT_DESC cancel hook, polled by Tesseract between words
    bool cancel_requested(void *cancel_this, int) {
        return static_cast<const std::stop_token *>(cancel_this)->stop_requested();
    }

    tesseract::OcrEngineMode engine_mode(const OcrMode mode) {
        return mode == OcrMode::Best ? tesseract::OEM_LSTM_ONLY : tesseract::OEM_DEFAULT;
    }

    /// @return 0 on success, like TessBaseAPI::Init.
    int init_api(tesseract::TessBaseAPI &api, const std::filesystem::path &tessdata, const OcrParams &params) {
        const std::string datapath = tessdata.string();
        return api.Init(datapath.empty() ? nullptr : datapath.c_str(),
                        params.language_code.c_str(),
                        engine_mode(params.mode));
    }

} // namespace

TesseractOcrEngine::TesseractOcrEngine(std::filesystem::path tessdata_dir)
    : tessdata_dir_(std::move(tessdata_dir)) {
}

std::string TesseractOcrEngine::identity() const {
    return std::string("tesseract-") + tesseract::TessBaseAPI::Version();
}

bool TesseractOcrEngine::is_available(const OcrParams &params, std::string &reason) const {
    if (params.language_code.empty()) {
        reason = "no OCR language selected";
        return false;
    }
    tesseract::TessBaseAPI api;
    if (init_api(api, tessdata_dir_, params) != 0) {
        reason = "Tesseract could not load language data for '" + params.language_code + "'";
        return false;
    }
    api.End();
    return true;
}

std::optional<OcrResult> TesseractOcrEngine::recognize(const std::filesystem::path &image_file,
                                                       const OcrParams &params,
                                                       const std::stop_token cancel) {
    if (cancel.stop_requested()) return std::nullopt;

    unique_PIX pix(pixRead(image_file.string().c_str()));
    if (!pix) {
        Logger::log(LogLevel::Error, "Leptonica cannot read " + image_file.string(), "tesseract");
        return std::nullopt;
    }

    tesseract::TessBaseAPI api;
    if (init_api(api, tessdata_dir_, params) != 0) {
        Logger::log(LogLevel::Error, "Tesseract init failed for language " + params.language_code, "tesseract");
        return std::nullopt;
    }
    api.SetPageSegMode(tesseract::PSM_AUTO);
    api.SetImage(pix.get());
    if (const int res = pixGetXRes(pix.get()); res > 0) {
        api.SetSourceResolution(res);
    }

    ETEXT_DESC monitor;
    monitor.cancel = cancel_requested;
    monitor.cancel_this = const_cast<std::stop_token *>(&cancel);
    if (api.Recognize(&monitor) != 0) {
        if (!cancel.stop_requested()) {
            Logger::log(LogLevel::Error, "Tesseract recognition failed for " + image_file.string(), "tesseract");
        }
        return std::nullopt;
    }
    if (cancel.stop_requested()) return std::nullopt;

    OcrResult result;
    result.page_width = static_cast<int>(pixGetWidth(pix.get()));
    result.page_height = static_cast<int>(pixGetHeight(pix.get()));

    const std::unique_ptr<tesseract::ResultIterator> it(api.GetIterator());
    constexpr auto level = tesseract::RIL_WORD;
    if (it && !it->Empty(level)) {
        do {
            const std::unique_ptr<const char, TextDeleter> text(it->GetUTF8Text(level));
            if (!text || *text == '\0') continue;
            int left = 0, top = 0, right = 0, bottom = 0;
            if (!it->BoundingBox(level, &left, &top, &right, &bottom)) continue;

            OcrTextElement element;
            element.text = text.get();
            element.bounds = Rect{static_cast<double>(left), static_cast<double>(top),
                                  static_cast<double>(right - left), static_cast<double>(bottom - top)};
            element.right_to_left = it->WordDirection() == tesseract::DIR_RIGHT_TO_LEFT;
            result.elements.push_back(std::move(element));
        } while (it->Next(level));
    }
    api.End();

    Logger::log(LogLevel::Debug,
                "Recognized " + std::to_string(result.elements.size()) + " words in " + image_file.filename().string(),
                "tesseract");
    return result;
}

} // namespace pagesmith
