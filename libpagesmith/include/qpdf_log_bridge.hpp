#ifndef PAGESMITH_QPDF_LOG_BRIDGE_HPP
#define PAGESMITH_QPDF_LOG_BRIDGE_HPP

#include "logger.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

namespace pagesmith {

    // redirects qpdf messages into our logger
    struct LoggerStreamBuf final : std::stringbuf {
        LogLevel level;
        std::string module;
        std::string pending;
        LoggerStreamBuf(const LogLevel lvl, const char *mod) : level(lvl), module(mod) {}
        // emits complete lines only; the tail waits for the next write
        int sync() override {
            std::string s = pending + str();
            str("");
            std::size_t start = 0;
            for (auto nl = s.find('\n'); nl != std::string::npos; nl = s.find('\n', start)) {
                emit(s.substr(start, nl - start));
                start = nl + 1;
            }
            pending = s.substr(start);
            return 0;
        }
        ~LoggerStreamBuf() override {
            emit(pending + str());
        }

        void emit(std::string line) const {
            while (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) Logger::log(level, line, module);
        }
    };

    /**
     * @brief Owns the streams a QPDFLogger writes to. Must outlive the QPDF it is attached to.
     */
    class QpdfLogBridge {
    public:
        QpdfLogBridge()
            : info_buf_(LogLevel::Debug, "qpdf"),
              warn_buf_(LogLevel::Warning, "qpdf"),
              info_os_(&info_buf_),
              warn_os_(&warn_buf_),
              logger_(QPDFLogger::create()) {
            info_os_ << std::unitbuf;
            warn_os_ << std::unitbuf;
            logger_->setOutputStreams(&info_os_, &warn_os_);
        }

        QpdfLogBridge(const QpdfLogBridge &) = delete;
        QpdfLogBridge &operator=(const QpdfLogBridge &) = delete;

        void attach(QPDF &pdf) const { pdf.setLogger(logger_); }

    private:
        LoggerStreamBuf info_buf_;
        LoggerStreamBuf warn_buf_;
        std::ostream info_os_;
        std::ostream warn_os_;
        std::shared_ptr<QPDFLogger> logger_;
    };

} // namespace pagesmith

#endif // PAGESMITH_QPDF_LOG_BRIDGE_HPP
