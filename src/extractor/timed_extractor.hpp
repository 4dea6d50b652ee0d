#ifndef TIMED_EXTRACTOR_HPP
#define TIMED_EXTRACTOR_HPP

#include <chrono>
#include <memory>
#include "extractor.hpp"
#include "../session/session.hpp"

namespace extractor
{
    // Decorator that bounds extraction time and publishes the session's
    // "currently processing" marker around each read.
    //
    // A read that overruns keeps running on its own thread; its result is
    // dropped and Timeout is reported.
    class TimedExtractor : public SpreadsheetExtractor
    {
    public:
        TimedExtractor(std::shared_ptr<SpreadsheetExtractor> inner, session::MonitoringSession &session,
                       bool enabled, std::chrono::milliseconds timeout);

        errors::Status extract(const std::string &path, cells::WorkbookSnapshot &snapshot) override;
        std::optional<std::string> lastAuthor(const std::string &path) override;

    private:
        std::shared_ptr<SpreadsheetExtractor> inner_;
        session::MonitoringSession &session_;
        bool enabled_;
        std::chrono::milliseconds timeout_;
    };
} // namespace extractor

#endif // TIMED_EXTRACTOR_HPP
