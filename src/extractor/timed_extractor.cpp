#include "timed_extractor.hpp"
#include "../logger/Mylogger.hpp"

#include <future>
#include <thread>

namespace extractor
{
    namespace
    {
        struct ExtractionResult
        {
            errors::Status status = errors::Status::Corrupt;
            cells::WorkbookSnapshot snapshot;
        };

        ExtractionResult runExtraction(SpreadsheetExtractor &inner, const std::string &path)
        {
            ExtractionResult result;
            try
            {
                result.status = inner.extract(path, result.snapshot);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Extraction of " + path + " threw: " + e.what());
                result.status = errors::Status::Corrupt;
            }
            return result;
        }
    }

    TimedExtractor::TimedExtractor(std::shared_ptr<SpreadsheetExtractor> inner, session::MonitoringSession &session,
                                   bool enabled, std::chrono::milliseconds timeout)
        : inner_(std::move(inner)), session_(session), enabled_(enabled), timeout_(timeout)
    {
    }

    errors::Status TimedExtractor::extract(const std::string &path, cells::WorkbookSnapshot &snapshot)
    {
        session_.beginProcessing(path);

        if (!enabled_)
        {
            ExtractionResult result = runExtraction(*inner_, path);
            session_.endProcessing(path);
            if (result.status == errors::Status::Ok)
                snapshot.swap(result.snapshot);
            return result.status;
        }

        auto promise = std::make_shared<std::promise<ExtractionResult>>();
        std::future<ExtractionResult> future = promise->get_future();
        std::shared_ptr<SpreadsheetExtractor> inner = inner_;

        std::thread([inner, promise, path]()
                    { promise->set_value(runExtraction(*inner, path)); })
            .detach();

        if (future.wait_for(timeout_) != std::future_status::ready)
        {
            MyLogger::error("Extraction timed out after " + std::to_string(timeout_.count()) + " ms: " + path);
            session_.endProcessing(path);
            return errors::Status::Timeout;
        }

        ExtractionResult result = future.get();
        session_.endProcessing(path);
        if (result.status == errors::Status::Ok)
            snapshot.swap(result.snapshot);
        return result.status;
    }

    std::optional<std::string> TimedExtractor::lastAuthor(const std::string &path)
    {
        return inner_->lastAuthor(path);
    }
} // namespace extractor
