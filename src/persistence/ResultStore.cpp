#include "ResultStore.hpp"

#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace persistence
{

JsonlResultStore::JsonlResultStore(std::string path, std::size_t snippet_chars, std::size_t max_pending)
    : path_(std::move(path))
    , snippet_chars_(snippet_chars)
    , max_pending_(max_pending > 0 ? max_pending : 1)
{
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence,
                                                "Unable to create result log directory",
                                                parent.string() + ": " + ec.message());
        }
    }
    worker_ = std::thread([this] { workerLoop(); });
}

JsonlResultStore::~JsonlResultStore()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

void JsonlResultStore::append(ResultRecord record)
{
    record.input = processing::truncateCodepoints(record.input, snippet_chars_);
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            PLOG_WARNING << "Result store is shutting down; dropping " << record.type << " record";
            return;
        }
        if (queue_.size() + in_flight_ >= max_pending_)
        {
            ++failed_writes_;
            dropped = true;
        }
        else
        {
            queue_.push_back(std::move(record));
        }
    }
    if (dropped)
    {
        PLOG_WARNING << "Result queue full (" << max_pending_ << " pending); dropping " << record.type << " record";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence, "Result queue full; record dropped",
                                            path_);
        return;
    }
    work_cv_.notify_one();
}

void JsonlResultStore::flush()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

std::size_t JsonlResultStore::pendingWrites() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + in_flight_;
}

std::size_t JsonlResultStore::failedWrites() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_writes_;
}

void JsonlResultStore::workerLoop()
{
    PROFILE_THREAD_NAME("ResultStore");

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;)
    {
        work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
        {
            if (stopping_)
                break;
            continue;
        }

        std::deque<ResultRecord> batch;
        batch.swap(queue_);
        in_flight_ = batch.size();
        lock.unlock();

        const bool ok = writeBatch(batch);

        lock.lock();
        if (!ok)
            failed_writes_ += batch.size();
        in_flight_ = 0;
        if (queue_.empty())
            idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

bool JsonlResultStore::writeBatch(const std::deque<ResultRecord>& batch)
{
    PROFILE_SCOPE_FUNCTION();

    try
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        if (!out)
        {
            PLOG_ERROR << "Cannot open result log " << path_;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to persist results",
                                              "Cannot open " + path_);
            return false;
        }
        for (const auto& record : batch)
            out << toJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        out.flush();
        if (!out)
        {
            PLOG_ERROR << "Write to result log " << path_ << " failed";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to persist results",
                                              "Write error on " + path_);
            return false;
        }
        PLOG_DEBUG << "Persisted " << batch.size() << " result record(s)";
        return true;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Result log error: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence, "Failed to persist results",
                                          ex.what());
        return false;
    }
}

nlohmann::json JsonlResultStore::toJson(const ResultRecord& record)
{
    return nlohmann::json{
        { "type", record.type },
        { "input", record.input },
        { "output", record.output },
        { "timestamp", isoTimestamp(record.timestamp) },
    };
}

std::string JsonlResultStore::isoTimestamp(std::chrono::system_clock::time_point tp)
{
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

} // namespace persistence
