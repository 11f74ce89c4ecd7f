#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace persistence
{

struct ResultRecord
{
    std::string type; // "detection", "summary" or "generation"
    std::string input;
    nlohmann::json output;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Write-only sink for completed analyses. append() must not block on I/O.
class IResultStore
{
public:
    virtual ~IResultStore() = default;

    virtual void append(ResultRecord record) = 0;

    // Blocks until everything appended so far has been handled.
    virtual void flush() {}
    virtual std::size_t pendingWrites() const { return 0; }
};

// Used when [persistence] enabled = false.
class NullResultStore : public IResultStore
{
public:
    void append(ResultRecord) override {}
};

/**
 * @brief Appends records as JSON lines from a background worker thread.
 *
 * Records are queued by append() and written in batches. Write failures are
 * logged and reported to ErrorReporter and the affected batch is dropped;
 * callers never see them. The destructor drains the queue before joining.
 */
class JsonlResultStore : public IResultStore
{
public:
    static constexpr std::size_t kDefaultSnippetChars = 500;
    static constexpr std::size_t kDefaultMaxPending = 10000;

    // Once max_pending records are queued or being written, further records
    // are dropped and counted in failedWrites().
    explicit JsonlResultStore(std::string path, std::size_t snippet_chars = kDefaultSnippetChars,
                              std::size_t max_pending = kDefaultMaxPending);
    ~JsonlResultStore() override;

    JsonlResultStore(const JsonlResultStore&) = delete;
    JsonlResultStore& operator=(const JsonlResultStore&) = delete;

    void append(ResultRecord record) override;
    void flush() override;
    std::size_t pendingWrites() const override;

    const std::string& path() const { return path_; }
    std::size_t failedWrites() const;

    static nlohmann::json toJson(const ResultRecord& record);
    // UTC, "YYYY-MM-DDTHH:MM:SS.mmmZ"
    static std::string isoTimestamp(std::chrono::system_clock::time_point tp);

private:
    void workerLoop();
    bool writeBatch(const std::deque<ResultRecord>& batch);

    std::string path_;
    std::size_t snippet_chars_;
    std::size_t max_pending_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<ResultRecord> queue_;
    std::size_t in_flight_ = 0;
    std::size_t failed_writes_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace persistence
