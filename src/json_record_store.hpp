#pragma once
#include "record_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

/// @brief JsonRecordStore: reference store over a JSON export and a thumbnail directory.
/// Work runs on one worker thread; results are handed back by poll() on the UI thread.
class JsonRecordStore : public RecordStore
{
public:
    JsonRecordStore(std::string path, std::string thumbnailRoot);
    ~JsonRecordStore() override;
    JsonRecordStore(const JsonRecordStore&) = delete;
    JsonRecordStore& operator=(const JsonRecordStore&) = delete;

    // Synchronous (re)load of the records file. Keeps the previous rows on failure.
    bool load(std::string* outError = nullptr);

    void queryTimeline(int64_t startTimeMs, int64_t endTimeMs, QueryCallback done) override;
    void fetchThumbnail(const ThumbnailRef& ref, ThumbnailCallback done) override;

    // Delivers finished callbacks; also checks the file for changes when auto reload is on.
    // Returns the number of callbacks run.
    std::size_t poll();

    void setAutoReload(bool enabled, double intervalS);

    // changes after every successful reload
    uint64_t refreshKey() const { return _refreshKey; }
    std::size_t recordCount() const;
    const std::string& lastError() const { return _lastError; }
    const std::string& path() const { return _path; }

    static std::string mimeTypeFor(const std::filesystem::path& file);

private:
    using Work = std::function<std::function<void()>()>;

    void post(Work work);
    void workerLoop();
    void checkReload();

    QueryResult runQuery(int64_t startTimeMs, int64_t endTimeMs) const;
    ThumbnailResult runFetch(const ThumbnailRef& ref) const;
    std::optional<std::filesystem::path> resolveImage(const ThumbnailRef& ref) const;

    std::string _path;
    std::filesystem::path _thumbnailRoot;

    // ---- rows, shared with the worker ----
    mutable std::mutex _dataMutex;
    std::vector<EventRecord> _rows; // sorted by timestamp
    std::unordered_map<int64_t, std::string> _pathById;

    // ---- worker ----
    std::mutex _workMutex;
    std::condition_variable _workCv;
    std::deque<Work> _work;
    bool _stop;

    std::mutex _doneMutex;
    std::deque<std::function<void()>> _done;

    // ---- auto reload (UI thread only) ----
    bool _autoReload;
    std::chrono::steady_clock::duration _reloadInterval;
    std::chrono::steady_clock::time_point _lastCheck;
    std::optional<std::filesystem::file_time_type> _mtime;
    uint64_t _refreshKey;
    std::string _lastError;

    std::thread _worker; // last: started once everything above exists
};
