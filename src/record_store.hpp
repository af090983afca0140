#pragma once
#include "model.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <string>
#include <vector>

/// @brief QueryResult: answer to RecordStore::queryTimeline.
struct QueryResult
{
    bool ok = false;
    std::vector<EventRecord> records;
    std::string error;
};

/// @brief ThumbnailResult: answer to RecordStore::fetchThumbnail.
struct ThumbnailResult
{
    enum class Status { Ok, NotFound, Failed, Cancelled };

    Status      status = Status::Failed;
    std::string mimeType;
    std::string base64Data;
    std::string error;

    static ThumbnailResult cancelled() { return { Status::Cancelled, {}, {}, "cancelled" }; }
    static ThumbnailResult notFound() { return { Status::NotFound, {}, {}, "not_found" }; }
    static ThumbnailResult failed(std::string err) { return { Status::Failed, {}, {}, std::move(err) }; }
};

/// @brief RecordStore: the external record/thumbnail source.
/// Callbacks are delivered on the UI thread.
class RecordStore
{
public:
    using QueryCallback = std::function<void(QueryResult)>;
    using ThumbnailCallback = std::function<void(ThumbnailResult)>;

    virtual ~RecordStore() = default;

    virtual void queryTimeline(int64_t startTimeMs, int64_t endTimeMs, QueryCallback done) = 0;
    virtual void fetchThumbnail(const ThumbnailRef& ref, ThumbnailCallback done) = 0;
};
