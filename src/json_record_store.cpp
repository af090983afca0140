#include "json_record_store.hpp"
#include "base64.hpp"
#include "parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

JsonRecordStore::JsonRecordStore(std::string path, std::string thumbnailRoot)
    : _path{ std::move(path) }
    , _thumbnailRoot{ thumbnailRoot.empty() ? fs::path(_path).parent_path() : fs::path(thumbnailRoot) }
    , _rows{}
    , _pathById{}
    , _work{}
    , _stop{ false }
    , _done{}
    , _autoReload{ false }
    , _reloadInterval{ std::chrono::seconds(1) }
    , _lastCheck{ std::chrono::steady_clock::now() }
    , _mtime{}
    , _refreshKey{ 0 }
    , _lastError{}
    , _worker{}
{
    _worker = std::thread([this]() { workerLoop(); });
}

JsonRecordStore::~JsonRecordStore()
{
    {
        std::lock_guard<std::mutex> lock(_workMutex);
        _stop = true;
    }
    _workCv.notify_all();
    if (_worker.joinable())
        _worker.join();
    // undelivered completions are dropped with the queue
}

bool JsonRecordStore::load(std::string* outError)
{
    std::string text;
    if (!read_file(_path, text))
    {
        _lastError = "cannot read " + _path;
        if (outError) *outError = _lastError;
        return false;
    }

    std::vector<EventRecord> rows;
    std::string err;
    if (!parse_timeline_payload(text, rows, &err))
    {
        _lastError = _path + ": " + err;
        if (outError) *outError = _lastError;
        return false;
    }

    std::stable_sort(rows.begin(), rows.end(),
        [](const EventRecord& a, const EventRecord& b) { return a.timestamp < b.timestamp; });

    std::unordered_map<int64_t, std::string> byId;
    for (const auto& r : rows)
    {
        if (r.id && r.imagePath && !r.imagePath->empty())
            byId[*r.id] = *r.imagePath;
    }

    {
        std::lock_guard<std::mutex> lock(_dataMutex);
        _rows = std::move(rows);
        _pathById = std::move(byId);
    }

    std::error_code ec;
    auto mtime = fs::last_write_time(_path, ec);
    if (!ec)
        _mtime = mtime;
    _lastError.clear();
    ++_refreshKey;
    return true;
}

std::size_t JsonRecordStore::recordCount() const
{
    std::lock_guard<std::mutex> lock(_dataMutex);
    return _rows.size();
}

void JsonRecordStore::setAutoReload(bool enabled, double intervalS)
{
    _autoReload = enabled;
    _reloadInterval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(std::max(0.05, intervalS)));
}

void JsonRecordStore::queryTimeline(int64_t startTimeMs, int64_t endTimeMs, QueryCallback done)
{
    post([this, startTimeMs, endTimeMs, done = std::move(done)]() mutable -> std::function<void()>
    {
        QueryResult result = runQuery(startTimeMs, endTimeMs);
        return [done = std::move(done), result = std::move(result)]() mutable { done(std::move(result)); };
    });
}

void JsonRecordStore::fetchThumbnail(const ThumbnailRef& ref, ThumbnailCallback done)
{
    post([this, ref, done = std::move(done)]() mutable -> std::function<void()>
    {
        ThumbnailResult result = runFetch(ref);
        return [done = std::move(done), result = std::move(result)]() mutable { done(std::move(result)); };
    });
}

std::size_t JsonRecordStore::poll()
{
    if (_autoReload)
        checkReload();

    std::deque<std::function<void()>> ready;
    {
        std::lock_guard<std::mutex> lock(_doneMutex);
        ready.swap(_done);
    }
    // callbacks may post new work, the lock is not held here
    for (auto& fn : ready)
        fn();
    return ready.size();
}

void JsonRecordStore::checkReload()
{
    const auto now = std::chrono::steady_clock::now();
    if (now - _lastCheck < _reloadInterval)
        return;
    _lastCheck = now;

    std::error_code ec;
    const auto mtime = fs::last_write_time(_path, ec);
    if (ec || (_mtime && *_mtime == mtime))
        return;

    std::string err;
    if (load(&err))
        std::cerr << "[timeline] reloaded " << _path << " (" << recordCount() << " records)\n";
    else
    {
        // a half-written file; try again at the next change
        _mtime = mtime;
        std::cerr << "[timeline] reload failed: " << err << "\n";
    }
}

void JsonRecordStore::post(Work work)
{
    {
        std::lock_guard<std::mutex> lock(_workMutex);
        _work.push_back(std::move(work));
    }
    _workCv.notify_one();
}

void JsonRecordStore::workerLoop()
{
    for (;;)
    {
        Work work;
        {
            std::unique_lock<std::mutex> lock(_workMutex);
            _workCv.wait(lock, [this]() { return _stop || !_work.empty(); });
            if (_stop)
                return;
            work = std::move(_work.front());
            _work.pop_front();
        }

        std::function<void()> completion = work();
        std::lock_guard<std::mutex> lock(_doneMutex);
        _done.push_back(std::move(completion));
    }
}

QueryResult JsonRecordStore::runQuery(int64_t startTimeMs, int64_t endTimeMs) const
{
    QueryResult result;
    if (endTimeMs < startTimeMs)
    {
        result.error = "invalid range";
        return result;
    }

    std::lock_guard<std::mutex> lock(_dataMutex);
    auto first = std::lower_bound(_rows.begin(), _rows.end(), startTimeMs,
        [](const EventRecord& e, int64_t t) { return e.timestamp < t; });
    auto last = std::upper_bound(first, _rows.end(), endTimeMs,
        [](int64_t t, const EventRecord& e) { return t < e.timestamp; });
    result.records.assign(first, last);
    result.ok = true;
    return result;
}

std::optional<fs::path> JsonRecordStore::resolveImage(const ThumbnailRef& ref) const
{
    std::string rel;
    if (ref.path && !ref.path->empty())
        rel = *ref.path;
    else if (ref.id)
    {
        std::lock_guard<std::mutex> lock(_dataMutex);
        auto it = _pathById.find(*ref.id);
        if (it == _pathById.end())
            return std::nullopt;
        rel = it->second;
    }
    else
        return std::nullopt;

    fs::path p(rel);
    if (p.is_relative())
        p = _thumbnailRoot / p;
    return p;
}

ThumbnailResult JsonRecordStore::runFetch(const ThumbnailRef& ref) const
{
    auto file = resolveImage(ref);
    if (!file)
        return ThumbnailResult::notFound();

    std::error_code ec;
    if (!fs::is_regular_file(*file, ec))
        return ec && ec != std::errc::no_such_file_or_directory
            ? ThumbnailResult::failed(ec.message())
            : ThumbnailResult::notFound();

    std::ifstream ifs(*file, std::ios::binary);
    if (!ifs)
        return ThumbnailResult::failed("cannot open " + file->string());
    std::string bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        return ThumbnailResult::failed("read error on " + file->string());
    if (bytes.empty())
        return ThumbnailResult::notFound();

    ThumbnailResult r;
    r.status = ThumbnailResult::Status::Ok;
    r.mimeType = mimeTypeFor(*file);
    r.base64Data = base64_encode(bytes);
    return r;
}

std::string JsonRecordStore::mimeTypeFor(const fs::path& file)
{
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".webp") return "image/webp";
    if (ext == ".gif") return "image/gif";
    if (ext == ".bmp") return "image/bmp";
    return "image/png";
}
