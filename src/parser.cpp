#include "parser.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss; oss << ifs.rdbuf();
    out = std::move(oss).str();
    return true;
}

// days since 1970-01-01 of a proleptic gregorian date
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = unsigned(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + int64_t(doe) - 719468;
}

bool parse_iso8601_ms(const std::string& text, int64_t& outMs)
{
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3)
        return false;
    if (mo < 1 || mo > 12 || d < 1 || d > 31)
        return false;

    size_t pos = size_t(consumed);
    int64_t ms = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' '))
    {
        int n = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d:%2d%n", &h, &mi, &s, &n) != 3)
            return false;
        pos += 1 + size_t(n);
        if (pos < text.size() && (text[pos] == '.' || text[pos] == ','))
        {
            // fraction, keep millisecond precision
            ++pos;
            int digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (digits < 3)
                    ms = ms * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits)
                ms *= 10;
        }
    }
    if (h > 23 || mi > 59 || s > 60)
        return false;

    int64_t offsetMin = 0;
    if (pos < text.size())
    {
        const char z = text[pos];
        if (z == 'Z' || z == 'z')
        {
            ++pos;
        }
        else if (z == '+' || z == '-')
        {
            int oh = 0, om = 0;
            const char* p = text.c_str() + pos + 1;
            if (std::sscanf(p, "%2d:%2d", &oh, &om) != 2 && std::sscanf(p, "%2d%2d", &oh, &om) < 1)
                return false;
            offsetMin = (z == '+' ? 1 : -1) * (oh * 60 + om);
            pos = text.size();
        }
        if (pos < text.size())
            return false;
    }

    const int64_t days = days_from_civil(y, unsigned(mo), unsigned(d));
    const int64_t secs = days * 86400 + h * 3600 + mi * 60 + s - offsetMin * 60;
    outMs = secs * 1000 + ms;
    return true;
}

static std::optional<std::string> opt_string(const json& o, const char* key)
{
    auto it = o.find(key);
    if (it == o.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

// metadata is either an object or the same object encoded as a string
static json metadata_of(const json& o)
{
    auto it = o.find("metadata");
    if (it == o.end())
        return json::object();
    if (it->is_object())
        return *it;
    if (it->is_string())
    {
        json m = json::parse(it->get<std::string>(), nullptr, false);
        if (!m.is_discarded() && m.is_object())
            return m;
    }
    return json::object();
}

static bool decode_timestamp(const json& o, int64_t& outMs)
{
    auto it = o.find("timestamp");
    if (it != o.end() && !it->is_null())
    {
        if (!it->is_number())
            return false;
        const double secs = it->get<double>();
        if (!std::isfinite(secs))
            return false;
        outMs = std::llround(secs * 1000.0);
        return outMs >= 0;
    }

    auto ct = o.find("created_at");
    if (ct != o.end() && ct->is_string())
        return parse_iso8601_ms(ct->get<std::string>(), outMs) && outMs >= 0;
    return false;
}

static void parse_record_object(const json& o, std::vector<EventRecord>& out)
{
    if (!o.is_object())
        return;

    EventRecord e;
    if (!decode_timestamp(o, e.timestamp))
        return;

    if (auto it = o.find("id"); it != o.end() && it->is_number_integer())
        e.id = it->get<int64_t>();
    e.imagePath = opt_string(o, "image_path");
    e.appName = opt_string(o, "process_name");
    e.windowTitle = opt_string(o, "window_title");
    e.processIcon = opt_string(o, "process_icon");
    e.processPath = opt_string(o, "process_path");

    if (!e.processIcon || !e.processPath)
    {
        const json meta = metadata_of(o);
        if (!e.processIcon)
            e.processIcon = opt_string(meta, "process_icon");
        if (!e.processPath)
            e.processPath = opt_string(meta, "process_path");
    }

    out.push_back(std::move(e));
}

// ---------- API ----------
bool parse_timeline_payload(const std::string& jsonText, std::vector<EventRecord>& out, std::string* outError)
{
    out.clear();

    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }

    // 1) {"records":[...]}
    if (root.is_object() && root.contains("records"))
    {
        const json& rows = root["records"];
        if (!rows.is_array())
        {
            if (outError) *outError = "\"records\" is not an array";
            return false;
        }
        out.reserve(rows.size());
        for (const auto& it : rows)
            parse_record_object(it, out);
        return true;
    }

    // 2) bare array
    if (root.is_array())
    {
        out.reserve(root.size());
        for (const auto& it : root)
            parse_record_object(it, out);
        return true;
    }

    if (outError) *outError = "Unsupported JSON root";
    return false;
}
