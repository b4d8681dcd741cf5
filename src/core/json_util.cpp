#include "core/json_util.hpp"

#include <cadence/logger.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace cadence::json
{

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

static std::string unescape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 >= s.size())
        {
            out += s[i];
            continue;
        }
        char next = s[++i];
        switch (next)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
            {
                // Only code points below 0x80 are produced by escape().
                unsigned long code = 0;
                if (i + 4 < s.size())
                    code = std::strtoul(s.substr(i + 1, 4).c_str(), nullptr, 16);
                if (i + 4 < s.size() && code < 0x80)
                {
                    out += static_cast<char>(code);
                    i += 4;
                }
                else
                {
                    out += next;
                }
                break;
            }
            default:
                out += next;
                break;
        }
    }
    return out;
}

// Position just past the ':' that follows "key", or npos.
static size_t value_position(const std::string& object, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = object.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = object.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    pos = object.find_first_not_of(" \t\n\r", pos + 1);
    return pos;
}

std::optional<std::string> read_string(const std::string& object, const std::string& key)
{
    auto pos = value_position(object, key);
    if (pos == std::string::npos || object[pos] != '"')
        return std::nullopt;
    size_t end     = pos + 1;
    bool   escaped = false;
    while (end < object.size())
    {
        char c = object[end];
        if (escaped)
            escaped = false;
        else if (c == '\\')
            escaped = true;
        else if (c == '"')
            break;
        ++end;
    }
    if (end >= object.size())
        return std::nullopt;
    return unescape(object.substr(pos + 1, end - pos - 1));
}

std::optional<double> read_number(const std::string& object, const std::string& key)
{
    auto pos = value_position(object, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = object.c_str() + pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value))
        return std::nullopt;
    return value;
}

std::optional<bool> read_bool(const std::string& object, const std::string& key)
{
    auto pos = value_position(object, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (object.compare(pos, 4, "true") == 0)
        return true;
    if (object.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

std::vector<std::string> read_object_array(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;
    auto                     pos = value_position(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return objects;

    int    depth     = 0;
    bool   in_string = false;
    bool   escaped   = false;
    size_t obj_start = 0;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (in_string)
        {
            if (escaped)
                escaped = false;
            else if (c == '\\')
                escaped = true;
            else if (c == '"')
                in_string = false;
            continue;
        }
        if (c == '"')
        {
            in_string = true;
        }
        else if (c == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (c == '}')
        {
            --depth;
            if (depth == 0)
                objects.push_back(json.substr(obj_start, i - obj_start + 1));
        }
        else if (c == ']' && depth == 0)
        {
            break;
        }
    }
    return objects;
}

std::string number(double value)
{
    if (std::floor(value) == value && std::fabs(value) < 1e15)
        return std::to_string(static_cast<long long>(value));
    std::ostringstream os;
    os.precision(10);
    os << value;
    return os.str();
}

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        CADENCE_LOG_WARN("config", "cannot open '{}' for reading", path);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

bool write_file(const std::string& path, const std::string& contents)
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            CADENCE_LOG_ERROR("config", "cannot create '{}': {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        CADENCE_LOG_ERROR("config", "cannot open '{}' for writing", path);
        return false;
    }
    f << contents;
    return f.good();
}

}   // namespace cadence::json
