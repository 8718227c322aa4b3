#include "panel_config.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace termpane
{

// ─── JSON writing ────────────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
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
                out += c;
                break;
        }
    }
    return out;
}

static std::string lowercase(std::string s)
{
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string PanelConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": 1,\n";
    if (working_directory)
        os << "  \"working_directory\": \"" << escape_json(*working_directory) << "\",\n";
    else
        os << "  \"working_directory\": null,\n";

    os << "  \"shell\": {\n";
    os << "    \"path\": \"" << escape_json(shell.path) << "\",\n";
    os << "    \"args\": [";
    for (size_t i = 0; i < shell.args.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << "\"" << escape_json(shell.args[i]) << "\"";
    }
    os << "],\n";
    os << "    \"environment\": {";
    size_t n = 0;
    for (const auto& [key, value] : shell.environment)
    {
        os << (n++ == 0 ? "\n" : ",\n");
        os << "      \"" << escape_json(key) << "\": \"" << escape_json(value) << "\"";
    }
    os << (shell.environment.empty() ? "}\n" : "\n    }\n");
    os << "  },\n";

    os << "  \"initial_directory_delay_ms\": " << initial_directory_delay_ms << ",\n";
    os << "  \"divider_thickness\": " << divider_thickness << ",\n";
    os << "  \"min_pane_size\": " << min_pane_size << ",\n";
    os << "  \"log_level\": \"" << lowercase(Logger::level_to_string(log_level)) << "\"\n";
    os << "}\n";
    return os.str();
}

// ─── JSON scanning ───────────────────────────────────────────────────────────
// Minimal reader for the document serialize() writes. Keys are looked up
// by name within a scope; nested objects are cut out of the outer scope
// before its keys are read.

static size_t skip_ws(const std::string& json, size_t pos)
{
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])))
        ++pos;
    return pos;
}

// Parse the string literal opening at pos. Returns the index one past the
// closing quote, or npos if unterminated.
static size_t parse_string_at(const std::string& json, size_t pos, std::string& out)
{
    if (pos >= json.size() || json[pos] != '"')
        return std::string::npos;

    out.clear();
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return i + 1;
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++i >= json.size())
            return std::string::npos;
        switch (json[i])
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
            default:
                out += json[i];
                break;
        }
    }
    return std::string::npos;
}

// Index just past the value starting at pos (string, object, array or bare
// token), or npos on malformed input.
static size_t skip_value(const std::string& json, size_t pos)
{
    if (pos >= json.size())
        return std::string::npos;

    if (json[pos] == '"')
    {
        std::string ignored;
        return parse_string_at(json, pos, ignored);
    }

    if (json[pos] == '{' || json[pos] == '[')
    {
        int depth = 0;
        for (size_t i = pos; i < json.size(); ++i)
        {
            char c = json[i];
            if (c == '"')
            {
                std::string ignored;
                size_t      end = parse_string_at(json, i, ignored);
                if (end == std::string::npos)
                    return std::string::npos;
                i = end - 1;
            }
            else if (c == '{' || c == '[')
            {
                ++depth;
            }
            else if (c == '}' || c == ']')
            {
                if (--depth == 0)
                    return i + 1;
            }
        }
        return std::string::npos;
    }

    size_t end = pos;
    while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']'
           && !std::isspace(static_cast<unsigned char>(json[end])))
        ++end;
    return end;
}

// Start of the value stored under key, or npos.
static size_t find_value(const std::string& json, const std::string& key)
{
    const std::string search = "\"" + key + "\"";
    size_t            pos    = json.find(search);
    while (pos != std::string::npos)
    {
        size_t colon = skip_ws(json, pos + search.size());
        if (colon < json.size() && json[colon] == ':')
            return skip_ws(json, colon + 1);
        pos = json.find(search, pos + 1);
    }
    return std::string::npos;
}

static std::optional<std::pair<size_t, size_t>> object_span(const std::string& json,
                                                            const std::string& key)
{
    size_t start = find_value(json, key);
    if (start == std::string::npos || json[start] != '{')
        return std::nullopt;
    size_t end = skip_value(json, start);
    if (end == std::string::npos)
        return std::nullopt;
    return std::make_pair(start, end);
}

// json with the object under key replaced by null.
static std::string without_object(const std::string& json, const std::string& key)
{
    auto span = object_span(json, key);
    if (!span)
        return json;
    std::string out = json;
    out.replace(span->first, span->second - span->first, "null");
    return out;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    std::string out;
    if (parse_string_at(json, pos, out) == std::string::npos)
        return std::nullopt;
    return out;
}

static bool is_json_null(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    return pos != std::string::npos && json.compare(pos, 4, "null") == 0;
}

static std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

static std::optional<std::vector<std::string>> read_json_string_array(const std::string& json,
                                                                      const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return std::nullopt;

    std::vector<std::string> out;
    pos = skip_ws(json, pos + 1);
    while (pos < json.size() && json[pos] != ']')
    {
        std::string item;
        size_t      end = parse_string_at(json, pos, item);
        if (end == std::string::npos)
            return std::nullopt;
        out.push_back(std::move(item));
        pos = skip_ws(json, end);
        if (pos < json.size() && json[pos] == ',')
            pos = skip_ws(json, pos + 1);
    }
    if (pos >= json.size())
        return std::nullopt;
    return out;
}

static std::optional<std::map<std::string, std::string>> read_json_string_map(
    const std::string& json, const std::string& key)
{
    auto span = object_span(json, key);
    if (!span)
        return std::nullopt;

    std::map<std::string, std::string> out;
    size_t                             pos = skip_ws(json, span->first + 1);
    while (pos < span->second - 1)
    {
        std::string k;
        std::string v;
        size_t      end = parse_string_at(json, pos, k);
        if (end == std::string::npos)
            return std::nullopt;
        pos = skip_ws(json, end);
        if (pos >= json.size() || json[pos] != ':')
            return std::nullopt;
        pos = skip_ws(json, pos + 1);
        end = parse_string_at(json, pos, v);
        if (end == std::string::npos)
            return std::nullopt;
        out[std::move(k)] = std::move(v);
        pos               = skip_ws(json, end);
        if (pos < json.size() && json[pos] == ',')
            pos = skip_ws(json, pos + 1);
    }
    return out;
}

// ─── Deserialization ─────────────────────────────────────────────────────────

bool PanelConfig::deserialize(const std::string& json)
{
    size_t start = skip_ws(json, 0);
    if (start >= json.size() || json[start] != '{')
        return false;
    size_t end = skip_value(json, start);
    if (end == std::string::npos || skip_ws(json, end) != json.size())
        return false;

    if (auto ver = read_json_number(json, "version"); ver && *ver > 1)
    {
        TERMPANE_LOG_WARN("config", "unsupported config version {}", static_cast<int>(*ver));
        return false;
    }

    PanelConfig next = *this;

    if (auto shell_span = object_span(json, "shell"))
    {
        std::string shell_json =
            json.substr(shell_span->first, shell_span->second - shell_span->first);

        if (auto env = read_json_string_map(shell_json, "environment"))
            next.shell.environment = std::move(*env);

        std::string shell_scope = without_object(shell_json, "environment");
        if (auto path = read_json_string(shell_scope, "path"); path && !path->empty())
            next.shell.path = std::move(*path);
        if (auto args = read_json_string_array(shell_scope, "args"))
            next.shell.args = std::move(*args);
    }

    std::string top = without_object(json, "shell");

    if (auto dir = read_json_string(top, "working_directory"))
        next.working_directory = std::move(*dir);
    else if (is_json_null(top, "working_directory"))
        next.working_directory.reset();

    if (auto delay = read_json_number(top, "initial_directory_delay_ms"); delay && *delay >= 0.0)
        next.initial_directory_delay_ms = static_cast<int>(*delay);
    if (auto thickness = read_json_number(top, "divider_thickness"); thickness && *thickness >= 0.0)
        next.divider_thickness = static_cast<float>(*thickness);
    if (auto min_size = read_json_number(top, "min_pane_size"); min_size && *min_size >= 0.0)
        next.min_pane_size = static_cast<float>(*min_size);

    if (auto level_name = read_json_string(top, "log_level"))
    {
        if (auto level = Logger::level_from_string(*level_name))
            next.log_level = *level;
        else
            TERMPANE_LOG_WARN("config", "unknown log level '{}', keeping current", *level_name);
    }

    *this = std::move(next);
    return true;
}

// ─── Environment / paths ─────────────────────────────────────────────────────

PanelConfig PanelConfig::from_environment()
{
    PanelConfig config;
    if (const char* shell = std::getenv("SHELL"); shell && *shell)
    {
        config.shell.path = shell;
    }
    return config;
}

SessionOptions PanelConfig::session_options() const
{
    SessionOptions options;
    options.working_directory = working_directory;
    options.shell             = shell;
    return options;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool PanelConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            TERMPANE_LOG_WARN("config", "cannot create {}: {}", dir.string(), ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TERMPANE_LOG_ERROR("config", "cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool PanelConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TERMPANE_LOG_DEBUG("config", "no config at {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        TERMPANE_LOG_WARN("config", "malformed config {}, using defaults", path);
        return false;
    }
    return true;
}

std::string PanelConfig::default_path()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    {
        return (std::filesystem::path(xdg) / "termpane" / "panel.json").string();
    }

    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "panel.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "termpane";
    return (dir / "panel.json").string();
}

}   // namespace termpane
