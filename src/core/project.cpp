#include <cadence/logger.hpp>
#include <cadence/project.hpp>
#include <limits>
#include <sstream>

#include "core/json_util.hpp"

namespace cadence
{

static constexpr int kSettingsVersion = 1;

// 0 (invalid) for anything that does not fit a pixel dimension.
static uint32_t to_dimension(double value)
{
    if (!(value > 0.0) || value > static_cast<double>(std::numeric_limits<uint32_t>::max()))
        return 0;
    return static_cast<uint32_t>(value);
}

std::string serialize_project_settings(const ProjectSettings& settings)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << kSettingsVersion << ",\n";
    os << "  \"name\": \"" << json::escape(settings.name) << "\",\n";
    os << "  \"width\": " << settings.width << ",\n";
    os << "  \"height\": " << settings.height << ",\n";
    os << "  \"fps\": " << json::number(settings.fps) << "\n";
    os << "}\n";
    return os.str();
}

bool deserialize_project_settings(const std::string& json_text, ProjectSettings& out)
{
    if (json_text.empty())
        return false;

    if (auto version = json::read_number(json_text, "version"))
    {
        if (*version > kSettingsVersion)
        {
            CADENCE_LOG_WARN("config", "project settings version {} is newer than {}", *version,
                             kSettingsVersion);
            return false;
        }
    }

    ProjectSettings parsed = out;
    if (auto name = json::read_string(json_text, "name"))
        parsed.name = *name;
    if (auto width = json::read_number(json_text, "width"))
        parsed.width = to_dimension(*width);
    if (auto height = json::read_number(json_text, "height"))
        parsed.height = to_dimension(*height);
    if (auto fps = json::read_number(json_text, "fps"))
        parsed.fps = *fps;

    if (!parsed.valid())
    {
        CADENCE_LOG_WARN("config", "rejecting project settings {}x{} @ {} fps", parsed.width,
                         parsed.height, parsed.fps);
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool load_project_settings(const std::string& path, ProjectSettings& out)
{
    std::string text;
    if (!json::read_file(path, text))
        return false;
    if (!deserialize_project_settings(text, out))
    {
        CADENCE_LOG_ERROR("config", "invalid project settings in '{}'", path);
        return false;
    }
    CADENCE_LOG_INFO("config", "loaded project '{}' ({}x{} @ {} fps)", out.name, out.width,
                     out.height, out.fps);
    return true;
}

bool save_project_settings(const std::string& path, const ProjectSettings& settings)
{
    return json::write_file(path, serialize_project_settings(settings));
}

}   // namespace cadence
