#pragma once

#include <cstdint>
#include <string>

namespace cadence
{

// Composition-wide output settings.
struct ProjectSettings
{
    std::string name   = "untitled";
    uint32_t    width  = 1920;
    uint32_t    height = 1080;
    double      fps    = 60.0;

    bool valid() const { return width > 0 && height > 0 && fps > 0.0; }

    bool operator==(const ProjectSettings&) const = default;
};

// JSON round-trip. deserialize() leaves `out` untouched on failure.
std::string serialize_project_settings(const ProjectSettings& settings);
bool        deserialize_project_settings(const std::string& json, ProjectSettings& out);

bool load_project_settings(const std::string& path, ProjectSettings& out);
bool save_project_settings(const std::string& path, const ProjectSettings& settings);

}   // namespace cadence
