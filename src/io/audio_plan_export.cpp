#include <cadence/audio_export.hpp>
#include <cadence/logger.hpp>
#include <cmath>
#include <sstream>

#include "core/json_util.hpp"

namespace cadence
{

static constexpr int kAudioPlanVersion = 1;

std::string serialize_audio_plan(const std::vector<AudioSegment>& segments,
                                 const ProjectSettings&           settings)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << kAudioPlanVersion << ",\n";
    os << "  \"fps\": " << json::number(settings.fps) << ",\n";
    os << "  \"segments\": [";

    for (size_t i = 0; i < segments.size(); ++i)
    {
        const auto& s = segments[i];
        os << (i == 0 ? "\n" : ",\n");
        os << "    {\"id\": \"" << json::escape(s.id) << "\"";
        os << ", \"path\": \"" << json::escape(s.source.path) << "\"";
        os << ", \"kind\": \"" << audio_source_kind_name(s.source.kind) << "\"";
        if (s.clip_id)
            os << ", \"clip_id\": " << *s.clip_id;
        os << ", \"project_start\": " << s.project_start;
        os << ", \"source_start\": " << s.source_start;
        os << ", \"duration\": " << s.duration;
        if (s.volume)
            os << ", \"volume\": " << json::number(*s.volume);
        if (s.fade_in)
            os << ", \"fade_in\": " << *s.fade_in;
        if (s.fade_out)
            os << ", \"fade_out\": " << *s.fade_out;
        if (s.show_waveform)
            os << ", \"show_waveform\": " << (*s.show_waveform ? "true" : "false");
        os << "}";
    }
    if (!segments.empty())
        os << "\n  ";
    os << "]\n";
    os << "}\n";
    return os.str();
}

bool deserialize_audio_plan(const std::string& json_text, std::vector<AudioSegment>& out)
{
    if (json_text.find("\"segments\"") == std::string::npos)
        return false;

    if (auto version = json::read_number(json_text, "version"))
    {
        if (*version > kAudioPlanVersion)
        {
            CADENCE_LOG_WARN("audio", "audio plan version {} is newer than {}", *version,
                             kAudioPlanVersion);
            return false;
        }
    }

    std::vector<AudioSegment> parsed;
    for (const auto& obj : json::read_object_array(json_text, "segments"))
    {
        AudioSegment s;
        auto         id   = json::read_string(obj, "id");
        auto         kind = parse_audio_source_kind(json::read_string(obj, "kind").value_or(""));
        auto         duration = json::read_number(obj, "duration");
        if (!id || id->empty() || !kind || !duration || *duration <= 0.0)
        {
            CADENCE_LOG_WARN("audio", "skipping malformed audio plan entry");
            continue;
        }

        s.id            = *id;
        s.source.path   = json::read_string(obj, "path").value_or("");
        s.source.kind   = *kind;
        s.duration      = static_cast<Frame>(std::llround(*duration));
        s.project_start = sanitize_frame(json::read_number(obj, "project_start").value_or(0.0));
        s.source_start  = sanitize_frame(json::read_number(obj, "source_start").value_or(0.0));
        if (auto clip_id = json::read_number(obj, "clip_id"); clip_id && *clip_id >= 0.0)
            s.clip_id = static_cast<ClipId>(*clip_id);
        if (auto volume = json::read_number(obj, "volume"))
            s.volume = *volume;
        if (auto fade_in = json::read_number(obj, "fade_in"))
            s.fade_in = static_cast<Frame>(std::llround(*fade_in));
        if (auto fade_out = json::read_number(obj, "fade_out"))
            s.fade_out = static_cast<Frame>(std::llround(*fade_out));
        s.show_waveform = json::read_bool(obj, "show_waveform");
        parsed.push_back(std::move(s));
    }

    out = std::move(parsed);
    return true;
}

bool write_audio_plan(const std::string&               path,
                      const std::vector<AudioSegment>& segments,
                      const ProjectSettings&           settings)
{
    if (!json::write_file(path, serialize_audio_plan(segments, settings)))
    {
        CADENCE_LOG_ERROR("audio", "failed to write audio plan '{}'", path);
        return false;
    }
    CADENCE_LOG_INFO("audio", "wrote {} audio segments to '{}'", segments.size(), path);
    return true;
}

}   // namespace cadence
