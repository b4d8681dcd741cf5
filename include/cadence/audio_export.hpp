#pragma once

#include <cadence/audio_plan.hpp>
#include <cadence/project.hpp>
#include <string>
#include <vector>

namespace cadence
{

// Audio plan document handed to the external mixer before muxing:
// project fps plus every segment, in registration order.
std::string serialize_audio_plan(const std::vector<AudioSegment>& segments,
                                 const ProjectSettings&           settings);

// Inverse of serialize_audio_plan(). Entries without an id, a known source
// kind or a positive duration are skipped. Returns false on a malformed
// document and leaves `out` untouched.
bool deserialize_audio_plan(const std::string& json, std::vector<AudioSegment>& out);

bool write_audio_plan(const std::string&               path,
                      const std::vector<AudioSegment>& segments,
                      const ProjectSettings&           settings);

}   // namespace cadence
