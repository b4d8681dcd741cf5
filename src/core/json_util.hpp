#pragma once

#include <optional>
#include <string>
#include <vector>

// Minimal JSON helpers for the flat documents cadence reads and writes
// (project settings, audio plans). Not a general parser: values are looked
// up by key inside one object body.
namespace cadence::json
{

std::string escape(const std::string& s);

std::optional<std::string> read_string(const std::string& object, const std::string& key);
std::optional<double>      read_number(const std::string& object, const std::string& key);
std::optional<bool>        read_bool(const std::string& object, const std::string& key);

// Top-level objects inside the array stored under `key`.
std::vector<std::string> read_object_array(const std::string& json, const std::string& key);

// Formats a double without trailing zeros ("60", "29.97").
std::string number(double value);

bool read_file(const std::string& path, std::string& out);
bool write_file(const std::string& path, const std::string& contents);

}   // namespace cadence::json
