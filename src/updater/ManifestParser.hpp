#pragma once

#include "UpdateTypes.hpp"

#include <string>

namespace updater
{

// Parser for the remote release manifest (version.json)
class ManifestParser
{
public:
    ManifestParser() = default;
    ~ManifestParser() = default;

    // Parse manifest from JSON string
    bool parse(const std::string& jsonContent, UpdateInfo& outInfo, std::string& outError) const;

    // Verify required fields
    static bool validate(const UpdateInfo& info, std::string& outError);
};

} // namespace updater
