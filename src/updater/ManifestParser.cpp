#include "ManifestParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cctype>
#include <charconv>

using json = nlohmann::json;

namespace updater
{

namespace
{

// versionCode may arrive as a JSON integer or as a string of digits
bool readVersionCode(const json& value, std::int64_t& out)
{
    if (value.is_number_integer())
    {
        out = value.get<std::int64_t>();
        return true;
    }

    if (value.is_string())
    {
        const std::string& text = value.get_ref<const std::string&>();
        if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
        {
            return false;
        }
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, out);
        return ec == std::errc() && ptr == end;
    }

    return false;
}

bool readOptionalString(const json& manifest, const char* key, std::string& out, std::string& outError)
{
    auto it = manifest.find(key);
    if (it == manifest.end() || it->is_null())
    {
        return true;
    }
    if (!it->is_string())
    {
        outError = std::string("Manifest field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool isAbsoluteHttpUrl(const std::string& url)
{
    for (const char* scheme : { "https://", "http://" })
    {
        const std::string prefix(scheme);
        if (url.size() > prefix.size() && url.compare(0, prefix.size(), prefix) == 0)
        {
            return true;
        }
    }
    return false;
}

} // namespace

bool ManifestParser::parse(const std::string& jsonContent, UpdateInfo& outInfo, std::string& outError) const
{
    try
    {
        json manifest = json::parse(jsonContent);
        if (!manifest.is_object())
        {
            outError = "Manifest is not a JSON object";
            return false;
        }

        UpdateInfo info;

        auto code = manifest.find("versionCode");
        if (code == manifest.end())
        {
            outError = "Manifest missing 'versionCode' field";
            return false;
        }
        if (!readVersionCode(*code, info.versionCode))
        {
            outError = "Manifest 'versionCode' is not an integer";
            return false;
        }

        auto url = manifest.find("downloadUrl");
        if (url == manifest.end() || !url->is_string())
        {
            outError = "Manifest missing 'downloadUrl' field";
            return false;
        }
        info.downloadUrl = url->get<std::string>();

        if (!readOptionalString(manifest, "version", info.version, outError) ||
            !readOptionalString(manifest, "changelog", info.changelog, outError) ||
            !readOptionalString(manifest, "releaseDate", info.releaseDate, outError))
        {
            return false;
        }

        auto mandatory = manifest.find("mandatory");
        if (mandatory != manifest.end() && !mandatory->is_null())
        {
            if (!mandatory->is_boolean())
            {
                outError = "Manifest field 'mandatory' must be a boolean";
                return false;
            }
            info.mandatory = mandatory->get<bool>();
        }

        std::string minVersion;
        if (!readOptionalString(manifest, "minVersion", minVersion, outError))
        {
            return false;
        }
        if (!minVersion.empty())
        {
            info.minVersion = minVersion;
        }

        if (!validate(info, outError))
        {
            return false;
        }

        PLOG_DEBUG << "Manifest parsed: version " << info.version << " (code " << info.versionCode << ")";
        outInfo = std::move(info);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ManifestParser::validate(const UpdateInfo& info, std::string& outError)
{
    if (info.downloadUrl.empty())
    {
        outError = "downloadUrl is empty in manifest";
        return false;
    }

    if (!isAbsoluteHttpUrl(info.downloadUrl))
    {
        outError = "downloadUrl is not an absolute http(s) URL: " + info.downloadUrl;
        return false;
    }

    if (info.versionCode < 0)
    {
        outError = "versionCode must not be negative";
        return false;
    }

    return true;
}

} // namespace updater
