#include "ScratchStorage.hpp"
#include "utils/Base64.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>

namespace fs = std::filesystem;

namespace updater
{

namespace
{
std::atomic<std::uint64_t> g_artifactSequence{ 0 };
}

ScratchStorage::ScratchStorage(fs::path root)
    : root_(std::move(root))
{
}

fs::path ScratchStorage::DefaultCacheRoot(const std::string& appName)
{
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
    {
        return fs::path(xdg) / appName / "updates";
    }

#ifdef _WIN32
    if (const char* local = std::getenv("LOCALAPPDATA"); local && *local)
    {
        return fs::path(local) / appName / "cache" / "updates";
    }
#else
    if (const char* home = std::getenv("HOME"); home && *home)
    {
        return fs::path(home) / ".cache" / appName / "updates";
    }
#endif

    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec)
    {
        temp = fs::current_path(ec);
    }
    return temp / appName / "updates";
}

std::string ScratchStorage::uniqueArtifactName(const std::string& extension) const
{
    for (;;)
    {
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        const std::uint64_t sequence = g_artifactSequence.fetch_add(1);

        std::string name = "update_v" + std::to_string(nanos) + "_" + std::to_string(sequence) + extension;

        std::error_code ec;
        if (!fs::exists(root_ / name, ec))
        {
            return name;
        }
        PLOG_DEBUG << "Artifact name already taken, retrying: " << name;
    }
}

bool ScratchStorage::ensureRoot(std::string& outError) const
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        outError = "Failed to create cache directory " + root_.string() + ": " + ec.message();
        PLOG_ERROR << outError;
        return false;
    }
    return true;
}

bool ScratchStorage::openForWrite(const std::string& name, std::ofstream& out, std::string& outError) const
{
    if (!ensureRoot(outError))
    {
        return false;
    }

    const fs::path path = root_ / name;
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        outError = "Failed to create output file: " + path.string();
        PLOG_ERROR << outError;
        return false;
    }
    return true;
}

bool ScratchStorage::writeEncoded(const std::string& name, std::string_view base64Data, std::string& outLocation,
                                  std::string& outError) const
{
    std::string bytes;
    if (!utils::Base64Decode(base64Data, bytes))
    {
        outError = "Artifact payload is not valid base64";
        PLOG_ERROR << outError;
        return false;
    }

    std::ofstream out;
    if (!openForWrite(name, out, outError))
    {
        return false;
    }

    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
    {
        outError = "Failed to write artifact: " + (root_ / name).string();
        PLOG_ERROR << outError;
        remove(name);
        return false;
    }

    return resolveLocation(name, outLocation, outError);
}

bool ScratchStorage::resolveLocation(const std::string& name, std::string& outLocation, std::string& outError) const
{
    std::error_code ec;
    const fs::path path = fs::absolute(root_ / name, ec);
    if (ec || !fs::is_regular_file(path, ec))
    {
        outError = "Downloaded artifact not found in cache: " + name;
        PLOG_ERROR << outError;
        return false;
    }
    outLocation = path.string();
    return true;
}

void ScratchStorage::remove(const std::string& name) const
{
    std::error_code ec;
    fs::remove(root_ / name, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove stale artifact " << name << ": " << ec.message();
    }
}

} // namespace updater
