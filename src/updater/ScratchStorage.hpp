#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace updater
{

// Cache-tier staging area for downloaded artifacts. Files here are
// transient; the platform (or the next cleanup) may evict them any time.
class ScratchStorage
{
public:
    explicit ScratchStorage(std::filesystem::path root);

    // $XDG_CACHE_HOME/<appName>/updates, ~/.cache/<appName>/updates,
    // or <temp>/<appName>/updates
    static std::filesystem::path DefaultCacheRoot(const std::string& appName);

    const std::filesystem::path& root() const { return root_; }

    // "update_v<nanoseconds>_<sequence><extension>", never reused within
    // the process and re-rolled if a file of that name already exists
    std::string uniqueArtifactName(const std::string& extension) const;

    // Opens root/name for binary writing, creating root if needed
    bool openForWrite(const std::string& name, std::ofstream& out, std::string& outError) const;

    // Decodes a base64 payload into root/name; outLocation receives the
    // written file's location
    bool writeEncoded(const std::string& name, std::string_view base64Data, std::string& outLocation,
                      std::string& outError) const;

    // Location of an existing artifact; fails if nothing was written under name
    bool resolveLocation(const std::string& name, std::string& outLocation, std::string& outError) const;

    void remove(const std::string& name) const;

private:
    bool ensureRoot(std::string& outError) const;

    std::filesystem::path root_;
};

} // namespace updater
