#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

// Cross-platform utilities for process management
class ProcessUtils
{
public:
    // Get the absolute path to the current executable
    static std::filesystem::path GetExecutablePath();

    // Resolve a program name against PATH; names containing a separator are
    // checked as given. Returns an empty path when nothing executable is found.
    static std::filesystem::path FindExecutable(const std::string& program);

    // Launch a process with optional arguments
    // Returns true if the process was started
    // If detached=true, process runs independently after parent exits
    // If detached=false, waits for it and stores its exit status in exitCode
    static bool LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                              bool detached = true, int* exitCode = nullptr);
};

} // namespace utils
