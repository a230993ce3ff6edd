#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#endif

namespace utils
{

namespace
{

bool isExecutableFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

} // namespace

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (size == 0)
    {
        PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
        return {};
    }

    while (size == buffer.size())
    {
        buffer.resize(buffer.size() * 2, L'\0');
        size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
    }
    buffer.resize(size);

    return std::filesystem::path(buffer);
#else
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
#endif
}

std::filesystem::path ProcessUtils::FindExecutable(const std::string& program)
{
    if (program.empty())
        return {};

    std::filesystem::path candidate(program);
    if (candidate.has_parent_path())
    {
        return isExecutableFile(candidate) ? candidate : std::filesystem::path{};
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return {};

#ifdef _WIN32
    const char separator = ';';
#else
    const char separator = ':';
#endif

    std::string paths(pathEnv);
    size_t start = 0;
    while (start <= paths.size())
    {
        size_t end = paths.find(separator, start);
        if (end == std::string::npos)
            end = paths.size();

        std::string dir = paths.substr(start, end - start);
        if (!dir.empty())
        {
            std::filesystem::path full = std::filesystem::path(dir) / program;
            if (isExecutableFile(full))
                return full;
#ifdef _WIN32
            full += ".exe";
            if (isExecutableFile(full))
                return full;
#endif
        }
        start = end + 1;
    }

    return {};
}

bool ProcessUtils::LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                 bool detached, int* exitCode)
{
    if (exePath.empty() || !std::filesystem::exists(exePath))
    {
        PLOG_ERROR << "Invalid executable path: " << exePath.string();
        return false;
    }

#ifdef _WIN32
    std::string cmdLine = "\"" + exePath.string() + "\"";
    for (const auto& arg : args)
    {
        cmdLine += " \"" + arg + "\"";
    }

    STARTUPINFOA si = {sizeof(si)};
    PROCESS_INFORMATION pi = {};
    si.dwFlags = STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_SHOW;

    DWORD creationFlags = detached ? DETACHED_PROCESS : 0;

    if (!CreateProcessA(nullptr, const_cast<char*>(cmdLine.c_str()), nullptr, nullptr, FALSE, creationFlags, nullptr,
                        nullptr, &si, &pi))
    {
        PLOG_ERROR << "CreateProcessA failed: " << GetLastError();
        return false;
    }

    if (!detached)
    {
        WaitForSingleObject(pi.hProcess, INFINITE);
        DWORD status = 0;
        GetExitCodeProcess(pi.hProcess, &status);
        if (exitCode)
            *exitCode = static_cast<int>(status);
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    PLOG_INFO << "Launched process: " << exePath.string();
    return true;
#else
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        return false;
    }

    if (pid == 0)
    {
        if (detached)
        {
            // Double fork so the launched process is reparented and never left as our zombie
            if (setsid() < 0)
                _exit(1);
            pid_t grandchild = fork();
            if (grandchild < 0)
                _exit(1);
            if (grandchild > 0)
                _exit(0);
        }

        execv(exePath.c_str(), argv.data());
        _exit(127);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0)
    {
        PLOG_ERROR << "waitpid() failed: " << strerror(errno);
        return false;
    }

    if (detached)
    {
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            PLOG_ERROR << "Failed to detach process: " << exePath;
            return false;
        }
    }
    else if (exitCode)
    {
        *exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    PLOG_INFO << "Launched process: " << exePath;
    return true;
#endif
}

} // namespace utils
