#include "ProcessUtils.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace platform
{

bool ProcessUtils::LaunchDetached(const std::string& program, const std::vector<std::string>& args)
{
    if (program.empty())
    {
        PLOG_ERROR << "LaunchDetached: empty program name";
        return false;
    }

#ifdef _WIN32
    std::string cmdLine = "\"" + program + "\"";
    for (const auto& arg : args)
    {
        cmdLine += " \"" + arg + "\"";
    }

    STARTUPINFOA si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, const_cast<char*>(cmdLine.c_str()), nullptr, nullptr, FALSE, DETACHED_PROCESS,
                        nullptr, nullptr, &si, &pi))
    {
        PLOG_ERROR << "CreateProcessA failed: " << GetLastError();
        return false;
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    return true;
#else
    // Report exec failure back through a close-on-exec pipe
    int errorPipe[2];
    if (pipe(errorPipe) != 0)
    {
        PLOG_ERROR << "pipe() failed: " << std::strerror(errno);
        return false;
    }
    fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << std::strerror(errno);
        close(errorPipe[0]);
        close(errorPipe[1]);
        return false;
    }

    if (pid == 0)
    {
        close(errorPipe[0]);
        setsid();

        // Keep the helper's chatter off the installer's terminal
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0)
        {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(program.c_str(), argv.data());

        int err = errno;
        ssize_t written = write(errorPipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(errorPipe[1]);
    int childErrno = 0;
    ssize_t n = read(errorPipe[0], &childErrno, sizeof(childErrno));
    close(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno)))
    {
        waitpid(pid, nullptr, 0);
        PLOG_DEBUG << "Could not run " << program << ": " << std::strerror(childErrno);
        return false;
    }

    // The opener normally returns quickly; reap it if it already has
    waitpid(pid, nullptr, WNOHANG);
    return true;
#endif
}

bool ProcessUtils::OpenUrl(const std::string& url)
{
#ifdef _WIN32
    HINSTANCE result = ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
    // ShellExecute reports success with values greater than 32
    bool ok = reinterpret_cast<INT_PTR>(result) > 32;
#elif defined(__APPLE__)
    bool ok = LaunchDetached("open", { url });
#else
    bool ok = LaunchDetached("xdg-open", { url });
#endif

    if (ok)
    {
        PLOG_DEBUG << "Opened " << url << " in the default browser";
    }
    else
    {
        PLOG_DEBUG << "No default URL handler available for " << url;
    }
    return ok;
}

} // namespace platform
