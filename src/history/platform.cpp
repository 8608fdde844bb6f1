#include "platform.hpp"
#include "history_error.hpp"
#include "../util.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace browsetrail {

const char* os_kind_name(OsKind kind) {
    switch (kind) {
        case OsKind::MacOS:          return "macOS";
        case OsKind::Windows:        return "Windows";
        case OsKind::Linux:          return "Linux";
        case OsKind::LinuxOnWindows: return "Linux (WSL)";
        case OsKind::Unsupported:    return "unsupported";
    }
    return "unsupported";
}

SystemInfo read_system_info() {
    SystemInfo info;
#ifdef _WIN32
    info.sysname = "Windows";
#else
    struct utsname uts;
    if (uname(&uts) == 0) {
        info.sysname = uts.sysname;
        info.release = uts.release;
    }
    if (info.sysname == "Linux") {
        info.proc_version = read_file("/proc/version");
    }
#endif
    return info;
}

bool is_wsl_kernel(const SystemInfo& info) {
    return to_lower(info.release).find("microsoft") != std::string::npos ||
           to_lower(info.proc_version).find("microsoft") != std::string::npos;
}

OsKind classify_os(const SystemInfo& info) {
    if (info.sysname == "Darwin") return OsKind::MacOS;
    if (info.sysname == "Windows") return OsKind::Windows;
    if (info.sysname == "Linux") {
        return is_wsl_kernel(info) ? OsKind::LinuxOnWindows : OsKind::Linux;
    }
    return OsKind::Unsupported;
}

std::string native_history_path(OsKind kind, const std::string& home) {
    switch (kind) {
        case OsKind::MacOS:
            return home + "/Library/Application Support/Google/Chrome/Default/History";
        case OsKind::Windows:
            return home + "\\AppData\\Local\\Google\\Chrome\\User Data\\Default\\History";
        case OsKind::Linux:
            return home + "/.config/google-chrome/Default/History";
        case OsKind::LinuxOnWindows:
        case OsKind::Unsupported:
            break;
    }
    throw HistoryError(HistoryErrorCode::UnsupportedPlatform,
                       std::string("Unsupported platform for Chrome history: ") +
                       os_kind_name(kind));
}

std::string wsl_history_path(const std::string& host_user) {
    return "/mnt/c/Users/" + host_user +
           "/AppData/Local/Google/Chrome/User Data/Default/History";
}

std::string validate_host_username(const std::string& raw) {
    std::string name = trim(raw);
    if (name.empty()) {
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: empty output");
    }
    if (name.find('%') != std::string::npos) {
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: "
                           "USERNAME was not expanded (" + name + ")");
    }
    if (name.find_first_of("/\\:\r\n") != std::string::npos) {
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: "
                           "unexpected output (" + name + ")");
    }
    return name;
}

std::string CmdExeHostIdentity::resolve_host_username() {
    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: pipe failed");
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: fork failed");
    }

    if (pid == 0) {
        // Child: stdout to the pipe, stderr discarded (cmd.exe warns about UNC cwd)
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(out_pipe[1]);
        execlp("cmd.exe", "cmd.exe", "/c", "echo %USERNAME%", nullptr);
        _exit(127);
    }

    close(out_pipe[1]);
    std::string output;
    std::array<char, 256> buffer;
    while (true) {
        ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            output.append(buffer.data(), static_cast<size_t>(n));
            if (output.size() > 4096) break;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(out_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                               "Could not get the Windows user name from WSL: waitpid failed");
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw HistoryError(HistoryErrorCode::IdentityResolutionFailed,
                           "Could not get the Windows user name from WSL: "
                           "cmd.exe exited with status " +
                           std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
    }

    return validate_host_username(output);
}

PlatformLocator::PlatformLocator(HostIdentity& identity)
    : PlatformLocator(identity, read_system_info(), home_directory()) {}

PlatformLocator::PlatformLocator(HostIdentity& identity, SystemInfo info, std::string home)
    : identity_(identity), info_(std::move(info)), home_(std::move(home)) {}

PlatformProfile PlatformLocator::resolve() const {
    OsKind kind = classify_os(info_);
    if (kind == OsKind::Unsupported) {
        throw HistoryError(HistoryErrorCode::UnsupportedPlatform,
                           "Unsupported OS for Chrome history: " +
                           (info_.sysname.empty() ? std::string("unknown") : info_.sysname));
    }
    if (kind == OsKind::LinuxOnWindows) {
        std::string user = identity_.resolve_host_username();
        return PlatformProfile{kind, wsl_history_path(user)};
    }
    return PlatformProfile{kind, native_history_path(kind, home_)};
}

} // namespace browsetrail
