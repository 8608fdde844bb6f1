#pragma once
#include <string>

namespace browsetrail {

enum class OsKind {
    MacOS,
    Windows,
    Linux,
    LinuxOnWindows, // Linux guest hosted by Windows (WSL)
    Unsupported,
};

const char* os_kind_name(OsKind kind);

struct PlatformProfile {
    OsKind os_kind;
    std::string history_file_path;
};

// Raw facts used to classify the running system
struct SystemInfo {
    std::string sysname;        // uname sysname, or "Windows"
    std::string release;        // kernel release
    std::string proc_version;   // contents of /proc/version, Linux only
};

SystemInfo read_system_info();

// True when the kernel strings carry the Microsoft build signature
bool is_wsl_kernel(const SystemInfo& info);

OsKind classify_os(const SystemInfo& info);

// Native profile path under `home`. Throws HistoryError(UnsupportedPlatform)
// for kinds that are not resolved from a local home directory.
std::string native_history_path(OsKind kind, const std::string& home);

// Host profile path as seen from inside a WSL guest
std::string wsl_history_path(const std::string& host_user);

// Source of the Windows account name when running inside WSL.
class HostIdentity {
public:
    virtual ~HostIdentity() = default;
    // Throws HistoryError(IdentityResolutionFailed)
    virtual std::string resolve_host_username() = 0;
};

// Asks the Windows host through cmd.exe.
class CmdExeHostIdentity : public HostIdentity {
public:
    std::string resolve_host_username() override;
};

// Trim and sanity-check a host account name. Throws
// HistoryError(IdentityResolutionFailed) on empty, unexpanded or path-like output.
std::string validate_host_username(const std::string& raw);

// Resolves where the default Chrome profile keeps its History file.
// Build one per request: construction snapshots the environment.
class PlatformLocator {
public:
    explicit PlatformLocator(HostIdentity& identity);
    PlatformLocator(HostIdentity& identity, SystemInfo info, std::string home);

    PlatformProfile resolve() const;

private:
    HostIdentity& identity_;
    SystemInfo info_;
    std::string home_;
};

} // namespace browsetrail
