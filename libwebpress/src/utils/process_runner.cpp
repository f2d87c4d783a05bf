//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace webpress {

namespace {

#ifdef _WIN32
constexpr char kPathSeparator = ';';

std::wstring quote_argument(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
        return arg;
    }
    std::wstring quoted = L"\"";
    size_t backslashes = 0;
    for (const wchar_t c : arg) {
        if (c == L'\\') {
            ++backslashes;
            continue;
        }
        if (c == L'"') {
            quoted.append(backslashes * 2 + 1, L'\\');
        } else {
            quoted.append(backslashes, L'\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, L'\\');
    quoted.push_back(L'"');
    return quoted;
}
#else
constexpr char kPathSeparator = ':';
#endif

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

} // namespace

#ifdef _WIN32

ProcessResult run_process(const fs::path& program, const std::vector<std::string>& args) {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(), "CreatePipe");
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    HANDLE null_in = CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                 OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

    std::wstring cmdline = quote_argument(program.wstring());
    for (const auto& a : args) {
        cmdline += L" " + quote_argument(fs::path(a).wstring());
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = null_in;
    si.hStdOutput = write_end;
    si.hStdError = write_end;

    PROCESS_INFORMATION pi{};
    const BOOL started = CreateProcessW(program.wstring().c_str(), cmdline.data(), nullptr, nullptr, TRUE,
                                        CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    const DWORD spawn_error = GetLastError();
    CloseHandle(write_end);
    if (null_in != INVALID_HANDLE_VALUE) CloseHandle(null_in);
    if (!started) {
        CloseHandle(read_end);
        throw std::system_error(static_cast<int>(spawn_error), std::system_category(),
                                "CreateProcess " + program.string());
    }

    ProcessResult result;
    char buffer[4096];
    DWORD got = 0;
    while (ReadFile(read_end, buffer, sizeof(buffer), &got, nullptr) && got > 0) {
        result.output.append(buffer, got);
    }
    CloseHandle(read_end);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 0;
    GetExitCodeProcess(pi.hProcess, &code);
    result.exit_code = static_cast<int>(code);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

#else

ProcessResult run_process(const fs::path& program, const std::vector<std::string>& args) {
    int pipefd[2];
    if (::pipe(pipefd) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    // keep the read end out of the child and of any other process spawned meanwhile
    ::fcntl(pipefd[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(pipefd[1], F_SETFD, FD_CLOEXEC);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDERR_FILENO);

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(program.string());
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& s : argv_storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawn(&pid, program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    ::close(pipefd[1]);
    if (rc != 0) {
        ::close(pipefd[0]);
        throw std::system_error(rc, std::generic_category(), "posix_spawn " + program.string());
    }

    ProcessResult result;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(pipefd[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    const fs::path as_path(name);
    if (as_path.has_parent_path()) {
        if (is_executable_file(as_path)) return as_path;
#ifdef _WIN32
        fs::path with_ext = as_path;
        with_ext += ".exe";
        if (is_executable_file(with_ext)) return with_ext;
#endif
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    if (!env_path) return std::nullopt;

    std::string_view remaining(env_path);
    while (true) {
        const auto sep = remaining.find(kPathSeparator);
        const std::string_view dir = remaining.substr(0, sep);
        if (!dir.empty()) {
            const fs::path candidate = fs::path(std::string(dir)) / name;
            if (is_executable_file(candidate)) return candidate;
#ifdef _WIN32
            fs::path with_ext = candidate;
            with_ext += ".exe";
            if (is_executable_file(with_ext)) return with_ext;
#endif
        }
        if (sep == std::string_view::npos) break;
        remaining.remove_prefix(sep + 1);
    }
    Logger::log(LogLevel::Debug, "Executable not found on PATH: " + name, "process");
    return std::nullopt;
}

} // namespace webpress
