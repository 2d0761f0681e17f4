#ifdef _WIN32

#include "process.hpp"

#include <thread>

#include <windows.h>

namespace buckle {

namespace {

class HandleGuard {
public:
    explicit HandleGuard(HANDLE h = nullptr) : h_(h) {}
    ~HandleGuard() { reset(); }

    HandleGuard(const HandleGuard&) = delete;
    HandleGuard& operator=(const HandleGuard&) = delete;

    HANDLE get() const { return h_; }
    HANDLE* out() { return &h_; }

    void reset(HANDLE h = nullptr) {
        if (h_ != nullptr && h_ != INVALID_HANDLE_VALUE) {
            CloseHandle(h_);
        }
        h_ = h;
    }

private:
    HANDLE h_;
};

std::string build_command_line(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

std::string build_environment_block(const std::unordered_map<std::string, std::string>& env) {
    std::string block;
    for (const auto& [key, value] : env) {
        block += key;
        block += '=';
        block += value;
        block += '\0';
    }
    block += '\0';
    return block;
}

void read_all(HANDLE pipe, std::string& out) {
    char chunk[4096];
    DWORD n = 0;
    while (ReadFile(pipe, chunk, sizeof(chunk), &n, nullptr) && n > 0) {
        out.append(chunk, n);
    }
}

} // namespace

Result<ScriptResult> spawn_and_capture(const std::vector<std::string>& argv,
                                       const std::unordered_map<std::string, std::string>& env,
                                       const std::string& cwd) {
    ScriptResult result;

    if (argv.empty()) {
        return Result<ScriptResult>::err(Error(ErrorCode::EXECUTION_ERROR, "empty command line"));
    }

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HandleGuard out_read, out_write, err_read, err_write;
    if (!CreatePipe(out_read.out(), out_write.out(), &sa, 0) ||
        !CreatePipe(err_read.out(), err_write.out(), &sa, 0)) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR,
                  "CreatePipe failed: " + std::to_string(GetLastError())));
    }
    SetHandleInformation(out_read.get(), HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read.get(), HANDLE_FLAG_INHERIT, 0);

    std::string cmd_line = build_command_line(argv);
    std::string env_block = build_environment_block(env);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nullptr;
    si.hStdOutput = out_write.get();
    si.hStdError = err_write.get();

    PROCESS_INFORMATION pi = {};

    BOOL success = CreateProcessA(
        argv[0].c_str(),
        const_cast<char*>(cmd_line.c_str()),
        nullptr,
        nullptr,
        TRUE,
        CREATE_NO_WINDOW,
        const_cast<char*>(env_block.c_str()),
        cwd.empty() ? nullptr : cwd.c_str(),
        &si,
        &pi);

    if (!success) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR,
                  "CreateProcess failed: " + std::to_string(GetLastError())));
    }

    HandleGuard process(pi.hProcess);
    HandleGuard thread(pi.hThread);

    // The child holds its own copies; ours must go for ReadFile to see EOF
    out_write.reset();
    err_write.reset();

    std::thread err_reader([&] { read_all(err_read.get(), result.stderr_text); });
    read_all(out_read.get(), result.stdout_text);
    err_reader.join();

    WaitForSingleObject(process.get(), INFINITE);

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(process.get(), &exit_code)) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR, "GetExitCodeProcess failed"));
    }
    result.exit_code = static_cast<int>(exit_code);

    return Result<ScriptResult>::ok(std::move(result));
}

} // namespace buckle

#endif // _WIN32
