#ifndef PRINCE_POPEN3_HPP
#define PRINCE_POPEN3_HPP

// Starts the engine with its stdin/stdout/stderr redirected. The parent ends
// are plain descriptors (POSIX) or overlapped pipe handles (Windows) so the
// stream pump can hand them to asio.

#include <string>
#include <vector>

#include "command_line.hpp"

#if defined(_WIN32)

#ifndef NOMINMAX
#define NOMINMAX
#endif
// asio needs <winsock2.h> ahead of <windows.h>
#include <winsock2.h>
#include <windows.h>
#include <cstdio>
#include <cstring>
#include <sstream>

#include "escape.hpp"

namespace prince {

class popen3 {
public:
    struct stream_spec {
        enum kind_t { INHERIT, PIPE };
        kind_t kind;
        stream_spec() : kind(INHERIT) {}
        static stream_spec inherit() { stream_spec s; s.kind = INHERIT; return s; }
        static stream_spec pipe()    { stream_spec s; s.kind = PIPE;    return s; }
    };

    struct options {
        stream_spec in;   // child's stdin
        stream_spec out;  // child's stdout
        stream_spec err;  // child's stderr
        std::string chdir_to;            // empty: inherit
        std::vector<std::string> env_kv; // "KEY=VALUE" added to the inherited environment
        options() {}
    };

    popen3()
    : proc_(NULL), th_(NULL), pid_(0),
      h_stdin_w_(NULL), h_stdout_r_(NULL), h_stderr_r_(NULL),
      last_err_(0) { ZeroMemory(&pi_, sizeof(pi_)); }

    ~popen3() {
        close_stdin();
        close_stdout();
        close_stderr();
        if (th_)   { CloseHandle(th_);   th_   = NULL; }
        if (proc_) { CloseHandle(proc_); proc_ = NULL; }
    }

    popen3(const popen3&) = delete;
    popen3& operator=(const popen3&) = delete;

    // argv: UTF-8, argv[0] is the executable. The command line handed to
    // CreateProcessW is escaped with escape_cmd (cmd.exe meta included).
    // Parent pipe ends are overlapped so they can be used with asio.
    bool start(const std::vector<std::string>& argv, const options& opt = options()) {
        clear_error();
        if (argv.empty()) return set_error("argv is empty", ERROR_INVALID_PARAMETER);
        if (!check_executable_(argv[0])) return false;

        std::wstring cmd = build_cmdline_utf16(argv);

        SECURITY_ATTRIBUTES sa_inh; ZeroMemory(&sa_inh, sizeof(sa_inh));
        sa_inh.nLength = sizeof(sa_inh);
        sa_inh.bInheritHandle = TRUE;
        sa_inh.lpSecurityDescriptor = NULL;

        HANDLE ch_in  = NULL, ch_out = NULL, ch_err = NULL;                // inherited by the child
        HANDLE parent_in_w = NULL, parent_out_r = NULL, parent_err_r = NULL;

        if (!setup_stream_(opt.in, false, STD_INPUT_HANDLE, &parent_in_w, &ch_in, &sa_inh)) {
            return false;
        }
        if (!setup_stream_(opt.out, true, STD_OUTPUT_HANDLE, &parent_out_r, &ch_out, &sa_inh)) {
            close_all_(ch_in, parent_in_w, NULL, NULL, NULL, NULL);
            return false;
        }
        if (!setup_stream_(opt.err, true, STD_ERROR_HANDLE, &parent_err_r, &ch_err, &sa_inh)) {
            close_all_(ch_in, parent_in_w, ch_out, parent_out_r, NULL, NULL);
            return false;
        }

        STARTUPINFOW si; ZeroMemory(&si, sizeof(si));
        si.cb = sizeof(si);
        si.dwFlags |= STARTF_USESTDHANDLES;
        si.hStdInput  = ch_in;
        si.hStdOutput = ch_out;
        si.hStdError  = ch_err;

        std::vector<wchar_t> cmd_buf(cmd.begin(), cmd.end());
        cmd_buf.push_back(L'\0');

        std::vector<wchar_t> env_block;
        if (!opt.env_kv.empty()) build_env_block_(opt.env_kv, env_block);
        std::wstring wdir = utf8_to_utf16_(opt.chdir_to);

        BOOL ok = CreateProcessW(
            NULL,
            &cmd_buf[0],
            NULL, NULL,
            TRUE,
            env_block.empty() ? 0 : CREATE_UNICODE_ENVIRONMENT,
            env_block.empty() ? NULL : &env_block[0],
            wdir.empty() ? NULL : wdir.c_str(),
            &si, &pi_
        );
        DWORD create_err = ok ? 0 : GetLastError();

        // the child holds its own copies now
        if (ch_in)  CloseHandle(ch_in);
        if (ch_out) CloseHandle(ch_out);
        if (ch_err) CloseHandle(ch_err);

        if (!ok) {
            close_all_(NULL, parent_in_w, NULL, parent_out_r, NULL, parent_err_r);
            return set_error("CreateProcessW", create_err);
        }

        proc_ = pi_.hProcess;
        th_   = pi_.hThread;
        pid_  = (unsigned long)pi_.dwProcessId;

        h_stdin_w_  = parent_in_w;
        h_stdout_r_ = parent_out_r;
        h_stderr_r_ = parent_err_r;
        return true;
    }

    bool start(const command_invocation& inv, const options& opt = options()) {
        return start(inv.argv(), opt);
    }

    void close_stdin()  { close_handle_(h_stdin_w_);  }
    void close_stdout() { close_handle_(h_stdout_r_); }
    void close_stderr() { close_handle_(h_stderr_r_); }

    // parent ends (NULL when not a pipe)
    HANDLE stdin_handle()  const { return h_stdin_w_;  }
    HANDLE stdout_handle() const { return h_stdout_r_; }
    HANDLE stderr_handle() const { return h_stderr_r_; }

    bool alive() const {
        if (!proc_) return false;
        return WaitForSingleObject(proc_, 0) == WAIT_TIMEOUT;
    }

    // Blocks until the child exits; *exit_code receives its exit code.
    bool wait(int* exit_code) {
        if (!proc_) return set_error("process not started", ERROR_INVALID_HANDLE);
        DWORD r = WaitForSingleObject(proc_, INFINITE);
        if (r != WAIT_OBJECT_0) return fail_api("WaitForSingleObject(process)");
        DWORD code = 0;
        if (!GetExitCodeProcess(proc_, &code)) return fail_api("GetExitCodeProcess");
        if (exit_code) *exit_code = (int)code;
        CloseHandle(th_);   th_   = NULL;
        CloseHandle(proc_); proc_ = NULL;
        return true;
    }

    bool kill() {
        if (!proc_) return set_error("process not started", ERROR_INVALID_HANDLE);
        if (!TerminateProcess(proc_, 1)) return fail_api("TerminateProcess");
        return true;
    }

    const std::string& last_error() const { return last_msg_; }
    int last_errno() const { return (int)last_err_; }
    unsigned long pid() const { return pid_; }

private:
    HANDLE proc_;
    HANDLE th_;
    unsigned long pid_;
    PROCESS_INFORMATION pi_;

    HANDLE h_stdin_w_;
    HANDLE h_stdout_r_;
    HANDLE h_stderr_r_;

    DWORD last_err_;
    std::string last_msg_;

    void clear_error() { last_err_ = 0; last_msg_.clear(); }
    bool set_error(const char* msg, DWORD e) { last_err_ = e; last_msg_ = format_error_(msg, e); return false; }
    bool fail_api(const char* api) { return set_error(api, GetLastError()); }

    bool check_executable_(const std::string& path) {
        if (path.find_first_of("\\/") == std::string::npos) return true; // PATH lookup
        DWORD attrs = GetFileAttributesW(utf8_to_utf16_(path).c_str());
        if (attrs == INVALID_FILE_ATTRIBUTES) {
            last_err_ = ERROR_FILE_NOT_FOUND;
            last_msg_ = "executable could not be found at " + path;
            return false;
        }
        if (attrs & FILE_ATTRIBUTE_DIRECTORY) {
            last_err_ = ERROR_ACCESS_DENIED;
            last_msg_ = "executable path is a directory: " + path;
            return false;
        }
        return true;
    }

    bool setup_stream_(const stream_spec& spec, bool parent_reads, DWORD std_id,
                       HANDLE* parent_end, HANDLE* child_end, SECURITY_ATTRIBUTES* sa) {
        if (spec.kind == stream_spec::PIPE)
            return make_named_pipe_pair_(parent_reads, parent_end, child_end, sa);
        HANDLE h = GetStdHandle(std_id);
        if (!h || h == INVALID_HANDLE_VALUE) { *child_end = NULL; return true; }
        HANDLE self = GetCurrentProcess();
        if (!DuplicateHandle(self, h, self, child_end, 0, TRUE, DUPLICATE_SAME_ACCESS))
            return fail_api("DuplicateHandle(inherit)");
        return true;
    }

    static void close_all_(HANDLE a, HANDLE b, HANDLE c, HANDLE d, HANDLE e, HANDLE f) {
        HANDLE hs[6] = { a, b, c, d, e, f };
        for (int i = 0; i < 6; ++i) if (hs[i]) CloseHandle(hs[i]);
    }

    static void close_handle_(HANDLE& h) {
        if (h) { CloseHandle(h); h = NULL; }
    }

    static std::string format_error_(const char* msg, DWORD e) {
        LPWSTR wbuf = 0;
        DWORD flags = FORMAT_MESSAGE_ALLOCATE_BUFFER|FORMAT_MESSAGE_FROM_SYSTEM|FORMAT_MESSAGE_IGNORE_INSERTS;
        FormatMessageW(flags, 0, e, 0, (LPWSTR)&wbuf, 0, 0);
        std::string tail;
        if (wbuf) { tail = utf16_to_utf8_(wbuf); LocalFree(wbuf); }
        std::ostringstream oss; oss << msg << " failed: " << tail << " (GetLastError=" << e << ")";
        return oss.str();
    }

    static std::wstring utf8_to_utf16_(const std::string& s) {
        if (s.empty()) return std::wstring();
        int len = MultiByteToWideChar(CP_UTF8, 0, &s[0], (int)s.size(), 0, 0);
        if (len <= 0) return std::wstring();
        std::wstring w(len, 0);
        MultiByteToWideChar(CP_UTF8, 0, &s[0], (int)s.size(), &w[0], len);
        return w;
    }
    static std::string utf16_to_utf8_(const std::wstring& w) {
        if (w.empty()) return std::string();
        int len = WideCharToMultiByte(CP_UTF8, 0, &w[0], (int)w.size(), 0, 0, 0, 0);
        std::string s(len, 0);
        WideCharToMultiByte(CP_UTF8, 0, &w[0], (int)w.size(), &s[0], len, 0, 0);
        return s;
    }

    static std::wstring build_cmdline_utf16(const std::vector<std::string>& argv) {
        std::string out;
        for (size_t i = 0; i < argv.size(); ++i) {
            if (i) out.push_back(' ');
            out += escape_cmd(argv[i], true, i == 0);
        }
        return utf8_to_utf16_(out);
    }

    // current environment plus env_kv, as a double-null-terminated block
    static void build_env_block_(const std::vector<std::string>& env_kv, std::vector<wchar_t>& block) {
        LPWCH cur = GetEnvironmentStringsW();
        if (cur) {
            for (LPWCH p = cur; *p; p += wcslen(p) + 1)
                block.insert(block.end(), p, p + wcslen(p) + 1);
            FreeEnvironmentStringsW(cur);
        }
        for (size_t i = 0; i < env_kv.size(); ++i) {
            std::wstring w = utf8_to_utf16_(env_kv[i]);
            block.insert(block.end(), w.begin(), w.end());
            block.push_back(L'\0');
        }
        block.push_back(L'\0');
    }

    // parent_reads=true : parent READs (INBOUND), child WRITEs
    // parent_reads=false: parent WRITEs (OUTBOUND), child READs
    bool make_named_pipe_pair_(bool parent_reads, HANDLE* parent_end, HANDLE* child_end, SECURITY_ATTRIBUTES* sa_child) {
        std::wstring name = unique_pipe_name_();
        DWORD open_mode = (parent_reads ? PIPE_ACCESS_INBOUND : PIPE_ACCESS_OUTBOUND)
                        | FILE_FLAG_OVERLAPPED | FILE_FLAG_FIRST_PIPE_INSTANCE;
        HANDLE server = CreateNamedPipeW(
            name.c_str(), open_mode,
            PIPE_TYPE_BYTE | PIPE_READMODE_BYTE | PIPE_WAIT,
            1, 64*1024, 64*1024, 0, NULL);
        if (server == INVALID_HANDLE_VALUE) return fail_api("CreateNamedPipeW");

        OVERLAPPED ov; ZeroMemory(&ov, sizeof(ov));
        HANDLE conn_evt = CreateEventW(NULL, TRUE, FALSE, NULL);
        if (!conn_evt) { CloseHandle(server); return fail_api("CreateEvent(connect)"); }
        ov.hEvent = conn_evt;

        if (!ConnectNamedPipe(server, &ov)) {
            DWORD e = GetLastError();
            if (e == ERROR_PIPE_CONNECTED) {
                SetEvent(conn_evt);
            } else if (e != ERROR_IO_PENDING) {
                CloseHandle(conn_evt);
                CloseHandle(server);
                return set_error("ConnectNamedPipe", e);
            }
        }

        HANDLE client = CreateFileW(
            name.c_str(), parent_reads ? GENERIC_WRITE : GENERIC_READ, 0, sa_child,
            OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, NULL);
        if (client == INVALID_HANDLE_VALUE) {
            DWORD e = GetLastError();
            CloseHandle(conn_evt);
            CloseHandle(server);
            return set_error("CreateFileW(pipe client)", e);
        }

        DWORD dummy = 0;
        if (!GetOverlappedResult(server, &ov, &dummy, TRUE)) {
            DWORD e = GetLastError();
            if (e != ERROR_PIPE_CONNECTED) {
                CloseHandle(client);
                CloseHandle(conn_evt);
                CloseHandle(server);
                return set_error("GetOverlappedResult(connect)", e);
            }
        }
        CloseHandle(conn_evt);
        SetHandleInformation(server, HANDLE_FLAG_INHERIT, 0);

        *parent_end = server;
        *child_end = client;
        return true;
    }

    static std::wstring unique_pipe_name_() {
        static LONG s_count = 0;
        LONG c = InterlockedIncrement(&s_count);
        wchar_t buf[256];
#if defined(_MSC_VER)
        _snwprintf(buf, 255, L"\\\\.\\pipe\\prince_popen3_%lu_%lu_%lu_%ld",
                   (unsigned long)GetCurrentProcessId(), (unsigned long)GetCurrentThreadId(),
                   (unsigned long)GetTickCount(), (long)c);
#else
        swprintf(buf, 255, L"\\\\.\\pipe\\prince_popen3_%lu_%lu_%lu_%ld",
                 (unsigned long)GetCurrentProcessId(), (unsigned long)GetCurrentThreadId(),
                 (unsigned long)GetTickCount(), (long)c);
#endif
        buf[255] = 0;
        return std::wstring(buf);
    }
};

} // namespace prince

#else // defined(_WIN32)

// POSIX
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace prince {

class popen3 {
public:
    struct stream_spec {
        enum mode_t { INHERIT, PIPE } mode;
        stream_spec() : mode(INHERIT) {}
        static stream_spec inherit() { stream_spec s; s.mode = INHERIT; return s; }
        static stream_spec pipe()    { stream_spec s; s.mode = PIPE;    return s; }
    };

    struct options {
        stream_spec in;   // child's stdin  (0)
        stream_spec out;  // child's stdout (1)
        stream_spec err;  // child's stderr (2)

        // make the parent pipe ends non-blocking (needed by asio descriptors)
        bool parent_nonblock;

        // child working directory, empty: unchanged
        std::string chdir_to;

        // "KEY=VALUE" entries set in the child on top of the inherited environment
        std::vector<std::string> env_kv;

        options() : parent_nonblock(false) {}
    };

public:
    popen3()
    : pid_(-1),
      in_w_(-1), out_r_(-1), err_r_(-1),
      last_errno_(0) {}

    ~popen3() {
        close_stdin();
        close_stdout();
        close_stderr();
        // reap if it already exited; never block here
        if (pid_ > 0) {
            int status;
            ::waitpid(pid_, &status, WNOHANG);
        }
    }

    popen3(const popen3&) = delete;
    popen3& operator=(const popen3&) = delete;

    // argv: ["prog", "arg1", ...], not empty. Arguments reach the child
    // unchanged through execvp; no shell is involved.
    // Returns false on failure (see last_error() / last_errno()).
    bool start(const std::vector<std::string>& argv, const options& opt = options()) {
        clear_last_error_();

        if (argv.empty()) {
            set_last_error_("argv is empty", EINVAL);
            return false;
        }
        if (!check_executable_(argv[0])) return false;

        int in_pipe[2]  = { -1, -1 }; // parent writes -> child reads (stdin)
        int out_pipe[2] = { -1, -1 }; // child writes  -> parent reads (stdout)
        int err_pipe[2] = { -1, -1 }; // child writes  -> parent reads (stderr)

        // every end is CLOEXEC from creation, so a fork on another thread
        // never passes this child's pipes on to its own child
        if (opt.in.mode  == stream_spec::PIPE && !make_pipe_(in_pipe))   return fail_perror_("pipe(stdin)");
        if (opt.out.mode == stream_spec::PIPE && !make_pipe_(out_pipe))  { safe_close_pair_(in_pipe);  return fail_perror_("pipe(stdout)"); }
        if (opt.err.mode == stream_spec::PIPE && !make_pipe_(err_pipe))  { safe_close_pair_(in_pipe); safe_close_pair_(out_pipe); return fail_perror_("pipe(stderr)"); }

        // the child reports a failed exec by writing errno here; a successful
        // exec closes it (CLOEXEC) and the parent reads EOF
        int exerr[2] = { -1, -1 };
        if (!make_pipe_(exerr)) {
            safe_close_pair_(in_pipe); safe_close_pair_(out_pipe); safe_close_pair_(err_pipe);
            return fail_perror_("pipe(exec_err)");
        }

        // argv and environment are prepared before fork: no allocation in the child
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (size_t i = 0; i < argv.size(); ++i)
            cargv.push_back(const_cast<char*>(argv[i].c_str()));
        cargv.push_back(0);

        std::vector<std::string> env_store;
        std::vector<char*> envp;
        if (!opt.env_kv.empty()) build_envp_(opt.env_kv, env_store, envp);

        pid_t p = ::fork();
        if (p < 0) {
            safe_close_pair_(in_pipe); safe_close_pair_(out_pipe); safe_close_pair_(err_pipe);
            safe_close_pair_(exerr);
            return fail_perror_("fork");
        }

        if (p == 0) {
            // -------- child --------
            ::close(exerr[0]);

            setup_child_stdio_(opt, in_pipe, out_pipe, err_pipe, exerr[1]);
            if (!envp.empty()) environ = &envp[0];

            if (!opt.chdir_to.empty()) {
                if (::chdir(opt.chdir_to.c_str()) != 0) {
                    write_errno_and_exit_(exerr[1]);
                }
            }

            // the engine must see the default SIGPIPE disposition
            ::signal(SIGPIPE, SIG_DFL);

            ::execvp(cargv[0], &cargv[0]);
            write_errno_and_exit_(exerr[1]);
        }

        // -------- parent --------
        pid_ = p;
        ::close(exerr[1]);

        if (opt.in.mode  == stream_spec::PIPE)  ::close(in_pipe[0]);   // child-read end
        if (opt.out.mode == stream_spec::PIPE)  ::close(out_pipe[1]);  // child-write end
        if (opt.err.mode == stream_spec::PIPE)  ::close(err_pipe[1]);  // child-write end

        in_w_  = (opt.in.mode  == stream_spec::PIPE) ? in_pipe[1]  : -1;
        out_r_ = (opt.out.mode == stream_spec::PIPE) ? out_pipe[0] : -1;
        err_r_ = (opt.err.mode == stream_spec::PIPE) ? err_pipe[0] : -1;

        if (opt.parent_nonblock) {
            if (in_w_  != -1) set_nonblock_(in_w_,  true);
            if (out_r_ != -1) set_nonblock_(out_r_, true);
            if (err_r_ != -1) set_nonblock_(err_r_, true);
        }

        int child_exec_errno = 0;
        ssize_t n = read_full_errno_(exerr[0], &child_exec_errno, sizeof(child_exec_errno));
        ::close(exerr[0]);

        if (n > 0) {
            int st;
            ::waitpid(pid_, &st, 0);
            cleanup_parent_fds_();
            char buf[256];
            std::snprintf(buf, sizeof(buf), "exec %s failed: %s",
                          argv[0].c_str(), std::strerror(child_exec_errno));
            set_last_error_(buf, child_exec_errno);
            pid_ = -1;
            return false;
        }
        return true;
    }

    bool start(const command_invocation& inv, const options& opt = options()) {
        return start(inv.argv(), opt);
    }

    void close_stdin()  { safe_close_(in_w_);  }
    void close_stdout() { safe_close_(out_r_); }
    void close_stderr() { safe_close_(err_r_); }

    pid_t pid() const { return pid_; }

    // non-blocking
    bool alive() const {
        if (pid_ <= 0) return false;
        int st;
        pid_t r = ::waitpid(pid_, &st, WNOHANG);
        return (r == 0);
    }

    // Blocks until the child exits. *exit_code is the exit status, or
    // 128 + signal number when the child was killed by a signal.
    bool wait(int* exit_code) {
        if (pid_ <= 0) { set_last_error_("no child", ECHILD); return false; }
        int st = 0;
        int r;
        do {
            r = ::waitpid(pid_, &st, 0);
        } while (r == -1 && errno == EINTR);
        if (r < 0) {
            fail_perror_("waitpid");
            return false;
        }
        if (exit_code) {
            if (WIFEXITED(st))        *exit_code = WEXITSTATUS(st);
            else if (WIFSIGNALED(st)) *exit_code = 128 + WTERMSIG(st);
            else                      *exit_code = -1;
        }
        pid_ = -1;
        cleanup_parent_fds_();
        return true;
    }

    bool kill(int sig = SIGKILL) {
        if (pid_ <= 0) { set_last_error_("no child", ECHILD); return false; }
        if (::kill(pid_, sig) != 0) return fail_perror_("kill");
        return true;
    }

    // parent ends, -1 when not a pipe
    int stdin_fd()  const { return in_w_;  }
    int stdout_fd() const { return out_r_; }
    int stderr_fd() const { return err_r_; }

    const std::string& last_error() const { return last_error_msg_; }
    int last_errno() const { return last_errno_; }

private:
    pid_t pid_;
    int in_w_, out_r_, err_r_;
    std::string last_error_msg_;
    int last_errno_;

    // Paths with a slash are checked up front so a typo in the engine path
    // gives a readable message instead of "exec failed".
    bool check_executable_(const std::string& path) {
        if (path.find('/') == std::string::npos) return true; // PATH lookup by execvp
        struct stat sb;
        if (::stat(path.c_str(), &sb) != 0) {
            int e = errno;
            set_last_error_(("executable could not be found at " + path).c_str(), e);
            return false;
        }
        if (!S_ISREG(sb.st_mode)) {
            set_last_error_(("executable is not a regular file: " + path).c_str(), EACCES);
            return false;
        }
        if (::access(path.c_str(), X_OK) != 0) {
            int e = errno;
            set_last_error_(("executable does not have execute permissions: " + path).c_str(), e);
            return false;
        }
        return true;
    }

    // pipe ends carry CLOEXEC; dup2 onto 0/1/2 drops it, an end that
    // already is the target fd gets it cleared here
    static void redirect_child_fd_(int from, int to, int exerr_w) {
        if (from == to) {
            int flags = ::fcntl(from, F_GETFD);
            if (flags == -1 || ::fcntl(from, F_SETFD, flags & ~FD_CLOEXEC) == -1)
                write_errno_and_exit_(exerr_w);
            return;
        }
        if (::dup2(from, to) == -1) write_errno_and_exit_(exerr_w);
        ::close(from);
    }

    static void setup_child_stdio_(const options& opt, int in_pipe[2], int out_pipe[2], int err_pipe[2], int exerr_w) {
        if (opt.in.mode == stream_spec::PIPE) {
            ::close(in_pipe[1]);
            redirect_child_fd_(in_pipe[0], 0, exerr_w);
        }
        if (opt.out.mode == stream_spec::PIPE) {
            ::close(out_pipe[0]);
            redirect_child_fd_(out_pipe[1], 1, exerr_w);
        }
        if (opt.err.mode == stream_spec::PIPE) {
            ::close(err_pipe[0]);
            redirect_child_fd_(err_pipe[1], 2, exerr_w);
        }
    }

    // Inherited environment with env_kv applied on top; a later entry for
    // the same key wins. "KEY" without '=' sets an empty value.
    static void build_envp_(const std::vector<std::string>& env_kv,
                            std::vector<std::string>& store, std::vector<char*>& envp) {
        for (char** e = environ; e && *e; ++e) store.push_back(*e);
        for (size_t i = 0; i < env_kv.size(); ++i) {
            const std::string& kv = env_kv[i];
            std::string::size_type pos = kv.find('=');
            if (pos == 0) continue;
            std::string key = kv.substr(0, pos);
            std::string entry = (pos == std::string::npos) ? kv + "=" : kv;
            bool replaced = false;
            for (size_t j = 0; j < store.size(); ++j) {
                if (store[j].compare(0, key.size() + 1, key + "=") == 0) {
                    store[j] = entry;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) store.push_back(entry);
        }
        envp.reserve(store.size() + 1);
        for (size_t i = 0; i < store.size(); ++i)
            envp.push_back(const_cast<char*>(store[i].c_str()));
        envp.push_back(0);
    }

    void cleanup_parent_fds_() {
        close_stdin();
        close_stdout();
        close_stderr();
    }

    void set_last_error_(const char* msg, int err) {
        last_error_msg_ = msg ? msg : "";
        last_errno_ = err;
    }
    void clear_last_error_() {
        last_error_msg_.clear();
        last_errno_ = 0;
    }
    bool fail_perror_(const char* where) {
        int e = errno;
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%s: %s", where, std::strerror(e));
        set_last_error_(buf, e);
        return false;
    }

    static void safe_close_(int& fd) {
        if (fd >= 0) { ::close(fd); fd = -1; }
    }
    static void safe_close_pair_(int p[2]) {
        if (p[0] != -1) ::close(p[0]);
        if (p[1] != -1) ::close(p[1]);
        p[0] = p[1] = -1;
    }
    static bool make_pipe_(int p[2]) {
#if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
        return ::pipe2(p, O_CLOEXEC) == 0;
#else
        if (::pipe(p) != 0) return false;
        if (::fcntl(p[0], F_SETFD, FD_CLOEXEC) == -1 || ::fcntl(p[1], F_SETFD, FD_CLOEXEC) == -1) {
            int e = errno;
            safe_close_pair_(p);
            errno = e;
            return false;
        }
        return true;
#endif
    }
    static int set_nonblock_(int fd, bool on) {
        if (fd < 0) return -1;
        int flags = ::fcntl(fd, F_GETFL);
        if (flags == -1) return -1;
        if (on) flags |= O_NONBLOCK;
        else    flags &= ~O_NONBLOCK;
        return ::fcntl(fd, F_SETFL, flags);
    }
    static ssize_t read_full_errno_(int fd, void* buf, size_t len) {
        char* p = static_cast<char*>(buf);
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::read(fd, p + got, len - got);
            if (n == 0) break; // EOF: exec succeeded
            if (n < 0) {
                if (errno == EINTR) continue;
                return n;
            }
            got += (size_t)n;
        }
        return (ssize_t)got;
    }
    static void write_errno_and_exit_(int fd) {
        int e = errno;
        (void)!::write(fd, &e, sizeof(e));
        _exit(127);
    }
};

} // namespace prince

#endif // defined(_WIN32)

#endif // PRINCE_POPEN3_HPP
