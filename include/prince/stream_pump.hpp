#ifndef PRINCE_STREAM_PUMP_HPP
#define PRINCE_STREAM_PUMP_HPP

// Moves bytes between the caller and a started engine: feeds stdin, drains
// stdout into a sink and stderr into a line handler. All three run as
// coroutines on one io_context so none of the pipes can back up while
// another one is being waited on.

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include <asio.hpp>
#include <asio/co_spawn.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <array>
#include <cstddef>
#include <exception>
#include <fstream>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>

#include "errors.hpp"
#include "log.hpp"
#include "log_parser.hpp"
#include "popen3.hpp"

#if !defined(_WIN32)
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace prince {

// What the engine reads on stdin.
struct input_spec {
    enum kind_t { NONE, BYTES, FILE };
    kind_t kind;
    std::string bytes; // BYTES
    std::string path;  // FILE

    input_spec() : kind(NONE) {}
    static input_spec none() { return input_spec(); }
    static input_spec from_bytes(const std::string& b) { input_spec s; s.kind = BYTES; s.bytes = b; return s; }
    static input_spec from_file(const std::string& p) { input_spec s; s.kind = FILE; s.path = p; return s; }
};

// Where the engine's stdout goes.
struct output_spec {
    enum kind_t { DISCARD, STREAM, FILE };
    kind_t kind;
    std::ostream* os; // STREAM, not owned
    std::string path; // FILE

    output_spec() : kind(DISCARD), os(0) {}
    static output_spec discard() { return output_spec(); }
    static output_spec to_stream(std::ostream& o) { output_spec s; s.kind = STREAM; s.os = &o; return s; }
    static output_spec to_file(const std::string& p) { output_spec s; s.kind = FILE; s.path = p; return s; }
};

class stream_pump {
public:
#if defined(_WIN32)
    typedef asio::windows::stream_handle native_stream;
#else
    typedef asio::posix::stream_descriptor native_stream;
#endif

    // Receives each diagnostic line without its terminator. Returning false
    // means the line was not consumed (the parser already saw fin|).
    typedef std::function<bool(const std::string&)> line_handler;

    explicit stream_pump(popen3& proc)
    : proc_(proc), stdin_bytes_(0), stdout_bytes_(0), stderr_lines_(0) {}

    // Runs until stdout and stderr reach EOF, then reaps the child.
    // Returns the exit code. Throws io_error; the child is reaped first.
    int run(const input_spec& in, const output_spec& out, const line_handler& on_line) {
        ignore_sigpipe_();
        std::shared_ptr<spdlog::logger> log = logger();

        std::ifstream in_file;
        if (in.kind == input_spec::FILE) {
            in_file.open(in.path.c_str(), std::ios::in | std::ios::binary);
            if (!in_file.is_open()) abort_("could not open input file: " + in.path);
        }
        std::ofstream out_file;
        std::ostream* sink = 0;
        if (out.kind == output_spec::FILE) {
            out_file.open(out.path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out_file.is_open()) abort_("could not open output file: " + out.path);
            sink = &out_file;
        } else if (out.kind == output_spec::STREAM) {
            sink = out.os;
        }

        asio::io_context io;
        native_stream in_stream(io), out_stream(io), err_stream(io);

        bool have_in = adopt_stdin_(in_stream);
        bool have_out = adopt_stdout_(out_stream);
        bool have_err = adopt_stderr_(err_stream);

        std::istream* source = in.kind == input_spec::FILE ? &in_file : 0;
        auto rethrow = [](std::exception_ptr e) { if (e) std::rethrow_exception(e); };
        if (have_in)  asio::co_spawn(io, feed_stdin_(in_stream, in, source), rethrow);
        if (have_out) asio::co_spawn(io, drain_stdout_(out_stream, sink), rethrow);
        if (have_err) asio::co_spawn(io, drain_stderr_(err_stream, on_line), rethrow);

        try {
            io.run();
        } catch (...) {
            kill_and_reap_();
            throw;
        }

        if (out_file.is_open()) {
            out_file.close();
            if (out_file.fail() && failure_.empty()) failure_ = "could not write output file: " + out.path;
        }

        int code = -1;
        if (!proc_.wait(&code)) {
            log->error("wait failed: {}", proc_.last_error());
            throw io_error("wait failed: " + proc_.last_error());
        }
        log->debug("engine exited with code {} (stdin {} bytes, stdout {} bytes, stderr {} lines)",
                   code, stdin_bytes_, stdout_bytes_, stderr_lines_);

        if (!failure_.empty()) throw io_error(failure_);
        return code;
    }

    // Feeds the diagnostic lines to a parser and closes it at EOF.
    int run(const input_spec& in, const output_spec& out, log_parser& parser) {
        int code = run(in, out, [&parser](const std::string& line) { return parser.feed(line); });
        parser.finish();
        return code;
    }

    // longer stderr lines reach the line handler in pieces of this size
    enum { MAX_STDERR_LINE = 64 * 1024 };

    std::size_t stdin_bytes() const { return stdin_bytes_; }
    std::size_t stdout_bytes() const { return stdout_bytes_; }
    std::size_t stderr_lines() const { return stderr_lines_; }

private:
    enum { CHUNK = 64 * 1024 };

    popen3& proc_;
    std::size_t stdin_bytes_;
    std::size_t stdout_bytes_;
    std::size_t stderr_lines_;
    std::string failure_;

    static void ignore_sigpipe_() {
#if !defined(_WIN32)
        // a child that stops reading must show up as EPIPE, not kill us
        static std::once_flag once;
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
#endif
    }

    static bool peer_closed_(const asio::error_code& ec) {
        if (ec == asio::error::broken_pipe) return true;
#if defined(_WIN32)
        if (ec.value() == ERROR_NO_DATA) return true;
#endif
        return false;
    }

    static bool end_of_stream_(const asio::error_code& ec) {
        return ec == asio::error::eof || ec == asio::error::broken_pipe;
    }

    void fail_(const std::string& what) {
        logger()->error("{}", what);
        if (failure_.empty()) failure_ = what;
        // stop the engine so the remaining pipes hit EOF
        if (!proc_.kill()) logger()->debug("kill: {}", proc_.last_error());
    }

    void kill_and_reap_() {
        if (!proc_.kill()) logger()->debug("kill: {}", proc_.last_error());
        proc_.close_stdin();
        proc_.close_stdout();
        proc_.close_stderr();
        int code = 0;
        if (!proc_.wait(&code)) logger()->debug("wait: {}", proc_.last_error());
    }

    [[noreturn]] void abort_(const std::string& what) {
        logger()->error("{}", what);
        kill_and_reap_();
        throw io_error(what);
    }

    // The pump owns a duplicate of each parent pipe end; the launcher's copy
    // is closed right away so EOF is seen as soon as the child lets go.
#if defined(_WIN32)
    bool adopt_(native_stream& s, HANDLE h, const char* name) {
        if (h == NULL) return false;
        HANDLE dup = NULL;
        if (!DuplicateHandle(GetCurrentProcess(), h, GetCurrentProcess(), &dup, 0, FALSE,
                             DUPLICATE_SAME_ACCESS)) {
            abort_(std::string("DuplicateHandle(") + name + ") failed");
        }
        asio::error_code ec;
        s.assign(dup, ec);
        if (ec) {
            CloseHandle(dup);
            abort_(std::string("assign(") + name + "): " + ec.message());
        }
        return true;
    }
    bool adopt_stdin_(native_stream& s)  { bool r = adopt_(s, proc_.stdin_handle(), "stdin");   proc_.close_stdin();  return r; }
    bool adopt_stdout_(native_stream& s) { bool r = adopt_(s, proc_.stdout_handle(), "stdout"); proc_.close_stdout(); return r; }
    bool adopt_stderr_(native_stream& s) { bool r = adopt_(s, proc_.stderr_handle(), "stderr"); proc_.close_stderr(); return r; }
#else
    bool adopt_(native_stream& s, int fd, const char* name) {
        if (fd < 0) return false;
        // CLOEXEC: an engine forked by another conversion must not hold it
        int dup = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
        if (dup == -1) abort_(std::string("dup(") + name + ") failed: " + std::strerror(errno));
        asio::error_code ec;
        s.assign(dup, ec);
        if (ec) {
            ::close(dup);
            abort_(std::string("assign(") + name + "): " + ec.message());
        }
        return true;
    }
    bool adopt_stdin_(native_stream& s)  { bool r = adopt_(s, proc_.stdin_fd(), "stdin");   proc_.close_stdin();  return r; }
    bool adopt_stdout_(native_stream& s) { bool r = adopt_(s, proc_.stdout_fd(), "stdout"); proc_.close_stdout(); return r; }
    bool adopt_stderr_(native_stream& s) { bool r = adopt_(s, proc_.stderr_fd(), "stderr"); proc_.close_stderr(); return r; }
#endif

    asio::awaitable<void> feed_stdin_(native_stream& stream, const input_spec& in, std::istream* source) {
        asio::error_code ec;

        if (in.kind == input_spec::BYTES && !in.bytes.empty()) {
            std::size_t n = co_await asio::async_write(stream, asio::buffer(in.bytes),
                                                       asio::redirect_error(asio::use_awaitable, ec));
            stdin_bytes_ += n;
        } else if (in.kind == input_spec::FILE) {
            std::array<char, CHUNK> buffer;
            while (!ec) {
                source->read(buffer.data(), buffer.size());
                std::streamsize got = source->gcount();
                if (got > 0) {
                    std::size_t n = co_await asio::async_write(stream, asio::buffer(buffer.data(), (std::size_t)got),
                                                               asio::redirect_error(asio::use_awaitable, ec));
                    stdin_bytes_ += n;
                }
                if (source->bad()) {
                    fail_("read failed on input file: " + in.path);
                    break;
                }
                if (source->eof()) break;
            }
        }

        if (ec && peer_closed_(ec)) {
            logger()->warn("engine closed stdin after {} bytes", stdin_bytes_);
        } else if (ec) {
            fail_("write to engine stdin failed: " + ec.message());
        }

        asio::error_code ignored;
        stream.close(ignored);
        logger()->debug("stdin closed ({} bytes)", stdin_bytes_);
        co_return;
    }

    asio::awaitable<void> drain_stdout_(native_stream& stream, std::ostream* sink) {
        std::array<char, CHUNK> buffer;

        for (;;) {
            asio::error_code ec;
            std::size_t n = co_await stream.async_read_some(asio::buffer(buffer),
                                                            asio::redirect_error(asio::use_awaitable, ec));
            if (n > 0 && sink) {
                sink->write(buffer.data(), (std::streamsize)n);
                if (!*sink) {
                    fail_("write to output sink failed");
                    break;
                }
            }
            stdout_bytes_ += n;
            if (end_of_stream_(ec)) break;
            if (ec) {
                fail_("read from engine stdout failed: " + ec.message());
                break;
            }
        }
        if (sink) sink->flush();
        logger()->debug("stdout drained ({} bytes)", stdout_bytes_);
        co_return;
    }

    asio::awaitable<void> drain_stderr_(native_stream& stream, const line_handler& on_line) {
        std::string pending;

        for (;;) {
            asio::error_code ec;
            std::size_t n = co_await asio::async_read_until(stream,
                                                            asio::dynamic_buffer(pending, MAX_STDERR_LINE), '\n',
                                                            asio::redirect_error(asio::use_awaitable, ec));
            if (!ec) {
                deliver_(pending.substr(0, n), on_line);
                pending.erase(0, n);
                continue;
            }
            if (ec == asio::error::not_found) {
                // buffer full without a newline
                deliver_(pending, on_line);
                pending.clear();
                continue;
            }
            if (end_of_stream_(ec)) {
                // last line without a terminator
                if (!pending.empty()) deliver_(pending, on_line);
                break;
            }
            fail_("read from engine stderr failed: " + ec.message());
            break;
        }
        logger()->debug("stderr drained ({} lines)", stderr_lines_);
        co_return;
    }

    void deliver_(const std::string& raw, const line_handler& on_line) {
        std::string line = raw;
        if (!line.empty() && line[line.size() - 1] == '\n') line.erase(line.size() - 1);
        if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
        ++stderr_lines_;
        if (!on_line || !on_line(line)) {
            logger()->debug("engine: {}", line);
        }
    }
};

} // namespace prince

#endif // PRINCE_STREAM_PUMP_HPP
