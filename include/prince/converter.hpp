#ifndef PRINCE_CONVERTER_HPP
#define PRINCE_CONVERTER_HPP

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "command_line.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "log_parser.hpp"
#include "messages.hpp"
#include "options.hpp"
#include "popen3.hpp"
#include "stream_pump.hpp"

namespace prince {

// One engine configuration plus the conversion operations. Every call builds
// a fresh command line from the current options, runs the engine once and
// returns true only when the engine reported fin|success.
//
// Messages and data records are appended to *msgs / *dats when given.
// Throws configuration_error, launch_error or io_error; a failed conversion
// is a false return, not an exception.
//
// A converter is not meant to be shared between threads while converting;
// separate converters are independent.
class converter {
public:
    typedef std::vector<engine_message> messages_t;
    typedef std::vector<engine_data> data_t;

    explicit converter(const std::string& exe_path)
    : options_(exe_path), last_exit_code_(-1) {}

    explicit converter(const conversion_options& opt)
    : options_(opt), last_exit_code_(-1) {}

    conversion_options& options() { return options_; }
    const conversion_options& options() const { return options_; }
    void set_options(const conversion_options& opt) { options_ = opt; }

    // child working directory, empty: the caller's
    void set_working_directory(const std::string& dir) { working_dir_ = dir; }
    const std::string& working_directory() const { return working_dir_; }

    // added to the inherited environment of every engine run
    void add_environment(const std::string& key, const std::string& value) { env_.push_back(key + "=" + value); }
    void clear_environment() { env_.clear(); }
    const std::vector<std::string>& environment() const { return env_; }

    // exit code of the last engine run, -1 before the first one
    int last_exit_code() const { return last_exit_code_; }

    // The invocation an operation would run, without running it.
    command_invocation command_for(log_mode mode, const std::vector<std::string>& positional) const {
        return build_command_line(options_, mode, positional);
    }

    // ---- PDF ----

    // Output named by the engine after the input (foo.html -> foo.pdf).
    bool convert_file(const std::string& input, messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(input), input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool convert_file_to_file(const std::string& input, const std::string& pdf,
                              messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(input, output_("--output=", pdf)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool convert_multiple_files(const std::vector<std::string>& inputs, const std::string& pdf,
                                messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(inputs, output_("--output=", pdf)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool convert_file_to_passthru(const std::string& input, std::ostream& out,
                                  messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_BUFFERED, args_(input, "--output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

    bool convert_multiple_files_to_passthru(const std::vector<std::string>& inputs, std::ostream& out,
                                            messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_BUFFERED, args_(inputs, "--output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

    bool convert_string_to_passthru(const std::string& document, std::ostream& out,
                                    messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_BUFFERED, args_("-"),
                    input_spec::from_bytes(document), output_spec::to_stream(out), msgs, dats);
    }

    bool convert_string_to_file(const std::string& document, const std::string& pdf,
                                messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(output_("--output=", pdf), "-"),
                    input_spec::from_bytes(document), output_spec::discard(), msgs, dats);
    }

    // input_list: file with one input path or URL per line
    bool convert_input_list(const std::string& input_list, const std::string& pdf,
                            messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(output_("--input-list=", input_list), output_("--output=", pdf)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool convert_input_list_to_passthru(const std::string& input_list, std::ostream& out,
                                        messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_BUFFERED, args_(output_("--input-list=", input_list), "--output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

    // ---- raster ----
    // raster_path is a template such as "page_%02d.png"; the engine writes
    // one file per page.

    bool rasterize_file(const std::string& input, const std::string& raster_path,
                        messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(input, output_("--raster-output=", raster_path)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool rasterize_multiple_files(const std::vector<std::string>& inputs, const std::string& raster_path,
                                  messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(inputs, output_("--raster-output=", raster_path)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    // The passthru forms stream exactly one page: set_raster_page() and a
    // raster format other than "auto" are required.
    bool rasterize_file_to_passthru(const std::string& input, std::ostream& out,
                                    messages_t* msgs = 0, data_t* dats = 0) {
        check_raster_passthru_();
        return run_(LOG_BUFFERED, args_(input, "--raster-output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

    bool rasterize_multiple_files_to_passthru(const std::vector<std::string>& inputs, std::ostream& out,
                                              messages_t* msgs = 0, data_t* dats = 0) {
        check_raster_passthru_();
        return run_(LOG_BUFFERED, args_(inputs, "--raster-output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

    bool rasterize_string_to_passthru(const std::string& document, std::ostream& out,
                                      messages_t* msgs = 0, data_t* dats = 0) {
        check_raster_passthru_();
        return run_(LOG_BUFFERED, args_("--raster-output=-", "-"),
                    input_spec::from_bytes(document), output_spec::to_stream(out), msgs, dats);
    }

    bool rasterize_string_to_file(const std::string& document, const std::string& raster_path,
                                  messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL, args_(output_("--raster-output=", raster_path), "-"),
                    input_spec::from_bytes(document), output_spec::discard(), msgs, dats);
    }

    bool rasterize_input_list(const std::string& input_list, const std::string& raster_path,
                              messages_t* msgs = 0, data_t* dats = 0) {
        return run_(LOG_NORMAL,
                    args_(output_("--input-list=", input_list), output_("--raster-output=", raster_path)),
                    input_spec::none(), output_spec::discard(), msgs, dats);
    }

    bool rasterize_input_list_to_passthru(const std::string& input_list, std::ostream& out,
                                          messages_t* msgs = 0, data_t* dats = 0) {
        check_raster_passthru_();
        return run_(LOG_BUFFERED, args_(output_("--input-list=", input_list), "--raster-output=-"),
                    input_spec::none(), output_spec::to_stream(out), msgs, dats);
    }

private:
    conversion_options options_;
    std::string working_dir_;
    std::vector<std::string> env_;
    int last_exit_code_;

    static std::string output_(const char* flag, const std::string& value) {
        return std::string(flag) + value;
    }

    static std::vector<std::string> args_(const std::string& a) {
        return std::vector<std::string>(1, a);
    }
    static std::vector<std::string> args_(const std::string& a, const std::string& b) {
        std::vector<std::string> v;
        v.push_back(a);
        v.push_back(b);
        return v;
    }
    static std::vector<std::string> args_(const std::vector<std::string>& inputs, const std::string& tail) {
        std::vector<std::string> v(inputs);
        v.push_back(tail);
        return v;
    }

    void check_raster_passthru_() const {
        if (options_.raster_page() < 1)
            throw configuration_error("raster page has to be set to a value > 0");
        if (options_.raster_format() == "auto")
            throw configuration_error("raster format has to be set to \"jpeg\" or \"png\"");
    }

    bool run_(log_mode mode, const std::vector<std::string>& positional,
              const input_spec& in, const output_spec& out,
              messages_t* msgs, data_t* dats) {
        std::shared_ptr<spdlog::logger> log = logger();
        command_invocation inv = build_command_line(options_, mode, positional);
        log->debug("command line: {}", inv.masked_str());

        popen3::options opt;
        opt.in  = popen3::stream_spec::pipe();
        opt.out = popen3::stream_spec::pipe();
        opt.err = popen3::stream_spec::pipe();
#if !defined(_WIN32)
        opt.parent_nonblock = true;
#endif
        opt.chdir_to = working_dir_;
        opt.env_kv = env_;

        popen3 proc;
        if (!proc.start(inv, opt)) {
            log->error("could not start engine: {}", proc.last_error());
            throw launch_error(proc.last_error(), proc.last_errno());
        }
        log->info("engine started, pid {}", (long)proc.pid());

        log_parser parser;
        stream_pump pump(proc);
        last_exit_code_ = pump.run(in, out, parser);

        if (msgs) msgs->insert(msgs->end(), parser.messages().begin(), parser.messages().end());
        if (dats) dats->insert(dats->end(), parser.data().begin(), parser.data().end());

        if (parser.outcome().empty()) {
            log->warn("engine ended without a fin| line (exit code {})", last_exit_code_);
        }
        log->info("conversion {}: {} messages, {} data records",
                  parser.succeeded() ? "succeeded" : "failed",
                  parser.messages().size(), parser.data().size());
        return parser.succeeded();
    }
};

} // namespace prince

#endif // PRINCE_CONVERTER_HPP
