#ifndef PRINCE_COMMAND_LINE_HPP
#define PRINCE_COMMAND_LINE_HPP

#include <sstream>
#include <string>
#include <vector>

#include "escape.hpp"
#include "options.hpp"

namespace prince {

enum log_mode { LOG_NORMAL, LOG_BUFFERED };

inline const char* log_mode_name(log_mode m) {
    return m == LOG_BUFFERED ? "buffered" : "normal";
}

// Argument vector of one engine run: argv[0] is the executable path.
// Built once per conversion and never modified afterwards.
class command_invocation {
public:
    explicit command_invocation(const std::vector<std::string>& argv) : argv_(argv) {}

    const std::vector<std::string>& argv() const { return argv_; }
    const std::string& executable() const { return argv_.front(); }
    size_t size() const { return argv_.size(); }
    const std::string& operator[](size_t i) const { return argv_[i]; }

    // Single command line string, every token escaped for this platform.
    std::string str() const { return join_(false); }

    // Same, with secret values replaced by ***. For logging.
    std::string masked_str() const { return join_(true); }

private:
    std::vector<std::string> argv_;

    std::string join_(bool mask) const {
        std::string out;
        for (size_t i = 0; i < argv_.size(); ++i) {
            if (i) out.push_back(' ');
            out += escape_arg(mask ? mask_(argv_[i]) : argv_[i], true, i == 0);
        }
        return out;
    }

    static std::string mask_(const std::string& tok) {
        static const char* const secret[] = {
            "--auth-password=", "--ssl-key-password=", "--user-password=",
            "--owner-password=", "--license-key=", 0
        };
        for (const char* const* s = secret; *s; ++s) {
            std::string prefix(*s);
            if (tok.compare(0, prefix.size(), prefix) == 0) return prefix + "***";
        }
        return tok;
    }
};

namespace detail {

inline void flag_(std::vector<std::string>& v, const char* name) {
    v.push_back(std::string("--") + name);
}

inline void value_(std::vector<std::string>& v, const char* name, const std::string& value) {
    v.push_back(std::string("--") + name + "=" + value);
}

inline void value_(std::vector<std::string>& v, const char* name, int value) {
    std::ostringstream oss;
    oss << value;
    value_(v, name, oss.str());
}

inline void text_(std::vector<std::string>& v, const char* name, const std::string& value) {
    if (!value.empty()) value_(v, name, value);
}

inline void list_(std::vector<std::string>& v, const char* name, const std::vector<std::string>& values) {
    for (size_t i = 0; i < values.size(); ++i) value_(v, name, values[i]);
}

} // namespace detail

// Option tokens shared by every operation, in canonical order. Fields still
// at their default emit nothing.
inline std::vector<std::string> option_tokens(const conversion_options& o) {
    using namespace detail;
    std::vector<std::string> v;

    // logging
    if (o.verbose()) flag_(v, "verbose");
    if (o.debug()) flag_(v, "debug");
    text_(v, "log", o.log());
    if (o.no_warn_css_unknown()) flag_(v, "no-warn-css-unknown");
    if (o.no_warn_css_unsupported()) flag_(v, "no-warn-css-unsupported");

    // input
    if (o.input_type() != "auto") value_(v, "input", o.input_type());
    text_(v, "baseurl", o.base_url());
    for (size_t i = 0; i < o.remaps().size(); ++i)
        value_(v, "remap", o.remaps()[i].first + "=" + o.remaps()[i].second);
    text_(v, "fileroot", o.file_root());
    if (o.xinclude()) flag_(v, "xinclude");
    if (o.xml_external_entities()) flag_(v, "xml-external-entities");
    if (o.iframes()) flag_(v, "iframes");
    if (o.no_local_files()) flag_(v, "no-local-files");

    // network
    if (o.no_network()) flag_(v, "no-network");
    if (o.no_redirects()) flag_(v, "no-redirects");
    text_(v, "auth-user", o.auth_user());
    text_(v, "auth-password", o.auth_password());
    text_(v, "auth-server", o.auth_server());
    text_(v, "auth-scheme", o.auth_scheme());
    if (!o.auth_methods().empty()) {
        std::string joined;
        for (size_t i = 0; i < o.auth_methods().size(); ++i) {
            if (i) joined.push_back(',');
            joined += o.auth_methods()[i];
        }
        value_(v, "auth-method", joined);
    }
    if (o.no_auth_preemptive()) flag_(v, "no-auth-preemptive");
    text_(v, "http-proxy", o.http_proxy());
    if (o.http_timeout() > 0) value_(v, "http-timeout", o.http_timeout());
    text_(v, "cookie", o.cookie());
    list_(v, "cookie", o.cookies());
    text_(v, "cookiejar", o.cookie_jar());
    text_(v, "ssl-cacert", o.ssl_cacert());
    text_(v, "ssl-capath", o.ssl_capath());
    text_(v, "ssl-cert", o.ssl_cert());
    text_(v, "ssl-cert-type", o.ssl_cert_type());
    text_(v, "ssl-key", o.ssl_key());
    text_(v, "ssl-key-type", o.ssl_key_type());
    text_(v, "ssl-key-password", o.ssl_key_password());
    text_(v, "ssl-version", o.ssl_version());
    if (o.insecure()) flag_(v, "insecure");
    if (o.no_parallel_downloads()) flag_(v, "no-parallel-downloads");

    // JavaScript
    if (o.javascript()) flag_(v, "javascript");
    list_(v, "script", o.scripts());
    if (o.max_passes() > 0) value_(v, "max-passes", o.max_passes());

    // CSS
    list_(v, "style", o.style_sheets());
    text_(v, "media", o.media());
    text_(v, "page-size", o.page_size());
    text_(v, "page-margin", o.page_margin());
    if (o.no_author_style()) flag_(v, "no-author-style");
    if (o.no_default_style()) flag_(v, "no-default-style");

    // PDF output
    text_(v, "pdf-id", o.pdf_id());
    text_(v, "pdf-script", o.pdf_script());
    for (size_t i = 0; i < o.pdf_event_scripts().size(); ++i) {
        const conversion_options::event_script_t& es = o.pdf_event_scripts()[i];
        value_(v, "pdf-event-script", es.first + ":" + es.second);
    }
    text_(v, "pdf-lang", o.pdf_lang());
    text_(v, "pdf-profile", o.pdf_profile());
    if (!o.pdf_output_intent().empty()) {
        value_(v, "pdf-output-intent", o.pdf_output_intent());
        if (o.convert_colors()) flag_(v, "convert-colors");
    }
    list_(v, "attach", o.file_attachments());
    if (o.no_artificial_fonts()) flag_(v, "no-artificial-fonts");
    if (!o.embed_fonts()) flag_(v, "no-embed-fonts");
    if (!o.subset_fonts()) flag_(v, "no-subset-fonts");
    if (!o.system_fonts()) flag_(v, "no-system-fonts");
    if (o.force_identity_encoding()) flag_(v, "force-identity-encoding");
    if (!o.compress()) flag_(v, "no-compress");
    if (o.no_object_streams()) flag_(v, "no-object-streams");
    text_(v, "fallback-cmyk-profile", o.fallback_cmyk_profile());
    if (o.tagged_pdf()) flag_(v, "tagged-pdf");
    if (o.pdf_forms()) flag_(v, "pdf-forms");
    if (o.css_dpi() > 0) value_(v, "css-dpi", o.css_dpi());

    // PDF metadata
    text_(v, "pdf-title", o.pdf_title());
    text_(v, "pdf-subject", o.pdf_subject());
    text_(v, "pdf-author", o.pdf_author());
    text_(v, "pdf-keywords", o.pdf_keywords());
    text_(v, "pdf-creator", o.pdf_creator());
    text_(v, "pdf-xmp", o.pdf_xmp());

    // PDF encryption
    if (o.encrypt()) {
        flag_(v, "encrypt");
        if (o.has_encrypt_info()) {
            const encrypt_info& e = o.encryption();
            value_(v, "key-bits", e.key_bits);
            // empty passwords are left out rather than passed as ""
            text_(v, "user-password", e.user_password);
            text_(v, "owner-password", e.owner_password);
            if (e.disallow_print) flag_(v, "disallow-print");
            if (e.disallow_modify) flag_(v, "disallow-modify");
            if (e.disallow_copy) flag_(v, "disallow-copy");
            if (e.disallow_annotate) flag_(v, "disallow-annotate");
            if (e.allow_copy_for_accessibility) flag_(v, "allow-copy-for-accessibility");
            if (e.allow_assembly) flag_(v, "allow-assembly");
        }
    }

    // raster output
    if (o.raster_format() != "auto") value_(v, "raster-format", o.raster_format());
    if (o.raster_jpeg_quality() > -1) value_(v, "raster-jpeg-quality", o.raster_jpeg_quality());
    if (o.raster_page() > 0) value_(v, "raster-pages", o.raster_page());
    if (o.raster_dpi() > 0) value_(v, "raster-dpi", o.raster_dpi());
    if (o.raster_threads() > -1) value_(v, "raster-threads", o.raster_threads());
    text_(v, "raster-background", o.raster_background());

    // license
    text_(v, "license-file", o.license_file());
    text_(v, "license-key", o.license_key());

    // fail-safes
    if (o.fail_dropped_content()) flag_(v, "fail-dropped-content");
    if (o.fail_missing_resources()) flag_(v, "fail-missing-resources");
    if (o.fail_stripped_transparency()) flag_(v, "fail-stripped-transparency");
    if (o.fail_missing_glyphs()) flag_(v, "fail-missing-glyphs");
    if (o.fail_pdf_profile_error()) flag_(v, "fail-pdf-profile-error");
    if (o.fail_pdf_tag_error()) flag_(v, "fail-pdf-tag-error");
    if (o.fail_invalid_license()) flag_(v, "fail-invalid-license");

    // free-form
    v.insert(v.end(), o.extra_options().begin(), o.extra_options().end());

    return v;
}

// executable, --structured-log=<mode>, option tokens, then positional.
inline command_invocation build_command_line(const conversion_options& o,
                                             log_mode mode,
                                             const std::vector<std::string>& positional) {
    std::vector<std::string> argv;
    argv.push_back(o.exe_path());
    detail::value_(argv, "structured-log", log_mode_name(mode));
    std::vector<std::string> opts = option_tokens(o);
    argv.insert(argv.end(), opts.begin(), opts.end());
    argv.insert(argv.end(), positional.begin(), positional.end());
    return command_invocation(argv);
}

} // namespace prince

#endif // PRINCE_COMMAND_LINE_HPP
