#ifndef PRINCE_OPTIONS_HPP
#define PRINCE_OPTIONS_HPP

#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace prince {

namespace detail {

inline std::string lower_(const std::string& s) {
    std::string out(s);
    for (std::string::size_type i = 0; i < out.size(); ++i)
        out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
    return out;
}

// valid is a null-terminated list
inline bool one_of_(const std::string& v, const char* const* valid) {
    for (; *valid; ++valid)
        if (v == *valid) return true;
    return false;
}

// lowercased v when it is in valid, otherwise fallback
inline std::string pick_(const std::string& v, const char* const* valid, const char* fallback) {
    std::string lower = lower_(v);
    return one_of_(lower, valid) ? lower : std::string(fallback);
}

} // namespace detail

// Parameters for PDF encryption; see conversion_options::set_encrypt_info().
struct encrypt_info {
    int key_bits;
    std::string user_password;
    std::string owner_password;
    bool disallow_print;
    bool disallow_modify;
    bool disallow_copy;
    bool disallow_annotate;
    bool allow_copy_for_accessibility;
    bool allow_assembly;

    encrypt_info()
    : key_bits(0),
      disallow_print(false), disallow_modify(false),
      disallow_copy(false), disallow_annotate(false),
      allow_copy_for_accessibility(false), allow_assembly(false) {}
};

// One field per engine flag. Setters validate scalars (configuration_error)
// and let unknown enumerated values fall back to their default silently.
// Repeatable fields keep insertion order and duplicates.
class conversion_options {
public:
    typedef std::pair<std::string, std::string> remap_t;        // url, dir
    typedef std::pair<std::string, std::string> event_script_t; // event, script

    explicit conversion_options(const std::string& exe_path)
    : exe_path_(exe_path),
      verbose_(false), debug_(false),
      no_warn_css_unknown_(false), no_warn_css_unsupported_(false),
      input_type_("auto"),
      xinclude_(false), xml_external_entities_(false),
      iframes_(false), no_local_files_(false),
      no_network_(false), no_redirects_(false),
      no_auth_preemptive_(false), http_timeout_(0),
      insecure_(false), no_parallel_downloads_(false),
      javascript_(false), max_passes_(0),
      no_author_style_(false), no_default_style_(false),
      convert_colors_(false),
      no_artificial_fonts_(false), embed_fonts_(true), subset_fonts_(true),
      system_fonts_(true), force_identity_encoding_(false), compress_(true),
      no_object_streams_(false), tagged_pdf_(false), pdf_forms_(false),
      css_dpi_(0),
      encrypt_(false), has_encrypt_info_(false),
      raster_format_("auto"), raster_jpeg_quality_(-1), raster_page_(0),
      raster_dpi_(0), raster_threads_(-1),
      fail_dropped_content_(false), fail_missing_resources_(false),
      fail_stripped_transparency_(false), fail_missing_glyphs_(false),
      fail_pdf_profile_error_(false), fail_pdf_tag_error_(false),
      fail_invalid_license_(false) {}

    const std::string& exe_path() const { return exe_path_; }
    void set_exe_path(const std::string& p) { exe_path_ = p; }

    // ---- logging ----
    void set_verbose(bool on)               { verbose_ = on; }
    void set_debug(bool on)                 { debug_ = on; }
    void set_log(const std::string& file)   { log_file_ = file; }
    void set_no_warn_css_unknown(bool on)   { no_warn_css_unknown_ = on; }
    void set_no_warn_css_unsupported(bool on) { no_warn_css_unsupported_ = on; }
    void set_no_warn_css(bool on) {
        no_warn_css_unknown_ = on;
        no_warn_css_unsupported_ = on;
    }

    bool verbose() const                    { return verbose_; }
    bool debug() const                      { return debug_; }
    const std::string& log() const          { return log_file_; }
    bool no_warn_css_unknown() const        { return no_warn_css_unknown_; }
    bool no_warn_css_unsupported() const    { return no_warn_css_unsupported_; }

    // ---- input ----
    // "auto" | "html" | "xml"; anything else becomes "auto"
    void set_input_type(const std::string& t) {
        static const char* const valid[] = { "xml", "html", "auto", 0 };
        input_type_ = detail::pick_(t, valid, "auto");
    }
    void set_html(bool html)                { input_type_ = html ? "html" : "xml"; }
    void set_base_url(const std::string& u) { base_url_ = u; }
    // Map a URL prefix to a local directory.
    void add_remap(const std::string& url, const std::string& dir) { remaps_.push_back(remap_t(url, dir)); }
    void clear_remaps()                     { remaps_.clear(); }
    void set_file_root(const std::string& r) { file_root_ = r; }
    void set_xinclude(bool on)              { xinclude_ = on; }
    void set_xml_external_entities(bool on) { xml_external_entities_ = on; }
    void set_iframes(bool on)               { iframes_ = on; }
    void set_no_local_files(bool on)        { no_local_files_ = on; }

    const std::string& input_type() const   { return input_type_; }
    const std::string& base_url() const     { return base_url_; }
    const std::vector<remap_t>& remaps() const { return remaps_; }
    const std::string& file_root() const    { return file_root_; }
    bool xinclude() const                   { return xinclude_; }
    bool xml_external_entities() const      { return xml_external_entities_; }
    bool iframes() const                    { return iframes_; }
    bool no_local_files() const             { return no_local_files_; }

    // ---- network ----
    void set_no_network(bool on)            { no_network_ = on; }
    void set_no_redirects(bool on)          { no_redirects_ = on; }
    void set_auth_user(const std::string& u) { auth_user_ = u; }
    void set_auth_password(const std::string& p) { auth_password_ = p; }
    void set_auth_server(const std::string& s) { auth_server_ = s; }
    // "http" | "https"; anything else clears the scheme
    void set_auth_scheme(const std::string& s) {
        static const char* const valid[] = { "http", "https", 0 };
        auth_scheme_ = detail::pick_(s, valid, "");
    }
    // Unknown methods are ignored.
    void add_auth_method(const std::string& m) {
        std::string lower = detail::lower_(m);
        if (detail::one_of_(lower, auth_methods_valid_())) auth_methods_.push_back(lower);
    }
    void clear_auth_methods()               { auth_methods_.clear(); }
    // Deprecated single-method form: replaces the list, unknown clears it.
    void set_auth_method(const std::string& m) {
        auth_methods_.clear();
        add_auth_method(m);
    }
    void set_no_auth_preemptive(bool on)    { no_auth_preemptive_ = on; }
    void set_http_proxy(const std::string& p) { http_proxy_ = p; }
    // seconds, > 0
    void set_http_timeout(int seconds) {
        if (seconds < 1) throw configuration_error("invalid httpTimeout value (must be > 0)");
        http_timeout_ = seconds;
    }
    void add_cookie(const std::string& c)   { cookies_.push_back(c); }
    void clear_cookies()                    { cookies_.clear(); }
    // Deprecated single Set-Cookie value, emitted before the cookie list.
    void set_cookie(const std::string& c)   { cookie_ = c; }
    void set_cookie_jar(const std::string& j) { cookie_jar_ = j; }
    void set_ssl_cacert(const std::string& f) { ssl_cacert_ = f; }
    void set_ssl_capath(const std::string& d) { ssl_capath_ = d; }
    void set_ssl_cert(const std::string& f) { ssl_cert_ = f; }
    void set_ssl_cert_type(const std::string& t) {
        static const char* const valid[] = { "pem", "der", 0 };
        ssl_cert_type_ = detail::pick_(t, valid, "");
    }
    void set_ssl_key(const std::string& f)  { ssl_key_ = f; }
    void set_ssl_key_type(const std::string& t) {
        static const char* const valid[] = { "pem", "der", 0 };
        ssl_key_type_ = detail::pick_(t, valid, "");
    }
    void set_ssl_key_password(const std::string& p) { ssl_key_password_ = p; }
    void set_ssl_version(const std::string& v) {
        static const char* const valid[] = {
            "default", "tlsv1", "tlsv1.0", "tlsv1.1", "tlsv1.2", "tlsv1.3", 0
        };
        ssl_version_ = detail::pick_(v, valid, "");
    }
    void set_insecure(bool on)              { insecure_ = on; }
    void set_no_parallel_downloads(bool on) { no_parallel_downloads_ = on; }

    bool no_network() const                 { return no_network_; }
    bool no_redirects() const               { return no_redirects_; }
    const std::string& auth_user() const    { return auth_user_; }
    const std::string& auth_password() const { return auth_password_; }
    const std::string& auth_server() const  { return auth_server_; }
    const std::string& auth_scheme() const  { return auth_scheme_; }
    const std::vector<std::string>& auth_methods() const { return auth_methods_; }
    bool no_auth_preemptive() const         { return no_auth_preemptive_; }
    const std::string& http_proxy() const   { return http_proxy_; }
    int http_timeout() const                { return http_timeout_; }
    const std::string& cookie() const       { return cookie_; }
    const std::vector<std::string>& cookies() const { return cookies_; }
    const std::string& cookie_jar() const   { return cookie_jar_; }
    const std::string& ssl_cacert() const   { return ssl_cacert_; }
    const std::string& ssl_capath() const   { return ssl_capath_; }
    const std::string& ssl_cert() const     { return ssl_cert_; }
    const std::string& ssl_cert_type() const { return ssl_cert_type_; }
    const std::string& ssl_key() const      { return ssl_key_; }
    const std::string& ssl_key_type() const { return ssl_key_type_; }
    const std::string& ssl_key_password() const { return ssl_key_password_; }
    const std::string& ssl_version() const  { return ssl_version_; }
    bool insecure() const                   { return insecure_; }
    bool no_parallel_downloads() const      { return no_parallel_downloads_; }

    // ---- JavaScript ----
    void set_javascript(bool on)            { javascript_ = on; }
    void add_script(const std::string& js)  { scripts_.push_back(js); }
    void clear_scripts()                    { scripts_.clear(); }
    void set_max_passes(int n) {
        if (n < 1) throw configuration_error("invalid maxPasses value (must be > 0)");
        max_passes_ = n;
    }

    bool javascript() const                 { return javascript_; }
    const std::vector<std::string>& scripts() const { return scripts_; }
    int max_passes() const                  { return max_passes_; }

    // ---- CSS ----
    void add_style_sheet(const std::string& css) { style_sheets_.push_back(css); }
    void clear_style_sheets()               { style_sheets_.clear(); }
    void set_media(const std::string& m)    { media_ = m; }
    void set_page_size(const std::string& s) { page_size_ = s; }
    void set_page_margin(const std::string& m) { page_margin_ = m; }
    void set_no_author_style(bool on)       { no_author_style_ = on; }
    void set_no_default_style(bool on)      { no_default_style_ = on; }

    const std::vector<std::string>& style_sheets() const { return style_sheets_; }
    const std::string& media() const        { return media_; }
    const std::string& page_size() const    { return page_size_; }
    const std::string& page_margin() const  { return page_margin_; }
    bool no_author_style() const            { return no_author_style_; }
    bool no_default_style() const           { return no_default_style_; }

    // ---- PDF output ----
    void set_pdf_id(const std::string& id)  { pdf_id_ = id; }
    void set_pdf_script(const std::string& s) { pdf_script_ = s; }
    // Events: will-close, will-save, did-save, will-print, did-print.
    // Adding an event twice replaces its script in place.
    void add_pdf_event_script(const std::string& event, const std::string& script) {
        static const char* const valid[] = {
            "will-close", "will-save", "did-save", "will-print", "did-print", 0
        };
        std::string lower = detail::lower_(event);
        if (!detail::one_of_(lower, valid)) throw configuration_error("invalid event value: " + event);
        for (size_t i = 0; i < pdf_event_scripts_.size(); ++i) {
            if (pdf_event_scripts_[i].first == lower) {
                pdf_event_scripts_[i].second = script;
                return;
            }
        }
        pdf_event_scripts_.push_back(event_script_t(lower, script));
    }
    void clear_pdf_event_scripts()          { pdf_event_scripts_.clear(); }
    void set_pdf_lang(const std::string& l) { pdf_lang_ = l; }
    void set_pdf_profile(const std::string& p) {
        static const char* const valid[] = {
            "pdf/a-1a", "pdf/a-1a+pdf/ua-1", "pdf/a-1b",
            "pdf/a-2a", "pdf/a-2a+pdf/ua-1", "pdf/a-2b",
            "pdf/a-3a", "pdf/a-3a+pdf/ua-1", "pdf/a-3b",
            "pdf/ua-1",
            "pdf/x-1a:2001", "pdf/x-1a:2003", "pdf/x-3:2002", "pdf/x-3:2003", "pdf/x-4",
            0
        };
        pdf_profile_ = detail::pick_(p, valid, "");
    }
    // ICC profile; convert_colors only takes effect together with a profile.
    void set_pdf_output_intent(const std::string& icc, bool convert_colors = false) {
        pdf_output_intent_ = icc;
        convert_colors_ = convert_colors;
    }
    void add_file_attachment(const std::string& f) { file_attachments_.push_back(f); }
    void clear_file_attachments()           { file_attachments_.clear(); }
    void set_no_artificial_fonts(bool on)   { no_artificial_fonts_ = on; }
    void set_embed_fonts(bool on)           { embed_fonts_ = on; }
    void set_subset_fonts(bool on)          { subset_fonts_ = on; }
    void set_system_fonts(bool on)          { system_fonts_ = on; }
    void set_force_identity_encoding(bool on) { force_identity_encoding_ = on; }
    void set_compress(bool on)              { compress_ = on; }
    void set_no_object_streams(bool on)     { no_object_streams_ = on; }
    void set_fallback_cmyk_profile(const std::string& p) { fallback_cmyk_profile_ = p; }
    void set_tagged_pdf(bool on)            { tagged_pdf_ = on; }
    void set_pdf_forms(bool on)             { pdf_forms_ = on; }
    void set_css_dpi(int dpi) {
        if (dpi < 1) throw configuration_error("invalid cssDpi value (must be > 0)");
        css_dpi_ = dpi;
    }

    const std::string& pdf_id() const       { return pdf_id_; }
    const std::string& pdf_script() const   { return pdf_script_; }
    const std::vector<event_script_t>& pdf_event_scripts() const { return pdf_event_scripts_; }
    const std::string& pdf_lang() const     { return pdf_lang_; }
    const std::string& pdf_profile() const  { return pdf_profile_; }
    const std::string& pdf_output_intent() const { return pdf_output_intent_; }
    bool convert_colors() const             { return convert_colors_; }
    const std::vector<std::string>& file_attachments() const { return file_attachments_; }
    bool no_artificial_fonts() const        { return no_artificial_fonts_; }
    bool embed_fonts() const                { return embed_fonts_; }
    bool subset_fonts() const               { return subset_fonts_; }
    bool system_fonts() const               { return system_fonts_; }
    bool force_identity_encoding() const    { return force_identity_encoding_; }
    bool compress() const                   { return compress_; }
    bool no_object_streams() const          { return no_object_streams_; }
    const std::string& fallback_cmyk_profile() const { return fallback_cmyk_profile_; }
    bool tagged_pdf() const                 { return tagged_pdf_; }
    bool pdf_forms() const                  { return pdf_forms_; }
    int css_dpi() const                     { return css_dpi_; }

    // ---- PDF metadata ----
    void set_pdf_title(const std::string& v)    { pdf_title_ = v; }
    void set_pdf_subject(const std::string& v)  { pdf_subject_ = v; }
    void set_pdf_author(const std::string& v)   { pdf_author_ = v; }
    void set_pdf_keywords(const std::string& v) { pdf_keywords_ = v; }
    void set_pdf_creator(const std::string& v)  { pdf_creator_ = v; }
    void set_pdf_xmp(const std::string& v)      { pdf_xmp_ = v; }

    const std::string& pdf_title() const    { return pdf_title_; }
    const std::string& pdf_subject() const  { return pdf_subject_; }
    const std::string& pdf_author() const   { return pdf_author_; }
    const std::string& pdf_keywords() const { return pdf_keywords_; }
    const std::string& pdf_creator() const  { return pdf_creator_; }
    const std::string& pdf_xmp() const      { return pdf_xmp_; }

    // ---- PDF encryption ----
    void set_encrypt(bool on)               { encrypt_ = on; }
    // Also enables encryption. key_bits must be 40 or 128; on error nothing
    // changes.
    void set_encrypt_info(int key_bits,
                          const std::string& user_password,
                          const std::string& owner_password,
                          bool disallow_print = false,
                          bool disallow_modify = false,
                          bool disallow_copy = false,
                          bool disallow_annotate = false,
                          bool allow_copy_for_accessibility = false,
                          bool allow_assembly = false) {
        if (key_bits != 40 && key_bits != 128) {
            std::ostringstream oss;
            oss << "Invalid value for keyBits: " << key_bits << " (must be 40 or 128)";
            throw configuration_error(oss.str());
        }
        encrypt_info info;
        info.key_bits = key_bits;
        info.user_password = user_password;
        info.owner_password = owner_password;
        info.disallow_print = disallow_print;
        info.disallow_modify = disallow_modify;
        info.disallow_copy = disallow_copy;
        info.disallow_annotate = disallow_annotate;
        info.allow_copy_for_accessibility = allow_copy_for_accessibility;
        info.allow_assembly = allow_assembly;
        encrypt_info_ = info;
        has_encrypt_info_ = true;
        encrypt_ = true;
    }

    bool encrypt() const                    { return encrypt_; }
    bool has_encrypt_info() const           { return has_encrypt_info_; }
    const encrypt_info& encryption() const  { return encrypt_info_; }

    // ---- raster output ----
    // "auto" | "png" | "jpeg"; anything else becomes "auto"
    void set_raster_format(const std::string& f) {
        static const char* const valid[] = { "auto", "png", "jpeg", 0 };
        raster_format_ = detail::pick_(f, valid, "auto");
    }
    void set_raster_jpeg_quality(int q) {
        if (q < 0 || q > 100) throw configuration_error("invalid rasterJpegQuality value (must be [0, 100])");
        raster_jpeg_quality_ = q;
    }
    void set_raster_page(int page) {
        if (page < 1) throw configuration_error("invalid rasterPage value (must be > 0)");
        raster_page_ = page;
    }
    void set_raster_dpi(int dpi) {
        if (dpi < 1) throw configuration_error("invalid rasterDpi value (must be > 0)");
        raster_dpi_ = dpi;
    }
    void set_raster_threads(int n)          { raster_threads_ = n; }
    // "white" | "transparent"; anything else clears it
    void set_raster_background(const std::string& bg) {
        static const char* const valid[] = { "white", "transparent", 0 };
        raster_background_ = detail::pick_(bg, valid, "");
    }

    const std::string& raster_format() const { return raster_format_; }
    int raster_jpeg_quality() const         { return raster_jpeg_quality_; }
    int raster_page() const                 { return raster_page_; }
    int raster_dpi() const                  { return raster_dpi_; }
    int raster_threads() const              { return raster_threads_; }
    const std::string& raster_background() const { return raster_background_; }

    // ---- license ----
    void set_license_file(const std::string& f) { license_file_ = f; }
    void set_license_key(const std::string& k)  { license_key_ = k; }

    const std::string& license_file() const { return license_file_; }
    const std::string& license_key() const  { return license_key_; }

    // ---- fail-safes ----
    void set_fail_dropped_content(bool on)       { fail_dropped_content_ = on; }
    void set_fail_missing_resources(bool on)     { fail_missing_resources_ = on; }
    void set_fail_stripped_transparency(bool on) { fail_stripped_transparency_ = on; }
    void set_fail_missing_glyphs(bool on)        { fail_missing_glyphs_ = on; }
    void set_fail_pdf_profile_error(bool on)     { fail_pdf_profile_error_ = on; }
    void set_fail_pdf_tag_error(bool on)         { fail_pdf_tag_error_ = on; }
    void set_fail_invalid_license(bool on)       { fail_invalid_license_ = on; }
    void set_fail_safe(bool on) {
        fail_dropped_content_ = on;
        fail_missing_resources_ = on;
        fail_stripped_transparency_ = on;
        fail_missing_glyphs_ = on;
        fail_pdf_profile_error_ = on;
        fail_pdf_tag_error_ = on;
        fail_invalid_license_ = on;
    }

    bool fail_dropped_content() const       { return fail_dropped_content_; }
    bool fail_missing_resources() const     { return fail_missing_resources_; }
    bool fail_stripped_transparency() const { return fail_stripped_transparency_; }
    bool fail_missing_glyphs() const        { return fail_missing_glyphs_; }
    bool fail_pdf_profile_error() const     { return fail_pdf_profile_error_; }
    bool fail_pdf_tag_error() const         { return fail_pdf_tag_error_; }
    bool fail_invalid_license() const       { return fail_invalid_license_; }

    // ---- free-form ----
    // Extra engine options, whitespace separated, appended last as given.
    void set_options(const std::string& extra) {
        std::istringstream iss(extra);
        std::vector<std::string> tokens;
        std::string tok;
        while (iss >> tok) tokens.push_back(tok);
        extra_options_.swap(tokens);
    }
    const std::vector<std::string>& extra_options() const { return extra_options_; }

private:
    static const char* const* auth_methods_valid_() {
        static const char* const valid[] = { "basic", "digest", "ntlm", "negotiate", 0 };
        return valid;
    }

    std::string exe_path_;

    bool verbose_;
    bool debug_;
    std::string log_file_;
    bool no_warn_css_unknown_;
    bool no_warn_css_unsupported_;

    std::string input_type_;
    std::string base_url_;
    std::vector<remap_t> remaps_;
    std::string file_root_;
    bool xinclude_;
    bool xml_external_entities_;
    bool iframes_;
    bool no_local_files_;

    bool no_network_;
    bool no_redirects_;
    std::string auth_user_;
    std::string auth_password_;
    std::string auth_server_;
    std::string auth_scheme_;
    std::vector<std::string> auth_methods_;
    bool no_auth_preemptive_;
    std::string http_proxy_;
    int http_timeout_;
    std::string cookie_;
    std::vector<std::string> cookies_;
    std::string cookie_jar_;
    std::string ssl_cacert_;
    std::string ssl_capath_;
    std::string ssl_cert_;
    std::string ssl_cert_type_;
    std::string ssl_key_;
    std::string ssl_key_type_;
    std::string ssl_key_password_;
    std::string ssl_version_;
    bool insecure_;
    bool no_parallel_downloads_;

    bool javascript_;
    std::vector<std::string> scripts_;
    int max_passes_;

    std::vector<std::string> style_sheets_;
    std::string media_;
    std::string page_size_;
    std::string page_margin_;
    bool no_author_style_;
    bool no_default_style_;

    std::string pdf_id_;
    std::string pdf_script_;
    std::vector<event_script_t> pdf_event_scripts_;
    std::string pdf_lang_;
    std::string pdf_profile_;
    std::string pdf_output_intent_;
    bool convert_colors_;
    std::vector<std::string> file_attachments_;
    bool no_artificial_fonts_;
    bool embed_fonts_;
    bool subset_fonts_;
    bool system_fonts_;
    bool force_identity_encoding_;
    bool compress_;
    bool no_object_streams_;
    std::string fallback_cmyk_profile_;
    bool tagged_pdf_;
    bool pdf_forms_;
    int css_dpi_;

    std::string pdf_title_;
    std::string pdf_subject_;
    std::string pdf_author_;
    std::string pdf_keywords_;
    std::string pdf_creator_;
    std::string pdf_xmp_;

    bool encrypt_;
    bool has_encrypt_info_;
    encrypt_info encrypt_info_;

    std::string raster_format_;
    int raster_jpeg_quality_;
    int raster_page_;
    int raster_dpi_;
    int raster_threads_;
    std::string raster_background_;

    std::string license_file_;
    std::string license_key_;

    bool fail_dropped_content_;
    bool fail_missing_resources_;
    bool fail_stripped_transparency_;
    bool fail_missing_glyphs_;
    bool fail_pdf_profile_error_;
    bool fail_pdf_tag_error_;
    bool fail_invalid_license_;

    std::vector<std::string> extra_options_;
};

} // namespace prince

#endif // PRINCE_OPTIONS_HPP
