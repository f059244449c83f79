#ifndef PRINCE_ESCAPE_HPP
#define PRINCE_ESCAPE_HPP

#include <string>

namespace prince {

// POSIX shells: wrap in single quotes, each embedded ' becomes '\''.
// Safe for any byte sequence, so the cmd.exe flags do not apply here.
inline std::string escape_posix(const std::string& arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (std::string::size_type i = 0; i < arg.size(); ++i) {
        if (arg[i] == '\'') out += "'\\''";
        else out.push_back(arg[i]);
    }
    out.push_back('\'');
    return out;
}

namespace detail {

// true when arg holds a %name% expansion (at least one char between the %s)
inline bool has_percent_expansion_(const std::string& arg) {
    std::string::size_type pos = arg.find('%');
    while (pos != std::string::npos) {
        std::string::size_type next = arg.find('%', pos + 1);
        if (next == std::string::npos) return false;
        if (next > pos + 1) return true;
        pos = next;
    }
    return false;
}

} // namespace detail

// Windows command line / cmd.exe rules.
//
//   meta   - additionally caret-escape cmd.exe meta characters
//   module - arg is the executable name; caret-escaping a quoted module name
//            would split it, so it is only quoted in that case
//
// Based on the winbox-args algorithm:
// MIT Licensed (c) John Stevenson <john-stevenson@blueyonder.co.uk>
// See https://github.com/johnstevenson/winbox-args for more information.
inline std::string escape_cmd(const std::string& raw, bool meta = true, bool module = false) {
    bool quote = raw.empty() || raw.find_first_of(" \t") != std::string::npos;

    // n backslashes before a double quote -> 2n+1 backslashes and the quote
    std::string arg;
    arg.reserve(raw.size() + 8);
    size_t dquotes = 0;
    size_t bs = 0;
    for (std::string::size_type i = 0; i < raw.size(); ++i) {
        const char c = raw[i];
        if (c == '\\') { ++bs; continue; }
        if (c == '"') {
            arg.append(bs * 2 + 1, '\\');
            ++dquotes;
        } else {
            arg.append(bs, '\\');
        }
        bs = 0;
        arg.push_back(c);
    }
    arg.append(bs, '\\');

    if (meta) {
        meta = dquotes > 0 || detail::has_percent_expansion_(arg);
        if (!meta) {
            // these are harmless once inside double quotes
            quote = quote || arg.find_first_of("^&|<>()") != std::string::npos;
        } else if (module && dquotes == 0 && quote) {
            meta = false;
        }
    }

    if (quote) {
        // trailing backslashes must not escape the closing quote
        std::string::size_type end = arg.find_last_not_of('\\');
        size_t trailing = (end == std::string::npos) ? arg.size() : arg.size() - end - 1;
        arg.append(trailing, '\\');
        arg.insert(arg.begin(), '"');
        arg.push_back('"');
    }

    if (meta) {
        std::string out;
        out.reserve(arg.size() * 2);
        for (std::string::size_type i = 0; i < arg.size(); ++i) {
            switch (arg[i]) {
            case '"': case '^': case '&': case '|':
            case '<': case '>': case '(': case ')': case '%':
                out.push_back('^');
                break;
            default:
                break;
            }
            out.push_back(arg[i]);
        }
        arg.swap(out);
    }

    return arg;
}

// Escape one argument for the command line of the current platform.
inline std::string escape_arg(const std::string& raw, bool meta = true, bool module = false) {
#if defined(_WIN32)
    return escape_cmd(raw, meta, module);
#else
    (void)meta;
    (void)module;
    return escape_posix(raw);
#endif
}

} // namespace prince

#endif // PRINCE_ESCAPE_HPP
