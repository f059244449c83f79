#ifndef PRINCE_MESSAGES_HPP
#define PRINCE_MESSAGES_HPP

#include <string>
#include <vector>

namespace prince {

struct engine_message {
    enum severity_t { ERR, WRN, INF, DBG };

    severity_t severity;
    std::string location; // filename / line, may be empty
    std::string text;

    engine_message() : severity(DBG) {}
    engine_message(severity_t sev, const std::string& loc, const std::string& txt)
    : severity(sev), location(loc), text(txt) {}

    // "err" / "wrn" / "inf" / "dbg"
    const char* tag() const {
        switch (severity) {
        case ERR: return "err";
        case WRN: return "wrn";
        case INF: return "inf";
        default:  return "dbg";
        }
    }
};

// One "dat|" record, passed through untouched.
struct engine_data {
    std::string key;
    std::string value;

    engine_data() {}
    engine_data(const std::string& k, const std::string& v) : key(k), value(v) {}
};

struct conversion_outcome {
    bool success;
    std::vector<engine_message> messages; // emission order
    std::vector<engine_data> data;

    conversion_outcome() : success(false) {}
};

inline bool operator==(const engine_message& a, const engine_message& b) {
    return a.severity == b.severity && a.location == b.location && a.text == b.text;
}
inline bool operator==(const engine_data& a, const engine_data& b) {
    return a.key == b.key && a.value == b.value;
}

} // namespace prince

#endif // PRINCE_MESSAGES_HPP
