#ifndef PRINCE_LOG_PARSER_HPP
#define PRINCE_LOG_PARSER_HPP

#include <istream>
#include <string>
#include <vector>

#include "messages.hpp"

namespace prince {

// State machine over the engine's diagnostic stream.
//
//   fin|<outcome>                 terminal
//   msg|<sev>|<location>|<text>   text may contain '|'
//   dat|<key>|<value>             value may contain '|'
//
// Anything else is an unstructured diagnostic: the two "prince: " prefixes
// below map to warning/error, the rest becomes a debug message holding the
// raw line.
class log_parser {
public:
    enum state_t { ACCUMULATING, DONE };

    log_parser() : state_(ACCUMULATING) {}

    // One line, with or without its terminator. Returns false once the
    // parser is DONE; the line is then ignored.
    bool feed(const std::string& raw) {
        if (state_ == DONE) return false;

        std::string line = chomp_(raw);
        std::string tag = line.substr(0, 4);

        if (tag == "fin|") {
            outcome_ = rtrim_(line.substr(4));
            state_ = DONE;
        } else if (tag == "msg|") {
            parse_msg_(rtrim_(line.substr(4)));
        } else if (tag == "dat|") {
            parse_dat_(rtrim_(line.substr(4)));
        } else {
            parse_fallback_(line);
        }
        return true;
    }

    // End of stream. Without a fin| line the outcome stays empty.
    void finish() { state_ = DONE; }

    // Reads the whole stream; stops consuming at fin|.
    conversion_outcome parse(std::istream& is) {
        std::string line;
        while (std::getline(is, line)) {
            if (!feed(line) || done()) break;
        }
        finish();
        conversion_outcome out;
        out.success = succeeded();
        out.messages = messages_;
        out.data = data_;
        return out;
    }

    bool done() const { return state_ == DONE; }
    state_t state() const { return state_; }

    // "success", "failure", anything else the engine wrote, or empty when
    // the stream ended before fin|.
    const std::string& outcome() const { return outcome_; }
    bool succeeded() const { return outcome_ == "success"; }

    const std::vector<engine_message>& messages() const { return messages_; }
    const std::vector<engine_data>& data() const { return data_; }

private:
    state_t state_;
    std::string outcome_;
    std::vector<engine_message> messages_;
    std::vector<engine_data> data_;

    static std::string chomp_(const std::string& s) {
        std::string::size_type n = s.size();
        if (n && s[n - 1] == '\n') --n;
        if (n && s[n - 1] == '\r') --n;
        return s.substr(0, n);
    }

    static std::string rtrim_(const std::string& s) {
        std::string::size_type n = s.find_last_not_of(" \t\r\n\v\f");
        return n == std::string::npos ? std::string() : s.substr(0, n + 1);
    }

    static engine_message::severity_t severity_(const std::string& tag) {
        if (tag == "err") return engine_message::ERR;
        if (tag == "wrn") return engine_message::WRN;
        if (tag == "inf") return engine_message::INF;
        return engine_message::DBG;
    }

    void parse_msg_(const std::string& body) {
        std::string::size_type p1 = body.find('|');
        if (p1 == std::string::npos) {
            messages_.push_back(engine_message(severity_(body), "", ""));
            return;
        }
        std::string::size_type p2 = body.find('|', p1 + 1);
        std::string sev = body.substr(0, p1);
        if (p2 == std::string::npos) {
            messages_.push_back(engine_message(severity_(sev), body.substr(p1 + 1), ""));
            return;
        }
        messages_.push_back(engine_message(severity_(sev),
                                           body.substr(p1 + 1, p2 - p1 - 1),
                                           body.substr(p2 + 1)));
    }

    void parse_dat_(const std::string& body) {
        std::string::size_type p = body.find('|');
        if (p == std::string::npos) data_.push_back(engine_data(body, ""));
        else                        data_.push_back(engine_data(body.substr(0, p), body.substr(p + 1)));
    }

    void parse_fallback_(const std::string& line) {
        static const std::string warning_prefix = "prince: warning: ";
        static const std::string error_prefix = "prince: error: ";

        if (line.compare(0, warning_prefix.size(), warning_prefix) == 0) {
            messages_.push_back(engine_message(engine_message::WRN, "", line.substr(warning_prefix.size())));
        } else if (line.compare(0, error_prefix.size(), error_prefix) == 0) {
            messages_.push_back(engine_message(engine_message::ERR, "", line.substr(error_prefix.size())));
        } else {
            messages_.push_back(engine_message(engine_message::DBG, "", line));
        }
    }
};

} // namespace prince

#endif // PRINCE_LOG_PARSER_HPP
