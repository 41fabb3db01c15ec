#include "record_reader.h"

#include <utility>

namespace csvprof {

RecordReader::RecordReader(std::istream& in, const Dialect& dialect,
                           ErrorCollector* errors)
    : in_(in), dialect_(dialect), errors_(errors) {}

bool RecordReader::next(std::vector<std::string>& fields) {
    enum class State { START_FIELD, UNQUOTED, QUOTED, QUOTE_IN_QUOTED };

    fields.clear();
    quoted_.clear();
    record_length_ = 0;

    std::streambuf* sb = in_.rdbuf();
    if (sb == nullptr || !in_.good()) {
        return false;
    }

    const char delim = dialect_.delimiter;
    const char quote = dialect_.quote_char;
    const size_t record_offset = offset_;

    State state = State::START_FIELD;
    bool field_quoted = false;
    bool has_content = false;
    std::string field;

    auto finish_field = [&]() {
        fields.push_back(std::move(field));
        quoted_.push_back(field_quoted);
        field.clear();
        field_quoted = false;
    };

    while (true) {
        int ch = sb->sbumpc();
        if (ch == std::char_traits<char>::eof()) {
            in_.setstate(std::ios::eofbit);
            if (!has_content) {
                return false;
            }
            if (state == State::QUOTED && errors_ != nullptr) {
                errors_->add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::WARNING,
                                   records_ + 1, fields.size() + 1, record_offset,
                                   "quoted field not closed before end of file",
                                   field.substr(0, 32));
            }
            finish_field();
            ++records_;
            return true;
        }
        ++offset_;
        char c = static_cast<char>(ch);

        if (state == State::QUOTED) {
            ++record_length_;
            if (!dialect_.double_quote && c == dialect_.escape_char && c != quote) {
                int escaped = sb->sbumpc();
                if (escaped != std::char_traits<char>::eof()) {
                    ++offset_;
                    ++record_length_;
                    field += static_cast<char>(escaped);
                }
                continue;
            }
            if (c == quote) {
                state = State::QUOTE_IN_QUOTED;
            } else {
                field += c;
            }
            continue;
        }

        if (state == State::QUOTE_IN_QUOTED) {
            if (c == quote && dialect_.double_quote) {
                ++record_length_;
                field += c;
                state = State::QUOTED;
                continue;
            }
            state = State::UNQUOTED;
        }

        if (c == '\n' || c == '\r') {
            if (c == '\r' && sb->sgetc() == '\n') {
                sb->sbumpc();
                ++offset_;
            }
            if (!has_content) {
                continue;  // blank line
            }
            finish_field();
            ++records_;
            return true;
        }

        has_content = true;
        ++record_length_;

        if (c == delim) {
            finish_field();
            state = State::START_FIELD;
        } else if (state == State::START_FIELD && quote != '\0' && c == quote) {
            field_quoted = true;
            state = State::QUOTED;
        } else {
            field += c;
            state = State::UNQUOTED;
        }
    }
}

} // namespace csvprof
