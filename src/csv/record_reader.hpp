#pragma once
#include "util/errors.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bprof {

// RFC4180-ish record splitter over an in-memory buffer.
// - Delimiters and newlines inside quotes are literal; "" inside quotes is one quote.
// - CRLF, LF and lone CR all end a record.
// - Lines with no characters at all are skipped.
class record_reader {
public:
    record_reader(std::string_view data, char delimiter, char quote)
        : data_(data), delim_(delimiter), quote_(quote) {}

    // Fills `fields` with the next record; false once the buffer is exhausted.
    bool next(std::vector<std::string>& fields) {
        fields.clear();
        // skip blank lines
        while (pos_ < data_.size() && (data_[pos_] == '\n' || data_[pos_] == '\r')) {
            consume_newline();
        }
        if (pos_ >= data_.size()) return false;

        record_line_ = line_;
        std::string cur;
        bool inq = false;
        while (pos_ < data_.size()) {
            const char c = data_[pos_];
            if (inq) {
                if (c == quote_) {
                    if (pos_ + 1 < data_.size() && data_[pos_ + 1] == quote_) { cur.push_back(quote_); pos_ += 2; }
                    else { inq = false; ++pos_; }
                } else {
                    if (c == '\n' || (c == '\r' && (pos_ + 1 >= data_.size() || data_[pos_ + 1] != '\n'))) ++line_;
                    cur.push_back(c);
                    ++pos_;
                }
                continue;
            }
            if (c == quote_)      { inq = true; ++pos_; }
            else if (c == delim_) { fields.push_back(std::move(cur)); cur.clear(); ++pos_; }
            else if (c == '\n' || c == '\r') { consume_newline(); break; }
            else { cur.push_back(c); ++pos_; }
        }
        if (inq) {
            throw dataset_error("unterminated quoted field starting at line " + std::to_string(record_line_));
        }
        fields.push_back(std::move(cur));
        ++records_;
        return true;
    }

    // 1-based line on which the last returned record started.
    std::size_t line() const noexcept { return record_line_; }
    std::size_t records() const noexcept { return records_; }

private:
    void consume_newline() {
        if (data_[pos_] == '\r' && pos_ + 1 < data_.size() && data_[pos_ + 1] == '\n') ++pos_;
        ++pos_;
        ++line_;
    }

    std::string_view data_;
    char delim_;
    char quote_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t record_line_ = 0;
    std::size_t records_ = 0;
};

}
