/**
 * @file record_reader.h
 * @brief Streaming, quote-aware record splitter.
 *
 * Reads one record at a time from an std::istream. A record ends at LF, CRLF
 * or CR outside quotes; blank lines are skipped and do not count as records.
 * A field starting with the quote character is quoted until the closing
 * quote; with double_quote a doubled quote is a literal quote, otherwise
 * escape_char escapes the next character. Characters after a closing quote
 * are appended to the field as-is.
 */

#ifndef CSVPROF_RECORD_READER_H
#define CSVPROF_RECORD_READER_H

#include "dialect.h"
#include "error.h"

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace csvprof {

class RecordReader {
public:
    /**
     * @param in      Source stream; must outlive the reader. Not closed.
     * @param dialect Delimiter and quoting rules
     * @param errors  Optional sink for UNCLOSED_QUOTE warnings
     */
    RecordReader(std::istream& in, const Dialect& dialect,
                 ErrorCollector* errors = nullptr);

    /**
     * @brief Read the next record.
     * @param fields Replaced with the record's fields (quotes removed)
     * @return false at end of input, fields is then empty
     */
    bool next(std::vector<std::string>& fields);

    /// Per-field flags for the last record: true if the field was quoted
    const std::vector<bool>& quoted() const { return quoted_; }

    /// Bytes of the last record, excluding its line terminator
    size_t record_length() const { return record_length_; }

    /// Records returned so far
    size_t records_read() const { return records_; }

    /// Bytes consumed so far
    size_t bytes_read() const { return offset_; }

private:
    std::istream& in_;
    Dialect dialect_;
    ErrorCollector* errors_;
    std::vector<bool> quoted_;
    size_t record_length_ = 0;
    size_t records_ = 0;
    size_t offset_ = 0;
};

} // namespace csvprof

#endif // CSVPROF_RECORD_READER_H
