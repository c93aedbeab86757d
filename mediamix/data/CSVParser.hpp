#pragma once
#include <eris/noncopyable.hpp>
#include <Eigen/Core>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mediamix { namespace data {

/** Primitive comma-separated-value file parser for numeric model inputs.  This is far from a
 * complete CSV parser: quoted fields are not supported and every field not listed in skip() must
 * hold a number.
 *
 * The intended basic usage is:
 *
 *     CSVParser csv("media.csv");
 *     for (auto &row : csv) {
 *         // Do something with row (which is a `const Eigen::RowVectorXd`)
 *     }
 *
 *     or, equivalently:
 *
 *     CSVParser csv("media.csv");
 *     while (csv.readRow()) {
 *         // Do something with csv.row()
 *     }
 *
 * The first line of the file is the header.  Lines beginning with # and empty lines are skipped.
 */
class CSVParser : private eris::noncopyable {
    public:
        /// Not default constructible
        CSVParser() = delete;
        /** Opens a csv file for parsing and reads its header.
         *
         * \param filename the file to read
         * \throws std::ios_base::failure for underlying IO errors
         */
        explicit CSVParser(const std::string &filename);

        /** The set of (non-numeric) header fields to skip.  The default contains "date" and
         * "week", the usual time index columns of media data.
         */
        const std::unordered_set<std::string>& skip() const { return skip_; }

        /** Adds the given field name to the list of header fields to skip, if not already present. */
        void skip(const std::string &name);

        /** Removes the given field name from the list of header fields to skip, if present. */
        void dontSkip(const std::string &name);

        /** Returns the header names read during construction, including skipped fields. */
        const std::vector<std::string>& header() const { return header_; }

        /** Returns the field names corresponding to the values of row(): header() without the
         * skipped fields.
         */
        const std::vector<std::string>& fields() const { return fields_; }

        /** Reads the next line of the CSV file, storing it in row().  Returns true if a row was
         * read, false if the end of the file was hit.
         *
         * \throws std::ios_base::failure if a read error occurs
         * \throws std::invalid_argument if the number of fields differs from the header, or if one
         * of the fields to parse cannot be converted to a double value.
         */
        bool readRow();

        /** Returns true if the parser has reached the end of the file. */
        bool eof() const { return f_.eof(); }

        /** The line number of the most-recently-read row (the header is line 1). */
        size_t lineNumber() const { return lineno_; }

        /** Accesses the most-recently-read row of the file.  If no row has yet been read, this will
         * be an empty vector.
         */
        const Eigen::RowVectorXd& row() const { return row_; }

        /** Accesses any skipped fields in the most-recently-read row. */
        const std::unordered_map<std::string, std::string>& rowSkipped() const { return row_skipped_; }

        // forward declaration
        class iterator;

        /// Returns an iterator that reads through the file
        iterator begin();

        /// Returns a past-the-end iterator
        iterator end();

    private:
        // Split a string by , and return a vector of elements
        static std::vector<std::string> split(const std::string &csr);

        void updateFields(); // regenerate fields, omitting things in skip_
        std::unordered_set<std::string> skip_{{"date", "week"}};
        std::vector<std::string> header_;
        std::vector<std::string> fields_;
        std::fstream f_;
        size_t lineno_; // Tracks the current line number
        Eigen::RowVectorXd row_; // The most-recently-read row (reused)
        std::unordered_map<std::string, std::string> row_skipped_;
};

/** Iterator class that allows iterating through the file.  The iterator satisfies the requirements
 * of an InputIterator. */
class CSVParser::iterator final : public std::iterator<std::input_iterator_tag, const Eigen::RowVectorXd, long> {
    public:
        /// Dereferences the iterator, returning the current CSVParser row.
        reference operator*() { return csv_.row(); }

        /// Dereferences the iterator, returning the current CSVParser row pointer.
        pointer operator->() { return &csv_.row(); }

        /** Increments the iterator, reading the next row of the file.  Previous iterators are
         * invalidated.
         */
        iterator& operator++() { end_ = not csv_.readRow(); return *this; }

        /** Return true if both iterators refer to the same CSVParser and are both (or neither)
         * past-the-end.
         */
        bool operator==(const iterator &other) {
            return &csv_ == &(other.csv_) and end_ == other.end_;
        }

        /** Returns the negation of the == operator. */
        bool operator!=(const iterator &other) { return !(*this == other); }

    private:
        iterator() = delete;
        CSVParser &csv_;
        bool end_; // true if this is a past-the-end iterator
        iterator(CSVParser &csv, bool end) : csv_(csv), end_(end) { if (!end_) end_ = not csv_.readRow(); }
        friend class CSVParser;
};

}}
