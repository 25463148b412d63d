/**
 * @file chunk_iterator.hh
 * @brief Sequential traversal of back-to-back chunk records in a buffer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk_iterator
     * @brief Walks consecutive chunk records stored in one byte buffer
     *
     * The buffer must start with a record; any file signature has to be
     * skipped by the caller. Each step advances by exactly the
     * serialized size of the current record. The buffer is not copied
     * and must outlive the iterator.
     *
     * In strict mode every parse error propagates. In lenient mode records
     * whose type is invalid or whose CRC does not match are reported via
     * parse_options::on_warning and skipped.
     */
    class PNGCHUNK_EXPORT chunk_iterator {
    public:
        chunk_iterator(const std::byte* data, std::size_t size);
        chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options);
        explicit chunk_iterator(const std::vector<std::byte>& buffer);
        chunk_iterator(const std::vector<std::byte>& buffer, const parse_options& options);

        /**
         * @brief Current record
         * @throws std::bad_optional_access when the iterator is at the end
         */
        const chunk& current() const { return m_current.value(); }

        /**
         * @brief Buffer offset of the current record's length field
         *
         * After a parse error this is the offset of the failing record.
         */
        std::size_t offset() const { return m_offset; }

        /**
         * @brief Advance to the next record
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        void advance();
        void read_record();
        void skip_damaged(const parse_error& e);

        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_offset;
        std::optional<chunk> m_current;
        bool m_ended;

        parse_options m_options;
        // m_options without the warning callback, used for single records
        parse_options m_record_options;
    };

    /**
     * @brief Parse every record in a buffer
     * @param buffer Back-to-back chunk records
     * @param options Parse options for controlling parsing behavior
     * @return Records in buffer order
     */
    PNGCHUNK_EXPORT std::vector<chunk> parse_chunks(const std::vector<std::byte>& buffer, const parse_options& options);
    PNGCHUNK_EXPORT std::vector<chunk> parse_chunks(const std::vector<std::byte>& buffer);

    /**
     * @brief Simple functional interface for iterating records
     *
     * @tparam Func Callable accepting (const chunk&, std::size_t offset)
     * @param buffer Back-to-back chunk records
     * @param func Function to call for each record
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& buffer, Func func, const parse_options& options) {
        chunk_iterator it(buffer, options);

        while (it.has_next()) {
            func(it.current(), it.offset());
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& buffer, Func func) {
        for_each_chunk(buffer, func, parse_options{});
    }

} // namespace pngchunk
