#ifndef ATOMVEC_OPS_RECYCLER_H
#define ATOMVEC_OPS_RECYCLER_H

#include <atomvec/atomvec_export.h>
#include <atomvec/util/warnings.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace atomvec {

    /**
     * Alignment - How operands of unequal length line up for an elementwise operation.
     *
     * The result has length() positions; output position i reads position
     * index(k, i) == i mod length_k of operand k. When a length does not divide the
     * result length the alignment carries a RecycleLength warning. Callers decide
     * whether to report() it.
     */
    class ATOMVEC_EXPORT Alignment {
    public:
        Alignment(size_t length, std::vector<size_t> operand_lengths, std::optional<Warning> warning)
            : _length{length}, _operand_lengths{std::move(operand_lengths)}, _warning{std::move(warning)} {}

        [[nodiscard]] size_t length() const { return _length; }
        [[nodiscard]] size_t operand_count() const { return _operand_lengths.size(); }
        [[nodiscard]] size_t operand_length(size_t operand) const { return _operand_lengths[operand]; }

        [[nodiscard]] size_t index(size_t operand, size_t i) const { return i % _operand_lengths[operand]; }
        [[nodiscard]] size_t index_a(size_t i) const { return index(0, i); }
        [[nodiscard]] size_t index_b(size_t i) const { return index(1, i); }

        [[nodiscard]] bool exact() const { return !_warning.has_value(); }
        [[nodiscard]] const std::optional<Warning>& warning() const { return _warning; }

        // Forwards the warning, if any, to the current warning handler
        void report() const;

    private:
        size_t _length;
        std::vector<size_t> _operand_lengths;
        std::optional<Warning> _warning;
    };

    /**
     * Align two operands: the result length is max(len_a, len_b) and the shorter one
     * is reused cyclically. Two empty operands give an empty result; an empty operand
     * against a non-empty one throws IncompatibleLengthError.
     */
    [[nodiscard]] ATOMVEC_EXPORT Alignment align(size_t len_a, size_t len_b);

    // N-ary form of align, same rules over every operand
    [[nodiscard]] ATOMVEC_EXPORT Alignment align(const std::vector<size_t>& lengths);

    /**
     * Fit a source of source_len elements onto target_len slots (assignment and
     * repeat_to_length). The source is reused cyclically or truncated; the warning is
     * raised when target_len is not a multiple of source_len. Operand 0 is the target,
     * operand 1 the source.
     */
    [[nodiscard]] ATOMVEC_EXPORT Alignment fit(size_t target_len, size_t source_len);

} // namespace atomvec

#endif // ATOMVEC_OPS_RECYCLER_H
