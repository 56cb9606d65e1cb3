#include <atomvec/ops/recycler.h>
#include <atomvec/util/errors.h>

#include <algorithm>

namespace atomvec {

    void Alignment::report() const {
        if (_warning) emit_warning(*_warning);
    }

    Alignment align(size_t len_a, size_t len_b) {
        return align(std::vector<size_t>{len_a, len_b});
    }

    Alignment align(const std::vector<size_t>& lengths) {
        if (lengths.empty()) return Alignment{0, {}, std::nullopt};

        size_t length = *std::max_element(lengths.begin(), lengths.end());
        if (length == 0) return Alignment{0, lengths, std::nullopt};

        std::optional<Warning> warning;
        for (size_t operand_length : lengths) {
            if (operand_length == 0) {
                throw_error<IncompatibleLengthError>(
                    "cannot recycle a zero-length operand to length {}", length);
            }
            if (!warning && length % operand_length != 0) {
                warning = Warning{WarningKind::RecycleLength,
                                  fmt::format("longer object length ({}) is not a multiple of shorter object length ({})",
                                              length, operand_length)};
            }
        }
        return Alignment{length, lengths, std::move(warning)};
    }

    Alignment fit(size_t target_len, size_t source_len) {
        if (target_len == 0) return Alignment{0, {target_len, source_len}, std::nullopt};
        if (source_len == 0) {
            throw_error<IncompatibleLengthError>("replacement has length zero, {} values are required", target_len);
        }

        std::optional<Warning> warning;
        if (target_len % source_len != 0) {
            warning = Warning{WarningKind::RecycleLength,
                              fmt::format("number of items to replace ({}) is not a multiple of replacement length ({})",
                                          target_len, source_len)};
        }
        return Alignment{target_len, {target_len, source_len}, std::move(warning)};
    }

} // namespace atomvec
