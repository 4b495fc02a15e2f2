#ifndef TEXT_NORMALIZER_HPP
#define TEXT_NORMALIZER_HPP

#include "Types.hpp"

#include <string_view>
#include <vector>

/**
 * @brief Pure content normalization: trailing whitespace and trailing blank lines.
 *
 * Works byte-wise, never fails and performs no I/O. The result is idempotent:
 * normalizing an already normalized buffer returns it unchanged.
 */
class TextNormalizer {
public:
    static NormalizationResult normalize(std::string_view content,
                                         const NormalizationConfig& config);

    // Space, tab, vertical tab, form feed and a stray carriage return.
    static bool is_trailing_whitespace(char ch);

    static std::string_view strip_trailing_whitespace(std::string_view content);

private:
    static void collapse_trailing_blank_lines(std::vector<Line>& lines);
};

#endif
