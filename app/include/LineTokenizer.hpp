#ifndef LINE_TOKENIZER_HPP
#define LINE_TOKENIZER_HPP

#include "Types.hpp"

#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Splits raw bytes into (content, terminator) pairs and joins them back.
 *
 * Only "\n" ends a line; a "\r" directly before it is part of the terminator.
 * Empty lines are kept, an unterminated final fragment gets LineTerminator::None
 * and an empty input yields no lines at all. join(tokenize(text)) == text for
 * every byte sequence.
 */
class LineTokenizer {
public:
    static std::vector<Line> tokenize(std::string_view text);
    static std::string join(const std::vector<Line>& lines);
    static std::size_t count_terminators(std::string_view text);
};

#endif
