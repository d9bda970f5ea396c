#include "structure_fingerprint.h"

#include <string>
#include <string_view>

#include "text_common.h"

namespace {

// index of the ')' closing the '(' at `open`, or npos
std::size_t match_paren(std::string_view s, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < s.size(); ++i) {
        if (s[i] == '(') {
            ++depth;
        } else if (s[i] == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::string_view::npos;
}

std::string_view control_token(std::string_view word) {
    if (word == "if")     return fp_tokens::IF_STMT;
    if (word == "for")    return fp_tokens::FOR_STMT;
    if (word == "while")  return fp_tokens::WHILE_STMT;
    if (word == "switch") return fp_tokens::SWITCH_STMT;
    return {};
}

bool is_arith(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/' || c == '%';
}

} // namespace

std::string structure_fingerprint(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    const std::size_t n = s.size();
    std::size_t i = 0;

    while (i < n) {
        const unsigned char c = (unsigned char)s[i];

        // words: control headers, calls, plain identifiers / literals
        if (is_word_char(c)) {
            const std::size_t start = i;
            while (i < n && is_word_char((unsigned char)s[i])) ++i;
            const std::string_view word = s.substr(start, i - start);

            if (is_ident_start(c)) {
                std::size_t j = i;
                while (j < n && is_space_ascii((unsigned char)s[j])) ++j;

                if (j < n && s[j] == '(') {
                    const std::size_t close = match_paren(s, j);
                    if (close != std::string_view::npos) {
                        const std::string_view ctl = control_token(word);
                        out.append(ctl.empty() ? fp_tokens::FUNC_CALL : ctl);
                        i = close + 1;
                        continue;
                    }
                }
            }
            out.append(word);
            continue;
        }

        const char next = (i + 1 < n) ? s[i + 1] : '\0';

        // two-char comparisons first so '=' of "==" is never an assignment
        if ((c == '=' || c == '!' || c == '<' || c == '>') && next == '=') {
            out.append(fp_tokens::CMP);
            i += 2;
            continue;
        }
        if (c == '<' || c == '>') {
            out.append(fp_tokens::CMP);
            ++i;
            continue;
        }
        if (c == '=') {
            out.append(fp_tokens::ASSIGN);
            ++i;
            continue;
        }
        if (is_arith((char)c)) {
            out.append(fp_tokens::OP);
            ++i;
            continue;
        }

        out.push_back((char)c);
        ++i;
    }
    return out;
}
