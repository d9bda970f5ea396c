#include "code_normalizer.h"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "text_common.h"

namespace {

const std::unordered_set<std::string_view>& reserved_words() {
    static const std::unordered_set<std::string_view> kReserved = {
        // C/C++ keywords
        "auto", "break", "case", "char", "const", "continue", "default",
        "do", "double", "else", "enum", "extern", "float", "for", "goto",
        "if", "int", "long", "register", "return", "short", "signed",
        "sizeof", "static", "struct", "switch", "typedef", "union",
        "unsigned", "void", "volatile", "while", "class", "namespace",
        "try", "catch", "new", "delete", "this", "template", "nullptr",
        "true", "false", "bool", "private", "protected", "public",
        "virtual", "friend", "operator", "using", "throw",
        // preprocessor
        "include", "define", "ifdef", "ifndef", "endif", "pragma",
        // std names common in student code
        "std", "string", "vector", "map", "set", "list", "queue", "stack",
        "pair", "cout", "cin", "cerr", "endl",
    };
    return kReserved;
}

constexpr std::string_view LINE_COMMENT  = "//";
constexpr std::string_view BLOCK_OPEN    = "/*";
constexpr std::string_view BLOCK_CLOSE   = "*/";

// per-document pass state; never shared between documents
struct NormalizeState {
    bool in_block_comment = false;
    IdentifierTable idents;
};

// Strips comments from an already trimmed line. Returns false when nothing
// of the line survives (still inside a block comment).
bool strip_comments(std::string& line, NormalizeState& st) {
    if (st.in_block_comment) {
        const std::size_t end = line.find(BLOCK_CLOSE);
        if (end == std::string::npos) return false;
        line.erase(0, end + BLOCK_CLOSE.size());
        st.in_block_comment = false;
    }

    const std::size_t sl = line.find(LINE_COMMENT);
    if (sl != std::string::npos) line.resize(sl);

    std::size_t open = line.find(BLOCK_OPEN);
    while (open != std::string::npos) {
        const std::size_t close = line.find(BLOCK_CLOSE, open + BLOCK_OPEN.size());
        if (close == std::string::npos) {
            line.resize(open);
            st.in_block_comment = true;
            break;
        }
        line.erase(open, close + BLOCK_CLOSE.size() - open);
        open = line.find(BLOCK_OPEN);
    }
    return true;
}

} // namespace

const std::string& IdentifierTable::placeholder_for(std::string_view ident) {
    auto it = names.find(std::string(ident));
    if (it != names.end()) return it->second;

    std::string ph = "VAR_" + std::to_string(next_id++);
    return names.emplace(std::string(ident), std::move(ph)).first->second;
}

bool is_reserved_word(std::string_view word) {
    return reserved_words().count(word) != 0;
}

std::string canonicalize_identifiers(std::string_view line, IdentifierTable& table) {
    std::string out;
    out.reserve(line.size() + 16);

    const std::size_t n = line.size();
    std::size_t i = 0;

    while (i < n) {
        const unsigned char c = (unsigned char)line[i];
        if (!is_word_char(c)) {
            out.push_back((char)c);
            ++i;
            continue;
        }

        // maximal word run; a run that starts with a digit is a literal
        const std::size_t start = i;
        while (i < n && is_word_char((unsigned char)line[i])) ++i;
        const std::string_view word = line.substr(start, i - start);

        if (is_digit_ascii(c) || is_reserved_word(word)) {
            out.append(word);
        } else {
            out.append(table.placeholder_for(word));
        }
    }
    return out;
}

std::vector<std::string> normalize_code_lines(const std::vector<std::string>& raw_lines) {
    std::vector<std::string> out;
    out.reserve(raw_lines.size());

    NormalizeState st;

    for (const auto& raw : raw_lines) {
        std::string line(trim_view(raw));
        if (line.empty()) continue;

        if (!strip_comments(line, st)) continue;

        trim_spaces(line);
        if (line.empty()) continue;

        out.push_back(canonicalize_identifiers(collapse_spaces(line), st.idents));
    }
    return out;
}

std::vector<std::string> normalize_code(std::string_view text) {
    return normalize_code_lines(split_lines(text));
}
