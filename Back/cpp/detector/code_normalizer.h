#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Identifier -> "VAR_<n>" mapping for one normalization pass over one
// document. Numbering is monotonic in first-encounter order.
struct IdentifierTable {
    std::unordered_map<std::string, std::string> names;
    int next_id = 1;

    const std::string& placeholder_for(std::string_view ident);
    std::size_t size() const { return names.size(); }
};

// Keywords / built-ins that keep their spelling.
bool is_reserved_word(std::string_view word);

// Replaces every identifier-shaped token of `line` that is not reserved.
std::string canonicalize_identifiers(std::string_view line, IdentifierTable& table);

// Raw lines -> cleaned lines: comments stripped, whitespace collapsed,
// empty lines dropped, identifiers canonicalized. Indices of the result do
// not map 1:1 to raw line indices.
std::vector<std::string> normalize_code_lines(const std::vector<std::string>& raw_lines);

// Same, starting from the caller's text (split on '\n').
std::vector<std::string> normalize_code(std::string_view text);
