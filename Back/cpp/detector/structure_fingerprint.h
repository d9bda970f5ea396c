#pragma once
#include <string>
#include <string_view>

// Class tokens written in place of the constructs they stand for.
namespace fp_tokens {
constexpr std::string_view IF_STMT     = "IF_STMT";
constexpr std::string_view FOR_STMT    = "FOR_STMT";
constexpr std::string_view WHILE_STMT  = "WHILE_STMT";
constexpr std::string_view SWITCH_STMT = "SWITCH_STMT";
constexpr std::string_view FUNC_CALL   = "FUNC_CALL";
constexpr std::string_view ASSIGN      = "ASSIGN";
constexpr std::string_view OP          = "OP";
constexpr std::string_view CMP         = "CMP";
} // namespace fp_tokens

// Window text -> structure-only string. One left-to-right scan:
//   if/for/while/switch + "(...)"  -> *_STMT
//   identifier + "(...)"           -> FUNC_CALL (arguments dropped)
//   == != <= >= < >                -> CMP
//   lone =                         -> ASSIGN
//   + - * / %                      -> OP
// Parenthesis groups nest and may span lines; an unclosed group leaves the
// head word verbatim. Everything else is copied as is.
std::string structure_fingerprint(std::string_view window_text);
