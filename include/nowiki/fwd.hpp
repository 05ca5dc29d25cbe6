#ifndef NOWIKI_FWD_HPP
#define NOWIKI_FWD_HPP

#include "nowiki/settings.hpp"

namespace nowiki {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define NOWIKI_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Attribute;
struct Block_Arguments;
struct Block_Parser;
struct Collecting_Logger;
struct Diagnostic;
struct Directive;
struct Document_Node;
enum struct Expansion_Error : Default_Underlying;
struct Expansion_Options;
struct Ignorant_Logger;
struct Lexer;
enum struct Lexer_Kind : Default_Underlying;
struct Line_Cursor;
struct Logger;
enum struct Node_Tag : Default_Underlying;
enum struct Nowiki_Format : Default_Underlying;
struct No_Support_Syntax_Highlighter;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Stream_Logger;
struct Sub_Parser_Descriptor;
enum struct Sub_Parser_Error : Default_Underlying;
enum struct Sub_Parser_Id : Default_Underlying;
struct Sub_Parser_Set;
struct Syntax_Highlighter;
enum struct Syntax_Highlight_Error : Default_Underlying;
struct Text_Parser;
struct Ulight_Syntax_Highlighter;
struct Wiki_Block_Parser;

} // namespace nowiki

#endif
