#ifndef NOWIKI_PRINT_HPP
#define NOWIKI_PRINT_HPP

#include <iosfwd>
#include <string_view>

#include "nowiki/document.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/memory_resources.hpp"

namespace nowiki {

/// @brief Appends a textual dump of the tree rooted at `node` to `out`.
/// Every node is printed on its own line, indented by two spaces per level of depth.
/// Elements print as their tag name followed by their attributes, like
/// `table-cell class="moin-integer"`,
/// and text runs print as a quoted string with `\`, `"`, LF, CR, and tab escaped.
///
/// Two trees are equal (`operator==`) if and only if their dumps are equal.
void print_document(Pmr_U8string& out, const Document_Node& node);

/// @brief Like `print_document`, but writes to a stream.
std::ostream& operator<<(std::ostream& out, const Document_Node& node);

} // namespace nowiki

#endif
