#ifndef OUTFLOW_HPP
#define OUTFLOW_HPP

#include <cstddef>
#include <iostream>
#include <string>

namespace mh {

// Writes a single byte of child output in readable form.
// Printable bytes pass through; \r and \t are spelled out and everything
// else becomes \xHH. last_was_escape tracks whether the previous byte was
// escaped so a separating space can be inserted on the way back to text.
void print_byte(unsigned char c, std::ostream& out, bool& last_was_escape);

// Renders the last max_lines lines of captured output, one per line, each
// prefixed with "  | ". Returns an empty string when nothing was captured.
std::string render_tail(const std::string& captured, std::size_t max_lines);

} // namespace mh

#endif // OUTFLOW_HPP
