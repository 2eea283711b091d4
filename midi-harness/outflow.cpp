#include "outflow.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mh {

void print_byte(unsigned char c, std::ostream& out, bool& last_was_escape) {
    bool is_print = std::isprint(c) != 0;

    if (is_print && last_was_escape) {
        out << ' ';
    }

    if (is_print) {
        out << c;
    } else if (c == '\r') {
        out << "\\r";
    } else if (c == '\t') {
        out << "\\t";
    } else {
        std::ios_base::fmtflags flags = out.flags();
        out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(c);
        out.flags(flags);
    }

    last_was_escape = !is_print;
}

std::string render_tail(const std::string& captured, std::size_t max_lines) {
    if (captured.empty() || max_lines == 0) return {};

    std::vector<std::string> lines;
    std::string current;
    for (char ch : captured) {
        if (ch == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) lines.push_back(current);

    std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::ostringstream out;
    for (std::size_t i = first; i < lines.size(); ++i) {
        bool last_was_escape = false;
        out << "  | ";
        for (char ch : lines[i]) {
            print_byte(static_cast<unsigned char>(ch), out, last_was_escape);
        }
        out << '\n';
    }
    return out.str();
}

} // namespace mh
