#ifndef STAMPBOOK_EMBED_H
#define STAMPBOOK_EMBED_H

#include <ostream>
#include <string>
#include "stampbook/bitmap.h"

namespace stampbook {

struct header_options {
    std::string name;       // identifier of the generated stamp
    std::string name_space; // optional, may be nested ("a::b")
    std::string source;     // asset path recorded in the header comment
};

// True for a plain C++ identifier ([A-Za-z_][A-Za-z0-9_]*).
bool is_identifier(const std::string& s);

// Joins a relative asset path onto the project root. Absolute paths and
// assets that do not exist are rejected with embed_error naming the path.
std::string resolve_asset(const std::string& root, const std::string& relative);

// Resolves, decodes and packs one asset. Any failure is rethrown as
// embed_error prefixed with the asset path.
packed_bitmap embed(const std::string& root, const std::string& relative);

// Writes a self-contained header defining <name>_data and a constexpr
// stampbook::stamp <name>. Throws embed_error on an invalid name or namespace.
void write_header(std::ostream& os, const header_options& options, const packed_bitmap& bitmap);

} // namespace stampbook

#endif // STAMPBOOK_EMBED_H
