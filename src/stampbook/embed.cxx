#include "stampbook/embed.h"

#include <cctype>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/finder.hpp>
#include <boost/algorithm/string/iter_find.hpp>
#include <boost/filesystem.hpp>
#include "stampbook/decode.h"
#include "stampbook/errors.h"
#include "stampbook/packer.h"

namespace fs = boost::filesystem;

namespace stampbook {

namespace {

std::vector<std::string> split_namespace(const std::string& name_space)
{
    std::vector<std::string> parts;
    if (name_space.empty())
        return parts;
    boost::algorithm::iter_split(parts, name_space, boost::algorithm::first_finder("::"));
    for (const auto& part : parts) {
        if (!is_identifier(part))
            throw embed_error("invalid namespace '" + name_space + "'");
    }
    return parts;
}

std::string guard_for(const std::vector<std::string>& scopes, const std::string& name)
{
    std::string guard = "STAMPBOOK_GENERATED_";
    for (const auto& scope : scopes)
        guard += boost::algorithm::to_upper_copy(scope) + "_";
    guard += boost::algorithm::to_upper_copy(name) + "_H";
    return guard;
}

void write_byte(std::ostream& os, std::uint8_t byte)
{
    os << "0b";
    for (int bit = 7; bit >= 0; --bit)
        os << ((byte >> bit) & 1 ? '1' : '0');
}

} // namespace

bool is_identifier(const std::string& s)
{
    if (s.empty())
        return false;
    const auto first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_')
            return false;
    }
    return true;
}

std::string resolve_asset(const std::string& root, const std::string& relative)
{
    const fs::path rel(relative);
    if (rel.empty())
        throw embed_error("no asset path given");
    if (rel.is_absolute())
        throw embed_error("asset path must be relative to the project root: " + relative);

    const fs::path resolved = fs::path(root) / rel;
    boost::system::error_code ec;
    if (!fs::is_regular_file(resolved, ec))
        throw embed_error("asset not found: " + resolved.string());
    return resolved.string();
}

packed_bitmap embed(const std::string& root, const std::string& relative)
{
    const std::string path = resolve_asset(root, relative);
    try {
        return pack(decode(path));
    } catch (const decode_error& e) {
        throw embed_error(e.what());
    } catch (const pack_error& e) {
        throw embed_error(path + ": " + e.what());
    }
}

void write_header(std::ostream& os, const header_options& options, const packed_bitmap& bitmap)
{
    if (!is_identifier(options.name))
        throw embed_error("invalid stamp name '" + options.name + "'");
    const auto scopes = split_namespace(options.name_space);
    const auto guard = guard_for(scopes, options.name);

    os << "// Generated by stampbook-embed";
    if (!options.source.empty())
        os << " from " << options.source;
    os << ". Do not edit.\n"
       << "#ifndef " << guard << "\n"
       << "#define " << guard << "\n\n"
       << "#include <cstdint>\n"
       << "#include <stampbook/stamp.h>\n\n";

    for (const auto& scope : scopes)
        os << "namespace " << scope << " {\n";
    if (!scopes.empty())
        os << "\n";

    // one line per row
    os << "const std::uint8_t " << options.name << "_data[" << bitmap.size()
       << "] STAMPBOOK_PROGMEM = {\n";
    const auto& bytes = bitmap.bytes();
    for (size_t y = 0; y < bitmap.height(); ++y) {
        os << "   ";
        for (size_t i = 0; i < bitmap.row_bytes(); ++i) {
            os << ' ';
            write_byte(os, bytes[y * bitmap.row_bytes() + i]);
            os << ',';
        }
        os << "\n";
    }
    os << "};\n\n";

    os << "constexpr stampbook::stamp " << options.name << "{" << bitmap.width() << ", "
       << bitmap.height() << ", " << options.name << "_data, stampbook::storage::domain::flash};\n";

    if (!scopes.empty())
        os << "\n";
    for (auto it = scopes.rbegin(); it != scopes.rend(); ++it)
        os << "} // namespace " << *it << "\n";

    os << "\n#endif // " << guard << "\n";
}

} // namespace stampbook
