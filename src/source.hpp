#ifndef SOURCE_HPP
#define SOURCE_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace fs = ::std::filesystem;

// Holds the text of one input in a buffer, along with a name for diagnostics.
// The buffer is always NUL-terminated, but the parser uses begin() and end()
// and never relies on it.
class source_t
{
public:
    source_t() = default;
    source_t(std::string name, std::string_view text);

    source_t(source_t&&) = default;
    source_t& operator=(source_t&&) = default;

    // Reads the file from disk. Throws if it can't be read.
    static source_t from_file(fs::path const& path);

    // Reads until end of stream.
    static source_t from_stream(std::string name, std::istream& is);

    std::string const& name() const { return m_name; }
    char const* source() const { return m_alloc ? m_alloc.get() : ""; }
    std::size_t size() const { return m_size; }

    char const* begin() const { return source(); }
    char const* end() const { return source() + m_size; }
    std::string_view view() const { return { source(), m_size }; }

private:
    void assign(std::string_view text);

    std::string m_name;
    std::size_t m_size = 0;
    std::unique_ptr<char[]> m_alloc;
};

#endif
