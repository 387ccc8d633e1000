#include "source.hpp"

#include <cstdio>
#include <cstring>
#include <iterator>
#include <stdexcept>

#include "format.hpp"

namespace
{
    using file_ptr_t = std::unique_ptr<std::FILE, int(*)(std::FILE*)>;

    // Returns false if the file couldn't be opened or read.
    bool read_binary_file(char const* filename, std::string& result)
    {
        file_ptr_t fp(std::fopen(filename, "rb"), &std::fclose);
        if(!fp)
            return false;

        // Get the file size
        if(std::fseek(fp.get(), 0, SEEK_END) != 0)
            return false;
        long const file_size = std::ftell(fp.get());
        if(file_size < 0 || std::fseek(fp.get(), 0, SEEK_SET) != 0)
            return false;

        result.resize(std::size_t(file_size));

        if(file_size && std::fread(result.data(), result.size(), 1, fp.get()) != 1)
            return false;

        return true;
    }
} // end anon namespace

source_t::source_t(std::string name, std::string_view text)
: m_name(std::move(name))
{
    assign(text);
}

source_t source_t::from_file(fs::path const& path)
{
    std::string text;
    if(!read_binary_file(path.string().c_str(), text))
        throw std::runtime_error(fmt("Unable to open file %", path.string()));
    return source_t(path.string(), text);
}

source_t source_t::from_stream(std::string name, std::istream& is)
{
    std::string const text(std::istreambuf_iterator<char>(is), {});
    if(is.bad())
        throw std::runtime_error(fmt("Unable to read %", name));
    return source_t(std::move(name), text);
}

void source_t::assign(std::string_view text)
{
    m_size = text.size();
    m_alloc.reset(new char[m_size + 1]);
    if(m_size)
        std::memcpy(m_alloc.get(), text.data(), m_size);
    m_alloc[m_size] = '\0';
}
