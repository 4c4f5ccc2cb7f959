#include <stash/fs/file_io.hpp>

#include <cerrno>
#include <cstring>
#include <iterator>

namespace stash {

template<class Stream>
static void
open_stream(Stream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        STASH_THROW(
            open_file_error()
            << file_path_info(path) << open_mode_info(mode)
            << internal_error_message_info(std::strerror(errno)));
    }
}

void
open_file(std::fstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
    file.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);
}

std::ifstream
open_file_for_reading(file_path const& path)
{
    std::ifstream in;
    open_stream(in, path, std::ios::in | std::ios::binary);
    in.exceptions(std::ios::badbit);
    return in;
}

string
read_file_contents(file_path const& path)
{
    std::ifstream in;
    open_file(in, path, std::ios::in | std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(in.tellg());
    in.seekg(0, std::ios::beg);
    in.read(&contents[0], contents.size());
    in.close();
    return contents;
}

string
read_stream_contents(std::istream& in)
{
    return string(
        std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output;
    open_file(
        output, path, std::ios::out | std::ios::trunc | std::ios::binary);
    output << contents;
}

} // namespace stash
