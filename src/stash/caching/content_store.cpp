#include <stash/caching/content_store.hpp>

#include <cerrno>
#include <cstring>
#include <random>

#include <stash/core/logging.hpp>

namespace stash {

string
make_random_file_name(std::size_t length)
{
    static char const alphabet[] = "23456789abcdefghijkmnpqrstuvwxyz";

    thread_local std::mt19937_64 generator{std::random_device()()};
    std::uniform_int_distribution<std::size_t> distribution(
        0, sizeof(alphabet) - 2);

    string name;
    name.reserve(length);
    for (std::size_t i = 0; i != length; ++i)
        name.push_back(alphabet[distribution(generator)]);
    return name;
}

content_file
create_new_content_file(file_path const& content_dir)
{
    create_directories_if_needed(content_dir);

    while (true)
    {
        auto path = content_dir / make_random_file_name();

        // "x" makes the open fail if the file already exists.
        std::FILE* file = std::fopen(path.string().c_str(), "wbx");
        if (file)
            return content_file{path, file_handle(file)};

        if (errno != EEXIST)
        {
            STASH_THROW(
                file_creation_failure()
                << file_path_info(path)
                << internal_error_message_info(std::strerror(errno)));
        }

        get_logger()->debug(
            "content file name collision on {}; trying again", path.string());
    }
}

static void
throw_write_failure(content_file const& file, int error)
{
    STASH_THROW(
        file_write_failure()
        << file_path_info(file.path)
        << internal_error_message_info(std::strerror(error)));
}

static void
check_open(content_file const& file)
{
    if (!file.handle)
    {
        STASH_THROW(
            internal_check_failed()
            << file_path_info(file.path)
            << internal_error_message_info("content file already closed"));
    }
}

void
append_content(content_file& file, char const* data, std::size_t size)
{
    check_open(file);
    if (size != 0 && std::fwrite(data, 1, size, file.handle.get()) != size)
        throw_write_failure(file, errno);
    file.bytes_written += size;
}

void
finish_content(content_file& file)
{
    check_open(file);

    // Closing flushes the buffered data, so errors like a full disk may not
    // show up until now.
    if (std::fclose(file.handle.release()) != 0)
        throw_write_failure(file, errno);

    get_logger()->debug(
        "wrote {} bytes to {}", file.bytes_written, file.path.string());
}

void
write_content(content_file& file, string const& data)
{
    append_content(file, data.data(), data.size());
    finish_content(file);
}

string
get_root_relative_path(file_path const& root, file_path const& path)
{
    auto relative = path.lexically_relative(root);
    if (relative.empty() || relative == "." || *relative.begin() == "..")
    {
        STASH_THROW(
            path_outside_root()
            << file_path_info(path) << directory_path_info(root));
    }
    return relative.generic_string();
}

} // namespace stash
