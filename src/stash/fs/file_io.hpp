#ifndef STASH_FS_FILE_IO_HPP
#define STASH_FS_FILE_IO_HPP

#include <fstream>

#include <stash/core/exception.hpp>

namespace stash {

// Open a file into the given fstream. Throw an error if the open operation
// fails, and enable the exception bits on the fstream so that subsequent
// failures will throw exceptions.
void
open_file(std::fstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
STASH_DEFINE_EXCEPTION(open_file_error)
STASH_DEFINE_ERROR_INFO(file_path, file_path)
STASH_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)

// Open a file for streaming its contents to the end.
// This throws open_file_error if the file can't be opened, but unlike
// open_file(), it only enables the badbit exception, so reading up to the end
// of the file is not an error.
std::ifstream
open_file_for_reading(file_path const& path);

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Get all the remaining contents of an input stream as a string.
string
read_stream_contents(std::istream& in);

// Write a string to a file (overwriting anything that might have been in it).
void
dump_string_to_file(file_path const& path, string const& contents);

} // namespace stash

#endif
