#pragma once
/*
 * FileIO
 *
 * Purpose: host-side plain text persistence.
 * read_text_file: mmap the file, normalize CRLF to LF.
 * write_text_file: safe write (write .tmp → fdatasync → atomic rename).
 * Both return false with msg on failure; msg also carries the success note.
 */
#include <string>
#include <string_view>
#include <filesystem>

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& msg);
bool write_text_file(const std::filesystem::path& path, std::string_view text, std::string& msg);
