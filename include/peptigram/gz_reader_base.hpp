#pragma once
// Gzip line reader interface. The rapidgzip implementation lives in
// src/sequence_io_backend.cpp and is reached only through make_gz_reader().

#include <cstddef>
#include <memory>
#include <string>

namespace peptigram {

class GzLineReader {
public:
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

    virtual ~GzLineReader() = default;

    // Next line without its line terminator. False once the stream is exhausted.
    virtual bool readline(std::string& line) = 0;
};

// Checks for the 1f 8b magic bytes; false for unreadable or short files
bool is_gzip_file(const std::string& path);

// Parallel reader for a gzip file, or nullptr when built without rapidgzip
// or the file is not gzip. Callers fall back to zlib on nullptr.
std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path);

}  // namespace peptigram
