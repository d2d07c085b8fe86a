// sequence_io_backend.cpp
// Gzip detection and make_gz_reader(). This is the only translation unit that
// includes rapidgzip headers, so its ODR-visible symbols stay out of the rest
// of peptigram_core.

#ifdef HAVE_RAPIDGZIP
#include <rapidgzip/rapidgzip.hpp>
#include <filereader/Standard.hpp>
#endif

#include "peptigram/gz_reader_base.hpp"
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

#ifdef HAVE_RAPIDGZIP
// Line reader over rapidgzip's parallel decompressor. Lines are returned
// without '\n' or a trailing '\r'.
class RapidgzipLineReader : public peptigram::GzLineReader {
public:
    explicit RapidgzipLineReader(const std::string& path)
        : chunk_(GZBUF_SIZE),
          reader_(std::make_unique<rapidgzip::ParallelGzipReader<>>(
              std::make_unique<rapidgzip::StandardFileReader>(path),
              0,  // auto-detect thread count
              GZBUF_SIZE)) {}

    bool readline(std::string& line) override {
        line.clear();
        bool got_any = false;
        for (;;) {
            if (pos_ == used_ && !fill_chunk()) break;
            got_any = true;

            const char* begin = chunk_.data() + pos_;
            const char* nl = static_cast<const char*>(
                std::memchr(begin, '\n', used_ - pos_));
            if (nl) {
                line.append(begin, nl);
                pos_ += static_cast<size_t>(nl - begin) + 1;
                break;
            }
            line.append(begin, used_ - pos_);
            pos_ = used_;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return got_any;
    }

private:
    bool fill_chunk() {
        if (at_eof_) return false;
        used_ = reader_->read(chunk_.data(), chunk_.size());
        pos_ = 0;
        if (used_ == 0) at_eof_ = true;
        return used_ > 0;
    }

    std::vector<char> chunk_;
    std::unique_ptr<rapidgzip::ParallelGzipReader<>> reader_;
    size_t pos_ = 0;
    size_t used_ = 0;
    bool at_eof_ = false;
};
#endif  // HAVE_RAPIDGZIP

}  // namespace

namespace peptigram {

bool is_gzip_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    char magic[2] = {0, 0};
    if (!in.read(magic, 2)) return false;
    return static_cast<unsigned char>(magic[0]) == 0x1f &&
           static_cast<unsigned char>(magic[1]) == 0x8b;
}

std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path) {
#ifdef HAVE_RAPIDGZIP
    if (is_gzip_file(path)) return std::make_unique<RapidgzipLineReader>(path);
#else
    (void)path;
#endif
    return nullptr;
}

}  // namespace peptigram
