#ifndef JSONL_UTILS_READER_SOURCE_H
#define JSONL_UTILS_READER_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <istream>
#include <memory>
#include <string>

namespace jsonl::utils {

/**
 * Byte source with absolute-offset seeking. Readers take exclusive
 * ownership of a source through std::unique_ptr.
 *
 * All operations throw ReaderError on failure.
 */
class Source {
   public:
    virtual ~Source() = default;

    /**
     * Seek to the end of the source
     * @return total size in bytes
     */
    virtual std::uint64_t seek_end() = 0;

    /**
     * Seek to an absolute offset from the start of the source
     */
    virtual void seek(std::uint64_t offset) = 0;

    /**
     * Read up to length bytes from the current position
     * @return number of bytes read, 0 at end of data
     */
    virtual std::size_t read(char *buffer, std::size_t length) = 0;

    /**
     * Short human-readable name used in log and error messages
     */
    virtual std::string describe() const = 0;
};

/**
 * Regular file opened in binary mode with 64-bit offsets.
 */
class FileSource : public Source {
   public:
    explicit FileSource(const std::string &path);
    ~FileSource() override;

    FileSource(const FileSource &) = delete;
    FileSource &operator=(const FileSource &) = delete;

    std::uint64_t seek_end() override;
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t length) override;
    std::string describe() const override { return path_; }

    const std::string &get_path() const { return path_; }

   private:
    std::string path_;
    FILE *file_handle_;
};

/**
 * Bytes held in memory.
 */
class MemorySource : public Source {
   public:
    explicit MemorySource(std::string data);

    std::uint64_t seek_end() override;
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t length) override;
    std::string describe() const override;

   private:
    std::string data_;
    std::size_t position_;
};

/**
 * Adapter over a std::istream. Seeking fails with FILE_IO_ERROR when the
 * stream does not support it (pipes, std::cin), so such sources can only
 * be read forward.
 */
class StreamSource : public Source {
   public:
    explicit StreamSource(std::unique_ptr<std::istream> stream);
    // Non-owning; the stream must outlive the source
    explicit StreamSource(std::istream &stream);

    std::uint64_t seek_end() override;
    void seek(std::uint64_t offset) override;
    std::size_t read(char *buffer, std::size_t length) override;
    std::string describe() const override { return "<stream>"; }

   private:
    std::unique_ptr<std::istream> owned_;
    std::istream *stream_;
};

}  // namespace jsonl::utils

#endif  // JSONL_UTILS_READER_SOURCE_H
