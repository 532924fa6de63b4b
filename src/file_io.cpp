#include "file_io.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <algorithm>
#include "config.hpp"

namespace {

/* owns one descriptor; close() reports the result for files being written */
class FileHandle {
public:
  explicit FileHandle(int fd) : fd_(fd) {}
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  ~FileHandle() { if (fd_ >= 0) ::close(fd_); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  bool close() {
    int fd = fd_;
    fd_ = -1;
    return fd < 0 || ::close(fd) == 0;
  }

private:
  int fd_;
};

/* read-only private mapping of a whole file */
class MappedFile {
public:
  MappedFile(int fd, size_t size) : size_(size) {
    void* mem = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    data_ = mem == MAP_FAILED ? nullptr : static_cast<const char*>(mem);
  }
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { if (data_) ::munmap(const_cast<char*>(data_), size_); }

  bool valid() const { return data_ != nullptr; }
  const char* data() const { return data_; }
  size_t size() const { return size_; }

private:
  const char* data_ = nullptr;
  size_t size_;
};

void append_normalized(std::string& out, const char* data, size_t n) {
  out.reserve(out.size() + n);
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n' && i > start && data[i - 1] == '\r') {
      out.append(data + start, i - 1 - start);
      out.push_back('\n');
      start = i + 1;
    }
  }
  out.append(data + start, n - start);
}

bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool sync_data(int fd) {
#if defined(__APPLE__)
  return ::fsync(fd) == 0;
#else
  return ::fdatasync(fd) == 0;
#endif
}

}  // namespace

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  FileHandle fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n > 0) {
    MappedFile map(fd.get(), n);
    if (!map.valid()) { msg = "can not mmap file: " + path.string(); return false; }
    append_normalized(out, map.data(), map.size());
  }
  msg = "opened file: " + path.string();
  return true;
}

bool write_text_file(const std::filesystem::path& path, std::string_view text, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  const std::string failed = "write file failed: " + tmp.string();
  {
    FileHandle fd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.valid()) { msg = failed; return false; }
    const size_t chunk = static_cast<size_t>(HEDIT_WRITE_CHUNK_SIZE);
    bool ok = true;
    for (size_t off = 0; ok && off < text.size(); off += chunk) {
      ok = write_all(fd.get(), text.data() + off, std::min(chunk, text.size() - off));
    }
    ok = ok && sync_data(fd.get());
    if (!fd.close() || !ok) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      msg = failed;
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = "write file failed: " + path.string(); return false; }
  msg = "saved file: " + path.string();
  return true;
}
