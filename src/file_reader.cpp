#include "file_reader.hpp"
#include "posix_handles.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

void split_lines(std::string_view data, std::vector<std::string>& out_lines) {
  out_lines.clear();
  size_t start = 0;
  while (start < data.size()) {
    size_t nl = data.find('\n', start);
    if (nl == std::string_view::npos) {
      out_lines.emplace_back(data.substr(start));
      break;
    }
    out_lines.emplace_back(data.substr(start, nl - start));
    start = nl + 1;
  }
  if (out_lines.empty()) out_lines.emplace_back();
}

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string() + " (" + std::strerror(errno) + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(); msg = "opened empty file: " + path.string(); return true; }
  MappedFile map;
  if (!map.map(fd.get(), n)) { msg = "can not mmap file: " + path.string(); return false; }
  split_lines(map.bytes(), out_lines);
  msg = "opened file: " + path.string();
  return true;
}
