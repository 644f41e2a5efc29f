#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <vector>

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadChunk = 64 * 1024;
const size_t max_path_len = 1 << 15;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back('\0');
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, uint64_t limit,
                       bool* truncated) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  if (truncated != nullptr) *truncated = false;
  std::string contents;
  char buf[kReadChunk];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    uint64_t room = limit - contents.size();
    if (static_cast<uint64_t>(amount) > room) {
      contents.append(buf, room);
      if (truncated != nullptr) *truncated = true;
      break;
    }
    contents.append(buf, amount);
  }
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  std::string temp_file;
  kj::AutoCloseFd fd = OsTempFile(path, &temp_file);
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  kj::UnwindDetector detector;
  KJ_DEFER(if (detector.isUnwinding()) remove(temp_file.c_str()));
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(),
                              "write " + temp_file);
    }
    pos += written;
  }
  if (fsync(fd) == -1) {
    throw std::system_error(errno, std::system_category(), "fsync " + path);
  }
  int err = OsAtomicMove(temp_file, path, overwrite);
  if (err != 0) {
    remove(temp_file.c_str());
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    try {
      File::RemoveTree(path_);
    } catch (const std::system_error& exc) {
      KJ_LOG(WARNING, "Failed to remove temporary directory", path_,
             exc.what());
    }
  }
}

}  // namespace util
