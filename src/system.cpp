/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "shortsmith/system.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace shortsmith {

// **---- Internal Helpers ----**

namespace {

long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f ? val : -1;
}

/// Count CPUs in a cpuset string like "0,2,4" or "0-3,8"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);
    size_t dash = item.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int lo = std::stoi(item.substr(0, dash));
        int hi = std::stoi(item.substr(dash + 1));
        if (hi >= lo)
          count += hi - lo + 1;
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = end + 1;
  }
  return count > 0 ? count : -1;
}

int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

int decode_status(int status) {
  if (status == -1)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// cgroup v2 (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !quota_str.empty() && !period_str.empty()) {
        long quota = std::stol(quota_str);
        long period = std::stol(period_str);
        if (quota > 0 && period > 0)
          limit = static_cast<int>((quota + period - 1) / period);
      }
    }
  }

  /// cgroup v1 CFS quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0)
      limit = static_cast<int>((quota + period - 1) / period);
  }

  /// cpuset
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0)
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  return std::max(1, limit);
}

int resolve_worker_count(int configured, size_t work_items) {
  int n = configured > 0 ? configured : detect_cpu_limit();
  if (work_items > 0 && static_cast<size_t>(n) > work_items)
    n = static_cast<int>(work_items);
  return std::max(1, n);
}

// **---- MemFile ----**

MemFile::MemFile(const char *name) {
  fd_ = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
}

MemFile::~MemFile() {
  if (fd_ != -1)
    close(fd_);
}

bool MemFile::write_all(const std::string &content) {
  if (fd_ == -1)
    return false;
  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd_, content.data() + written, content.size() - written);
    if (n <= 0)
      return false;
    written += static_cast<size_t>(n);
  }
  return true;
}

std::string MemFile::proc_path() const {
  return fmt::format("/proc/{}/fd/{}", getpid(), fd_);
}

// **---- Child processes ----**

int run_command(const std::string &cmd) {
  return decode_status(std::system(cmd.c_str()));
}

int run_capture(const std::string &cmd, std::string &output) {
  output.clear();
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe)
    return -1;

  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
    output.append(buf, n);
  }
  return decode_status(pclose(pipe));
}

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int total = static_cast<int>(seconds);
  int h = total / 3600;
  int m = (total % 3600) / 60;
  int s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace shortsmith
