/**
 * @file system.hpp
 * @brief System utilities: CPU detection, child processes, in-memory files
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for sizing worker pools
 *
 *          - MemFile, an RAII memfd that child processes can read through
 *            /proc/<pid>/fd/<n>
 *
 *          - Shell command execution with exit-status decoding
 *
 *          - Time formatting utilities
 */

#ifndef SHORTSMITH_SYSTEM_HPP
#define SHORTSMITH_SYSTEM_HPP

#include <cstddef>
#include <string>

namespace shortsmith {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note std::thread::hardware_concurrency() reports the host's cores inside
 *       a container. This reads the cgroup v2 `cpu.max`, the cgroup v1 CFS
 *       quota and the cpuset files, in that order.
 *
 * @return Detected CPU limit (at least 1)
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured worker count.
 * @param configured Requested count, 0 = auto
 * @param work_items Upper bound from the amount of work (0 = unbounded)
 */
int resolve_worker_count(int configured, size_t work_items);

// **---- In-memory files ----**

/**
 * @class MemFile
 * @brief RAII wrapper around memfd_create.
 * @note Not copyable; the descriptor is closed on destruction.
 */
class MemFile {
public:
  explicit MemFile(const char *name);
  ~MemFile();

  MemFile(const MemFile &) = delete;
  MemFile &operator=(const MemFile &) = delete;

  bool is_valid() const { return fd_ != -1; }

  /// Write the whole string; false on error
  bool write_all(const std::string &content);

  /// Path a child process can open, e.g. /proc/123/fd/4
  std::string proc_path() const;

private:
  int fd_ = -1;
};

// **---- Child processes ----**

/**
 * @brief Run a shell command and wait for it.
 * @return The command's exit code, or -1 if it could not be run or was
 *         killed by a signal
 */
int run_command(const std::string &cmd);

/**
 * @brief Run a shell command and capture its standard output.
 * @param output Receives everything the command wrote to stdout
 * @return Exit code as in run_command()
 */
int run_capture(const std::string &cmd, std::string &output);

/**
 * @brief Quote a string for safe use as one POSIX shell word.
 */
std::string shell_quote(const std::string &arg);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

} // namespace shortsmith

#endif // SHORTSMITH_SYSTEM_HPP
