#ifndef SNAPVAULT_UTIL_H
#define SNAPVAULT_UTIL_H

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace snapvault {

// "500 B", "1.50 KiB", "2.00 GiB" ...
std::string format_size(uint64_t bytes);

// Accepts "100", "100B", "10K", "1.5MiB", "1KB" (SI), "2G" ...
// Single-letter and IEC suffixes are powers of 1024, KB/MB/GB/TB powers of 1000.
bool parse_size(const std::string &text, uint64_t *out);

bool path_has_parent_dir(const std::string &path);
std::string path_join(const std::string &dir, const std::string &name);
std::string path_dirname(const std::string &path);
std::string path_basename(const std::string &path);
std::string absolute_path(const std::string &path);

bool make_dirs(const std::string &path, int mode, std::string *err);
bool read_file(const std::string &path, std::string *out, std::string *err);
bool write_file_atomic(const std::string &path, const std::string &content, std::string *err);
int remove_tree(const std::string &path);

std::string random_hex(size_t bytes);
double monotonic_seconds();
std::string format_local_time(time_t t, const char *fmt);

std::string shell_quote(const std::string &arg);
std::string shell_join(const std::vector<std::string> &argv);
bool find_in_path(const std::string &program);

// Last `max_len` bytes of `text`, trimmed, for error messages.
std::string tail_excerpt(const std::string &text, size_t max_len);

}

#endif
