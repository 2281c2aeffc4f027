#include "util/utils.hpp"

#include <fnmatch.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <sstream>

namespace pollagent {

uint32_t fnv1a_32(std::string_view data) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

uint64_t fnv1a_64(std::string_view data) {
  uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string hash_of_set(const std::vector<std::string>& items) {
  std::vector<std::string> sorted(items);
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

  std::string joined;
  for (const auto& item : sorted) {
    joined += item;
    joined += '\n';
  }
  return std::format("{:016x}", fnv1a_64(joined));
}

bool match_glob(const std::string& name, const std::string& pattern) {
  return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

bool match_any_glob(const std::string& name,
                    const std::vector<std::string>& patterns) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&name](const std::string& pattern) {
                       return match_glob(name, pattern);
                     });
}

std::vector<std::string> split(const std::string& str, char delim) {
  std::vector<std::string> parts;
  std::istringstream iss(str);
  std::string part;
  while (std::getline(iss, part, delim)) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::string get_hostname() {
  char hostname[256];
  if (gethostname(hostname, sizeof(hostname)) == 0) {
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
  }
  return "unknown";
}

int64_t now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace pollagent
