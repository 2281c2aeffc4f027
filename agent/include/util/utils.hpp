#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pollagent {

// 32 位 FNV-1a，跨进程稳定
uint32_t fnv1a_32(std::string_view data);
// 64 位 FNV-1a，跨进程稳定
uint64_t fnv1a_64(std::string_view data);

// 与顺序、重复无关的集合哈希，结果为十六进制字符串
std::string hash_of_set(const std::vector<std::string>& items);

// fnmatch(3) 风格的通配符匹配
bool match_glob(const std::string& name, const std::string& pattern);
bool match_any_glob(const std::string& name,
                    const std::vector<std::string>& patterns);

// 按分隔符切分，丢弃空段
std::vector<std::string> split(const std::string& str, char delim);

std::string get_hostname();

// 当前时间（unix 毫秒）
int64_t now_millis();

}  // namespace pollagent
