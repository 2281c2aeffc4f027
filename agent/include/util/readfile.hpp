#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace pollagent {
// 读取 /proc 下文本文件的辅助类
class ReadFile {
public:
  explicit ReadFile(const std::string &name) : _file_stream(name) {}

  ~ReadFile() {
    if (_file_stream.is_open())
      _file_stream.close();
  }

  bool is_open() const { return _file_stream.is_open(); }

  // 读取一行并按空白切分到 args 中；文件结束或空行返回 false
  bool read_line(std::vector<std::string> *args) {
    std::string line;
    if (!std::getline(_file_stream, line) || line.empty()) {
      return false;
    }
    std::istringstream line_stream(line);
    std::string word;
    while (line_stream >> word) {
      args->push_back(word);
    }
    return true;
  }

  // 跳过 n 行（表头等）
  void skip_lines(int n) {
    std::string line;
    for (int i = 0; i < n && std::getline(_file_stream, line); ++i) {
    }
  }

private:
  std::ifstream _file_stream;
};

} // namespace pollagent
