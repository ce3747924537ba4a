#include "sanitizer.hpp"

namespace {

bool is_ascii_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

bool is_kept(unsigned char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
  case '.':
  case ',':
  case '!':
  case '?':
  case '-':
    return true;
  default:
    return is_ascii_space(c);
  }
}

}

std::string sanitize(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (is_kept(static_cast<unsigned char>(c))) {
      result.push_back(c);
    }
  }
  return result;
}

std::string trim(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_ascii_space(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && is_ascii_space(static_cast<unsigned char>(text[end - 1])))
    --end;
  return text.substr(begin, end - begin);
}
