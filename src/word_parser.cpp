#include "word_parser.hpp"
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mipsim
{

// ===== Helpers privados =====
std::string_view WordParser::trim(std::string_view s) {
  std::size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

bool WordParser::starts_with(std::string_view s, std::string_view p) {
  if (s.size() < p.size()) return false;
  for (std::size_t i = 0; i < p.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(s[i])) !=
        std::toupper(static_cast<unsigned char>(p[i])))
      return false;
  }
  return true;
}

// Acepta "+" inicial, prefijo 0x (solo base 16) y "_" simples entre dígitos.
std::optional<Word> WordParser::parse_uint32(std::string_view text, int base) {
  std::string_view s = text;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);

  bool prefixed = false;
  if (base == 16 && starts_with(s, "0x")) {
    s.remove_prefix(2);
    prefixed = true;
  }

  // "_" permitido entre dígitos, o justo después del prefijo
  std::string digits;
  digits.reserve(s.size());
  bool prev_underscore = false;
  for (char c : s) {
    if (c == '_') {
      if (prev_underscore || (digits.empty() && !prefixed)) return std::nullopt;
      prev_underscore = true;
      continue;
    }
    prev_underscore = false;
    digits.push_back(c);
  }
  if (prev_underscore || digits.empty()) return std::nullopt;

  std::uint64_t v = 0;
  const char* first = digits.data();
  const char* last  = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, v, base);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  if (v > 0xFFFFFFFFull) return std::nullopt;
  return static_cast<Word>(v);
}

// ===== API =====

std::optional<Word> WordParser::parse_word(std::string_view line) {
  const auto s = trim(line);
  if (s.empty()) return std::nullopt;

  // 1) 0x... / 0X...
  if (starts_with(s, "0x")) return parse_uint32(s, 16);

  // 2) 32 dígitos binarios
  if (s.size() == 32 && s.find_first_not_of("01") == std::string_view::npos)
    return parse_uint32(s, 2);

  // 3) hex sin prefijo
  return parse_uint32(s, 16);
}

std::vector<Word> WordParser::parse_words(const std::string& src) {
  std::vector<Word> words;
  std::istringstream is(src);
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(is, line)) {
    ++lineno;
    if (auto w = parse_word(line)) {
      words.push_back(*w);
    } else if (!trim(line).empty()) {
      LOG_IF(cfg::kLogParse, "[Parser] línea " << lineno << " descartada: '" << trim(line) << "'");
    }
  }
  return words;
}

std::vector<Word> WordParser::read_words_from_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("No se puede abrir archivo de palabras: " + path);
  std::string src((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_words(src);
}

Addr WordParser::parse_base_pc(std::string_view text, Addr fallback) {
  const auto s = trim(text);
  const auto v = parse_uint32(s, starts_with(s, "0x") ? 16 : 10);
  return v ? static_cast<Addr>(*v) : fallback;
}

} // namespace mipsim
