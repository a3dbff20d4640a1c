#include "deskboot/ShellSyntax.h"

#include <cctype>
#include <optional>

namespace deskboot {

namespace {

std::string_view
trim(std::string_view str) {
  const auto first = str.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}

bool
isNameStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool
isNameChar(char c) {
  return isNameStart(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Consumes a variable name from the front of `str`.
std::optional<std::string_view>
takeName(std::string_view& str) {
  if (str.empty() || !isNameStart(str.front())) {
    return std::nullopt;
  }

  std::size_t len = 1;
  while (len < str.size() && isNameChar(str[len])) {
    len++;
  }

  auto name = str.substr(0, len);
  str.remove_prefix(len);
  return name;
}

/// Consumes a value up to an unquoted `;` or the end of the line.
std::optional<std::string>
takeValue(std::string_view& str) {
  std::string value;

  while (!str.empty() && str.front() != ';') {
    const char c = str.front();
    str.remove_prefix(1);

    if (c == '\'') {
      auto end = str.find('\'');
      if (end == std::string_view::npos) {
        return std::nullopt;
      }
      value.append(str.substr(0, end));
      str.remove_prefix(end + 1);
    } else if (c == '\\') {
      if (str.empty()) {
        return std::nullopt;
      }
      value.push_back(str.front());
      str.remove_prefix(1);
    } else if (c == ' ' || c == '\t') {
      // Unquoted whitespace ends the word, only a terminator may follow.
      if (!trim(str).empty() && trim(str).front() != ';') {
        return std::nullopt;
      }
      str = trim(str);
    } else {
      value.push_back(c);
    }
  }

  return value;
}

bool
isTerminated(std::string_view rest) {
  rest = trim(rest);
  if (rest.empty()) {
    return true;
  }
  return rest.front() == ';' && trim(rest.substr(1)).empty();
}

} // namespace

ErrorOr<Environment>
parseShellAssignments(std::string_view text) {
  Environment result;

  int lineNo = 0;
  while (!text.empty()) {
    lineNo++;

    const auto eol = text.find('\n');
    auto line = trim(text.substr(0, eol));
    text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto syntaxError = [lineNo](std::string_view what) {
      return Error::make("line " + std::to_string(lineNo) + ": " +
                         std::string(what));
    };

    if (line.substr(0, 7) == "export ") {
      auto rest = trim(line.substr(7));
      if (!takeName(rest).has_value() || !isTerminated(rest)) {
        return syntaxError("invalid export");
      }
      continue;
    }

    auto name = takeName(line);
    if (!name.has_value() || line.empty() || line.front() != '=') {
      return syntaxError("expected NAME=value");
    }
    line.remove_prefix(1);

    auto value = takeValue(line);
    if (!value.has_value() || !isTerminated(line)) {
      return syntaxError("malformed value for " + std::string(*name));
    }

    result.set(std::string(*name), std::move(*value));
  }

  return result;
}

std::string
shellQuote(std::string_view value) {
  const bool plain =
    !value.empty() && value.find_first_not_of(
                        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                        "0123456789_-./:=,+@%") == std::string_view::npos;
  if (plain) {
    return std::string(value);
  }

  std::string result = "'";
  for (char c : value) {
    if (c == '\'') {
      result += "'\\''";
    } else {
      result.push_back(c);
    }
  }
  result += '\'';
  return result;
}

} // namespace deskboot
