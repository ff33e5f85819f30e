#include "cortex/memory/frontmatter.hpp"

#include "cortex/common/fs.hpp"

#include <map>
#include <sstream>

namespace cortex::memory {

namespace {

struct HeaderValue {
  enum class Kind { Null, Scalar, List };
  Kind kind = Kind::Null;
  std::string scalar;
  std::vector<std::string> items;
};

using Header = std::map<std::string, HeaderValue>;

common::Error field_error(const common::ErrorCode code, std::string message, std::string field) {
  common::Error error = common::make_error(code, std::move(message));
  error.field = std::move(field);
  return error;
}

common::Error line_error(const common::ErrorCode code, std::string message,
                         const std::size_t line) {
  common::Error error = common::make_error(code, std::move(message));
  error.line = line;
  return error;
}

std::string unquote_scalar(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    std::string out;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      out.push_back(value[i]);
      if (value[i] == '\'' && i + 2 < value.size() && value[i + 1] == '\'') {
        ++i;
      }
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      if (value[i] == '\\' && i + 2 < value.size()) {
        const char next = value[++i];
        out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
        continue;
      }
      out.push_back(value[i]);
    }
    return out;
  }
  return value;
}

bool is_null_scalar(const std::string &value) {
  return value.empty() || value == "null" || value == "~" || value == "Null" || value == "NULL";
}

std::vector<std::string> split_flow_items(const std::string &body) {
  std::vector<std::string> items;
  std::string current;
  char quote = '\0';
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == '\\' && quote == '"' && i + 1 < body.size()) {
        current.push_back(body[++i]);
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
      continue;
    }
    if (ch == ',') {
      items.push_back(common::trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!common::trim(current).empty() || !items.empty()) {
    items.push_back(common::trim(current));
  }
  return items;
}

HeaderValue parse_inline_value(const std::string &raw) {
  HeaderValue value;
  const std::string trimmed = common::trim(raw);
  if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
    value.kind = HeaderValue::Kind::List;
    for (const auto &item : split_flow_items(trimmed.substr(1, trimmed.size() - 2))) {
      value.items.push_back(unquote_scalar(item));
    }
    return value;
  }
  if (is_null_scalar(trimmed)) {
    return value;
  }
  value.kind = HeaderValue::Kind::Scalar;
  value.scalar = unquote_scalar(trimmed);
  return value;
}

// Only top-level `key: value` pairs and block lists of scalars are accepted.
common::Result<Header> parse_header(const std::vector<std::string> &lines) {
  Header header;
  std::string list_key;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    const std::size_t line_number = i + 2;
    const std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const bool indented = line.front() == ' ' || line.front() == '\t';
    if (trimmed.front() == '-' && (trimmed.size() == 1 || trimmed[1] == ' ')) {
      if (list_key.empty()) {
        return common::Result<Header>::failure(line_error(
            common::ErrorCode::InvalidFrontmatter, "List item outside of a key", line_number));
      }
      auto &entry = header[list_key];
      entry.kind = HeaderValue::Kind::List;
      entry.items.push_back(unquote_scalar(trimmed.substr(1)));
      continue;
    }
    if (indented) {
      return common::Result<Header>::failure(line_error(
          common::ErrorCode::InvalidFrontmatter, "Unexpected indentation", line_number));
    }

    const std::size_t colon = trimmed.find(':');
    if (colon == std::string::npos || colon == 0) {
      return common::Result<Header>::failure(line_error(
          common::ErrorCode::InvalidFrontmatter, "Invalid YAML frontmatter", line_number));
    }
    const std::string key = common::trim(trimmed.substr(0, colon));
    const std::string rest = trimmed.substr(colon + 1);
    if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t') {
      return common::Result<Header>::failure(line_error(
          common::ErrorCode::InvalidFrontmatter, "Invalid YAML frontmatter", line_number));
    }
    if (header.contains(key)) {
      common::Error error = line_error(common::ErrorCode::InvalidFrontmatter,
                                       "Duplicate frontmatter key", line_number);
      error.field = key;
      return common::Result<Header>::failure(std::move(error));
    }

    header[key] = parse_inline_value(rest);
    list_key = header[key].kind == HeaderValue::Kind::Null ? key : std::string();
  }

  return common::Result<Header>::success(std::move(header));
}

common::Result<common::Timestamp> required_timestamp(const Header &header,
                                                     const std::string &key) {
  const auto it = header.find(key);
  if (it == header.end()) {
    return common::Result<common::Timestamp>::failure(
        field_error(common::ErrorCode::MissingField, "Missing required field: " + key, key));
  }
  if (it->second.kind != HeaderValue::Kind::Scalar) {
    return common::Result<common::Timestamp>::failure(
        field_error(common::ErrorCode::InvalidTimestamp, "Invalid timestamp for " + key, key));
  }
  auto parsed = common::parse_iso8601(it->second.scalar);
  if (!parsed.ok()) {
    return common::Result<common::Timestamp>::failure(
        field_error(common::ErrorCode::InvalidTimestamp, "Invalid timestamp for " + key, key));
  }
  return parsed;
}

common::Result<std::vector<std::string>> string_list(const Header &header, const std::string &key,
                                                     const common::ErrorCode code) {
  const auto it = header.find(key);
  if (it == header.end() || it->second.kind == HeaderValue::Kind::Null) {
    return common::Result<std::vector<std::string>>::success({});
  }
  if (it->second.kind != HeaderValue::Kind::List) {
    return common::Result<std::vector<std::string>>::failure(
        field_error(code, key + " must be a list", key));
  }
  std::vector<std::string> values;
  for (const auto &item : it->second.items) {
    const std::string trimmed = common::trim(item);
    if (trimmed.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          field_error(code, key + " must contain non-empty strings", key));
    }
    values.push_back(trimmed);
  }
  return common::Result<std::vector<std::string>>::success(std::move(values));
}

bool needs_quotes(const std::string &value) {
  if (value.empty() || common::trim(value) != value || is_null_scalar(value)) {
    return true;
  }
  if (value.find_first_of(",[]{}\"'#\n\t\\") != std::string::npos ||
      value.find(": ") != std::string::npos) {
    return true;
  }
  const char first = value.front();
  return first == '-' || first == '&' || first == '*' || first == '!' || first == '|' ||
         first == '>' || first == '%' || first == '@' || first == '`' || first == '?';
}

std::string quote_scalar(const std::string &value) {
  if (!needs_quotes(value)) {
    return value;
  }
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

std::string flow_list(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += quote_scalar(values[i]);
  }
  out += "]";
  return out;
}

} // namespace

common::Result<Memory> FrontmatterSerializer::parse(const std::string &raw) const {
  // CRLF is accepted in the header only; the body is returned byte for byte.
  auto lines = common::split(raw, '\n');
  for (auto &line : lines) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
  }

  if (lines.empty() || common::trim(lines.front()) != "---") {
    return common::Result<Memory>::failure(line_error(
        common::ErrorCode::MissingFrontmatter, "Memory file must start with frontmatter", 1));
  }

  std::size_t end_index = 0;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    if (common::trim(lines[i]) == "---") {
      end_index = i;
      break;
    }
  }
  if (end_index == 0) {
    return common::Result<Memory>::failure(
        line_error(common::ErrorCode::MissingFrontmatter,
                   "Memory file frontmatter must be closed with '---'", lines.size()));
  }

  const std::vector<std::string> header_lines(lines.begin() + 1, lines.begin() + end_index);
  auto header = parse_header(header_lines);
  if (!header.ok()) {
    return common::Result<Memory>::failure(header.error());
  }
  const Header &fields = header.value();

  Memory memory;
  auto created_at = required_timestamp(fields, "created_at");
  if (!created_at.ok()) {
    return common::Result<Memory>::failure(created_at.error());
  }
  memory.metadata.created_at = created_at.value();

  auto updated_at = required_timestamp(fields, "updated_at");
  if (!updated_at.ok()) {
    return common::Result<Memory>::failure(updated_at.error());
  }
  memory.metadata.updated_at = updated_at.value();

  auto tags = string_list(fields, "tags", common::ErrorCode::InvalidTags);
  if (!tags.ok()) {
    return common::Result<Memory>::failure(tags.error());
  }
  memory.metadata.tags = std::move(tags.value());

  const auto source = fields.find("source");
  if (source == fields.end()) {
    return common::Result<Memory>::failure(
        field_error(common::ErrorCode::MissingField, "Missing required field: source", "source"));
  }
  if (source->second.kind != HeaderValue::Kind::Scalar ||
      common::trim(source->second.scalar).empty()) {
    return common::Result<Memory>::failure(field_error(
        common::ErrorCode::InvalidSource, "Source must be a non-empty string", "source"));
  }
  memory.metadata.source = common::trim(source->second.scalar);

  if (const auto expires = fields.find("expires_at");
      expires != fields.end() && expires->second.kind != HeaderValue::Kind::Null) {
    auto expires_at = required_timestamp(fields, "expires_at");
    if (!expires_at.ok()) {
      return common::Result<Memory>::failure(expires_at.error());
    }
    memory.metadata.expires_at = expires_at.value();
  }

  auto citations = string_list(fields, "citations", common::ErrorCode::InvalidCitations);
  if (!citations.ok()) {
    return common::Result<Memory>::failure(citations.error());
  }
  memory.metadata.citations = std::move(citations.value());

  std::size_t body_start = 0;
  for (std::size_t i = 0; i <= end_index; ++i) {
    body_start = raw.find('\n', body_start);
    if (body_start == std::string::npos) {
      break;
    }
    ++body_start;
  }
  if (body_start != std::string::npos) {
    memory.content = raw.substr(body_start);
  }
  return common::Result<Memory>::success(std::move(memory));
}

common::Result<std::string> FrontmatterSerializer::serialize(const Memory &memory) const {
  const auto valid = validate_metadata(memory.metadata);
  if (!valid.ok()) {
    return common::Result<std::string>::failure(valid.error());
  }

  const auto &metadata = memory.metadata;
  std::ostringstream out;
  out << "---\n";
  out << "created_at: " << common::format_iso8601(metadata.created_at) << "\n";
  out << "updated_at: " << common::format_iso8601(metadata.updated_at) << "\n";
  out << "tags: " << flow_list(metadata.tags) << "\n";
  out << "source: " << quote_scalar(metadata.source) << "\n";
  if (metadata.expires_at.has_value()) {
    out << "expires_at: " << common::format_iso8601(*metadata.expires_at) << "\n";
  }
  if (!metadata.citations.empty()) {
    out << "citations: " << flow_list(metadata.citations) << "\n";
  }
  out << "---\n";
  out << memory.content;
  return common::Result<std::string>::success(out.str());
}

} // namespace cortex::memory
