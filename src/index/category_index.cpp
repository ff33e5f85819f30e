#include "cortex/index/category_index.hpp"

#include "cortex/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace cortex::index {

namespace {

enum class Section { None, Memories, Subcategories };

struct EntryState {
  std::optional<std::string> path;
  std::optional<std::size_t> token_estimate;
  std::optional<std::string> summary;
  std::optional<common::Timestamp> updated_at;
  std::optional<std::size_t> memory_count;
  std::optional<std::string> description;
  std::size_t line = 0;
};

common::Error parse_error(const common::ErrorCode code, std::string message,
                          const std::size_t line, std::optional<std::string> field = std::nullopt) {
  common::Error error = common::make_error(code, std::move(message));
  error.line = line;
  error.field = std::move(field);
  return error;
}

std::size_t indent_of(const std::string &line) {
  std::size_t indent = 0;
  while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
    ++indent;
  }
  return indent;
}

std::string quote(const std::string &value) {
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
    case '\r':
      out += "\\r";
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

std::string unquote(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      switch (next) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(next);
        break;
      }
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

common::Result<std::size_t> parse_count(const std::string &raw, const std::string &field,
                                        const std::size_t line) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return common::Result<std::size_t>::failure(
        parse_error(common::ErrorCode::MissingField, "Missing " + field + " value", line, field));
  }
  std::size_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return common::Result<std::size_t>::failure(parse_error(
        common::ErrorCode::InvalidIndexNumber, "Invalid " + field + " value", line, field));
  }
  return common::Result<std::size_t>::success(parsed);
}

common::Status apply_key(EntryState &state, const Section section, const std::string &key,
                         const std::string &value, const std::size_t line) {
  const bool in_memories = section == Section::Memories;
  if (key == "path") {
    const std::string path = unquote(value);
    if (path.empty()) {
      return common::Status::failure(
          parse_error(common::ErrorCode::MissingField, "Missing path value", line, "path"));
    }
    state.path = path;
    return common::Status::success();
  }
  if (key == "token_estimate" && in_memories) {
    auto parsed = parse_count(value, key, line);
    if (!parsed.ok()) {
      return common::Status::failure(parsed.error());
    }
    state.token_estimate = parsed.value();
    return common::Status::success();
  }
  if (key == "summary" && in_memories) {
    const std::string summary = unquote(value);
    if (!summary.empty()) {
      state.summary = summary;
    }
    return common::Status::success();
  }
  if (key == "updated_at" && in_memories) {
    const std::string text = unquote(value);
    if (text.empty()) {
      return common::Status::success();
    }
    auto parsed = common::parse_iso8601(text);
    if (!parsed.ok()) {
      return common::Status::failure(parse_error(common::ErrorCode::InvalidTimestamp,
                                                 "Invalid updated_at value", line, key));
    }
    state.updated_at = parsed.value();
    return common::Status::success();
  }
  if (key == "memory_count" && !in_memories) {
    auto parsed = parse_count(value, key, line);
    if (!parsed.ok()) {
      return common::Status::failure(parsed.error());
    }
    state.memory_count = parsed.value();
    return common::Status::success();
  }
  if (key == "description" && !in_memories) {
    const std::string description = unquote(value);
    if (!description.empty()) {
      state.description = description;
    }
    return common::Status::success();
  }
  return common::Status::failure(parse_error(common::ErrorCode::InvalidIndexEntry,
                                             "Unexpected index field: " + key, line, key));
}

common::Status finalize_entry(const EntryState &state, const Section section,
                              CategoryIndex &index) {
  if (!state.path.has_value()) {
    return common::Status::failure(
        parse_error(common::ErrorCode::MissingField, "Missing path value", state.line, "path"));
  }
  if (section == Section::Memories) {
    if (!state.token_estimate.has_value()) {
      return common::Status::failure(parse_error(common::ErrorCode::MissingField,
                                                 "Missing token_estimate value", state.line,
                                                 "token_estimate"));
    }
    index.memories.push_back(IndexMemoryEntry{.path = *state.path,
                                              .token_estimate = *state.token_estimate,
                                              .summary = state.summary,
                                              .updated_at = state.updated_at});
    return common::Status::success();
  }
  if (!state.memory_count.has_value()) {
    return common::Status::failure(parse_error(common::ErrorCode::MissingField,
                                               "Missing memory_count value", state.line,
                                               "memory_count"));
  }
  index.subcategories.push_back(IndexSubcategoryEntry{.path = *state.path,
                                                      .memory_count = *state.memory_count,
                                                      .description = state.description});
  return common::Status::success();
}

// Splits `key: value`; the key must be `[A-Za-z0-9_]+`.
bool split_key_value(const std::string &text, std::string &key, std::string &value) {
  const std::size_t colon = text.find(':');
  if (colon == std::string::npos) {
    return false;
  }
  key = common::trim(text.substr(0, colon));
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                         (ch >= '0' && ch <= '9') || ch == '_';
    if (!allowed) {
      return false;
    }
  }
  value = common::trim(text.substr(colon + 1));
  return true;
}

} // namespace

const IndexMemoryEntry *CategoryIndex::find_memory(const std::string &path) const {
  const auto it = std::find_if(memories.begin(), memories.end(),
                               [&path](const IndexMemoryEntry &entry) { return entry.path == path; });
  return it == memories.end() ? nullptr : &*it;
}

const IndexSubcategoryEntry *CategoryIndex::find_subcategory(const std::string &path) const {
  const auto it =
      std::find_if(subcategories.begin(), subcategories.end(),
                   [&path](const IndexSubcategoryEntry &entry) { return entry.path == path; });
  return it == subcategories.end() ? nullptr : &*it;
}

common::Result<CategoryIndex> parse_category_index(const std::string &raw) {
  CategoryIndex index;
  Section section = Section::None;
  bool seen_memories = false;
  bool seen_subcategories = false;
  std::optional<EntryState> entry;
  std::size_t entry_indent = 0;

  const auto flush = [&]() -> common::Status {
    if (!entry.has_value()) {
      return common::Status::success();
    }
    auto status = finalize_entry(*entry, section, index);
    entry.reset();
    return status;
  };

  const auto lines = common::split(raw, '\n');
  for (std::size_t i = 0; i < lines.size(); ++i) {
    std::string line = lines[i];
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const std::size_t line_number = i + 1;
    const std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const std::size_t indent = indent_of(line);
    const bool is_item = trimmed.front() == '-' && (trimmed.size() == 1 || trimmed[1] == ' ');

    if (indent == 0 && !is_item) {
      auto flushed = flush();
      if (!flushed.ok()) {
        return common::Result<CategoryIndex>::failure(flushed.error());
      }
      std::string key;
      std::string value;
      if (!split_key_value(trimmed, key, value)) {
        return common::Result<CategoryIndex>::failure(parse_error(
            common::ErrorCode::InvalidIndexFormat, "Invalid index format", line_number));
      }
      const bool empty_list = value.empty() || common::trim(value) == "[]";
      if (!empty_list || (key != "memories" && key != "subcategories")) {
        return common::Result<CategoryIndex>::failure(parse_error(
            common::ErrorCode::InvalidIndexSection, "Unexpected index section: " + key,
            line_number, key));
      }
      bool &seen = key == "memories" ? seen_memories : seen_subcategories;
      if (seen) {
        return common::Result<CategoryIndex>::failure(parse_error(
            common::ErrorCode::InvalidIndexSection, "Duplicate index section: " + key,
            line_number, key));
      }
      seen = true;
      section = key == "memories" ? Section::Memories : Section::Subcategories;
      continue;
    }

    if (section == Section::None) {
      return common::Result<CategoryIndex>::failure(parse_error(
          common::ErrorCode::InvalidIndexSection, "Index entry outside of a section",
          line_number));
    }

    std::string body;
    if (is_item) {
      auto flushed = flush();
      if (!flushed.ok()) {
        return common::Result<CategoryIndex>::failure(flushed.error());
      }
      entry = EntryState{};
      entry->line = line_number;
      entry_indent = indent;
      body = common::trim(trimmed.substr(1));
      if (body.empty()) {
        continue;
      }
    } else {
      if (!entry.has_value() || indent <= entry_indent) {
        return common::Result<CategoryIndex>::failure(parse_error(
            common::ErrorCode::InvalidIndexEntry, "Invalid index entry", line_number));
      }
      body = trimmed;
    }

    std::string key;
    std::string value;
    if (!split_key_value(body, key, value)) {
      return common::Result<CategoryIndex>::failure(
          parse_error(common::ErrorCode::InvalidIndexEntry, "Invalid index entry", line_number));
    }
    auto applied = apply_key(*entry, section, key, value, line_number);
    if (!applied.ok()) {
      return common::Result<CategoryIndex>::failure(applied.error());
    }
  }

  auto flushed = flush();
  if (!flushed.ok()) {
    return common::Result<CategoryIndex>::failure(flushed.error());
  }
  return common::Result<CategoryIndex>::success(std::move(index));
}

std::string serialize_category_index(const CategoryIndex &index) {
  std::ostringstream out;
  if (index.memories.empty()) {
    out << "memories: []\n";
  } else {
    out << "memories:\n";
    for (const auto &entry : index.memories) {
      out << "  - path: " << entry.path << "\n";
      out << "    token_estimate: " << entry.token_estimate << "\n";
      if (entry.summary.has_value()) {
        out << "    summary: " << quote(*entry.summary) << "\n";
      }
      if (entry.updated_at.has_value()) {
        out << "    updated_at: " << common::format_iso8601(*entry.updated_at) << "\n";
      }
    }
  }

  if (index.subcategories.empty()) {
    out << "subcategories: []\n";
  } else {
    out << "subcategories:\n";
    for (const auto &entry : index.subcategories) {
      out << "  - path: " << entry.path << "\n";
      out << "    memory_count: " << entry.memory_count << "\n";
      if (entry.description.has_value()) {
        out << "    description: " << quote(*entry.description) << "\n";
      }
    }
  }
  return out.str();
}

void sort_entries(CategoryIndex &index) {
  std::sort(index.memories.begin(), index.memories.end(),
            [](const IndexMemoryEntry &a, const IndexMemoryEntry &b) { return a.path < b.path; });
  std::sort(index.subcategories.begin(), index.subcategories.end(),
            [](const IndexSubcategoryEntry &a, const IndexSubcategoryEntry &b) {
              return a.path < b.path;
            });
}

void upsert_memory_entry(CategoryIndex &index, IndexMemoryEntry entry) {
  auto it = std::find_if(index.memories.begin(), index.memories.end(),
                         [&entry](const IndexMemoryEntry &e) { return e.path == entry.path; });
  if (it != index.memories.end()) {
    if (!entry.summary.has_value()) {
      entry.summary = it->summary;
    }
    *it = std::move(entry);
  } else {
    index.memories.push_back(std::move(entry));
  }
  sort_entries(index);
}

void upsert_subcategory_entry(CategoryIndex &index, IndexSubcategoryEntry entry) {
  auto it = std::find_if(index.subcategories.begin(), index.subcategories.end(),
                         [&entry](const IndexSubcategoryEntry &e) { return e.path == entry.path; });
  if (it != index.subcategories.end()) {
    if (!entry.description.has_value()) {
      entry.description = it->description;
    }
    *it = std::move(entry);
  } else {
    index.subcategories.push_back(std::move(entry));
  }
  sort_entries(index);
}

bool remove_memory_entry(CategoryIndex &index, const std::string &path) {
  return std::erase_if(index.memories,
                       [&path](const IndexMemoryEntry &e) { return e.path == path; }) > 0;
}

bool remove_subcategory_entry(CategoryIndex &index, const std::string &path) {
  return std::erase_if(index.subcategories,
                       [&path](const IndexSubcategoryEntry &e) { return e.path == path; }) > 0;
}

} // namespace cortex::index
