#include "tests/helpers/test_helpers.hpp"

#include "cortex/memory/frontmatter.hpp"
#include "cortex/observability/global.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace cortex::testing {

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("cortex-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::optional<std::string> TempDir::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool TempDir::exists(const std::string &name) const {
  std::error_code ec;
  return std::filesystem::exists(path_ / name, ec);
}

TempStore::TempStore(const bool strict_reindex)
    : serializer_(std::make_shared<memory::FrontmatterSerializer>()) {
  storage_ = std::make_shared<storage::FilesystemStorage>(storage::FilesystemStorageOptions{
      .layout = storage::StorageLayout{.root = dir_.path()},
      .strict_reindex = strict_reindex,
      .reindex_timeout = std::chrono::milliseconds(0),
      .tokenizer = nullptr,
      .serializer = serializer_});
}

void TempStore::write_raw_memory(const std::string &relative, const std::string &content,
                                 const common::Timestamp updated_at,
                                 const std::optional<common::Timestamp> expires_at) const {
  memory::Memory value{.metadata = {.created_at = updated_at,
                                    .updated_at = updated_at,
                                    .tags = {},
                                    .source = "test",
                                    .expires_at = expires_at,
                                    .citations = {}},
                       .content = content};
  const auto serialized = serializer_->serialize(value);
  if (!serialized.ok()) {
    throw std::runtime_error(describe_failure(serialized.error()));
  }
  dir_.create_file(relative, serialized.value());
}

std::shared_ptr<Recorded> install_recorder() {
  auto sink = std::make_shared<Recorded>();
  observability::set_global_observer(std::make_unique<RecordingObserver>(sink));
  return sink;
}

common::Timestamp at(const std::string &iso8601) {
  const auto parsed = common::parse_iso8601(iso8601);
  if (!parsed.ok()) {
    throw std::runtime_error("bad test timestamp: " + iso8601);
  }
  return parsed.value();
}

std::string describe_failure(const common::Error &error) { return error.describe(); }

} // namespace cortex::testing
