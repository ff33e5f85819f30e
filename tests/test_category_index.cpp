#include "test_framework.hpp"

#include "cortex/common/time.hpp"
#include "cortex/index/category_index.hpp"
#include "cortex/index/index_builder.hpp"
#include "cortex/index/tree_walk.hpp"

#include <map>

void register_category_index_tests(std::vector<cortex::tests::TestCase> &tests) {
  using cortex::tests::require;
  namespace idx = cortex::index;
  namespace common = cortex::common;
  using common::ErrorCode;

  tests.push_back({"category_index_parses_block_format", [] {
                     const std::string raw = "memories:\n"
                                             "  - path: project/notes\n"
                                             "    token_estimate: 42\n"
                                             "    summary: \"Weekly \\\"sync\\\" notes\"\n"
                                             "    updated_at: 2024-05-01T10:00:00.000Z\n"
                                             "subcategories:\n"
                                             "  - path: project/cortex\n"
                                             "    memory_count: 3\n"
                                             "    description: Engine work\n";
                     const auto parsed = idx::parse_category_index(raw);
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().describe());
                     const auto &index = parsed.value();
                     require(index.memories.size() == 1, "memory count mismatch");
                     require(index.memories[0].token_estimate == 42, "token estimate mismatch");
                     require(index.memories[0].summary ==
                                 std::optional<std::string>("Weekly \"sync\" notes"),
                             "summary mismatch");
                     require(index.memories[0].updated_at.has_value(), "updated_at missing");
                     require(index.subcategories.size() == 1, "subcategory count mismatch");
                     require(index.subcategories[0].memory_count == 3, "memory_count mismatch");
                     require(index.subcategories[0].description ==
                                 std::optional<std::string>("Engine work"),
                             "description mismatch");
                   }});

  tests.push_back({"category_index_serializes_empty_sections", [] {
                     const auto text = idx::serialize_category_index(idx::CategoryIndex{});
                     require(text == "memories: []\nsubcategories: []\n", "empty index text mismatch");
                     const auto parsed = idx::parse_category_index(text);
                     require(parsed.ok(), "empty index should parse");
                     require(parsed.value() == idx::CategoryIndex{}, "empty index should be empty");
                     require(idx::parse_category_index("").ok(), "blank document should parse");
                   }});

  tests.push_back({"category_index_serialize_parse_preserves_fields", [] {
                     const auto updated = common::parse_iso8601("2024-05-01T10:00:00.123Z");
                     require(updated.ok(), "timestamp parse failed");
                     idx::CategoryIndex index;
                     index.memories.push_back(idx::IndexMemoryEntry{
                         .path = "a/one", .token_estimate = 7, .summary = "line\nbreak",
                         .updated_at = updated.value()});
                     index.memories.push_back(
                         idx::IndexMemoryEntry{.path = "a/two", .token_estimate = 0});
                     index.subcategories.push_back(idx::IndexSubcategoryEntry{
                         .path = "a/b", .memory_count = 0, .description = "Colon: value"});
                     const auto parsed = idx::parse_category_index(idx::serialize_category_index(index));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().describe());
                     require(parsed.value() == index, "index should survive serialization");
                   }});

  tests.push_back({"category_index_error_codes", [] {
                     const auto unknown_section = idx::parse_category_index("entries: []\n");
                     require(!unknown_section.ok() &&
                                 unknown_section.error().code == ErrorCode::InvalidIndexSection,
                             "unknown section should be INVALID_INDEX_SECTION");

                     const auto duplicate =
                         idx::parse_category_index("memories: []\nmemories: []\n");
                     require(!duplicate.ok() &&
                                 duplicate.error().code == ErrorCode::InvalidIndexSection,
                             "duplicate section should be INVALID_INDEX_SECTION");

                     const auto bad_number = idx::parse_category_index(
                         "memories:\n  - path: a/b\n    token_estimate: many\n");
                     require(!bad_number.ok() &&
                                 bad_number.error().code == ErrorCode::InvalidIndexNumber,
                             "bad number should be INVALID_INDEX_NUMBER");
                     require(bad_number.error().line == std::optional<std::size_t>(3),
                             "bad number line mismatch");

                     const auto missing_estimate =
                         idx::parse_category_index("memories:\n  - path: a/b\n");
                     require(!missing_estimate.ok() &&
                                 missing_estimate.error().code == ErrorCode::MissingField,
                             "missing token_estimate should be MISSING_FIELD");

                     const auto wrong_key = idx::parse_category_index(
                         "subcategories:\n  - path: a\n    token_estimate: 1\n");
                     require(!wrong_key.ok() &&
                                 wrong_key.error().code == ErrorCode::InvalidIndexEntry,
                             "memory key in subcategories should be INVALID_INDEX_ENTRY");

                     const auto garbage = idx::parse_category_index("not an index\n");
                     require(!garbage.ok() && garbage.error().code == ErrorCode::InvalidIndexFormat,
                             "garbage should be INVALID_INDEX_FORMAT");

                     const auto bad_date = idx::parse_category_index(
                         "memories:\n  - path: a/b\n    token_estimate: 1\n    updated_at: soon\n");
                     require(!bad_date.ok() && bad_date.error().code == ErrorCode::InvalidTimestamp,
                             "bad updated_at should be INVALID_TIMESTAMP");
                   }});

  tests.push_back({"category_index_upsert_keeps_summary_and_description", [] {
                     idx::CategoryIndex index;
                     idx::upsert_memory_entry(index, idx::IndexMemoryEntry{
                                                         .path = "a/z", .token_estimate = 1,
                                                         .summary = "kept"});
                     idx::upsert_memory_entry(index,
                                              idx::IndexMemoryEntry{.path = "a/b", .token_estimate = 2});
                     idx::upsert_memory_entry(index,
                                              idx::IndexMemoryEntry{.path = "a/z", .token_estimate = 5});
                     require(index.memories.size() == 2, "upsert should replace by path");
                     require(index.memories[0].path == "a/b", "entries should be sorted");
                     require(index.memories[1].token_estimate == 5, "estimate should update");
                     require(index.memories[1].summary == std::optional<std::string>("kept"),
                             "summary should survive an upsert without one");

                     idx::upsert_subcategory_entry(index, idx::IndexSubcategoryEntry{
                                                              .path = "a/c", .memory_count = 1,
                                                              .description = "about c"});
                     idx::upsert_subcategory_entry(
                         index, idx::IndexSubcategoryEntry{.path = "a/c", .memory_count = 4});
                     require(index.subcategories.size() == 1, "subcategory upsert duplicated");
                     require(index.subcategories[0].memory_count == 4, "count should update");
                     require(index.subcategories[0].description ==
                                 std::optional<std::string>("about c"),
                             "description should survive");

                     require(idx::remove_memory_entry(index, "a/b"), "remove should find entry");
                     require(!idx::remove_memory_entry(index, "a/b"), "second remove should miss");
                     require(idx::remove_subcategory_entry(index, "a/c"), "remove sub failed");
                   }});

  tests.push_back({"index_builder_builds_full_tree", [] {
                     idx::IndexBuilder builder;
                     builder.add_category("empty/deep");
                     builder.add_memory("project/cortex",
                                        idx::IndexMemoryEntry{.path = "project/cortex/a",
                                                              .token_estimate = 1});
                     builder.add_memory("project/cortex",
                                        idx::IndexMemoryEntry{.path = "project/cortex/b",
                                                              .token_estimate = 1});
                     builder.add_memory("project", idx::IndexMemoryEntry{.path = "project/top",
                                                                         .token_estimate = 1});
                     builder.set_description("project", "All projects");
                     const auto tree = builder.build();

                     require(tree.contains(""), "root missing");
                     require(tree.size() == 5, "tree should hold root plus four categories");
                     require(builder.memory_count() == 3, "memory count mismatch");
                     require(builder.category_count() == 4, "category count mismatch");

                     const auto &root = tree.at("");
                     require(root.subcategories.size() == 2, "root should list two children");
                     require(root.subcategories[0].path == "empty", "root children unsorted");
                     require(root.subcategories[1].memory_count == 1,
                             "project count should be direct memories only");
                     require(root.subcategories[1].description ==
                                 std::optional<std::string>("All projects"),
                             "description missing");
                     require(tree.at("project").subcategories.front().memory_count == 2,
                             "cortex count mismatch");
                     require(tree.at("empty/deep").memories.empty(), "empty category not empty");
                   }});

  tests.push_back({"tree_walk_guards_against_cycles", [] {
                     std::map<std::string, idx::CategoryIndex> graph;
                     graph["a"].subcategories.push_back({.path = "a/b", .memory_count = 0});
                     graph["a/b"].subcategories.push_back({.path = "a", .memory_count = 0});
                     graph["a/b"].subcategories.push_back({.path = "a/c", .memory_count = 0});
                     graph["a/c"];

                     std::vector<std::string> order;
                     const auto status = idx::walk_category_tree(
                         {"a", "a/c"},
                         [&graph](const std::string &category) {
                           return common::Result<idx::CategoryIndex>::success(graph[category]);
                         },
                         [&order](const std::string &category, const idx::CategoryIndex &) {
                           order.push_back(category);
                           return common::Status::success();
                         });
                     require(status.ok(), "walk should succeed");
                     require(order == std::vector<std::string>({"a", "a/b", "a/c"}),
                             "walk should visit each node once in depth-first order");
                   }});

  tests.push_back({"tree_walk_stops_on_failure", [] {
                     std::size_t visits = 0;
                     const auto status = idx::walk_category_tree(
                         {"x", "y"},
                         [](const std::string &category) {
                           if (category == "x") {
                             return common::Result<idx::CategoryIndex>::failure(common::make_error(
                                 common::ErrorCode::StorageError, "boom"));
                           }
                           return common::Result<idx::CategoryIndex>::success({});
                         },
                         [&visits](const std::string &, const idx::CategoryIndex &) {
                           ++visits;
                           return common::Status::success();
                         });
                     require(!status.ok(), "walk should fail");
                     require(visits == 0, "no node should be visited after the failure");
                   }});
}
