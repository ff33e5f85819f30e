#include "test_framework.hpp"

#include "cortex/memory/identity.hpp"

void register_identity_tests(std::vector<cortex::tests::TestCase> &tests) {
  using cortex::tests::require;
  namespace mem = cortex::memory;
  using cortex::common::ErrorCode;

  tests.push_back({"identity_valid_slug_characters", [] {
                     require(mem::is_valid_slug("project-cortex-2"), "slug should be valid");
                     require(!mem::is_valid_slug(""), "empty slug should be invalid");
                     require(!mem::is_valid_slug("Project"), "uppercase should be invalid");
                     require(!mem::is_valid_slug("a_b"), "underscore should be invalid");
                     require(!mem::is_valid_slug("a.b"), "dot should be invalid");
                     require(!mem::is_valid_slug(".."), "parent ref should be invalid");
                   }});

  tests.push_back({"identity_normalizes_whitespace_segments", [] {
                     const auto identity = mem::validate_slug_path(" project / /cortex/ notes ");
                     require(identity.ok(), "path should validate");
                     require(identity.value().slug == "notes", "slug mismatch");
                     require(identity.value().category_path() == "project/cortex",
                             "category mismatch");
                     require(identity.value().slug_path() == "project/cortex/notes",
                             "slug path mismatch");
                   }});

  tests.push_back({"identity_requires_category_and_slug", [] {
                     const auto single = mem::validate_slug_path("notes");
                     require(!single.ok() && single.error().code == ErrorCode::InvalidPath,
                             "single segment should be INVALID_PATH");
                     const auto blank = mem::validate_slug_path(" / ");
                     require(!blank.ok() && blank.error().code == ErrorCode::InvalidPath,
                             "blank path should be INVALID_PATH");
                   }});

  tests.push_back({"identity_rejects_bad_segments", [] {
                     const auto upper = mem::validate_slug_path("project/Notes");
                     require(!upper.ok() && upper.error().code == ErrorCode::InvalidSlug,
                             "uppercase segment should be INVALID_SLUG");
                     require(upper.error().field == std::optional<std::string>("Notes"),
                             "field should name the bad segment");
                     const auto dots = mem::validate_slug_path("../etc/passwd");
                     require(!dots.ok() && dots.error().code == ErrorCode::InvalidSlug,
                             "parent traversal should be rejected");
                   }});

  tests.push_back({"identity_reserves_index_slug", [] {
                     const auto reserved = mem::validate_slug_path("project/index");
                     require(!reserved.ok() && reserved.error().code == ErrorCode::InvalidSlug,
                             "index slug should be reserved");
                     require(mem::validate_slug_path("index/notes").ok(),
                             "index is only reserved as the terminal slug");
                   }});

  tests.push_back({"identity_category_path_validation", [] {
                     const auto ok = mem::validate_category_path("project/ cortex /");
                     require(ok.ok() && ok.value() == "project/cortex", "category normalize failed");
                     const auto empty = mem::validate_category_path("//");
                     require(!empty.ok() && empty.error().code == ErrorCode::InvalidPath,
                             "empty category should be INVALID_PATH");
                     const auto bad = mem::validate_category_path("project/My Notes");
                     require(!bad.ok() && bad.error().code == ErrorCode::InvalidSlug,
                             "bad category segment should be INVALID_SLUG");
                   }});

  tests.push_back({"identity_parent_and_chain", [] {
                     require(mem::parent_category("a/b/c") == "a/b", "parent mismatch");
                     require(mem::parent_category("a").empty(), "top-level parent should be root");
                     const auto chain = mem::category_chain("a/b/c");
                     require(chain == std::vector<std::string>({"a", "a/b", "a/b/c"}),
                             "chain mismatch");
                     require(mem::category_chain("").empty(), "root chain should be empty");
                   }});
}
