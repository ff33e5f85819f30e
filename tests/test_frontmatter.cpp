#include "test_framework.hpp"

#include "cortex/common/time.hpp"
#include "cortex/memory/frontmatter.hpp"
#include "cortex/memory/serializer.hpp"
#include "cortex/memory/tokenizer.hpp"

namespace {

const char *VALID_MEMORY = "---\n"
                           "created_at: 2024-01-01T00:00:00.000Z\n"
                           "updated_at: 2024-01-02T12:30:00.000Z\n"
                           "tags: [example, \"with, comma\"]\n"
                           "source: user\n"
                           "expires_at: 2030-06-01T00:00:00Z\n"
                           "citations: [docs/readme.md]\n"
                           "---\n"
                           "Body line one\n"
                           "Body line two";

} // namespace

void register_frontmatter_tests(std::vector<cortex::tests::TestCase> &tests) {
  using cortex::tests::require;
  namespace mem = cortex::memory;
  namespace common = cortex::common;
  using common::ErrorCode;

  tests.push_back({"frontmatter_parses_full_header", [] {
                     mem::FrontmatterSerializer serializer;
                     const auto parsed = serializer.parse(VALID_MEMORY);
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().describe());
                     const auto &memory = parsed.value();
                     require(memory.metadata.tags ==
                                 std::vector<std::string>({"example", "with, comma"}),
                             "tags mismatch");
                     require(memory.metadata.source == "user", "source mismatch");
                     require(memory.metadata.expires_at.has_value(), "expires_at missing");
                     require(common::format_iso8601(*memory.metadata.expires_at) ==
                                 "2030-06-01T00:00:00.000Z",
                             "expires_at mismatch");
                     require(memory.metadata.citations ==
                                 std::vector<std::string>({"docs/readme.md"}),
                             "citations mismatch");
                     require(memory.content == "Body line one\nBody line two", "content mismatch");
                   }});

  tests.push_back({"frontmatter_accepts_crlf_and_block_lists", [] {
                     mem::FrontmatterSerializer serializer;
                     const std::string raw = "---\r\n"
                                             "created_at: 2024-01-01T00:00:00Z\r\n"
                                             "updated_at: 2024-01-01T00:00:00Z\r\n"
                                             "tags:\r\n"
                                             "  - alpha\r\n"
                                             "  - 'beta'\r\n"
                                             "source: \"agent\"\r\n"
                                             "unknown_key: ignored\r\n"
                                             "---\r\n"
                                             "text\r\n";
                     const auto parsed = serializer.parse(raw);
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().describe());
                     require(parsed.value().metadata.tags ==
                                 std::vector<std::string>({"alpha", "beta"}),
                             "block list mismatch");
                     require(parsed.value().metadata.source == "agent", "quoted source mismatch");
                     require(parsed.value().content == "text\r\n", "body bytes should be kept");
                   }});

  tests.push_back({"frontmatter_roundtrip_preserves_content", [] {
                     mem::FrontmatterSerializer serializer;
                     const auto created = common::parse_iso8601("2024-03-04T05:06:07.089Z");
                     require(created.ok(), "timestamp parse failed");
                     for (const std::string content :
                          {std::string(), std::string("one line"), std::string("\nleading"),
                           std::string("trailing\n\n"), std::string("a: b\n---\nafter marker"),
                           std::string("windows\r\nline endings\r\n")}) {
                       mem::Memory memory{.metadata = {.created_at = created.value(),
                                                       .updated_at = created.value(),
                                                       .tags = {"x"},
                                                       .source = "user: admin",
                                                       .expires_at = std::nullopt,
                                                       .citations = {}},
                                          .content = content};
                       const auto raw = serializer.serialize(memory);
                       require(raw.ok(), "serialize failed");
                       const auto parsed = serializer.parse(raw.value());
                       require(parsed.ok(), parsed.ok() ? "" : parsed.error().describe());
                       require(parsed.value().content == content,
                               "content did not round trip: '" + content + "'");
                       require(parsed.value().metadata.source == "user: admin",
                               "quoted source did not round trip");
                       require(parsed.value().metadata.created_at == created.value(),
                               "timestamp did not round trip");
                     }
                   }});

  tests.push_back({"frontmatter_omits_empty_citations", [] {
                     mem::FrontmatterSerializer serializer;
                     mem::Memory memory;
                     memory.metadata.source = "user";
                     memory.content = "x";
                     const auto raw = serializer.serialize(memory);
                     require(raw.ok(), "serialize failed");
                     require(raw.value().find("citations") == std::string::npos,
                             "empty citations should be omitted");
                     require(raw.value().find("expires_at") == std::string::npos,
                             "missing expiry should be omitted");
                     require(raw.value().find("tags: []") != std::string::npos,
                             "empty tags should be written as an empty list");
                   }});

  tests.push_back({"frontmatter_missing_markers", [] {
                     mem::FrontmatterSerializer serializer;
                     const auto no_open = serializer.parse("just text");
                     require(!no_open.ok() && no_open.error().code == ErrorCode::MissingFrontmatter,
                             "missing opening marker should fail");
                     const auto no_close =
                         serializer.parse("---\ncreated_at: 2024-01-01T00:00:00Z\nbody");
                     require(!no_close.ok() &&
                                 no_close.error().code == ErrorCode::MissingFrontmatter,
                             "missing closing marker should fail");
                   }});

  tests.push_back({"frontmatter_field_errors", [] {
                     mem::FrontmatterSerializer serializer;
                     const std::string ts = "2024-01-01T00:00:00Z";

                     const auto missing_created =
                         serializer.parse("---\nupdated_at: " + ts + "\nsource: u\n---\n");
                     require(!missing_created.ok() &&
                                 missing_created.error().code == ErrorCode::MissingField,
                             "missing created_at should be MISSING_FIELD");

                     const auto bad_ts = serializer.parse("---\ncreated_at: yesterday\nupdated_at: " +
                                                          ts + "\nsource: u\n---\n");
                     require(!bad_ts.ok() && bad_ts.error().code == ErrorCode::InvalidTimestamp,
                             "bad timestamp should be INVALID_TIMESTAMP");

                     const auto bad_tags = serializer.parse("---\ncreated_at: " + ts +
                                                            "\nupdated_at: " + ts +
                                                            "\ntags: solo\nsource: u\n---\n");
                     require(!bad_tags.ok() && bad_tags.error().code == ErrorCode::InvalidTags,
                             "scalar tags should be INVALID_TAGS");

                     const auto no_source = serializer.parse("---\ncreated_at: " + ts +
                                                             "\nupdated_at: " + ts + "\n---\n");
                     require(!no_source.ok() && no_source.error().code == ErrorCode::MissingField,
                             "missing source should be MISSING_FIELD");

                     const auto empty_source = serializer.parse(
                         "---\ncreated_at: " + ts + "\nupdated_at: " + ts + "\nsource: ''\n---\n");
                     require(!empty_source.ok() &&
                                 empty_source.error().code == ErrorCode::InvalidSource,
                             "empty source should be INVALID_SOURCE");

                     const auto bad_citations =
                         serializer.parse("---\ncreated_at: " + ts + "\nupdated_at: " + ts +
                                          "\nsource: u\ncitations: [a, '']\n---\n");
                     require(!bad_citations.ok() &&
                                 bad_citations.error().code == ErrorCode::InvalidCitations,
                             "empty citation should be INVALID_CITATIONS");
                   }});

  tests.push_back({"frontmatter_rejects_duplicate_keys", [] {
                     mem::FrontmatterSerializer serializer;
                     const auto parsed = serializer.parse(
                         "---\nsource: a\nsource: b\n---\n");
                     require(!parsed.ok() && parsed.error().code == ErrorCode::InvalidFrontmatter,
                             "duplicate key should be INVALID_FRONTMATTER");
                     require(parsed.error().line == std::optional<std::size_t>(3),
                             "duplicate key line mismatch");
                   }});

  tests.push_back({"frontmatter_serialize_validates_metadata", [] {
                     mem::FrontmatterSerializer serializer;
                     mem::Memory memory;
                     memory.metadata.source = "  ";
                     const auto raw = serializer.serialize(memory);
                     require(!raw.ok() && raw.error().code == ErrorCode::InvalidSource,
                             "blank source should not serialize");
                   }});

  tests.push_back({"serializer_factory_formats", [] {
                     const auto serializer = mem::create_serializer("frontmatter");
                     require(serializer.ok(), "frontmatter serializer should exist");
                     require(serializer.value()->format() == "frontmatter", "format mismatch");
                     const auto unknown = mem::create_serializer("json");
                     require(!unknown.ok() && unknown.error().code == ErrorCode::InvalidConfig,
                             "unknown format should be INVALID_CONFIG");
                   }});

  tests.push_back({"tokenizer_heuristic_estimate", [] {
                     mem::HeuristicTokenizer tokenizer;
                     require(tokenizer.estimate("") == 0, "empty text should be 0 tokens");
                     require(tokenizer.estimate(" \n\t ") == 0, "blank text should be 0 tokens");
                     require(tokenizer.estimate("a") == 1, "short text should be 1 token");
                     require(tokenizer.estimate("abcdefgh") == 2, "8 chars should be 2 tokens");
                     require(tokenizer.estimate("abcdefghi") == 3, "9 chars should round up");
                   }});
}
