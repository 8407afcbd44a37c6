#include "test_framework.hpp"

#include "fileweave/chunking/chunker.hpp"
#include "fileweave/chunking/engine.hpp"
#include "fileweave/common/hash.hpp"
#include "fileweave/common/utf8.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <set>
#include <variant>

namespace {

namespace chunking = fileweave::chunking;

chunking::ChunkingConfig make_config(chunking::ChunkStrategy strategy, std::size_t max,
                                     std::size_t overlap) {
  chunking::ChunkingConfig config;
  config.strategy = strategy;
  config.max_chunk_size = max;
  config.overlap_size = overlap;
  return config;
}

std::vector<chunking::DocumentChunk> chunk_with(chunking::ChunkStrategy strategy,
                                                std::string_view content, std::size_t max,
                                                std::size_t overlap) {
  auto chunker = chunking::create_chunker(make_config(strategy, max, overlap));
  fileweave::tests::require(chunker.ok(), chunker.error());
  auto chunks = chunker.value()->chunk(content);
  fileweave::tests::require(chunks.ok(), chunks.error());
  return chunks.value();
}

std::string concatenate(const std::vector<chunking::DocumentChunk> &chunks) {
  std::string out;
  for (const auto &chunk : chunks) {
    out += chunk.content;
  }
  return out;
}

std::vector<std::string> contents(const std::vector<chunking::DocumentChunk> &chunks) {
  std::vector<std::string> out;
  for (const auto &chunk : chunks) {
    out.push_back(chunk.content);
  }
  return out;
}

} // namespace

void register_chunking_tests(std::vector<fileweave::tests::TestCase> &tests) {
  using fileweave::tests::require;
  namespace common = fileweave::common;
  using chunking::ChunkStrategy;
  using fileweave::testing::TempWorkspace;

  tests.push_back({"chunk_strategy_names_round_trip", [] {
                     require(chunking::chunk_strategy_to_string(ChunkStrategy::FixedSize) ==
                                 "fixed_size",
                             "snake_case name expected");
                     const auto camel = chunking::chunk_strategy_from_string("ParagraphBoundary");
                     require(camel.ok() && camel.value() == ChunkStrategy::ParagraphBoundary,
                             "CamelCase should parse");
                     const auto snake = chunking::chunk_strategy_from_string("semantic_similarity");
                     require(snake.ok() && snake.value() == ChunkStrategy::SemanticSimilarity,
                             "snake_case should parse");
                     require(!chunking::chunk_strategy_from_string("by_mood").ok(),
                             "unknown strategy should fail");
                     const auto format = chunking::document_format_from_string("DiscordHtml");
                     require(format.ok() && format.value() == chunking::DocumentFormat::DiscordHtml,
                             "format should parse");
                     require(chunking::document_format_to_string(chunking::DocumentFormat::Json) ==
                                 "json",
                             "format name mismatch");
                   }});

  tests.push_back({"chunking_config_defaults_and_validation", [] {
                     const chunking::ChunkingConfig defaults;
                     require(defaults.max_chunk_size == 2000, "default max");
                     require(defaults.overlap_size == 200, "default overlap");
                     require(defaults.strategy == ChunkStrategy::SentenceBoundary,
                             "default strategy");
                     require(defaults.preserve_metadata, "default preserve_metadata");
                     require(defaults.format == chunking::DocumentFormat::PlainText,
                             "default format");
                     require(defaults.validate().ok(), "defaults are valid");

                     const auto equal = make_config(ChunkStrategy::FixedSize, 10, 10).validate();
                     require(!equal.ok(), "overlap == max should fail");
                     require(equal.kind() == common::ErrorKind::InvalidConfig, "kind mismatch");
                     require(!make_config(ChunkStrategy::FixedSize, 0, 0).validate().ok(),
                             "zero max should fail");
                     require(!chunking::create_chunker(make_config(ChunkStrategy::FixedSize, 5, 9))
                                  .ok(),
                             "factory should validate");
                   }});

  tests.push_back({"chunking_config_from_settings", [] {
                     fileweave::config::ChunkingSettings settings;
                     settings.max_chunk_size = 300;
                     settings.overlap_size = 30;
                     settings.strategy = "FixedSize";
                     settings.format = "markdown";
                     settings.preserve_metadata = false;
                     const auto config = chunking::ChunkingConfig::from_settings(settings);
                     require(config.ok(), config.error());
                     require(config.value().strategy == ChunkStrategy::FixedSize, "strategy");
                     require(config.value().format == chunking::DocumentFormat::Markdown, "format");
                     require(!config.value().preserve_metadata, "preserve_metadata");

                     settings.overlap_size = 300;
                     require(!chunking::ChunkingConfig::from_settings(settings).ok(),
                             "invalid overlap should fail");
                   }});

  tests.push_back({"unsupported_strategies_fail_at_creation", [] {
                     for (const auto strategy :
                          {ChunkStrategy::ConversationBreak, ChunkStrategy::HtmlStructureAware,
                           ChunkStrategy::SemanticSimilarity}) {
                       const auto chunker = chunking::create_chunker(make_config(strategy, 100, 10));
                       require(!chunker.ok(), "strategy should be unsupported");
                       require(chunker.kind() == common::ErrorKind::Internal, "kind mismatch");
                       require(chunker.error().find("not supported") != std::string::npos,
                               "message should say unsupported");
                     }
                   }});

  tests.push_back({"fixed_size_splits_ascii_and_reconstructs", [] {
                     const std::string text = "This is a test string for chunking.";
                     const auto chunks = chunk_with(ChunkStrategy::FixedSize, text, 10, 0);
                     require(chunks.size() >= 2, "at least two chunks expected");
                     require(common::char_count(chunks.front().content) <= 10,
                             "first chunk within limit");
                     require(concatenate(chunks) == text, "reconstruction mismatch");
                     for (const auto &chunk : chunks) {
                       require(chunk.content.size() <= 10, "chunk exceeds max size");
                     }
                   }});

  tests.push_back({"fixed_size_never_splits_multibyte_codepoints", [] {
                     const std::string text = "Hello 世界 Test";
                     const auto chunks = chunk_with(ChunkStrategy::FixedSize, text, 5, 0);
                     require(contents(chunks) ==
                                 std::vector<std::string>({"Hello", " 世", "界 T", "est"}),
                             "unexpected chunk layout");
                     for (const auto &chunk : chunks) {
                       require(common::is_valid_utf8(chunk.content), "chunk must be valid UTF-8");
                       require(common::is_char_boundary(text, chunk.metadata.byte_range.first) &&
                                   common::is_char_boundary(text, chunk.metadata.byte_range.second),
                               "byte range must sit on boundaries");
                     }
                     require(chunks[1].metadata.byte_range == chunking::ByteRange(5, 9),
                             "byte range mismatch");
                     require(chunks[1].metadata.char_range == chunking::CharRange(5, 7),
                             "char range mismatch");
                   }});

  tests.push_back({"fixed_size_overlap_carries_trailing_bytes", [] {
                     const auto chunks = chunk_with(ChunkStrategy::FixedSize, "abcdefghij", 4, 2);
                     require(contents(chunks) ==
                                 std::vector<std::string>({"abcd", "cdefgh", "ghij"}),
                             "overlap layout mismatch");
                     require(chunks[1].metadata.byte_range == chunking::ByteRange(2, 8),
                             "overlap should move the range start");
                     require(chunks[2].metadata.char_range == chunking::CharRange(6, 10),
                             "char range should follow the overlap");
                   }});

  tests.push_back({"fixed_size_overlap_snaps_to_codepoint_boundary", [] {
                     const std::string text = "ab世cd";
                     const auto narrow = chunk_with(ChunkStrategy::FixedSize, text, 5, 2);
                     require(contents(narrow) == std::vector<std::string>({"ab世", "cd"}),
                             "overlap inside a codepoint should be dropped");
                     const auto wide = chunk_with(ChunkStrategy::FixedSize, text, 5, 3);
                     require(contents(wide) == std::vector<std::string>({"ab世", "世cd"}),
                             "overlap covering the codepoint should carry it");
                     require(wide[1].metadata.byte_range == chunking::ByteRange(2, 7),
                             "byte range mismatch");
                   }});

  tests.push_back({"fixed_size_oversized_codepoint_gets_its_own_chunk", [] {
                     const std::string text = "a🚀b";
                     const auto chunks = chunk_with(ChunkStrategy::FixedSize, text, 2, 0);
                     require(contents(chunks) == std::vector<std::string>({"a", "🚀", "b"}),
                             "wide codepoint should stand alone");
                   }});

  tests.push_back({"paragraph_chunking_one_per_paragraph_when_tight", [] {
                     const auto chunks = chunk_with(ChunkStrategy::ParagraphBoundary, "A\n\nB\n\nC", 2, 0);
                     require(contents(chunks) == std::vector<std::string>({"A", "B", "C"}),
                             "three single-paragraph chunks expected");
                     require(chunks[2].metadata.byte_range == chunking::ByteRange(6, 7),
                             "byte range mismatch");
                   }});

  tests.push_back({"paragraph_chunking_groups_and_keeps_oversized", [] {
                     const std::string text = "one\n\ntwo\n\na much longer paragraph\n\nend";
                     const auto chunks = chunk_with(ChunkStrategy::ParagraphBoundary, text, 10, 0);
                     require(contents(chunks) ==
                                 std::vector<std::string>(
                                     {"one\n\ntwo", "a much longer paragraph", "end"}),
                             "grouping mismatch");
                     const auto blank = chunk_with(ChunkStrategy::ParagraphBoundary,
                                                   "\n\n  \n\nonly\n\n", 100, 0);
                     require(contents(blank) == std::vector<std::string>({"only"}),
                             "blank paragraphs should be skipped");
                   }});

  tests.push_back({"paragraph_overlap_prefixes_context", [] {
                     const auto chunks = chunk_with(ChunkStrategy::ParagraphBoundary, "A\n\nB\n\nC", 2, 1);
                     require(chunks.size() == 3, "three chunks expected");
                     require(chunks[0].content == "A", "first chunk has no context");
                     require(chunks[1].content == "[Context: A]\n\nB", "context prefix mismatch");
                     require(chunks[2].content == "[Context: B]\n\nC", "context prefix mismatch");
                     require(chunks[1].metadata.byte_range == chunking::ByteRange(3, 4),
                             "byte range keeps pointing at the paragraph");

                     const auto long_tail = chunk_with(ChunkStrategy::ParagraphBoundary,
                                                       "long paragraph\n\nnext", 5, 4);
                     require(long_tail[1].content == "next",
                             "context longer than overlap is not carried");
                   }});

  tests.push_back({"sentence_chunking_groups_whole_sentences", [] {
                     const std::string text = "First one. Second one! Third?";
                     const auto tight = chunk_with(ChunkStrategy::SentenceBoundary, text, 15, 0);
                     require(contents(tight) ==
                                 std::vector<std::string>({"First one. ", "Second one! ", "Third?"}),
                             "sentence split mismatch");
                     require(concatenate(tight) == text, "reconstruction mismatch");

                     const auto roomy = chunk_with(ChunkStrategy::SentenceBoundary, text, 30, 0);
                     require(roomy.size() == 1, "everything fits in one chunk");

                     const auto decimal =
                         chunk_with(ChunkStrategy::SentenceBoundary, "Pi is 3.14 roughly. Yes.", 20, 0);
                     require(decimal.front().content == "Pi is 3.14 roughly. ",
                             "a dot inside a number does not end a sentence");
                   }});

  tests.push_back({"sentence_chunking_falls_back_for_long_sentences", [] {
                     const std::string text = "Tiny. " + std::string(25, 'x');
                     const auto chunks = chunk_with(ChunkStrategy::SentenceBoundary, text, 10, 0);
                     require(chunks.size() == 4, "short sentence plus three windows expected");
                     require(chunks[0].content == "Tiny. ", "first sentence mismatch");
                     for (const auto &chunk : chunks) {
                       require(chunk.content.size() <= 10, "chunk exceeds max size");
                     }
                     require(concatenate(chunks) == text, "reconstruction mismatch");
                   }});

  tests.push_back({"find_boundaries_exposes_cut_points", [] {
                     const auto fixed =
                         chunking::FixedSizeChunker(make_config(ChunkStrategy::FixedSize, 4, 0));
                     require(fixed.find_boundaries("abcdefghij") ==
                                 std::vector<std::size_t>({0, 4, 8, 10}),
                             "fixed boundaries mismatch");
                     const auto sentence = chunking::SentenceChunker(
                         make_config(ChunkStrategy::SentenceBoundary, 100, 0));
                     require(sentence.find_boundaries("A. B.") == std::vector<std::size_t>({0, 3, 5}),
                             "sentence boundaries mismatch");
                     const auto paragraph = chunking::ParagraphChunker(
                         make_config(ChunkStrategy::ParagraphBoundary, 100, 0));
                     require(paragraph.find_boundaries("A\n\nB") == std::vector<std::size_t>({0, 3, 4}),
                             "paragraph boundaries mismatch");
                   }});

  tests.push_back({"chunk_metadata_indices_ids_and_hashes", [] {
                     const auto chunks =
                         chunk_with(ChunkStrategy::FixedSize, "abcdefghijklmnopqrstuvwxyz", 5, 1);
                     std::set<std::string> ids;
                     for (std::size_t i = 0; i < chunks.size(); ++i) {
                       require(chunks[i].metadata.chunk_index == i, "indices should be sequential");
                       require(chunks[i].metadata.total_chunks == chunks.size(),
                               "total_chunks should be back-filled");
                       require(chunks[i].id.size() == 32, "id should be 128-bit hex");
                       require(chunks[i].content_hash == common::sha256_hex(chunks[i].content),
                               "content hash mismatch");
                       ids.insert(chunks[i].id);
                     }
                     require(ids.size() == chunks.size(), "ids should be unique");
                   }});

  tests.push_back({"chunkers_handle_empty_and_invalid_input", [] {
                     for (const auto strategy : {ChunkStrategy::FixedSize, ChunkStrategy::SentenceBoundary,
                                                 ChunkStrategy::ParagraphBoundary}) {
                       require(chunk_with(strategy, "", 10, 0).empty(), "empty input has no chunks");
                       auto chunker = chunking::create_chunker(make_config(strategy, 10, 0));
                       require(chunker.ok(), chunker.error());
                       const auto invalid = chunker.value()->chunk(std::string("ok\xC3", 3));
                       require(!invalid.ok(), "invalid UTF-8 should fail");
                       require(invalid.kind() == common::ErrorKind::EncodingError, "kind mismatch");
                     }
                   }});

  tests.push_back({"chunk_boundaries_always_valid_utf8", [] {
                     const std::vector<std::string> samples = {
                         "Grüße aus Köln. Ça va? Très bien!\n\nNächster Absatz.",
                         "日本語のテキスト。二つ目の文！\n\n三つ目の段落です。",
                         "mixed 🚀 emoji 🎉 text. with\n\nparagraphs 👍 and more",
                         "ascii only. nothing fancy here! ok?"};
                     for (const auto &text : samples) {
                       for (const auto strategy : {ChunkStrategy::FixedSize,
                                                   ChunkStrategy::SentenceBoundary,
                                                   ChunkStrategy::ParagraphBoundary}) {
                         for (std::size_t max = 1; max <= 24; ++max) {
                           for (const std::size_t overlap : {std::size_t{0}, max / 2}) {
                             const auto chunks = chunk_with(strategy, text, max, overlap);
                             for (const auto &chunk : chunks) {
                               const auto [begin, end] = chunk.metadata.byte_range;
                               require(common::is_valid_utf8(chunk.content),
                                       "chunk content must be valid UTF-8");
                               require(begin < end && end <= text.size(), "range out of bounds");
                               require(common::is_char_boundary(text, begin) &&
                                           common::is_char_boundary(text, end),
                                       "range must sit on codepoint boundaries");
                             }
                             if (overlap == 0 && strategy != ChunkStrategy::ParagraphBoundary) {
                               require(concatenate(chunks) == text,
                                       "zero-overlap chunks must tile the input");
                             }
                           }
                         }
                       }
                     }
                   }});

  tests.push_back({"engine_chunks_and_records_source", [] {
                     fileweave::testing::ObserverScope scope;
                     auto engine = chunking::ChunkingEngine::create(
                         make_config(ChunkStrategy::FixedSize, 4, 0));
                     require(engine.ok(), engine.error());
                     require(engine.value().chunker().name() == "fixed_size", "chunker mismatch");
                     const auto chunks = engine.value().chunk("abcdefgh", std::string("mem.txt"));
                     require(chunks.ok(), chunks.error());
                     require(chunks.value().size() == 2, "two chunks expected");
                     require(chunks.value()[0].metadata.source_file == std::optional<std::string>("mem.txt"),
                             "source file should be recorded");

                     bool saw_event = false;
                     for (const auto &event : scope.observer().events) {
                       if (const auto *chunked = std::get_if<fileweave::observability::ChunkingEvent>(&event)) {
                         saw_event = chunked->chunks == 2 && chunked->input_bytes == 8 &&
                                     chunked->strategy == "fixed_size";
                       }
                     }
                     require(saw_event, "chunking event should be recorded");
                   }});

  tests.push_back({"engine_without_metadata_drops_source", [] {
                     auto config = make_config(ChunkStrategy::SentenceBoundary, 50, 0);
                     config.preserve_metadata = false;
                     auto engine = chunking::ChunkingEngine::create(config);
                     require(engine.ok(), engine.error());
                     const auto chunks = engine.value().chunk("One. Two.", std::string("x.txt"));
                     require(chunks.ok(), chunks.error());
                     require(!chunks.value()[0].metadata.source_file.has_value(),
                             "source should be dropped");
                     require(chunks.value()[0].metadata.total_chunks == 1,
                             "positional metadata is always kept");
                   }});

  tests.push_back({"engine_chunk_file_reads_through_file_reader", [] {
                     const TempWorkspace workspace;
                     const auto path = workspace.create_file("doc.md", "Alpha.\n\nBeta.\n\nGamma.");
                     auto engine = chunking::ChunkingEngine::create(
                         make_config(ChunkStrategy::ParagraphBoundary, 8, 0));
                     require(engine.ok(), engine.error());
                     const auto chunks = engine.value().chunk_file(path);
                     require(chunks.ok(), chunks.error());
                     require(chunks.value().size() == 3, "three paragraphs expected");
                     require(chunks.value()[2].metadata.source_file ==
                                 std::optional<std::string>(path.string()),
                             "source should be the file path");

                     const auto bad = workspace.create_file("bad.txt", std::string("\xFF", 1));
                     const auto failed = engine.value().chunk_file(bad);
                     require(!failed.ok(), "invalid file should fail");
                     require(failed.kind() == common::ErrorKind::EncodingError, "kind mismatch");

                     const auto unsupported = chunking::ChunkingEngine::create(
                         make_config(ChunkStrategy::SemanticSimilarity, 100, 0));
                     require(!unsupported.ok(), "unsupported strategy should fail");
                   }});
}
