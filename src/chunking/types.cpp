#include "fileweave/chunking/types.hpp"

#include "fileweave/common/fs.hpp"

#include <array>

namespace fileweave::chunking {

namespace {

struct StrategyName {
  ChunkStrategy strategy;
  const char *snake;
  const char *camel;
};

constexpr std::array<StrategyName, 6> STRATEGY_NAMES = {{
    {ChunkStrategy::FixedSize, "fixed_size", "FixedSize"},
    {ChunkStrategy::SentenceBoundary, "sentence_boundary", "SentenceBoundary"},
    {ChunkStrategy::ParagraphBoundary, "paragraph_boundary", "ParagraphBoundary"},
    {ChunkStrategy::ConversationBreak, "conversation_break", "ConversationBreak"},
    {ChunkStrategy::HtmlStructureAware, "html_structure_aware", "HtmlStructureAware"},
    {ChunkStrategy::SemanticSimilarity, "semantic_similarity", "SemanticSimilarity"},
}};

struct FormatName {
  DocumentFormat format;
  const char *snake;
  const char *camel;
};

constexpr std::array<FormatName, 5> FORMAT_NAMES = {{
    {DocumentFormat::PlainText, "plain_text", "PlainText"},
    {DocumentFormat::Markdown, "markdown", "Markdown"},
    {DocumentFormat::Html, "html", "Html"},
    {DocumentFormat::DiscordHtml, "discord_html", "DiscordHtml"},
    {DocumentFormat::Json, "json", "Json"},
}};

} // namespace

std::string chunk_strategy_to_string(const ChunkStrategy strategy) {
  for (const auto &entry : STRATEGY_NAMES) {
    if (entry.strategy == strategy) {
      return entry.snake;
    }
  }
  return "sentence_boundary";
}

common::Result<ChunkStrategy> chunk_strategy_from_string(const std::string_view value) {
  const std::string trimmed = common::trim(std::string(value));
  for (const auto &entry : STRATEGY_NAMES) {
    if (trimmed == entry.snake || trimmed == entry.camel) {
      return common::Result<ChunkStrategy>::success(entry.strategy);
    }
  }
  return common::Result<ChunkStrategy>::failure(common::make_error(
      common::ErrorKind::InvalidConfig, "unknown chunk strategy: " + trimmed));
}

std::string document_format_to_string(const DocumentFormat format) {
  for (const auto &entry : FORMAT_NAMES) {
    if (entry.format == format) {
      return entry.snake;
    }
  }
  return "plain_text";
}

common::Result<DocumentFormat> document_format_from_string(const std::string_view value) {
  const std::string trimmed = common::trim(std::string(value));
  for (const auto &entry : FORMAT_NAMES) {
    if (trimmed == entry.snake || trimmed == entry.camel) {
      return common::Result<DocumentFormat>::success(entry.format);
    }
  }
  return common::Result<DocumentFormat>::failure(common::make_error(
      common::ErrorKind::InvalidConfig, "unknown document format: " + trimmed));
}

common::Status ChunkingConfig::validate() const {
  if (max_chunk_size == 0) {
    return common::Status::failure(common::make_error(common::ErrorKind::InvalidConfig,
                                                      "max_chunk_size must be greater than 0"));
  }
  if (overlap_size >= max_chunk_size) {
    return common::Status::failure(common::make_error(
        common::ErrorKind::InvalidConfig,
        "overlap_size (" + std::to_string(overlap_size) + ") must be smaller than max_chunk_size (" +
            std::to_string(max_chunk_size) + ")"));
  }
  return common::Status::success();
}

common::Result<ChunkingConfig>
ChunkingConfig::from_settings(const config::ChunkingSettings &settings) {
  auto strategy = chunk_strategy_from_string(settings.strategy);
  if (!strategy.ok()) {
    return common::Result<ChunkingConfig>::failure(strategy.error_info());
  }
  auto format = document_format_from_string(settings.format);
  if (!format.ok()) {
    return common::Result<ChunkingConfig>::failure(format.error_info());
  }

  ChunkingConfig config{
      .max_chunk_size = settings.max_chunk_size,
      .overlap_size = settings.overlap_size,
      .strategy = strategy.value(),
      .preserve_metadata = settings.preserve_metadata,
      .format = format.value(),
  };
  if (auto valid = config.validate(); !valid.ok()) {
    return common::Result<ChunkingConfig>::failure(valid.error_info());
  }
  return common::Result<ChunkingConfig>::success(config);
}

} // namespace fileweave::chunking
