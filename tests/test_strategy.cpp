#include "test_framework.hpp"

#include "fileweave/io/size_class.hpp"
#include "fileweave/io/strategy.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <variant>

namespace {

fileweave::io::StrategySelector tiny_selector() {
  return fileweave::io::StrategySelector::create(
             fileweave::io::SizeThresholds{
                 .small_threshold = 4, .medium_threshold = 16, .stream_chunk_size = 3})
      .value();
}

} // namespace

void register_strategy_tests(std::vector<fileweave::tests::TestCase> &tests) {
  using fileweave::tests::require;
  namespace io = fileweave::io;
  namespace common = fileweave::common;
  using fileweave::testing::TempWorkspace;

  tests.push_back({"size_class_threshold_edges", [] {
                     require(io::size_class_from_size(0) == io::FileSizeClass::Small, "0 -> Small");
                     require(io::size_class_from_size(1048575) == io::FileSizeClass::Small,
                             "1048575 -> Small");
                     require(io::size_class_from_size(1048576) == io::FileSizeClass::Medium,
                             "1048576 -> Medium");
                     require(io::size_class_from_size(16777215) == io::FileSizeClass::Medium,
                             "16777215 -> Medium");
                     require(io::size_class_from_size(16777216) == io::FileSizeClass::Large,
                             "16777216 -> Large");
                     require(io::size_class_to_string(io::FileSizeClass::Medium) == "medium",
                             "name mismatch");
                   }});

  tests.push_back({"size_thresholds_are_injectable", [] {
                     const io::SizeThresholds thresholds{
                         .small_threshold = 10, .medium_threshold = 20, .stream_chunk_size = 5};
                     require(thresholds.classify(9) == io::FileSizeClass::Small, "9 -> Small");
                     require(thresholds.classify(10) == io::FileSizeClass::Medium, "10 -> Medium");
                     require(thresholds.classify(20) == io::FileSizeClass::Large, "20 -> Large");

                     fileweave::config::IoConfig io_config;
                     io_config.small_file_threshold = 100;
                     io_config.medium_file_threshold = 200;
                     io_config.stream_chunk_size = 50;
                     const auto converted = io::thresholds_from_config(io_config);
                     require(converted.small_threshold == 100 && converted.medium_threshold == 200 &&
                                 converted.stream_chunk_size == 50,
                             "config conversion mismatch");
                   }});

  tests.push_back({"strategy_selector_rejects_invalid_thresholds", [] {
                     const auto inverted = io::StrategySelector::create(io::SizeThresholds{
                         .small_threshold = 20, .medium_threshold = 10, .stream_chunk_size = 1});
                     require(!inverted.ok(), "small >= medium should fail");
                     require(inverted.kind() == common::ErrorKind::InvalidConfig, "kind mismatch");
                     const auto zero_chunk = io::StrategySelector::create(io::SizeThresholds{
                         .small_threshold = 1, .medium_threshold = 10, .stream_chunk_size = 0});
                     require(!zero_chunk.ok(), "zero stream chunk should fail");
                   }});

  tests.push_back({"strategy_selector_rejects_zero_small_threshold", [] {
                     const auto zero_small = io::StrategySelector::create(io::SizeThresholds{
                         .small_threshold = 0, .medium_threshold = 10, .stream_chunk_size = 1});
                     require(!zero_small.ok(), "zero small threshold should fail");
                     require(zero_small.kind() == common::ErrorKind::InvalidConfig, "kind mismatch");

                     const TempWorkspace workspace;
                     const auto empty = workspace.create_file("empty.txt", "");
                     const io::StrategySelector selector;
                     auto strategy = selector.optimal_for_read(empty);
                     require(strategy.ok(), strategy.error());
                     require(std::holds_alternative<io::BufferedRead>(strategy.value()),
                             "empty file must never be mapped");
                   }});

  tests.push_back({"strategy_selector_picks_by_size", [] {
                     const TempWorkspace workspace;
                     const auto small = workspace.create_file("small.txt", "abc");
                     const auto medium = workspace.create_file("medium.txt", "abcdefgh");
                     const auto large = workspace.create_file("large.txt", "abcdefghijklmnopq");
                     const auto selector = tiny_selector();

                     auto s = selector.optimal_for_read(small);
                     require(s.ok(), s.error());
                     require(std::holds_alternative<io::BufferedRead>(s.value()), "small -> buffered");

                     auto m = selector.optimal_for_read(medium);
                     require(m.ok(), m.error());
                     require(std::holds_alternative<io::MappedRead>(m.value()), "medium -> mapped");
                     require(io::strategy_name(m.value()) == "memory_mapped", "name mismatch");

                     auto l = selector.optimal_for_read(large);
                     require(l.ok(), l.error());
                     const auto *streaming = std::get_if<io::StreamingRead>(&l.value());
                     require(streaming != nullptr, "large -> streaming");
                     require(streaming->chunk_size == 3, "stream chunk size should be injected");
                     require(streaming->offset == 0, "offset starts at zero");
                   }});

  tests.push_back({"strategy_selector_read_errors", [] {
                     const TempWorkspace workspace;
                     const io::StrategySelector selector;
                     const auto missing = selector.optimal_for_read(workspace.path() / "nope.txt");
                     require(!missing.ok(), "missing file should fail");
                     require(missing.kind() == common::ErrorKind::NotFound, "kind mismatch");

                     const auto dir = selector.optimal_for_read(workspace.path());
                     require(!dir.ok(), "directory should fail");
                     require(dir.kind() == common::ErrorKind::NotAFile, "kind mismatch");
                   }});

  tests.push_back({"mapped_file_rejects_empty_file", [] {
                     const TempWorkspace workspace;
                     const auto empty = workspace.create_file("empty.bin", "");
                     const auto mapped = io::MappedFile::open(empty);
                     require(!mapped.ok(), "empty file cannot be mapped");
                     require(mapped.kind() == common::ErrorKind::Io, "kind mismatch");
                   }});

  tests.push_back({"strategy_selector_write_creates_parents", [] {
                     const TempWorkspace workspace;
                     const io::StrategySelector selector;
                     const auto target = workspace.path() / "nested" / "dir" / "out.txt";
                     auto strategy = selector.optimal_for_write(target);
                     require(strategy.ok(), strategy.error());
                     require(strategy.value().mode == io::WriteMode::Truncate, "default mode");
                     require(std::filesystem::is_directory(target.parent_path()),
                             "parent should exist");
                     auto status = strategy.value().sink.write("data");
                     require(status.ok(), status.error());
                     status = strategy.value().sink.close();
                     require(status.ok(), status.error());
                     require(workspace.read_file("nested/dir/out.txt") == "data", "content mismatch");

                     const auto dir = selector.optimal_for_write(workspace.path());
                     require(!dir.ok(), "directory target should fail");
                     require(dir.kind() == common::ErrorKind::NotAFile, "kind mismatch");
                   }});

  tests.push_back({"file_sink_refuses_truncate_while_mapped", [] {
                     const TempWorkspace workspace;
                     const auto path = workspace.create_file("mapped.txt", "mapped content");
                     auto mapped = io::MappedFile::open(path);
                     require(mapped.ok(), mapped.error());

                     const auto sink = io::FileSink::open(path, io::WriteMode::Truncate);
                     require(!sink.ok(), "truncate should be refused while mapped");
                     require(sink.kind() == common::ErrorKind::ConcurrencyError, "kind mismatch");
                     require(workspace.read_file("mapped.txt") == "mapped content",
                             "content must be untouched");
                   }});

  tests.push_back({"file_sink_rejects_use_after_close", [] {
                     const TempWorkspace workspace;
                     auto sink = io::FileSink::open(workspace.path() / "closed.txt",
                                                    io::WriteMode::Truncate);
                     require(sink.ok(), sink.error());
                     auto status = sink.value().close();
                     require(status.ok(), status.error());
                     const auto write = sink.value().write("late");
                     require(!write.ok(), "write after close should fail");
                     require(write.kind() == common::ErrorKind::InvalidState, "kind mismatch");
                   }});
}
