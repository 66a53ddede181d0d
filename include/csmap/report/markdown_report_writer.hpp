#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "csmap/error/error.hpp"
#include "csmap/parse/model.hpp"
#include "csmap/utils/canonical_path.hpp"

namespace csmap::report {

// Renders the model as one markdown interface map per unit plus a
// README.md project index (script table, dependency adjacency list, public
// method quick reference, enum index, skipped files).
class MarkdownReportWriter {
 public:
  static constexpr std::string_view kIndexFileName = "README.md";

  explicit MarkdownReportWriter(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Creates output_dir if needed. Returns the number of bytes written.
  [[nodiscard]] auto Write(
      const parse::InterfaceModel& model, const CanonicalPath& output_dir) const
      -> std::expected<size_t, CsmapError>;

  // Report file name per unit, in unit order: "<stem>.md", or the
  // identifier with '/' replaced by '_' when two units share a stem
  static auto ReportFileNames(const parse::InterfaceModel& model)
      -> std::vector<std::string>;

  static auto RenderUnit(const parse::SourceUnit& unit) -> std::string;

  static auto RenderIndex(const parse::InterfaceModel& model) -> std::string;

  // Engine callbacks such as Awake or OnTriggerEnter2D
  static auto IsLifecycleMethod(std::string_view name) -> bool;

  // Derives directly from one of the engine's behaviour base classes
  static auto IsBehaviourType(const parse::TypeDeclaration& type) -> bool;

  // "int count = 0"
  static auto FormatParameter(const parse::ParameterSpec& parameter)
      -> std::string;

  // "void Move(Vector3 direction, float speed = 1f)"
  static auto FormatSignature(const parse::MethodSpec& method) -> std::string;

 private:
  [[nodiscard]] auto WriteFile(
      const CanonicalPath& path, std::string_view content) const
      -> std::expected<size_t, CsmapError>;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap::report
