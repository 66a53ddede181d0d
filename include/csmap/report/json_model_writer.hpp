#pragma once

#include <expected>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "csmap/error/error.hpp"
#include "csmap/parse/model.hpp"
#include "csmap/utils/canonical_path.hpp"

namespace csmap::parse {

// JSON forms of the model. Absent optionals are omitted; enums use their
// keyword spelling.
void to_json(nlohmann::json& j, const Visibility& o);
void to_json(nlohmann::json& j, const TypeKind& o);
void to_json(nlohmann::json& j, const ParameterSpec& o);
void to_json(nlohmann::json& j, const EnumDeclaration& o);
void to_json(nlohmann::json& j, const FieldSpec& o);
void to_json(nlohmann::json& j, const PropertySpec& o);
void to_json(nlohmann::json& j, const MethodSpec& o);
void to_json(nlohmann::json& j, const TypeDeclaration& o);
void to_json(nlohmann::json& j, const DependencyEdge& o);
void to_json(nlohmann::json& j, const SourceUnit& o);
void to_json(nlohmann::json& j, const UnitDiagnostic& o);
void to_json(nlohmann::json& j, const InterfaceModel& o);

}  // namespace csmap::parse

namespace csmap::report {

// Writes the whole model as model.json for tooling that wants the
// structure rather than the markdown rendering
class JsonModelWriter {
 public:
  static constexpr std::string_view kFileName = "model.json";

  explicit JsonModelWriter(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Creates output_dir if needed. Returns the number of bytes written.
  [[nodiscard]] auto Write(
      const parse::InterfaceModel& model, const CanonicalPath& output_dir) const
      -> std::expected<size_t, CsmapError>;

  static auto ToJson(const parse::InterfaceModel& model) -> nlohmann::json;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace csmap::report
