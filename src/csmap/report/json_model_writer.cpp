#include "csmap/report/json_model_writer.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace csmap::parse {

namespace {

void ToJsonOptional(
    nlohmann::json& j, const std::string& key,
    const std::optional<std::string>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

void to_json(nlohmann::json& j, const Visibility& o) {
  j = std::string(ToString(o));
}

void to_json(nlohmann::json& j, const TypeKind& o) {
  j = std::string(ToString(o));
}

void to_json(nlohmann::json& j, const ParameterSpec& o) {
  j = nlohmann::json{{"name", o.name}, {"type", o.type_name}};
  ToJsonOptional(j, "default", o.default_value);
}

void to_json(nlohmann::json& j, const EnumDeclaration& o) {
  j = nlohmann::json{
      {"name", o.name}, {"visibility", o.visibility}, {"values", o.values}};
}

void to_json(nlohmann::json& j, const FieldSpec& o) {
  j = nlohmann::json{
      {"name", o.name},
      {"type", o.type_name},
      {"visibility", o.visibility},
      {"static", o.is_static},
      {"readonly", o.is_readonly},
      {"constant", o.is_constant},
      {"annotated", o.is_annotated}};
  ToJsonOptional(j, "default", o.default_value);
  ToJsonOptional(j, "group", o.group_label);
  ToJsonOptional(j, "description", o.description);
  ToJsonOptional(j, "documentation", o.documentation);
}

void to_json(nlohmann::json& j, const PropertySpec& o) {
  j = nlohmann::json{
      {"name", o.name},
      {"type", o.type_name},
      {"visibility", o.visibility},
      {"get", o.has_getter},
      {"set", o.has_setter},
      {"static", o.is_static}};
  ToJsonOptional(j, "documentation", o.documentation);
}

void to_json(nlohmann::json& j, const MethodSpec& o) {
  j = nlohmann::json{
      {"name", o.name},
      {"returnType", o.return_type},
      {"visibility", o.visibility},
      {"parameters", o.parameters},
      {"static", o.is_static},
      {"virtual", o.is_virtual},
      {"override", o.is_override},
      {"abstract", o.is_abstract},
      {"async", o.is_async},
      {"generator", o.is_generator}};
  ToJsonOptional(j, "documentation", o.documentation);
}

void to_json(nlohmann::json& j, const TypeDeclaration& o) {
  j = nlohmann::json{
      {"name", o.name},
      {"visibility", o.visibility},
      {"kind", o.kind},
      {"abstract", o.is_abstract},
      {"static", o.is_static},
      {"partial", o.is_partial},
      {"sealed", o.is_sealed},
      {"baseTypes", o.base_types},
      {"fields", o.fields},
      {"properties", o.properties},
      {"methods", o.methods},
      {"enums", o.enums}};
  ToJsonOptional(j, "documentation", o.documentation);
  ToJsonOptional(j, "enclosingType", o.enclosing_type);
}

void to_json(nlohmann::json& j, const DependencyEdge& o) {
  j = nlohmann::json{{"from", o.from_unit}, {"to", o.to_type_name}};
}

void to_json(nlohmann::json& j, const SourceUnit& o) {
  j = nlohmann::json{
      {"identifier", o.identifier},
      {"filename", o.filename},
      {"usings", o.usings},
      {"types", o.types},
      {"enums", o.enums},
      {"dependencies", o.dependencies},
      {"restrictedBuild", o.restricted_build}};
  ToJsonOptional(j, "namespace", o.namespace_name);
  ToJsonOptional(j, "documentation", o.file_documentation);
}

void to_json(nlohmann::json& j, const UnitDiagnostic& o) {
  j = nlohmann::json{{"identifier", o.identifier}, {"message", o.message}};
}

void to_json(nlohmann::json& j, const InterfaceModel& o) {
  j = nlohmann::json{
      {"units", o.units},
      {"edges", o.AllEdges()},
      {"diagnostics", o.diagnostics}};
}

}  // namespace csmap::parse

namespace csmap::report {

JsonModelWriter::JsonModelWriter(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto JsonModelWriter::ToJson(const parse::InterfaceModel& model)
    -> nlohmann::json {
  return model;
}

auto JsonModelWriter::Write(
    const parse::InterfaceModel& model, const CanonicalPath& output_dir) const
    -> std::expected<size_t, CsmapError> {
  std::error_code ec;
  std::filesystem::create_directories(output_dir.Path(), ec);
  if (ec) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed,
        fmt::format("{}: {}", output_dir, ec.message()));
  }

  auto path = output_dir / kFileName;
  auto content = ToJson(model).dump(2);

  std::ofstream file(path.Path(), std::ios::binary | std::ios::trunc);
  if (!file) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed, path.String());
  }
  file << content << '\n';
  if (!file) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed, path.String());
  }

  logger_->debug("JsonModelWriter: Wrote {}", path);
  return content.size() + 1;
}

}  // namespace csmap::report
