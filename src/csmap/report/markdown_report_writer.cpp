#include "csmap/report/markdown_report_writer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <tuple>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace csmap::report {

namespace {

constexpr auto kLifecycleMethods = std::to_array<std::string_view>({
    "Awake",
    "Start",
    "Update",
    "FixedUpdate",
    "LateUpdate",
    "OnEnable",
    "OnDisable",
    "OnDestroy",
    "OnGUI",
    "OnTriggerEnter",
    "OnTriggerExit",
    "OnTriggerStay",
    "OnTriggerEnter2D",
    "OnTriggerExit2D",
    "OnTriggerStay2D",
    "OnCollisionEnter",
    "OnCollisionExit",
    "OnCollisionStay",
    "OnCollisionEnter2D",
    "OnCollisionExit2D",
    "OnCollisionStay2D",
    "OnMouseDown",
    "OnMouseUp",
    "OnMouseEnter",
    "OnMouseExit",
    "OnMouseOver",
    "OnMouseDrag",
    "OnBecameVisible",
    "OnBecameInvisible",
    "OnApplicationPause",
    "OnApplicationQuit",
    "OnApplicationFocus",
    "OnDrawGizmos",
    "OnDrawGizmosSelected",
    "OnValidate",
    "Reset",
    "OnAnimatorMove",
    "OnAnimatorIK",
    "OnRenderObject",
    "OnWillRenderObject",
    "OnPreRender",
    "OnPostRender",
    "OnRenderImage",
});

constexpr auto kBehaviourBaseTypes = std::to_array<std::string_view>({
    "MonoBehaviour",
    "NetworkBehaviour",
    "ScriptableObject",
    "Editor",
    "EditorWindow",
});

constexpr std::string_view kNone = "—";
constexpr std::string_view kCheck = "✓";

using Buffer = std::back_insert_iterator<std::string>;

// `a`, `b`, `c`
auto JoinCode(const std::vector<std::string>& items) -> std::string {
  std::string result;
  for (const auto& item : items) {
    if (!result.empty()) {
      result += ", ";
    }
    fmt::format_to(std::back_inserter(result), "`{}`", item);
  }
  return result;
}

// Table cells cannot contain pipes or line breaks
auto EscapeCell(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (c == '|') {
      result += "\\|";
    } else if (c == '\n' || c == '\r') {
      result += ' ';
    } else {
      result += c;
    }
  }
  return result;
}

auto QualifiedName(const parse::TypeDeclaration& type) -> std::string {
  if (type.enclosing_type) {
    return fmt::format("{}.{}", *type.enclosing_type, type.name);
  }
  return type.name;
}

auto LowerCase(std::string text) -> std::string {
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

// Unit indices ordered by file name, case-insensitively
auto SortedByFilename(const parse::InterfaceModel& model)
    -> std::vector<size_t> {
  std::vector<size_t> order(model.units.size());
  for (size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }
  std::ranges::stable_sort(order, [&model](size_t lhs, size_t rhs) {
    return LowerCase(model.units[lhs].filename) <
           LowerCase(model.units[rhs].filename);
  });
  return order;
}

void AppendEnum(
    Buffer out, std::string_view heading, const parse::EnumDeclaration& e) {
  fmt::format_to(out, "{} enum `{}`\n", heading, e.name);
  fmt::format_to(out, "Values: {}\n\n", JoinCode(e.values));
}

void AppendDocumentation(
    Buffer out, const std::optional<std::string>& documentation) {
  if (documentation) {
    fmt::format_to(out, "> {}\n\n", *documentation);
  }
}

auto FieldNotes(const parse::FieldSpec& field) -> std::string {
  std::vector<std::string> notes;
  if (field.is_constant) {
    notes.emplace_back("const");
  }
  if (field.is_static) {
    notes.emplace_back("static");
  }
  if (field.is_readonly) {
    notes.emplace_back("readonly");
  }
  if (field.default_value) {
    notes.push_back(fmt::format("= {}", *field.default_value));
  }
  if (field.description) {
    notes.push_back(*field.description);
  }
  if (field.documentation) {
    notes.push_back(*field.documentation);
  }

  std::string result;
  for (const auto& note : notes) {
    if (!result.empty()) {
      result += ", ";
    }
    result += EscapeCell(note);
  }
  return result;
}

void AppendFieldTable(
    Buffer out, std::string_view title,
    const std::vector<const parse::FieldSpec*>& fields, bool with_group) {
  if (fields.empty()) {
    return;
  }
  fmt::format_to(out, "### {}\n", title);
  if (with_group) {
    fmt::format_to(out, "| Type | Name | Group | Notes |\n");
    fmt::format_to(out, "|------|------|-------|-------|\n");
  } else {
    fmt::format_to(out, "| Type | Name | Notes |\n");
    fmt::format_to(out, "|------|------|-------|\n");
  }
  for (const auto* field : fields) {
    if (with_group) {
      fmt::format_to(
          out, "| `{}` | `{}` | {} | {} |\n", EscapeCell(field->type_name),
          field->name, EscapeCell(field->group_label.value_or("")),
          FieldNotes(*field));
    } else {
      fmt::format_to(
          out, "| `{}` | `{}` | {} |\n", EscapeCell(field->type_name),
          field->name, FieldNotes(*field));
    }
  }
  fmt::format_to(out, "\n");
}

void AppendProperties(Buffer out, const parse::TypeDeclaration& type) {
  if (type.properties.empty()) {
    return;
  }
  fmt::format_to(out, "### Properties\n");
  fmt::format_to(out, "| Type | Name | get | set | Notes |\n");
  fmt::format_to(out, "|------|------|-----|-----|-------|\n");
  for (const auto& property : type.properties) {
    std::string notes;
    if (property.is_static) {
      notes = "static";
    }
    if (property.documentation) {
      if (!notes.empty()) {
        notes += ", ";
      }
      notes += EscapeCell(*property.documentation);
    }
    fmt::format_to(
        out, "| `{}` | `{}` | {} | {} | {} |\n",
        EscapeCell(property.type_name), property.name,
        property.has_getter ? kCheck : kNone,
        property.has_setter ? kCheck : kNone, notes);
  }
  fmt::format_to(out, "\n");
}

auto MethodModifiers(const parse::MethodSpec& method) -> std::string {
  std::vector<std::string_view> modifiers;
  if (method.is_static) {
    modifiers.emplace_back("static");
  }
  if (method.is_async) {
    modifiers.emplace_back("async");
  }
  if (method.is_generator) {
    modifiers.emplace_back("coroutine");
  }
  if (method.is_abstract) {
    modifiers.emplace_back("abstract");
  }
  if (method.is_virtual) {
    modifiers.emplace_back("virtual");
  }
  if (method.is_override) {
    modifiers.emplace_back("override");
  }
  if (modifiers.empty()) {
    return {};
  }
  return fmt::format(" *[{}]*", fmt::join(modifiers, ", "));
}

void AppendMethodList(
    Buffer out, std::string_view title,
    const std::vector<const parse::MethodSpec*>& methods) {
  if (methods.empty()) {
    return;
  }
  fmt::format_to(out, "### {}\n", title);
  for (const auto* method : methods) {
    fmt::format_to(
        out, "- `{}`{}\n", MarkdownReportWriter::FormatSignature(*method),
        MethodModifiers(*method));
    if (method->documentation) {
      fmt::format_to(out, "  - {}\n", *method->documentation);
    }
  }
  fmt::format_to(out, "\n");
}

void AppendType(Buffer out, const parse::TypeDeclaration& type) {
  std::string modifiers;
  if (type.is_abstract) {
    modifiers += "abstract ";
  }
  if (type.is_static) {
    modifiers += "static ";
  }
  if (type.is_sealed) {
    modifiers += "sealed ";
  }
  if (type.is_partial) {
    modifiers += "partial ";
  }

  fmt::format_to(
      out, "## {} {}{} `{}`", parse::ToString(type.visibility), modifiers,
      parse::ToString(type.kind), QualifiedName(type));
  if (!type.base_types.empty()) {
    fmt::format_to(out, " : {}", JoinCode(type.base_types));
  }
  fmt::format_to(out, "\n\n");
  AppendDocumentation(out, type.documentation);

  for (const auto& nested_enum : type.enums) {
    AppendEnum(out, "###", nested_enum);
  }

  std::vector<const parse::FieldSpec*> public_fields;
  std::vector<const parse::FieldSpec*> serialized_fields;
  std::vector<const parse::FieldSpec*> constant_fields;
  for (const auto& field : type.fields) {
    if (field.visibility == parse::Visibility::kPublic) {
      public_fields.push_back(&field);
    } else if (field.is_annotated) {
      serialized_fields.push_back(&field);
    } else {
      constant_fields.push_back(&field);
    }
  }
  AppendFieldTable(out, "Public Fields", public_fields, false);
  AppendFieldTable(out, "Serialized Fields (Inspector)", serialized_fields, true);
  AppendFieldTable(out, "Constants", constant_fields, false);

  AppendProperties(out, type);

  bool is_behaviour = MarkdownReportWriter::IsBehaviourType(type);
  std::vector<const parse::MethodSpec*> lifecycle;
  std::vector<const parse::MethodSpec*> public_api;
  std::vector<const parse::MethodSpec*> overridable;
  for (const auto& method : type.methods) {
    if (is_behaviour && MarkdownReportWriter::IsLifecycleMethod(method.name)) {
      lifecycle.push_back(&method);
    } else if (method.visibility == parse::Visibility::kPublic) {
      public_api.push_back(&method);
    } else {
      overridable.push_back(&method);
    }
  }

  if (!lifecycle.empty()) {
    std::vector<std::string> names;
    for (const auto* method : lifecycle) {
      names.push_back(method->name);
    }
    fmt::format_to(out, "### Unity Lifecycle\n{}\n\n", JoinCode(names));
  }
  AppendMethodList(out, "Public Methods", public_api);
  AppendMethodList(out, "Overridable (protected/internal)", overridable);
}

}  // namespace

MarkdownReportWriter::MarkdownReportWriter(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto MarkdownReportWriter::IsLifecycleMethod(std::string_view name) -> bool {
  return std::ranges::find(kLifecycleMethods, name) != kLifecycleMethods.end();
}

auto MarkdownReportWriter::IsBehaviourType(const parse::TypeDeclaration& type)
    -> bool {
  return std::ranges::any_of(type.base_types, [](const std::string& base) {
    return std::ranges::find(kBehaviourBaseTypes, std::string_view(base)) !=
           kBehaviourBaseTypes.end();
  });
}

auto MarkdownReportWriter::FormatParameter(const parse::ParameterSpec& parameter)
    -> std::string {
  if (parameter.default_value) {
    return fmt::format(
        "{} {} = {}", parameter.type_name, parameter.name,
        *parameter.default_value);
  }
  return fmt::format("{} {}", parameter.type_name, parameter.name);
}

auto MarkdownReportWriter::FormatSignature(const parse::MethodSpec& method)
    -> std::string {
  std::vector<std::string> parameters;
  for (const auto& parameter : method.parameters) {
    parameters.push_back(FormatParameter(parameter));
  }
  return fmt::format(
      "{} {}({})", method.return_type, method.name,
      fmt::join(parameters, ", "));
}

auto MarkdownReportWriter::ReportFileNames(const parse::InterfaceModel& model)
    -> std::vector<std::string> {
  std::map<std::string, size_t> stem_counts;
  for (const auto& unit : model.units) {
    ++stem_counts[unit.Stem()];
  }

  std::vector<std::string> names;
  names.reserve(model.units.size());
  for (const auto& unit : model.units) {
    if (stem_counts[unit.Stem()] == 1) {
      names.push_back(unit.Stem() + ".md");
      continue;
    }
    auto flattened = std::filesystem::path(unit.identifier)
                         .replace_extension()
                         .generic_string();
    std::ranges::replace(flattened, '/', '_');
    names.push_back(flattened + ".md");
  }
  return names;
}

auto MarkdownReportWriter::RenderUnit(const parse::SourceUnit& unit)
    -> std::string {
  std::string text;
  auto out = std::back_inserter(text);

  fmt::format_to(out, "# {}\n\n", unit.filename);
  AppendDocumentation(out, unit.file_documentation);

  if (unit.namespace_name) {
    fmt::format_to(out, "**Namespace:** `{}`\n\n", *unit.namespace_name);
  }
  if (unit.restricted_build) {
    fmt::format_to(out, "**Build:** contains editor-only sections\n\n");
  }
  if (!unit.dependencies.empty()) {
    std::vector<std::string> targets;
    for (const auto& edge : unit.dependencies) {
      targets.push_back(edge.to_type_name);
    }
    fmt::format_to(out, "**Depends on:** {}\n\n", JoinCode(targets));
  }

  for (const auto& top_level_enum : unit.enums) {
    AppendEnum(out, "##", top_level_enum);
  }
  for (const auto& type : unit.types) {
    AppendType(out, type);
  }
  return text;
}

auto MarkdownReportWriter::RenderIndex(const parse::InterfaceModel& model)
    -> std::string {
  std::string text;
  auto out = std::back_inserter(text);
  auto file_names = ReportFileNames(model);
  auto order = SortedByFilename(model);

  fmt::format_to(out, "# Project Interface Map\n\n");
  fmt::format_to(
      out, "Interface summary of **{}** C# scripts.\n", model.units.size());
  fmt::format_to(
      out,
      "Each linked file lists the public API, serialized fields, "
      "dependencies and lifecycle hooks of one script.\n\n");

  // Script index
  fmt::format_to(out, "## Script Index\n\n");
  fmt::format_to(out, "| Script | Types | Base | Depends On |\n");
  fmt::format_to(out, "|--------|-------|------|------------|\n");
  for (auto i : order) {
    const auto& unit = model.units[i];
    std::vector<std::string> type_names;
    std::vector<std::string> bases;
    for (const auto& type : unit.types) {
      type_names.push_back(QualifiedName(type));
      bases.insert(bases.end(), type.base_types.begin(), type.base_types.end());
    }
    std::ranges::sort(bases);
    auto duplicates = std::ranges::unique(bases);
    bases.erase(duplicates.begin(), duplicates.end());

    std::vector<std::string> targets;
    for (const auto& edge : unit.dependencies) {
      targets.push_back(edge.to_type_name);
    }

    fmt::format_to(
        out, "| [{}]({}) | {} | {} | {} |\n", unit.filename, file_names[i],
        JoinCode(type_names), bases.empty() ? std::string(kNone) : JoinCode(bases),
        targets.empty() ? std::string(kNone) : JoinCode(targets));
  }
  fmt::format_to(out, "\n");

  // Adjacency list
  fmt::format_to(out, "## Dependency Graph (Adjacency)\n```\n");
  for (auto i : order) {
    const auto& unit = model.units[i];
    for (const auto& edge : unit.dependencies) {
      fmt::format_to(out, "{} -> {}\n", unit.Stem(), edge.to_type_name);
    }
  }
  fmt::format_to(out, "```\n\n");

  // Public method quick reference
  fmt::format_to(out, "## All Public Methods (Quick Reference)\n\n");
  for (auto i : order) {
    for (const auto& type : model.units[i].types) {
      std::vector<const parse::MethodSpec*> methods;
      for (const auto& method : type.methods) {
        if (method.visibility == parse::Visibility::kPublic &&
            !IsLifecycleMethod(method.name)) {
          methods.push_back(&method);
        }
      }
      if (methods.empty()) {
        continue;
      }
      fmt::format_to(out, "### `{}`\n", QualifiedName(type));
      for (const auto* method : methods) {
        fmt::format_to(out, "- `{}`\n", FormatSignature(*method));
      }
      fmt::format_to(out, "\n");
    }
  }

  // Enum index: (name, scope, file, values)
  using EnumEntry = std::tuple<
      std::string, std::string, std::string, const parse::EnumDeclaration*>;
  std::vector<EnumEntry> enums;
  for (const auto& unit : model.units) {
    for (const auto& top_level_enum : unit.enums) {
      enums.emplace_back(top_level_enum.name, "", unit.filename, &top_level_enum);
    }
    for (const auto& type : unit.types) {
      for (const auto& nested_enum : type.enums) {
        enums.emplace_back(
            nested_enum.name, QualifiedName(type) + ".", unit.filename,
            &nested_enum);
      }
    }
  }
  if (!enums.empty()) {
    std::ranges::stable_sort(enums, [](const auto& lhs, const auto& rhs) {
      return std::get<0>(lhs) < std::get<0>(rhs);
    });
    fmt::format_to(out, "## All Enums\n\n");
    for (const auto& [name, scope, filename, declaration] : enums) {
      fmt::format_to(
          out, "- **{}{}**: {}  *(in {})*\n", scope, name,
          JoinCode(declaration->values), filename);
    }
    fmt::format_to(out, "\n");
  }

  if (!model.diagnostics.empty()) {
    fmt::format_to(out, "## Skipped Files\n\n");
    for (const auto& diagnostic : model.diagnostics) {
      fmt::format_to(
          out, "- `{}`: {}\n", diagnostic.identifier, diagnostic.message);
    }
    fmt::format_to(out, "\n");
  }

  return text;
}

auto MarkdownReportWriter::Write(
    const parse::InterfaceModel& model, const CanonicalPath& output_dir) const
    -> std::expected<size_t, CsmapError> {
  std::error_code ec;
  std::filesystem::create_directories(output_dir.Path(), ec);
  if (ec) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed,
        fmt::format("{}: {}", output_dir, ec.message()));
  }

  size_t total_bytes = 0;
  auto file_names = ReportFileNames(model);
  for (size_t i = 0; i < model.units.size(); ++i) {
    auto written =
        WriteFile(output_dir / file_names[i], RenderUnit(model.units[i]));
    if (!written) {
      return std::unexpected(written.error());
    }
    total_bytes += *written;
  }

  auto written = WriteFile(output_dir / kIndexFileName, RenderIndex(model));
  if (!written) {
    return std::unexpected(written.error());
  }
  total_bytes += *written;

  logger_->debug(
      "MarkdownReportWriter: Wrote {} interface maps + {} to {}",
      model.units.size(), kIndexFileName, output_dir);
  return total_bytes;
}

auto MarkdownReportWriter::WriteFile(
    const CanonicalPath& path, std::string_view content) const
    -> std::expected<size_t, CsmapError> {
  std::ofstream file(path.Path(), std::ios::binary | std::ios::trunc);
  if (!file) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed, path.String());
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    return CsmapError::Unexpected(
        CsmapErrorCode::kFileWriteFailed, path.String());
  }
  return content.size();
}

}  // namespace csmap::report
