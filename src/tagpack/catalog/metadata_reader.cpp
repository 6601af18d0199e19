#include "tagpack/catalog/metadata_reader.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/strings/ascii.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace tagpack::catalog {

namespace {

// Reports the first structural problem of a document; CodecError carries
// the source name as subject and "line N: ..." as detail.
class DocumentParser {
 public:
  explicit DocumentParser(std::string source_name)
      : source_name_(std::move(source_name)) {
  }

  auto Parse(const YAML::Node& root) -> Result<std::vector<TypeDefinition>> {
    if (root.IsNull()) {
      return std::vector<TypeDefinition>{};
    }
    if (!root.IsMap()) {
      return Fail(root, "document root must be a mapping");
    }
    if (auto checked = ValidateKeys(root, {"types", "instructions"}, "root");
        !checked) {
      return std::unexpected(checked.error());
    }

    std::vector<TypeDefinition> definitions;
    if (auto types = root["types"]) {
      auto parsed = ParseDefinitions(types, "members", false);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      std::ranges::move(*parsed, std::back_inserter(definitions));
    }
    if (auto instructions = root["instructions"]) {
      auto parsed = ParseDefinitions(instructions, "parameters", true);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      std::ranges::move(*parsed, std::back_inserter(definitions));
    }
    return definitions;
  }

 private:
  auto Fail(const YAML::Node& node, std::string_view message)
      -> std::unexpected<CodecError> {
    return std::unexpected(
        CodecError::MalformedValue(
            source_name_,
            fmt::format("line {}: {}", node.Mark().line + 1, message)));
  }

  auto ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) -> Result<void> {
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        return Fail(
            pair.first, fmt::format("unknown field '{}' in {}", key, context));
      }
    }
    return {};
  }

  auto RequireString(
      const YAML::Node& node, const char* key, std::string_view context)
      -> Result<std::string> {
    auto value = node[key];
    if (!value || !value.IsScalar()) {
      return Fail(
          node, fmt::format("missing required field '{}' in {}", key, context));
    }
    return value.as<std::string>();
  }

  auto OptionalBool(const YAML::Node& node, const char* key, bool fallback)
      -> Result<bool> {
    auto value = node[key];
    if (!value) {
      return fallback;
    }
    bool flag = false;
    if (!value.IsScalar() || !YAML::convert<bool>::decode(value, flag)) {
      return Fail(value, fmt::format("'{}' must be true or false", key));
    }
    return flag;
  }

  auto ParseDefinitions(
      const YAML::Node& list, const char* member_key, bool is_instruction)
      -> Result<std::vector<TypeDefinition>> {
    if (!list.IsSequence()) {
      return Fail(list, "type and instruction lists must be sequences");
    }
    std::vector<TypeDefinition> definitions;
    for (const auto& node : list) {
      if (!node.IsMap()) {
        return Fail(node, "definition must be a mapping");
      }
      if (auto checked = ValidateKeys(node, {"name", member_key}, "definition");
          !checked) {
        return std::unexpected(checked.error());
      }
      auto name = RequireString(node, "name", "definition");
      if (!name) {
        return std::unexpected(name.error());
      }
      auto members_node = node[member_key];
      if (!members_node || !members_node.IsSequence()) {
        return Fail(
            node, fmt::format(
                      "definition '{}' needs a '{}' sequence", *name,
                      member_key));
      }

      std::vector<FieldDescriptor> members;
      for (const auto& member_node : members_node) {
        auto member = ParseMember(member_node, *name, is_instruction);
        if (!member) {
          return std::unexpected(member.error());
        }
        members.push_back(std::move(*member));
      }
      definitions.push_back(
          TypeDefinition::Composite(
              std::move(*name), std::move(members), is_instruction));
    }
    return definitions;
  }

  auto ParseMember(
      const YAML::Node& node, const std::string& owner, bool is_instruction)
      -> Result<FieldDescriptor> {
    std::string context = fmt::format("member of '{}'", owner);
    if (!node.IsMap()) {
      return Fail(node, fmt::format("{} must be a mapping", context));
    }
    auto checked =
        is_instruction
            ? ValidateKeys(
                  node,
                  {"name", "type", "dimension", "hidden", "usage", "required",
                   "visible"},
                  context)
            : ValidateKeys(
                  node, {"name", "type", "dimension", "hidden"}, context);
    if (!checked) {
      return std::unexpected(checked.error());
    }

    FieldDescriptor field;
    auto name = RequireString(node, "name", context);
    if (!name) {
      return std::unexpected(name.error());
    }
    field.name = std::move(*name);
    auto type_name = RequireString(node, "type", context);
    if (!type_name) {
      return std::unexpected(type_name.error());
    }
    field.type_name = std::move(*type_name);

    if (auto dimension = node["dimension"]) {
      auto parsed = ParseDimension(field.name, dimension.as<std::string>());
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      field.array_length = *parsed;
    }
    auto hidden = OptionalBool(node, "hidden", false);
    auto required = OptionalBool(node, "required", false);
    auto visible = OptionalBool(node, "visible", true);
    for (const auto* flag : {&hidden, &required, &visible}) {
      if (!*flag) {
        return std::unexpected(flag->error());
      }
    }
    field.hidden = *hidden;
    field.required = *required;
    field.visible = *visible;

    if (auto usage = node["usage"]) {
      auto text = absl::AsciiStrToLower(usage.as<std::string>());
      if (text == "input") {
        field.usage = ParameterUsage::kInput;
      } else if (text == "output") {
        field.usage = ParameterUsage::kOutput;
      } else if (text == "inout") {
        field.usage = ParameterUsage::kInOut;
      } else {
        return Fail(
            usage, fmt::format(
                       "usage of '{}' must be Input, Output or InOut",
                       field.name));
      }
    } else if (is_instruction) {
      field.usage = ParameterUsage::kInput;
    }
    return field;
  }

  std::string source_name_;
};

}  // namespace

auto YamlMetadataReader::FromFile(const std::filesystem::path& path)
    -> YamlMetadataReader {
  return YamlMetadataReader(path.string(), path.string(), true);
}

auto YamlMetadataReader::FromString(
    std::string content, std::string source_name) -> YamlMetadataReader {
  return YamlMetadataReader(std::move(source_name), std::move(content), false);
}

auto YamlMetadataReader::ReadTypeDefinitions() const
    -> Result<std::vector<TypeDefinition>> {
  try {
    YAML::Node root = is_file_ ? YAML::LoadFile(content_)
                               : YAML::Load(content_);
    auto definitions = DocumentParser(source_name_).Parse(root);
    if (definitions) {
      spdlog::debug(
          "{}: read {} type definitions", source_name_, definitions->size());
    }
    return definitions;
  } catch (const YAML::Exception& e) {
    return std::unexpected(CodecError::MalformedValue(source_name_, e.what()));
  }
}

auto LoadCatalog(const std::vector<std::filesystem::path>& files)
    -> Result<TypeCatalog> {
  std::vector<TypeDefinition> definitions;
  for (const auto& file : files) {
    auto read = YamlMetadataReader::FromFile(file).ReadTypeDefinitions();
    if (!read) {
      return std::unexpected(read.error());
    }
    std::ranges::move(*read, std::back_inserter(definitions));
  }
  return TypeCatalog::Build(std::move(definitions));
}

}  // namespace tagpack::catalog
