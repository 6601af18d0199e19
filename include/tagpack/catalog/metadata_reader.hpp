#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::catalog {

// Source of type definitions exported from a controller project.
class MetadataReader {
 public:
  virtual ~MetadataReader() = default;

  [[nodiscard]] virtual auto ReadTypeDefinitions() const
      -> Result<std::vector<TypeDefinition>> = 0;

 protected:
  MetadataReader() = default;
  MetadataReader(const MetadataReader&) = default;
  auto operator=(const MetadataReader&) -> MetadataReader& = default;
  MetadataReader(MetadataReader&&) = default;
  auto operator=(MetadataReader&&) -> MetadataReader& = default;
};

// Reads user-defined types and Add-On Instruction definitions from YAML:
//
//   types:
//     - name: Pair
//       members:
//         - { name: Kp, type: REAL }
//         - { name: Gains, type: REAL, dimension: 4, hidden: false }
//   instructions:
//     - name: PID_Lite
//       parameters:
//         - { name: EnableIn, type: BOOL, usage: Input, visible: false }
//
// Unknown keys are rejected with their line number. A malformed YAML
// document, or a structurally invalid one, yields kMalformedValue whose
// subject is the source name.
class YamlMetadataReader final : public MetadataReader {
 public:
  static auto FromFile(const std::filesystem::path& path)
      -> YamlMetadataReader;
  static auto FromString(std::string content, std::string source_name)
      -> YamlMetadataReader;

  [[nodiscard]] auto ReadTypeDefinitions() const
      -> Result<std::vector<TypeDefinition>> override;

 private:
  YamlMetadataReader(
      std::string source_name, std::string content, bool is_file)
      : source_name_(std::move(source_name)),
        content_(std::move(content)),
        is_file_(is_file) {
  }

  std::string source_name_;
  // File path when is_file_, document text otherwise.
  std::string content_;
  bool is_file_;
};

// Reads every file and builds one catalog from the union of definitions.
auto LoadCatalog(const std::vector<std::filesystem::path>& files)
    -> Result<TypeCatalog>;

}  // namespace tagpack::catalog
