#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tagpack/catalog/metadata_reader.hpp"
#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::catalog {
namespace {

class MetadataReaderTest : public ::testing::Test {
 protected:
  static auto Read(const std::string& yaml)
      -> Result<std::vector<TypeDefinition>> {
    return YamlMetadataReader::FromString(yaml, "project.yaml")
        .ReadTypeDefinitions();
  }
};

TEST_F(MetadataReaderTest, ReadsTypesAndInstructions) {
  auto definitions = Read(R"(
types:
  - name: Pair
    members:
      - { name: Kp, type: REAL }
      - { name: Ki, type: REAL, dimension: 0, hidden: false }
instructions:
  - name: PID_Lite
    parameters:
      - name: EnableIn
        type: BOOL
        usage: Input
        required: false
        visible: false
      - { name: Setpoint, type: DINT, usage: Input, required: true }
      - { name: Output, type: REAL, usage: output }
      - { name: Buffer, type: DINT, usage: InOut }
)");
  ASSERT_TRUE(definitions.has_value()) << definitions.error().Message();
  ASSERT_EQ(definitions->size(), 2);

  const auto& pair = (*definitions)[0];
  EXPECT_EQ(pair.name, "Pair");
  EXPECT_FALSE(pair.is_instruction);
  ASSERT_EQ(pair.AllMembers().size(), 2);
  EXPECT_EQ(pair.AllMembers()[1].type_name, "REAL");
  EXPECT_EQ(pair.AllMembers()[1].usage, ParameterUsage::kNone);

  const auto& pid = (*definitions)[1];
  EXPECT_TRUE(pid.is_instruction);
  const auto& params = pid.AllMembers();
  ASSERT_EQ(params.size(), 4);
  EXPECT_EQ(params[0].usage, ParameterUsage::kInput);
  EXPECT_FALSE(params[0].visible);
  EXPECT_TRUE(params[1].required);
  EXPECT_TRUE(params[1].visible);
  EXPECT_EQ(params[2].usage, ParameterUsage::kOutput);
  EXPECT_EQ(params[3].usage, ParameterUsage::kInOut);
}

TEST_F(MetadataReaderTest, InstructionParametersDefaultToInput) {
  auto definitions = Read(R"(
instructions:
  - name: Scale
    parameters:
      - { name: In, type: REAL }
)");
  ASSERT_TRUE(definitions.has_value());
  EXPECT_EQ(
      (*definitions)[0].AllMembers()[0].usage, ParameterUsage::kInput);
}

TEST_F(MetadataReaderTest, ReadsDimension) {
  auto definitions = Read(R"(
types:
  - name: Recipe
    members:
      - { name: Steps, type: DINT, dimension: 10 }
)");
  ASSERT_TRUE(definitions.has_value());
  EXPECT_EQ((*definitions)[0].AllMembers()[0].array_length, 10);
}

TEST_F(MetadataReaderTest, MalformedDimensionNamesField) {
  auto definitions = Read(R"(
types:
  - name: Recipe
    members:
      - { name: Steps, type: DINT, dimension: ten }
)");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_EQ(definitions.error().kind, ErrorKind::kMalformedDimension);
  EXPECT_EQ(definitions.error().subject, "Steps");
}

TEST_F(MetadataReaderTest, UnknownKeyRejectedWithLine) {
  auto definitions = Read(R"(types:
  - name: Pair
    members:
      - { name: Kp, type: REAL, scale: 2 }
)");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_EQ(definitions.error().kind, ErrorKind::kMalformedValue);
  EXPECT_EQ(definitions.error().subject, "project.yaml");
  EXPECT_NE(definitions.error().detail.find("line 4"), std::string::npos);
  EXPECT_NE(definitions.error().detail.find("scale"), std::string::npos);
}

TEST_F(MetadataReaderTest, UsageOnlyAllowedOnInstructions) {
  auto definitions = Read(R"(
types:
  - name: Pair
    members:
      - { name: Kp, type: REAL, usage: Input }
)");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_EQ(definitions.error().kind, ErrorKind::kMalformedValue);
}

TEST_F(MetadataReaderTest, MissingTypeRejected) {
  auto definitions = Read(R"(
types:
  - name: Pair
    members:
      - { name: Kp }
)");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_NE(
      definitions.error().detail.find("missing required field 'type'"),
      std::string::npos);
}

TEST_F(MetadataReaderTest, BadBooleanRejected) {
  auto definitions = Read(R"(
types:
  - name: Pair
    members:
      - { name: Kp, type: REAL, hidden: maybe }
)");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_EQ(definitions.error().kind, ErrorKind::kMalformedValue);
}

TEST_F(MetadataReaderTest, InvalidYamlReported) {
  auto definitions = Read("types: [unclosed");
  ASSERT_FALSE(definitions.has_value());
  EXPECT_EQ(definitions.error().kind, ErrorKind::kMalformedValue);
}

TEST_F(MetadataReaderTest, EmptyDocumentHasNoDefinitions) {
  auto definitions = Read("");
  ASSERT_TRUE(definitions.has_value());
  EXPECT_TRUE(definitions->empty());
}

TEST_F(MetadataReaderTest, LoadCatalogMergesFiles) {
  auto dir = std::filesystem::path(::testing::TempDir()) / "tagpack_reader";
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "a.yaml") << "types:\n"
                                     "  - name: Pair\n"
                                     "    members:\n"
                                     "      - { name: Kp, type: REAL }\n";
    std::ofstream(dir / "b.yaml") << "types:\n"
                                     "  - name: Loop\n"
                                     "    members:\n"
                                     "      - { name: Gains, type: Pair }\n";
  }
  auto catalog = LoadCatalog({dir / "a.yaml", dir / "b.yaml"});
  ASSERT_TRUE(catalog.has_value()) << catalog.error().Message();
  EXPECT_TRUE(catalog->Contains("Pair"));
  EXPECT_TRUE(catalog->Contains("Loop"));
}

TEST_F(MetadataReaderTest, LoadCatalogMissingFile) {
  auto catalog = LoadCatalog({"/nonexistent/tagpack/types.yaml"});
  ASSERT_FALSE(catalog.has_value());
  EXPECT_EQ(catalog.error().kind, ErrorKind::kMalformedValue);
}

}  // namespace
}  // namespace tagpack::catalog
