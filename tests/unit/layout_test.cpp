#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/catalog_util.hpp"
#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/common/error.hpp"
#include "tagpack/layout/layout.hpp"

namespace tagpack::layout {
namespace {

using catalog::FieldDescriptor;
using catalog::TypeCatalog;
using catalog::TypeDefinition;
using test::Field;

class LayoutTest : public ::testing::Test {
 protected:
  LayoutTest() : catalog_(test::CatalogFromYaml(R"(
types:
  - name: Pair
    members:
      - { name: Kp, type: REAL }
      - { name: Ki, type: REAL }
  - name: Status
    members:
      - { name: Run, type: BOOL }
      - { name: Fault, type: BOOL }
  - name: Wide
    members:
      - { name: Count, type: LINT }
      - { name: Tag, type: SINT }
  - name: Empty
    members:
      - { name: Scratch, type: DINT, hidden: true }
  - name: Node
    members:
      - { name: Value, type: DINT }
      - { name: Next, type: Node }
instructions:
  - name: PID_Lite
    parameters:
      - { name: EnableIn, type: BOOL, usage: Input, visible: false }
      - { name: Setpoint, type: DINT, usage: Input }
      - { name: Gains, type: Pair, usage: Input }
      - { name: Buffer, type: DINT, usage: InOut }
      - { name: Out, type: REAL, usage: Output }
)")) {
  }

  auto Assign(
      const std::vector<FieldDescriptor>& fields,
      const LayoutOptions& options = {}) -> Layout {
    auto layout = AssignLayout(catalog_, fields, options);
    EXPECT_TRUE(layout.has_value()) << layout.error().Message();
    return layout.value_or(Layout{});
  }

  static void ExpectPlaced(
      const Layout& layout, const std::string& path, uint32_t byte_offset,
      std::optional<uint32_t> bit_offset = std::nullopt) {
    const PlacedField* field = layout.Find(path);
    ASSERT_NE(field, nullptr) << path;
    EXPECT_EQ(field->byte_offset, byte_offset) << path;
    EXPECT_EQ(field->bit_offset, bit_offset) << path;
  }

  // Chain L1 -> L2 -> ... -> L<levels>; the last level holds a DINT.
  static auto NestedChain(int levels) -> TypeCatalog {
    std::vector<TypeDefinition> types;
    for (int i = 1; i <= levels; ++i) {
      std::string name = "L" + std::to_string(i);
      if (i == levels) {
        types.push_back(TypeDefinition::Composite(name, {Field("V", "DINT")}));
      } else {
        types.push_back(TypeDefinition::Composite(
            name, {Field("Next", "L" + std::to_string(i + 1))}));
      }
    }
    auto built = TypeCatalog::Build(std::move(types));
    EXPECT_TRUE(built.has_value());
    return std::move(*built);
  }

  TypeCatalog catalog_;
};

TEST_F(LayoutTest, SintThenIntAlignsToTwo) {
  auto layout = Assign({Field("A", "SINT"), Field("B", "INT")});
  ExpectPlaced(layout, "A", 0);
  ExpectPlaced(layout, "B", 2);
  EXPECT_EQ(layout.total_byte_size, 4);
}

TEST_F(LayoutTest, LintAlignsToEight) {
  auto layout = Assign({Field("A", "SINT"), Field("B", "LINT")});
  ExpectPlaced(layout, "B", 8);
  EXPECT_EQ(layout.total_byte_size, 16);
}

TEST_F(LayoutTest, ThirtyThreeBoolsSpanTwoWords) {
  std::vector<FieldDescriptor> fields;
  for (int i = 0; i < 33; ++i) {
    fields.push_back(Field("B" + std::to_string(i), "BOOL"));
  }
  auto layout = Assign(fields);
  ASSERT_EQ(layout.fields.size(), 33);
  for (uint32_t i = 0; i < 32; ++i) {
    ExpectPlaced(layout, "B" + std::to_string(i), 0, i);
  }
  ExpectPlaced(layout, "B32", 4, 0U);
  EXPECT_EQ(layout.total_byte_size, 8);
  EXPECT_EQ(layout.fields[32].byte_size, 4);
}

TEST_F(LayoutTest, InstructionHeaderExample) {
  auto layout = Assign(
      {Field("EnableIn", "BOOL"), Field("Setpoint", "DINT"),
       Field("Gain", "REAL")});
  ExpectPlaced(layout, "EnableIn", 0, 0U);
  ExpectPlaced(layout, "Setpoint", 4);
  ExpectPlaced(layout, "Gain", 8);
  EXPECT_EQ(layout.total_byte_size, 12);
}

TEST_F(LayoutTest, BoolCounterSpansWholeScope) {
  auto layout =
      Assign({Field("A", "BOOL"), Field("D", "DINT"), Field("B", "BOOL")});
  ExpectPlaced(layout, "A", 0, 0U);
  ExpectPlaced(layout, "D", 4);
  ExpectPlaced(layout, "B", 0, 1U);
  EXPECT_EQ(layout.total_byte_size, 8);
}

TEST_F(LayoutTest, BoolHostWordTakesCurrentCursor) {
  auto layout = Assign({Field("S", "SINT"), Field("F", "BOOL")});
  ExpectPlaced(layout, "F", 1, 0U);
  EXPECT_EQ(layout.total_byte_size, 5);
}

TEST_F(LayoutTest, BoolArrayCountsAsScalars) {
  auto layout = Assign({Field("Flags", "BOOL", 3), Field("Last", "BOOL")});
  ASSERT_EQ(layout.fields.size(), 4);
  ExpectPlaced(layout, "Flags[0]", 0, 0U);
  ExpectPlaced(layout, "Flags[2]", 0, 2U);
  ExpectPlaced(layout, "Last", 0, 3U);
  EXPECT_EQ(layout.total_byte_size, 4);
}

TEST_F(LayoutTest, AtomicArrayElementsAreConsecutive) {
  auto layout = Assign({Field("S", "SINT"), Field("Steps", "INT", 3)});
  ExpectPlaced(layout, "Steps[0]", 2);
  ExpectPlaced(layout, "Steps[1]", 4);
  ExpectPlaced(layout, "Steps[2]", 6);
  EXPECT_EQ(layout.total_byte_size, 8);
}

TEST_F(LayoutTest, CompositeArraySplicedAtAlignment) {
  auto layout = Assign({Field("S", "SINT"), Field("Gains", "Pair", 2)});
  ExpectPlaced(layout, "S", 0);
  ExpectPlaced(layout, "Gains[0].Kp", 4);
  ExpectPlaced(layout, "Gains[0].Ki", 8);
  ExpectPlaced(layout, "Gains[1].Kp", 12);
  ExpectPlaced(layout, "Gains[1].Ki", 16);
  EXPECT_EQ(layout.total_byte_size, 20);
}

TEST_F(LayoutTest, CompositeBoolsUseTheirOwnCounter) {
  auto layout = Assign(
      {Field("Enable", "BOOL"), Field("St", "Status"), Field("Done", "BOOL")});
  ExpectPlaced(layout, "Enable", 0, 0U);
  ExpectPlaced(layout, "St.Run", 4, 0U);
  ExpectPlaced(layout, "St.Fault", 4, 1U);
  ExpectPlaced(layout, "Done", 0, 1U);
  EXPECT_EQ(layout.total_byte_size, 8);
}

TEST_F(LayoutTest, CompositeAlignsLikeItsFirstLeaf) {
  auto layout = Assign({Field("I", "INT"), Field("W", "Wide", 2)});
  ExpectPlaced(layout, "W[0].Count", 8);
  ExpectPlaced(layout, "W[0].Tag", 16);
  // Wide is 9 bytes; the next element realigns to 8.
  ExpectPlaced(layout, "W[1].Count", 24);
  ExpectPlaced(layout, "W[1].Tag", 32);
  EXPECT_EQ(layout.total_byte_size, 33);
}

TEST_F(LayoutTest, TimerIsThreeDints) {
  auto layout = Assign({Field("B", "BOOL"), Field("T", "TIMER")});
  ExpectPlaced(layout, "T.Control", 4);
  ExpectPlaced(layout, "T.PRE", 8);
  ExpectPlaced(layout, "T.ACC", 12);
  EXPECT_EQ(layout.total_byte_size, 16);
}

TEST_F(LayoutTest, PadToWord) {
  auto fields = std::vector<FieldDescriptor>{Field("A", "SINT")};
  EXPECT_EQ(Assign(fields).total_byte_size, 1);
  EXPECT_EQ(
      Assign(fields, LayoutOptions{.pad_to_word = true}).total_byte_size, 4);
}

TEST_F(LayoutTest, Deterministic) {
  std::vector<FieldDescriptor> fields = {
      Field("Enable", "BOOL"), Field("Gains", "Pair", 3), Field("T", "TIMER"),
      Field("Flags", "BOOL", 40), Field("Count", "LINT")};
  auto first = Assign(fields);
  auto second = Assign(fields);
  EXPECT_EQ(first, second);
}

TEST_F(LayoutTest, StringMemberUnsupported) {
  std::vector<FieldDescriptor> fields = {Field("Name", "STRING")};
  auto layout = AssignLayout(catalog_, fields);
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kUnsupportedType);
}

TEST_F(LayoutTest, UnknownMemberType) {
  std::vector<FieldDescriptor> fields = {Field("X", "Missing")};
  auto layout = AssignLayout(catalog_, fields);
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kTypeNotFound);
  EXPECT_EQ(layout.error().subject, "Missing");
}

TEST_F(LayoutTest, CompositeWithoutStorageUnsupported) {
  std::vector<FieldDescriptor> fields = {Field("E", "Empty")};
  auto layout = AssignLayout(catalog_, fields);
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kUnsupportedType);
}

TEST_F(LayoutTest, HiddenMembersTakeNoSpace) {
  std::vector<FieldDescriptor> fields = {Field("A", "DINT")};
  fields.push_back(Field("Hidden", "LINT"));
  fields.back().hidden = true;
  fields.push_back(Field("B", "DINT"));
  auto layout = Assign(fields);
  EXPECT_EQ(layout.Find("Hidden"), nullptr);
  ExpectPlaced(layout, "B", 4);
  EXPECT_EQ(layout.total_byte_size, 8);
}

TEST_F(LayoutTest, EightNestedCompositesSucceed) {
  auto chain = NestedChain(8);
  auto layout = AssignTypeLayout(chain, "L1");
  ASSERT_TRUE(layout.has_value()) << layout.error().Message();
  ASSERT_EQ(layout->fields.size(), 1);
  EXPECT_EQ(layout->fields[0].path, "Next.Next.Next.Next.Next.Next.Next.V");
  EXPECT_EQ(layout->total_byte_size, 4);
}

TEST_F(LayoutTest, NineNestedCompositesFail) {
  auto chain = NestedChain(9);
  auto layout = AssignTypeLayout(chain, "L1");
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kMaxNestingDepthExceeded);
  EXPECT_EQ(layout.error().subject, "L9");
  EXPECT_EQ(layout.error().depth, std::optional<int>(8));
}

TEST_F(LayoutTest, ConfiguredDepthLimit) {
  auto chain = NestedChain(3);
  EXPECT_TRUE(
      AssignTypeLayout(chain, "L1", {.max_nesting_depth = 3}).has_value());
  auto layout = AssignTypeLayout(chain, "L1", {.max_nesting_depth = 2});
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kMaxNestingDepthExceeded);
}

TEST_F(LayoutTest, SelfReferenceStopsAtDepthLimit) {
  auto layout = AssignTypeLayout(catalog_, "Node");
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kMaxNestingDepthExceeded);
}

TEST_F(LayoutTest, InstructionInputs) {
  auto layout = AssignTypeLayout(catalog_, "PID_Lite");
  ASSERT_TRUE(layout.has_value()) << layout.error().Message();
  // InOut parameters are references, not tag storage.
  EXPECT_EQ(layout->Find("Buffer"), nullptr);
  ExpectPlaced(*layout, "EnableIn", 0, 0U);
  ExpectPlaced(*layout, "Setpoint", 4);
  ExpectPlaced(*layout, "Gains.Kp", 8);
  ExpectPlaced(*layout, "Out", 16);
  EXPECT_EQ(
      InputFieldNames(*layout),
      (std::vector<std::string>{"EnableIn", "Setpoint", "Gains.Kp",
                                "Gains.Ki"}));
}

TEST_F(LayoutTest, RepeatedNameInFieldListRejected) {
  std::vector<FieldDescriptor> fields = {
      Field("A", "DINT"), Field("B", "INT"), Field("a", "DINT")};
  auto layout = AssignLayout(catalog_, fields);
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::kDuplicateName);
  EXPECT_EQ(layout.error().subject, "a");
}

TEST_F(LayoutTest, FindIgnoresCase) {
  auto layout = Assign({Field("EnableIn", "BOOL"), Field("Gains", "Pair", 2)});
  const PlacedField* field = layout.Find("enablein");
  ASSERT_NE(field, nullptr);
  EXPECT_EQ(field->path, "EnableIn");
  ASSERT_NE(layout.Find("GAINS[1].kp"), nullptr);
  EXPECT_EQ(layout.Find("GAINS[1].kp")->path, "Gains[1].Kp");
  EXPECT_EQ(layout.Find("Gains[2].Kp"), nullptr);
}

TEST_F(LayoutTest, FormatLayoutListsEveryField) {
  auto layout = Assign(
      {Field("EnableIn", "BOOL"), Field("Setpoint", "DINT"),
       Field("Gain", "REAL")});
  std::string table = FormatLayout(layout);
  EXPECT_NE(table.find("PATH"), std::string::npos);
  EXPECT_NE(table.find("EnableIn"), std::string::npos);
  EXPECT_NE(table.find("Setpoint"), std::string::npos);
  EXPECT_NE(table.find("total: 12 bytes"), std::string::npos);
}

}  // namespace
}  // namespace tagpack::layout
