// RegistrySource.cpp - the in-memory reflective source

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Attributes/Attributes.hpp>

#include <string>
#include <string_view>

namespace SourceDemo
{
  struct Column
  {
    std::string name{};

    friend void NginMarker(NGIN::Attributes::Tag<Column>, NGIN::Attributes::MarkerBuilder<Column> &b)
    {
      b.Field<&Column::name>("name");
    }
  };

  struct PrimaryKey : Column
  {
    friend void NginMarker(NGIN::Attributes::Tag<PrimaryKey>, NGIN::Attributes::MarkerBuilder<PrimaryKey> &b)
    {
      b.Base<Column>();
    }
  };

  struct Unrelated
  {
  };

  struct Widget
  {
    int size{};

    friend void NginStructure(NGIN::Attributes::Tag<Widget>, NGIN::Attributes::StructureBuilder &b)
    {
      b.Final();
      b.Property("size", "int").Marker<Column>({"widget_size"});
    }
  };

  struct Gadget
  {
  };
} // namespace SourceDemo

namespace NGIN::Attributes
{
  template <>
  struct DescribeStructure<SourceDemo::Gadget>
  {
    static void Do(StructureBuilder &b) { b.Abstract().Constant("VERSION", "int"); }
  };
} // namespace NGIN::Attributes

namespace
{
  NGIN::Attributes::Registry MakeHierarchy()
  {
    using namespace NGIN::Attributes;
    Registry reg;
    reg.Contract("Demo::Identifiable");
    reg.Contract("Demo::Named").Implements("Demo::Identifiable");
    reg.Contract("Demo::Timestamped");
    reg.Class("Demo::Model").Abstract().Implements("Demo::Timestamped").Property("id", "int").Marker<PrimaryKey>({"id"});
    auto user = reg.Class("Demo::User").Parent("Demo::Model").Implements("Demo::Named");
    user.Property("name", "string").Marker<SourceDemo::Column>({"user_name"});
    user.Property("email");
    user.Method("Rename").Parameter("to", "string");
    reg.Class("Demo::Admin").Parent("Demo::User").Final().Property("name").Static();
    return reg;
  }
} // namespace

namespace
{
  int g_reopenWarnings = 0;

  void CountWarnings(NGIN::Attributes::LogLevel level, std::string_view message)
  {
    if (level == NGIN::Attributes::LogLevel::Warn && message.find("reopened") != std::string_view::npos)
      ++g_reopenWarnings;
  }
} // namespace

TEST_CASE("RegistryDescribesStructures", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  const auto reg = MakeHierarchy();
  CHECK(reg.StructureCount() == NGIN::UIntSize{6});
  CHECK(reg.Contains(StructureIdOf("Demo::User")));
  CHECK_FALSE(reg.Contains(StructureIdOf("Demo::Ghost")));
  CHECK_FALSE(reg.Describe(StructureIdOf("Demo::Ghost")).has_value());

  auto info = reg.Describe(StructureIdOf("Demo::Admin"));
  REQUIRE(info.has_value());
  CHECK(info->qualifiedName == "Demo::Admin");
  CHECK(info->shortName == "Admin");
  CHECK(info->kind == StructureKind::Class);
  CHECK(info->isFinal);
  CHECK_FALSE(info->isAbstract);
  REQUIRE(info->ancestors.Size() == NGIN::UIntSize{2});
  CHECK(info->ancestors[0] == "Demo::User");
  CHECK(info->ancestors[1] == "Demo::Model");

  auto model = reg.Describe(StructureIdOf("Demo::Model"));
  REQUIRE(model.has_value());
  CHECK(model->isAbstract);
}

TEST_CASE("RegistryListsContractsDepthFirstWithoutDuplicates", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  auto reg = MakeHierarchy();
  reg.Class("Demo::Admin").Implements("Demo::Identifiable");

  const auto contracts = reg.ImplementedContracts(StructureIdOf("Demo::Admin"));
  REQUIRE(contracts.Size() == NGIN::UIntSize{3});
  CHECK(contracts[0] == StructureIdOf("Demo::Identifiable"));
  CHECK(contracts[1] == StructureIdOf("Demo::Named"));
  CHECK(contracts[2] == StructureIdOf("Demo::Timestamped"));

  const auto userContracts = reg.ImplementedContracts(StructureIdOf("Demo::User"));
  REQUIRE(userContracts.Size() == NGIN::UIntSize{3});
  CHECK(userContracts[0] == StructureIdOf("Demo::Named"));
  CHECK(userContracts[1] == StructureIdOf("Demo::Identifiable"));
  CHECK(userContracts[2] == StructureIdOf("Demo::Timestamped"));
}

TEST_CASE("RegistryChildComponentsIncludeInheritedMembers", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  const auto reg = MakeHierarchy();
  const auto props = reg.ChildComponents(StructureIdOf("Demo::Admin"), ComponentKind::Property);
  REQUIRE(props.Size() == NGIN::UIntSize{3});
  CHECK(props[0].name == "name");
  CHECK(props[0].declaringStructure == "Demo::Admin");
  CHECK(props[0].isStatic);
  CHECK_FALSE(props[0].declaredType.has_value());
  CHECK(props[1].name == "email");
  CHECK(props[1].declaringStructure == "Demo::User");
  CHECK(props[2].name == "id");
  CHECK(props[2].declaringStructure == "Demo::Model");
  REQUIRE(props[2].declaredType.has_value());
  CHECK(*props[2].declaredType == "int");

  CHECK(reg.ChildComponents(StructureIdOf("Demo::Admin"), ComponentKind::Constant).Size() == NGIN::UIntSize{0});
}

TEST_CASE("RegistryParametersCarryPositionAndMethod", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  auto reg = MakeHierarchy();
  reg.Class("Demo::User").Method("Rename").Parameter("reason").Optional();

  const auto params = reg.Parameters(StructureIdOf("Demo::Admin"), "Rename");
  REQUIRE(params.Size() == NGIN::UIntSize{2});
  CHECK(params[0].kind == ComponentKind::Parameter);
  CHECK(params[0].name == "to");
  CHECK(params[0].method == "Rename");
  CHECK(params[0].position == 0u);
  CHECK_FALSE(params[0].isOptional);
  CHECK(params[1].name == "reason");
  CHECK(params[1].position == 1u);
  CHECK(params[1].isOptional);
  CHECK(params[1].declaringStructure == "Demo::User");

  CHECK(reg.Parameters(StructureIdOf("Demo::User"), "Missing").Size() == NGIN::UIntSize{0});
}

TEST_CASE("RegistryAttachedMarkersMatchSubtypes", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  const auto reg = MakeHierarchy();
  const auto &column = MarkerTypeOf<SourceDemo::Column>();
  const auto &pk = MarkerTypeOf<SourceDemo::PrimaryKey>();

  const auto idTarget = Target::Member(StructureIdOf("Demo::Model"), ComponentKind::Property, "id");
  auto asColumn = reg.AttachedMarkers(idTarget, column);
  REQUIRE(asColumn.Size() == NGIN::UIntSize{1});
  CHECK(asColumn[0].type == &pk);
  REQUIRE(asColumn[0].arguments.size() == 1u);

  const auto nameTarget = Target::Member(StructureIdOf("Demo::User"), ComponentKind::Property, "name");
  CHECK(reg.AttachedMarkers(nameTarget, column).Size() == NGIN::UIntSize{1});
  CHECK(reg.AttachedMarkers(nameTarget, pk).Size() == NGIN::UIntSize{0});
  CHECK(reg.AttachedMarkers(nameTarget, MarkerTypeOf<SourceDemo::Unrelated>()).Size() == NGIN::UIntSize{0});

  // Admin redeclares `name` without markers.
  const auto adminName = Target::Member(StructureIdOf("Demo::Admin"), ComponentKind::Property, "name");
  CHECK(reg.AttachedMarkers(adminName, column).Size() == NGIN::UIntSize{0});

  // Inherited, not redeclared: the declaring class's markers are visible.
  const auto adminId = Target::Member(StructureIdOf("Demo::Admin"), ComponentKind::Property, "id");
  CHECK(reg.AttachedMarkers(adminId, column).Size() == NGIN::UIntSize{1});
}

TEST_CASE("RegistryRegisterRunsDescriptionHooks", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  Registry reg;
  reg.Register<SourceDemo::Widget>();
  reg.Register<SourceDemo::Gadget>();

  const auto widgetId = StructureIdOf<SourceDemo::Widget>();
  auto widget = reg.Describe(widgetId);
  REQUIRE(widget.has_value());
  CHECK(widget->shortName == "Widget");
  CHECK(widget->isFinal);
  const auto sizeTarget = Target::Member(widgetId, ComponentKind::Property, "size");
  CHECK(reg.AttachedMarkers(sizeTarget, MarkerTypeOf<SourceDemo::Column>()).Size() == NGIN::UIntSize{1});

  const auto gadgetId = StructureIdOf<const SourceDemo::Gadget &>();
  auto gadget = reg.Describe(gadgetId);
  REQUIRE(gadget.has_value());
  CHECK(gadget->isAbstract);
  CHECK(reg.ChildComponents(gadgetId, ComponentKind::Constant).Size() == NGIN::UIntSize{1});
}

TEST_CASE("RegistryReopeningKeepsTheOriginalKind", "[attributes][Source]")
{
  using namespace NGIN::Attributes;
  g_reopenWarnings = 0;
  SetLogSink(&CountWarnings);
  SetLogLevel(LogLevel::Warn);

  Registry reg;
  reg.Class("Demo::Base").Property("id");
  reg.Class("Demo::Repository").Parent("Demo::Base");
  reg.Contract("Demo::Repository").Property("name");
  reg.Class("Demo::Repository");

  SetLogLevel(LogLevel::Off);
  SetLogSink(nullptr);

  const auto id = StructureIdOf("Demo::Repository");
  auto info = reg.Describe(id);
  REQUIRE(info.has_value());
  CHECK(info->kind == StructureKind::Class);
  REQUIRE(reg.Ancestors(id).Size() == NGIN::UIntSize{1});
  // Reopening still adds to the existing record.
  CHECK(reg.ChildComponents(id, ComponentKind::Property).Size() == NGIN::UIntSize{2});
  CHECK(g_reopenWarnings == 1);
  CHECK(reg.StructureCount() == NGIN::UIntSize{2});
}
