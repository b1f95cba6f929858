// CustomResolution.cpp - markers that resolve further data through the analyzer

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Attributes/Attributes.hpp>

#include <expected>
#include <string>
#include <utility>

namespace CustomDemo
{
  // Counts its own depth in the class hierarchy by analyzing the parent.
  struct Lineage
  {
    int depth{0};
    std::string root{};

    std::expected<void, NGIN::Attributes::Error> CustomResolve(NGIN::Attributes::ClassAnalyzer &analyzer,
                                                               const NGIN::Attributes::StructureInfo &info)
    {
      if (info.ancestors.Size() == 0)
      {
        root = info.shortName;
        return {};
      }
      auto parent = analyzer.Analyze<Lineage>(info.ancestors[0]);
      if (!parent.has_value())
        return std::unexpected(std::move(parent.error()));
      depth = (*parent)->depth + 1;
      root = (*parent)->root;
      return {};
    }
  };

  // Never terminates on its own.
  struct Recursive
  {
    std::expected<void, NGIN::Attributes::Error> CustomResolve(NGIN::Attributes::ClassAnalyzer &analyzer,
                                                               const NGIN::Attributes::StructureInfo &info)
    {
      auto again = analyzer.Analyze<Recursive>(info.id);
      if (!again.has_value())
        return std::unexpected(std::move(again.error()));
      return {};
    }
  };

  struct Origin
  {
    std::string declaredIn{};
    bool sawMarkerFirst{false};
    bool flagged{false};

    void CustomResolve(NGIN::Attributes::ClassAnalyzer &, const NGIN::Attributes::ComponentInfo &info)
    {
      sawMarkerFirst = flagged;
      declaredIn = info.declaringStructure;
    }

    friend void NginMarker(NGIN::Attributes::Tag<Origin>, NGIN::Attributes::MarkerBuilder<Origin> &b)
    {
      b.Field<&Origin::flagged>("flagged");
    }
  };

  struct Origins
  {
    using PropertyMarker = Origin;
    NGIN::Attributes::MarkerMap<Origin> origins;

    bool IncludePropertiesByDefault() const { return true; }
    void SetProperties(NGIN::Attributes::MarkerMap<Origin> p) { origins = std::move(p); }
  };
} // namespace CustomDemo

TEST_CASE("CustomResolutionReceivesTheAnalyzer", "[attributes][CustomResolution]")
{
  using namespace NGIN::Attributes;
  Registry reg;
  reg.Class("Demo::Animal");
  reg.Class("Demo::Mammal").Parent("Demo::Animal");
  reg.Class("Demo::Dog").Parent("Demo::Mammal");
  Analyzer analyzer{reg};

  CHECK(MarkerTypeOf<CustomDemo::Lineage>().Has(Capability::CustomResolution));

  auto dog = analyzer.Analyze<CustomDemo::Lineage>("Demo::Dog");
  REQUIRE(dog.has_value());
  CHECK((*dog)->depth == 2);
  CHECK((*dog)->root == "Animal");
}

TEST_CASE("ComponentCustomResolutionRunsAfterOtherSteps", "[attributes][CustomResolution]")
{
  using namespace NGIN::Attributes;
  Registry reg;
  reg.Class("Demo::Base").Property("id");
  reg.Class("Demo::Derived").Parent("Demo::Base").Property("name").Marker<CustomDemo::Origin>({true});
  Analyzer analyzer{reg};

  auto m = analyzer.Analyze<CustomDemo::Origins>("Demo::Derived");
  REQUIRE(m.has_value());
  const auto &origins = (*m)->origins;
  REQUIRE(origins.Size() == NGIN::UIntSize{2});
  CHECK(origins.Find("name")->declaredIn == "Demo::Derived");
  CHECK(origins.Find("name")->sawMarkerFirst);
  CHECK(origins.Find("id")->declaredIn == "Demo::Base");
  CHECK_FALSE(origins.Find("id")->sawMarkerFirst);
}

TEST_CASE("DepthGuardStopsRunawayRecursion", "[attributes][CustomResolution]")
{
  using namespace NGIN::Attributes;
  Registry reg;
  reg.Class("Demo::Loop");
  Analyzer analyzer{reg, AnalyzerOptions{16}};
  CHECK(analyzer.Options().maxDepth == 16u);

  auto m = analyzer.Analyze<CustomDemo::Recursive>("Demo::Loop");
  REQUIRE_FALSE(m.has_value());
  CHECK(m.error().code == ErrorCode::RecursionLimit);

  // The guard unwinds completely: a bounded analysis still succeeds afterwards.
  reg.Class("Demo::Leaf");
  auto lineage = analyzer.Analyze<CustomDemo::Lineage>("Demo::Leaf");
  REQUIRE(lineage.has_value());
  CHECK((*lineage)->depth == 0);
}

TEST_CASE("DepthGuardAllowsLegitimateNesting", "[attributes][CustomResolution]")
{
  using namespace NGIN::Attributes;
  Registry reg;
  reg.Class("Demo::A");
  reg.Class("Demo::B").Parent("Demo::A");
  reg.Class("Demo::C").Parent("Demo::B");
  Analyzer tight{reg, AnalyzerOptions{2}};
  Analyzer roomy{reg, AnalyzerOptions{3}};

  auto failed = tight.Analyze<CustomDemo::Lineage>("Demo::C");
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error().code == ErrorCode::RecursionLimit);

  auto ok = roomy.Analyze<CustomDemo::Lineage>("Demo::C");
  REQUIRE(ok.has_value());
  CHECK((*ok)->depth == 2);
}
