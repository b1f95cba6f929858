// Instantiation.cpp - binding raw arguments onto marker fields

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Attributes/Attributes.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace InstDemo
{
  struct Basic
  {
    int a{0};
    int b{0};

    friend void NginMarker(NGIN::Attributes::Tag<Basic>, NGIN::Attributes::MarkerBuilder<Basic> &b)
    {
      b.Field<&Basic::a>("a");
      b.Field<&Basic::b>("b");
    }
  };

  struct Entity
  {
    std::string table;
    int shards{4};

    friend void NginMarker(NGIN::Attributes::Tag<Entity>, NGIN::Attributes::MarkerBuilder<Entity> &b)
    {
      b.Required<&Entity::table>("table");
      b.Field<&Entity::shards>("shards");
    }
  };

  enum class Color
  {
    Red,
    Green,
    Blue
  };

  struct Typed
  {
    bool flag{false};
    double ratio{1.0};
    Color color{Color::Red};
    std::optional<int> limit{5};
    std::string label{"x"};

    friend void NginMarker(NGIN::Attributes::Tag<Typed>, NGIN::Attributes::MarkerBuilder<Typed> &b)
    {
      b.Field<&Typed::flag>("flag");
      b.Field<&Typed::ratio>("ratio");
      b.Field<&Typed::color>("color");
      b.Field<&Typed::limit>("limit");
      b.Field<&Typed::label>("label");
    }
  };

  struct Limits
  {
    int count{0};
    unsigned char level{0};
    float scale{1.0f};
    Color color{Color::Red};

    friend void NginMarker(NGIN::Attributes::Tag<Limits>, NGIN::Attributes::MarkerBuilder<Limits> &b)
    {
      b.Field<&Limits::count>("count");
      b.Field<&Limits::level>("level");
      b.Field<&Limits::scale>("scale");
      b.Field<&Limits::color>("color");
    }
  };
} // namespace InstDemo

TEST_CASE("InstantiateWithoutArgumentsKeepsDefaults", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  auto m = Instantiate<InstDemo::Basic>();
  REQUIRE(m.has_value());
  CHECK((*m)->a == 0);
  CHECK((*m)->b == 0);
}

TEST_CASE("InstantiateBindsPositionalThenNamed", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  auto m = Instantiate<InstDemo::Basic>({5});
  REQUIRE(m.has_value());
  CHECK((*m)->a == 5);
  CHECK((*m)->b == 0);

  auto n = Instantiate<InstDemo::Basic>({{"b", 7}});
  REQUIRE(n.has_value());
  CHECK((*n)->a == 0);
  CHECK((*n)->b == 7);

  auto both = Instantiate<InstDemo::Basic>({3, {"b", 9}});
  REQUIRE(both.has_value());
  CHECK((*both)->a == 3);
  CHECK((*both)->b == 9);
}

TEST_CASE("InstantiateReportsMissingRequiredFields", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  auto m = Instantiate<InstDemo::Entity>({{"shards", 8}});
  REQUIRE_FALSE(m.has_value());
  CHECK(m.error().code == ErrorCode::MissingRequiredArguments);
  CHECK(m.error().detail.find("table") != std::string::npos);

  auto ok = Instantiate<InstDemo::Entity>({{"table", "users"}});
  REQUIRE(ok.has_value());
  CHECK((*ok)->table == "users");
  CHECK((*ok)->shards == 4);
}

TEST_CASE("InstantiateRejectsMalformedArgumentLists", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;

  auto unknown = Instantiate<InstDemo::Basic>({{"c", 1}});
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error().code == ErrorCode::InvalidArgument);
  CHECK(unknown.error().detail.find("c") != std::string::npos);

  auto tooMany = Instantiate<InstDemo::Basic>({1, 2, 3});
  REQUIRE_FALSE(tooMany.has_value());
  CHECK(tooMany.error().code == ErrorCode::InvalidArgument);

  auto twice = Instantiate<InstDemo::Basic>({1, {"a", 2}});
  REQUIRE_FALSE(twice.has_value());
  CHECK(twice.error().code == ErrorCode::InvalidArgument);

  auto order = Instantiate<InstDemo::Basic>({{"b", 2}, 1});
  REQUIRE_FALSE(order.has_value());
  CHECK(order.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("InstantiateConvertsArgumentValues", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  auto m = Instantiate<InstDemo::Typed>({{"flag", true},
                                         {"ratio", std::int64_t{3}},
                                         {"color", 2},
                                         {"limit", std::monostate{}},
                                         {"label", "hi"}});
  REQUIRE(m.has_value());
  CHECK((*m)->flag);
  CHECK((*m)->ratio == 3.0);
  CHECK((*m)->color == InstDemo::Color::Blue);
  CHECK_FALSE((*m)->limit.has_value());
  CHECK((*m)->label == "hi");

  auto limited = Instantiate<InstDemo::Typed>({{"limit", 9}});
  REQUIRE(limited.has_value());
  REQUIRE((*limited)->limit.has_value());
  CHECK(*(*limited)->limit == 9);
}

TEST_CASE("InstantiateRejectsUnconvertibleValues", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  auto m = Instantiate<InstDemo::Typed>({{"flag", "yes"}});
  REQUIRE_FALSE(m.has_value());
  CHECK(m.error().code == ErrorCode::ArgumentTypeMismatch);
  CHECK(m.error().detail.find("flag") != std::string::npos);
}

TEST_CASE("InstantiateRejectsNumbersOutsideTheFieldRange", "[attributes][Instantiation]")
{
  using namespace NGIN::Attributes;
  using InstDemo::Limits;

  auto wide = Instantiate<Limits>({{"count", std::int64_t{5000000000}}});
  REQUIRE_FALSE(wide.has_value());
  CHECK(wide.error().code == ErrorCode::ArgumentTypeMismatch);
  CHECK(wide.error().detail.find("count") != std::string::npos);

  auto negative = Instantiate<Limits>({{"level", -1}});
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().code == ErrorCode::ArgumentTypeMismatch);

  auto huge = Instantiate<Limits>({{"count", 1e20}});
  REQUIRE_FALSE(huge.has_value());
  CHECK(huge.error().code == ErrorCode::ArgumentTypeMismatch);

  auto tooBigForFloat = Instantiate<Limits>({{"scale", 1e300}});
  REQUIRE_FALSE(tooBigForFloat.has_value());
  CHECK(tooBigForFloat.error().code == ErrorCode::ArgumentTypeMismatch);

  auto edges = Instantiate<Limits>({{"count", std::int64_t{2147483647}}, {"level", 255}, {"scale", 0.5}, {"color", 1}});
  REQUIRE(edges.has_value());
  CHECK((*edges)->count == 2147483647);
  CHECK((*edges)->level == 255);
  CHECK((*edges)->scale == 0.5f);
  CHECK((*edges)->color == InstDemo::Color::Green);

  auto truncated = Instantiate<Limits>({{"count", -2.75}});
  REQUIRE(truncated.has_value());
  CHECK((*truncated)->count == -2);
}
