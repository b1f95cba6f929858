#include <NGIN/Attributes/Attributes.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace Demo
{
  struct Column
  {
    std::string name{};
    bool nullable{false};

    void FromReflection(const NGIN::Attributes::ComponentInfo &info)
    {
      if (name.empty())
        name = info.name;
    }

    friend void NginMarker(NGIN::Attributes::Tag<Column>, NGIN::Attributes::MarkerBuilder<Column> &b)
    {
      b.Field<&Column::name>("name");
      b.Field<&Column::nullable>("nullable");
    }
  };

  struct Table : NGIN::Attributes::Inheritable
  {
    using PropertyMarker = Column;

    std::string name{};
    NGIN::Attributes::MarkerMap<Column> columns;

    void FromReflection(const NGIN::Attributes::StructureInfo &info)
    {
      if (name.empty())
        name = info.shortName;
    }
    bool IncludePropertiesByDefault() const { return true; }
    void SetProperties(NGIN::Attributes::MarkerMap<Column> c) { columns = std::move(c); }

    friend void NginMarker(NGIN::Attributes::Tag<Table>, NGIN::Attributes::MarkerBuilder<Table> &b)
    {
      b.Field<&Table::name>("name");
    }
  };

  struct Record
  {
    int id{0};
  };

  struct User : Record
  {
    std::string email;
    std::string nickname;

    friend void NginStructure(NGIN::Attributes::Tag<User>, NGIN::Attributes::StructureBuilder &b)
    {
      b.Parent("Demo::Record");
      b.Property("email", "string").Marker<Column>({"email_address"});
      b.Property("nickname", "string").Marker<Column>({{"nullable", true}});
    }
  };
} // namespace Demo

int main()
{
  using namespace NGIN::Attributes;
  std::cout << "Library: " << LibraryName() << "\n";

  Registry reg;
  reg.Class("Demo::Record").Marker<Demo::Table>({"records"}).Property("id", "int");
  reg.Register<Demo::User>();

  Analyzer analyzer{reg};
  MemoryCacheAnalyzer cache{analyzer};

  Demo::User user{};
  auto table = cache.Analyze<Demo::Table>(user);
  if (!table.has_value())
  {
    std::cerr << "analysis failed: " << table.error().message << " (" << table.error().detail << ")\n";
    return 1;
  }

  std::cout << "table " << (*table)->name << "\n";
  const auto &columns = (*table)->columns;
  for (NGIN::UIntSize i = 0; i < columns.Size(); ++i)
  {
    const auto &column = columns.At(i);
    std::cout << "  " << columns.NameAt(i) << " -> " << column->name << (column->nullable ? " NULL" : " NOT NULL")
              << "\n";
  }
  std::cout << "cached analyses: " << cache.Size() << "\n";
  return 0;
}
