#include <iostream>
#include <string>
#include <utility>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Attributes/Attributes.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Column
  {
    std::string name{};
    friend void NginMarker(Attributes::Tag<Column>, Attributes::MarkerBuilder<Column> &b)
    {
      b.Field<&Column::name>("name");
    }
  };

  struct Table : Attributes::Inheritable
  {
    using PropertyMarker = Column;
    std::string name{};
    Attributes::MarkerMap<Column> columns;

    bool IncludePropertiesByDefault() const { return true; }
    void SetProperties(Attributes::MarkerMap<Column> c) { columns = std::move(c); }
    friend void NginMarker(Attributes::Tag<Table>, Attributes::MarkerBuilder<Table> &b)
    {
      b.Field<&Table::name>("name");
    }
  };
}

int main()
{
  using namespace NGIN::Attributes;
  using BenchDemo::Column;
  using BenchDemo::Table;

  Registry reg;
  auto base = reg.Class("Bench::Entity").Marker<Table>({"entities"});
  base.Property("id", "int");
  auto leaf = reg.Class("Bench::Order").Parent("Bench::Entity");
  for (int i = 0; i < 16; ++i)
    leaf.Property("field" + std::to_string(i), "int").Marker<Column>({"col" + std::to_string(i)});

  Analyzer analyzer{reg};
  MemoryCacheAnalyzer cache{analyzer};

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<1000;++i) {
      auto t = analyzer.Analyze<Table>("Bench::Order");
      n += t.value()->columns.Size();
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Analyze inherited Table, 17 columns 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    (void)cache.Analyze<Table>("Bench::Order");
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<1000;++i) {
      auto t = cache.Analyze<Table>("Bench::Order");
      n += t.value()->columns.Size();
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Cached Analyze Table 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    UIntSize n = 0;
    for (int i=0;i<10000;++i) {
      n += reg.ChildComponents(StructureIdOf("Bench::Order"), ComponentKind::Property).Size();
    }
    ctx.doNotOptimize(n);
    ctx.stop(); }, "Registry ChildComponents 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    const Argument args[] = {Argument{"col"}};
    ctx.start();
    UIntSize ok = 0;
    for (int i=0;i<10000;++i) {
      auto made = Instantiate(MarkerTypeOf<Column>(), args);
      ok += made.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(ok);
    ctx.stop(); }, "Instantiate Column 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
