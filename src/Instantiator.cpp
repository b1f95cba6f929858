#include <NGIN/Attributes/Instantiator.hpp>
#include <NGIN/Attributes/Log.hpp>

#include <fmt/core.h>

#include <string>

namespace NGIN::Attributes
{
  namespace
  {
    constexpr NGIN::UInt32 kNoField = static_cast<NGIN::UInt32>(-1);

    Error BindError(ErrorCode code, std::string_view message, const MarkerTypeDesc &type, std::string_view what)
    {
      return Error{code, message, fmt::format("{}: {}", type.qualifiedName, what)};
    }
  } // namespace

  std::expected<MarkerInstance, Error> Instantiate(const MarkerTypeDesc &type, std::span<const Argument> args)
  {
    if (!type.Create)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "marker type has no factory"});

    auto owner = type.Create();
    void *obj = owner.get();

    NGIN::Containers::Vector<NGIN::UInt8> bound;
    bound.Reserve(type.fields.Size());
    for (NGIN::UIntSize i = 0; i < type.fields.Size(); ++i)
      bound.PushBack(0);

    NGIN::UIntSize nextPositional = 0;
    bool sawNamed = false;
    for (const auto &arg : args)
    {
      NGIN::UInt32 idx = kNoField;
      if (arg.IsNamed())
      {
        sawNamed = true;
        idx = type.FindField(arg.name);
        if (idx == kNoField)
          return std::unexpected(BindError(ErrorCode::InvalidArgument, "unknown argument", type, arg.name));
      }
      else
      {
        if (sawNamed)
          return std::unexpected(BindError(ErrorCode::InvalidArgument, "positional argument after named argument",
                                           type, fmt::format("position {}", nextPositional)));
        if (nextPositional >= type.fields.Size())
          return std::unexpected(BindError(ErrorCode::InvalidArgument, "too many arguments", type,
                                           fmt::format("expected at most {}", type.fields.Size())));
        idx = static_cast<NGIN::UInt32>(nextPositional++);
      }

      const auto &field = type.fields[idx];
      if (bound[idx])
        return std::unexpected(BindError(ErrorCode::InvalidArgument, "argument bound twice", type, field.name));

      void *target = type.UpcastTo(field.owner, obj);
      if (!target || !field.Store)
        return std::unexpected(BindError(ErrorCode::InvalidArgument, "field is not writable", type, field.name));
      auto stored = field.Store(target, arg.value);
      if (!stored.has_value())
        return std::unexpected(BindError(stored.error().code, stored.error().message, type, field.name));
      bound[idx] = 1;
    }

    std::string missing;
    for (NGIN::UIntSize i = 0; i < type.fields.Size(); ++i)
    {
      if (!type.fields[i].required || bound[i])
        continue;
      if (!missing.empty())
        missing += ", ";
      missing += type.fields[i].name;
    }
    if (!missing.empty())
    {
      detail::Log(LogLevel::Warn, "{} is missing required arguments: {}", type.qualifiedName, missing);
      return std::unexpected(BindError(ErrorCode::MissingRequiredArguments, "missing required arguments", type, missing));
    }

    return MarkerInstance{std::move(owner), obj, &type};
  }

} // namespace NGIN::Attributes
