// Instantiator.hpp
// Builds marker objects from raw constructor-style arguments, applying member-initializer defaults.
#pragma once

#include <expected>
#include <initializer_list>
#include <span>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/MarkerType.hpp>

namespace NGIN::Attributes
{

  /**
   * Create a marker of `type` and bind `args` to its declared fields.
   *
   * Positional arguments bind in field declaration order and must precede named ones; named
   * arguments bind by field name. Fields left unbound keep their member-initializer value unless
   * they were declared Required, in which case the call fails with MissingRequiredArguments.
   * Unknown names, surplus positional arguments and binding a field twice are InvalidArgument;
   * values that cannot be converted to the field type are ArgumentTypeMismatch.
   *
   * The returned instance points at the concrete object (`object == owner.get()`).
   */
  [[nodiscard]] NGIN_ATTRIBUTES_API std::expected<MarkerInstance, Error>
  Instantiate(const MarkerTypeDesc &type, std::span<const Argument> args = {});

  template <class M>
  [[nodiscard]] std::expected<std::shared_ptr<M>, Error> Instantiate(std::initializer_list<Argument> args = {})
  {
    auto made = Instantiate(MarkerTypeOf<M>(), std::span<const Argument>{args.begin(), args.size()});
    if (!made.has_value())
      return std::unexpected(std::move(made.error()));
    return std::shared_ptr<M>(made->owner, static_cast<M *>(made->object));
  }

} // namespace NGIN::Attributes
