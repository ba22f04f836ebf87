#pragma once

#include <railwatch/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace railwatch::catalog {

/// Storage collaborator for image files. References are opaque strings owned
/// by the store; the catalog only keeps and hands them back.
class IImageStore {
 public:
  virtual ~IImageStore() = default;

  /// Stores bytes under name (a plain file name). Never overwrites: the
  /// returned reference may differ from name when it is already taken.
  [[nodiscard]] virtual std::expected<std::string, railwatch::core::Error> save(
      std::span<const std::byte> bytes, std::string_view name) = 0;

  /// Releases a reference. Removing a reference that no longer exists succeeds.
  [[nodiscard]] virtual std::expected<void, railwatch::core::Error> remove(
      std::string_view reference) = 0;

  /// Two-phase release. stage_removal hides the file so contains() is false
  /// but the bytes are kept; restore_removal undoes it and commit_removal
  /// discards the bytes. Staging or restoring a reference with nothing on
  /// disk succeeds.
  [[nodiscard]] virtual std::expected<void, railwatch::core::Error> stage_removal(
      std::string_view reference) = 0;
  [[nodiscard]] virtual std::expected<void, railwatch::core::Error> restore_removal(
      std::string_view reference) = 0;
  [[nodiscard]] virtual std::expected<void, railwatch::core::Error> commit_removal(
      std::string_view reference) = 0;

  [[nodiscard]] virtual bool contains(std::string_view reference) const = 0;
};

}  // namespace railwatch::catalog
