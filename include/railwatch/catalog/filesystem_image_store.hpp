#pragma once

#include <railwatch/catalog/image_store.hpp>
#include <railwatch/core/error.hpp>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace railwatch::catalog {

/// Image store backed by one flat directory. A collision on save appends
/// "-1", "-2", ... to the stem; files are created exclusively, so an existing
/// file is never overwritten. Staged removals are renamed to
/// "<reference>.removing" until committed or restored.
/// Thread-safety: callers serialize save/remove (InspectionCatalog holds its
/// writer lock around them).
class FileSystemImageStore : public IImageStore {
 public:
  /// Creates root (and parents) if needed.
  [[nodiscard]] static std::expected<std::unique_ptr<FileSystemImageStore>, railwatch::core::Error>
  open(const std::filesystem::path& root);

  [[nodiscard]] std::expected<std::string, railwatch::core::Error> save(
      std::span<const std::byte> bytes, std::string_view name) override;

  [[nodiscard]] std::expected<void, railwatch::core::Error> remove(
      std::string_view reference) override;

  [[nodiscard]] std::expected<void, railwatch::core::Error> stage_removal(
      std::string_view reference) override;

  [[nodiscard]] std::expected<void, railwatch::core::Error> restore_removal(
      std::string_view reference) override;

  [[nodiscard]] std::expected<void, railwatch::core::Error> commit_removal(
      std::string_view reference) override;

  [[nodiscard]] bool contains(std::string_view reference) const override;

  /// Absolute location of a reference, for display or serving.
  [[nodiscard]] std::filesystem::path path_for(std::string_view reference) const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

 private:
  explicit FileSystemImageStore(std::filesystem::path root);

  [[nodiscard]] std::filesystem::path staged_path(std::string_view reference) const;

  std::filesystem::path root_;
};

}  // namespace railwatch::catalog
