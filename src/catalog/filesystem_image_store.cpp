#include <railwatch/catalog/filesystem_image_store.hpp>
#include <railwatch/catalog/filename.hpp>
#include <railwatch/core/log.hpp>
#include <cerrno>
#include <cstdio>
#include <format>
#include <memory>
#include <system_error>

namespace railwatch::catalog {

namespace rc = railwatch::core;
namespace fs = std::filesystem;

namespace {

constexpr int kMaxCollisionSuffix = 1000;
constexpr std::string_view kStagedSuffix = ".removing";

/// A reference must be a single plain path component and never a staged name.
bool is_plain_name(std::string_view name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find_first_of("/\\") == std::string_view::npos &&
         !name.ends_with(kStagedSuffix);
}

struct FileCloser {
  void operator()(std::FILE* f) const noexcept { std::fclose(f); }
};

rc::Error invalid_reference(std::string_view reference) {
  return rc::make_error(rc::ErrorCode::Storage,
                        std::format("'{}' is not a valid image reference", reference));
}

}  // namespace

FileSystemImageStore::FileSystemImageStore(fs::path root) : root_(std::move(root)) {}

std::expected<std::unique_ptr<FileSystemImageStore>, rc::Error> FileSystemImageStore::open(
    const fs::path& root) {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage,
        std::format("cannot create upload directory {}: {}", root.string(), ec.message())));
  }
  const fs::path absolute = fs::absolute(root, ec);
  return std::unique_ptr<FileSystemImageStore>(
      new FileSystemImageStore(ec ? root : absolute));
}

std::expected<std::string, rc::Error> FileSystemImageStore::save(
    std::span<const std::byte> bytes, std::string_view name) {
  if (!is_plain_name(name)) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("'{}' is not a plain file name", name)));
  }

  const FilenameParts parts = split_extension(name);
  for (int suffix = 0; suffix <= kMaxCollisionSuffix; ++suffix) {
    const std::string candidate =
        suffix == 0 ? std::string(name)
                    : std::format("{}-{}{}", parts.stem, suffix, parts.extension);
    const fs::path target = root_ / candidate;

    // "x": fail with EEXIST instead of truncating a file another writer owns.
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(target.string().c_str(), "wbx"));
    if (!file) {
      const int err = errno;
      if (err == EEXIST) continue;
      return std::unexpected(rc::make_error(
          rc::ErrorCode::Storage,
          std::format("cannot create {}: {}", target.string(),
                      std::error_code(err, std::generic_category()).message())));
    }

    const bool written =
        std::fwrite(bytes.data(), 1, bytes.size(), file.get()) == bytes.size();
    const bool closed = std::fclose(file.release()) == 0;
    if (written && closed) {
      return candidate;
    }

    std::error_code ec;
    fs::remove(target, ec);
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("failed writing {}", target.string())));
  }

  return std::unexpected(rc::make_error(
      rc::ErrorCode::Storage, std::format("no free name for '{}'", name)));
}

std::expected<void, rc::Error> FileSystemImageStore::remove(std::string_view reference) {
  if (!is_plain_name(reference)) {
    return std::unexpected(invalid_reference(reference));
  }
  std::error_code ec;
  fs::remove(root_ / reference, ec);
  if (ec) {
    rc::log::warn(std::format("Image store: cannot remove {}: {}", reference, ec.message()));
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage,
        std::format("cannot remove {}: {}", reference, ec.message())));
  }
  return {};
}

std::expected<void, rc::Error> FileSystemImageStore::stage_removal(std::string_view reference) {
  if (!is_plain_name(reference)) {
    return std::unexpected(invalid_reference(reference));
  }
  std::error_code ec;
  fs::rename(root_ / reference, staged_path(reference), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    rc::log::warn(std::format("Image store: cannot stage {}: {}", reference, ec.message()));
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("cannot stage {}: {}", reference, ec.message())));
  }
  return {};
}

std::expected<void, rc::Error> FileSystemImageStore::restore_removal(std::string_view reference) {
  if (!is_plain_name(reference)) {
    return std::unexpected(invalid_reference(reference));
  }
  std::error_code ec;
  fs::rename(staged_path(reference), root_ / reference, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("cannot restore {}: {}", reference, ec.message())));
  }
  return {};
}

std::expected<void, rc::Error> FileSystemImageStore::commit_removal(std::string_view reference) {
  if (!is_plain_name(reference)) {
    return std::unexpected(invalid_reference(reference));
  }
  std::error_code ec;
  fs::remove(staged_path(reference), ec);
  if (ec) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("cannot discard {}: {}", reference, ec.message())));
  }
  return {};
}

bool FileSystemImageStore::contains(std::string_view reference) const {
  if (!is_plain_name(reference)) return false;
  std::error_code ec;
  return fs::is_regular_file(root_ / reference, ec);
}

fs::path FileSystemImageStore::path_for(std::string_view reference) const {
  return root_ / reference;
}

fs::path FileSystemImageStore::staged_path(std::string_view reference) const {
  return root_ / (std::string(reference) + std::string(kStagedSuffix));
}

}  // namespace railwatch::catalog
