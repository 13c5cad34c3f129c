#include "arrow_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>

#include <algorithm>

#include "config/config.pb.h"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace flightline::storage {

using namespace flightline::storage::common;

namespace {

constexpr int64_t kCopyBlockBytes = 4 * 1024 * 1024;

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::shared_ptr<ArrowObjectStore> ArrowObjectStore::FromConfig(const flightline::runtime::config::StorageConfig& config) {
  auto [fs, root] = Unwrap(ResolveFileSystem(config.root_uri(), config.s3()));
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
}

std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  return JoinKey(root_path_, key);
}

std::vector<std::string> ArrowObjectStore::List(const std::string& prefix) {
  const auto dir_key     = ParentKey(prefix);
  const auto name_filter = BaseName(prefix);

  arrow::fs::FileSelector selector;
  selector.base_dir        = dir_key.empty() ? root_path_ : ObjectPath(dir_key);
  selector.allow_not_found = true;
  selector.recursive       = false;

  auto infos = Unwrap(fs_->GetFileInfo(selector));

  std::vector<std::string> keys;
  for (const auto& info : infos) {
    if (!info.IsFile()) {
      continue;
    }
    auto name = info.base_name();
    if (!name_filter.empty() && name.rfind(name_filter, 0) != 0) {
      continue;
    }
    keys.push_back(dir_key.empty() ? name : dir_key + "/" + name);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

bool ArrowObjectStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.IsFile();
}

std::shared_ptr<arrow::io::InputStream> ArrowObjectStore::OpenInputStream(const std::string& key) {
  return Unwrap(fs_->OpenInputStream(ObjectPath(key)));
}

void ArrowObjectStore::EnsureParent(const std::string& path) {
  // object stores have no directories; local files need one
  if (fs_->type_name() != "local") {
    return;
  }
  auto pos = path.find_last_of('/');
  if (pos == std::string::npos || pos == 0) {
    return;
  }
  Unwrap(fs_->CreateDir(path.substr(0, pos), /*recursive=*/true));
}

/*
  Stream a local file into the store in fixed-size blocks.
*/
void ArrowObjectStore::Upload(const std::filesystem::path& local_path, const std::string& key) {
  arrow::fs::LocalFileSystem local;

  std::error_code ec;
  auto            absolute = std::filesystem::absolute(local_path, ec);
  if (ec) {
    throw util::StorageError("cannot resolve " + local_path.string() + ": " + ec.message());
  }

  auto input = Unwrap(local.OpenInputStream(absolute.generic_string()));
  auto path  = ObjectPath(key);
  EnsureParent(path);
  auto output = Unwrap(fs_->OpenOutputStream(path));

  for (;;) {
    auto block = Unwrap(input->Read(kCopyBlockBytes));
    if (block->size() == 0) {
      break;
    }
    Unwrap(output->Write(block));
  }
  Unwrap(output->Close());
  Unwrap(input->Close());
}

void ArrowObjectStore::Write(const std::string& key, std::string_view data) {
  auto path = ObjectPath(key);
  EnsureParent(path);
  auto output = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(output->Write(data.data(), static_cast<int64_t>(data.size())));
  Unwrap(output->Close());
}

} // namespace flightline::storage
