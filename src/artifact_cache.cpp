#include "arbiter/artifact_cache.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(ARBITER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

#if defined(ARBITER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

// Unique temp name so concurrent writers never share a partial file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      ofs.close();
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool valid_key(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace

ArtifactCache::ArtifactCache(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {}

std::string ArtifactCache::key_for(const std::string& compiler_path, const std::string& cpp_standard,
                                   const std::string& optimization_level,
                                   const std::vector<std::string>& flags, const std::string& source) {
  jsonlite::Array flag_values;
  for (const auto& f : flags) flag_values.emplace_back(f);
  jsonlite::Object desc;
  desc["cache_format"] = static_cast<std::uint64_t>(version::CACHE_FORMAT_VERSION);
  desc["compiler"] = compiler_path;
  desc["std"] = cpp_standard;
  desc["opt"] = optimization_level;
  desc["flags"] = std::move(flag_values);
  desc["source_hash"] = blake3_hex(source);
  return hash_domain("cache:", jsonlite::to_json(desc));
}

std::string ArtifactCache::object_path(const std::string& key) const {
  return (fs::path(root_) / "objects" / key.substr(0, 2) / key.substr(2, 2) / key).string();
}

std::string ArtifactCache::meta_path(const std::string& key) const {
  return object_path(key) + ".meta";
}

bool ArtifactCache::put(const std::string& key, const std::string& bytes) {
  if (!valid_key(key)) return false;

  std::string stored = bytes;
  std::string encoding = "identity";
#if defined(ARBITER_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(bytes);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  const fs::path target = object_path(key);
  if (!atomic_write(target, stored)) return false;

  jsonlite::Object meta;
  meta["digest"] = key;
  meta["encoding"] = encoding;
  meta["original_size"] = static_cast<std::uint64_t>(bytes.size());
  meta["stored_size"] = static_cast<std::uint64_t>(stored.size());
  meta["stored_blob_hash"] = blake3_hex(stored);
  meta["content_hash"] = hash_domain("cache:", bytes);
  meta["created_at"] = static_cast<std::uint64_t>(std::time(nullptr));
  if (!atomic_write(meta_path(key), jsonlite::to_json(meta))) {
    // Blob without meta is unreadable anyway; drop it.
    std::error_code ec;
    fs::remove(target, ec);
    return false;
  }
  return true;
}

std::optional<ArtifactInfo> ArtifactCache::info(const std::string& key) const {
  if (!valid_key(key)) return std::nullopt;
  const auto text = read_all(meta_path(key));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  ArtifactInfo inf;
  inf.key = jsonlite::get_string(obj, "digest");
  if (inf.key != key) return std::nullopt;
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.content_hash = jsonlite::get_string(obj, "content_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  return inf;
}

std::optional<std::string> ArtifactCache::get(const std::string& key) const {
  const auto meta = info(key);
  if (!meta) return std::nullopt;
  auto data = read_all(object_path(key));
  if (!data) return std::nullopt;

  if (data->size() != meta->stored_size || blake3_hex(*data) != meta->stored_blob_hash)
    return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(ARBITER_WITH_ZSTD)
    *data = decompress_zstd(*data, meta->original_size);
#else
    return std::nullopt;  // written by a zstd build, unreadable here
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (data->size() != meta->original_size || hash_domain("cache:", *data) != meta->content_hash)
    return std::nullopt;
  return data;
}

bool ArtifactCache::contains(const std::string& key) const {
  if (!valid_key(key)) return false;
  std::error_code ec;
  return fs::exists(object_path(key), ec) && fs::exists(meta_path(key), ec);
}

}  // namespace arbiter
