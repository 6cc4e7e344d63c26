// src/core/credential_store.cpp
#include "core/credential_store.hpp"
#include "hash_sha256.h"
#include "log.h"
#include <fstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace panes {

std::string credentialKey(const std::string& path) {
  return sha256_string(path);
}

YamlCredentialStore::YamlCredentialStore(fs::path file) : file_(std::move(file)) {}

bool YamlCredentialStore::load(std::string& err) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
  std::error_code ec;
  if (!fs::exists(file_, ec)) return true;
  try {
    YAML::Node root = YAML::LoadFile(file_.string());
    if (auto pw = root["passwords"]) {
      for (const auto& kv : pw) entries_[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

std::optional<std::string> YamlCredentialStore::get(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(credentialKey(path));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

bool YamlCredentialStore::save(const std::string& password, const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_[credentialKey(path)] = password;
  std::string err;
  if (!flushLocked(err)) {
    LOGE("credential store write failed: " + err);
    return false;
  }
  return true;
}

bool YamlCredentialStore::remove(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  if (entries_.erase(credentialKey(path)) == 0) return true;
  std::string err;
  if (!flushLocked(err)) {
    LOGE("credential store write failed: " + err);
    return false;
  }
  return true;
}

size_t YamlCredentialStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

bool YamlCredentialStore::flushLocked(std::string& err) const {
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << "passwords" << YAML::Value << YAML::BeginMap;
  for (const auto& kv : entries_) out << YAML::Key << kv.first << YAML::Value << kv.second;
  out << YAML::EndMap << YAML::EndMap;
  if (!out.good()) {
    err = out.GetLastError();
    return false;
  }

  std::error_code ec;
  if (file_.has_parent_path()) fs::create_directories(file_.parent_path(), ec);
  fs::path tmp = file_;
  tmp += ".tmp";
  {
    std::ofstream fo(tmp, std::ios::trunc);
    if (!fo) { err = "cannot write " + tmp.string(); return false; }
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    fo << out.c_str() << "\n";
    if (!fo) { err = "write failed: " + tmp.string(); return false; }
  }
  fs::rename(tmp, file_, ec);
  if (ec) {
    err = "rename failed: " + ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace panes
