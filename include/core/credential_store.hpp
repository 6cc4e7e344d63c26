#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace panes {

// Passwords per container. Implementations key by a hash of the path so
// stored keys have bounded length and do not reveal the path.
class ICredentialStore {
public:
  virtual ~ICredentialStore() = default;
  virtual std::optional<std::string> get(const std::string& path) const = 0;
  virtual bool save(const std::string& password, const std::string& path) = 0;
  virtual bool remove(const std::string& path) = 0;
};

std::string credentialKey(const std::string& path);

// `passwords: { <sha256(path)>: <password> }` in a YAML file, rewritten on
// every change with owner-only permissions.
class YamlCredentialStore : public ICredentialStore {
public:
  explicit YamlCredentialStore(std::filesystem::path file);

  // Reads the file. A missing file is an empty store.
  bool load(std::string& err);

  std::optional<std::string> get(const std::string& path) const override;
  bool save(const std::string& password, const std::string& path) override;
  bool remove(const std::string& path) override;

  size_t size() const;

private:
  bool flushLocked(std::string& err) const;

  std::filesystem::path file_;
  mutable std::mutex mu_;
  std::map<std::string, std::string> entries_;
};

} // namespace panes
