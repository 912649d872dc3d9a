#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

#include "util/io_monad.hpp"

namespace hookrelay {
namespace fs = std::filesystem;

struct Credential {
  std::string api_key;
  std::string project_id;
  // "inbound" projects link to the dashboard, "console" to the console.
  std::string project_mode{"inbound"};
  std::string project_name;
  std::string identity;

  friend Credential tag_invoke(const boost::json::value_to_tag<Credential> &,
                               const boost::json::value &jv);
};

// Read-only access to the credential written by the login flow.
class ICredentialStore {
public:
  virtual ~ICredentialStore() = default;
  virtual monad::MyResult<Credential> load() const = 0;
};

// JSON file store. HOOKRELAY_API_KEY, when set, replaces the file's api_key
// so CI runs need no credential file at all.
class CredentialStoreFile : public ICredentialStore {
public:
  explicit CredentialStoreFile(fs::path path) : path_(std::move(path)) {}

  monad::MyResult<Credential> load() const override;

  const fs::path &path() const { return path_; }

  static fs::path default_path();

private:
  fs::path path_;
};

} // namespace hookrelay
