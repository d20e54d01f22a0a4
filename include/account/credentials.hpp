#ifndef CIRRUS_ACCOUNT_CREDENTIALS_HPP
#define CIRRUS_ACCOUNT_CREDENTIALS_HPP

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

namespace cirrus {
namespace account {

class CredentialsError : public std::runtime_error {
public:
  explicit CredentialsError(const std::string& message)
    : std::runtime_error("Credentials error: " + message) {}
};

// Session details of an already authenticated account
struct Credentials {
  std::string bridge_user;       // storage network user
  std::string bridge_password;   // storage network password (the account's user id)
  std::string bucket_id;
  std::string mnemonic;          // shared secret for key derivation
  std::string root_folder_id;
  std::string token;             // bearer token for the catalog API
};

// Parses a credentials document:
//   {"bridgeUser": "...", "userId": "...", "bucket": "...",
//    "mnemonic": "...", "rootFolderId": 42, "token": "..."}
Credentials parse_credentials(std::istream& input);
Credentials load_credentials(const std::filesystem::path& path);

} // namespace account
} // namespace cirrus

#endif // CIRRUS_ACCOUNT_CREDENTIALS_HPP
