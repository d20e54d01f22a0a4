#include "account/credentials.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace cirrus {
namespace account {

using json = nlohmann::json;

namespace {

// Folder ids are stored as numbers, everything else as strings
std::string optional_field(const json& tree, const std::string& key) {
  auto it = tree.find(key);
  if (it == tree.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return it->dump();
  }
  throw CredentialsError("field '" + key + "' must be a string or an integer");
}

std::string required(const json& tree, const std::string& key) {
  auto value = optional_field(tree, key);
  if (value.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Credentials: Missing field " << key;
    throw CredentialsError("missing field '" + key + "'");
  }
  return value;
}

} // namespace

Credentials parse_credentials(std::istream& input) {
  json tree;
  try {
    tree = json::parse(input);
  } catch (const json::parse_error& e) {
    throw CredentialsError("malformed JSON: " + std::string(e.what()));
  }
  if (!tree.is_object()) {
    throw CredentialsError("document is not a JSON object");
  }

  Credentials credentials;
  credentials.bridge_user = required(tree, "bridgeUser");
  credentials.bridge_password = required(tree, "userId");
  credentials.bucket_id = required(tree, "bucket");
  credentials.mnemonic = required(tree, "mnemonic");
  credentials.root_folder_id = required(tree, "rootFolderId");
  credentials.token = optional_field(tree, "token");

  BOOST_LOG_TRIVIAL(debug) << "Credentials: Loaded session for " << credentials.bridge_user
                           << " (bucket " << credentials.bucket_id << ")";
  return credentials;
}

Credentials load_credentials(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Credentials: Reading " << path.string();

  std::ifstream file(path);
  if (!file) {
    throw CredentialsError("cannot open " + path.string() + ", log in first");
  }
  return parse_credentials(file);
}

} // namespace account
} // namespace cirrus
