#include "catalog/catalog_client.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace cirrus {
namespace catalog {

using json = nlohmann::json;

namespace {

// Ids come back as strings or numbers depending on the API version
std::string id_text(const json& answer, const std::string& key) {
  auto it = answer.find(key);
  if (it == answer.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return it->dump();
  }
  throw RegistrationError("catalog field '" + key + "' has unexpected type " + it->type_name());
}

} // namespace

DriveCatalogClient::DriveCatalogClient(std::shared_ptr<network::Transport> transport, std::string api_url,
                                       std::string token)
  : transport_(std::move(transport))
  , api_url_(std::move(api_url))
  , token_(std::move(token)) {
  if (!transport_) {
    throw std::invalid_argument("Catalog client: transport is required");
  }
}

std::string DriveCatalogClient::request_body(const FileEntry& entry) {
  json file;
  file["fileId"] = entry.remote_object_id;
  file["type"] = entry.type;
  file["bucket"] = entry.bucket_id;
  file["size"] = entry.size;
  file["folder_id"] = entry.folder_id;
  file["name"] = entry.name;
  file["plain_name"] = entry.name;
  file["encrypt_version"] = "03-aes";

  json body;
  body["file"] = file;
  return body.dump();
}

CatalogRecord DriveCatalogClient::register_file(const FileEntry& entry) {
  BOOST_LOG_TRIVIAL(info) << "Catalog client: Registering " << entry.name
                          << (entry.type.empty() ? "" : "." + entry.type)
                          << " in folder " << entry.folder_id;

  network::HttpRequest request;
  request.method = "POST";
  request.url = api_url_ + "/storage/file";
  request.headers["Content-Type"] = "application/json";
  if (!token_.empty()) {
    request.headers["Authorization"] = "Bearer " + token_;
  }
  request.body = request_body(entry);

  network::HttpResponse response;
  try {
    response = transport_->send(request);
  } catch (const network::NetworkError& e) {
    BOOST_LOG_TRIVIAL(error) << "Catalog client: " << e.what();
    throw RegistrationError(e.what());
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "Catalog client: Catalog answered with status " << response.status;
    throw RegistrationError("catalog answered with HTTP status " + std::to_string(response.status),
                            response.status);
  }

  CatalogRecord record;
  try {
    auto answer = json::parse(response.body);
    if (!answer.is_object()) {
      throw RegistrationError("catalog response is not an object", response.status);
    }
    record.uuid = id_text(answer, "uuid");
    record.id = id_text(answer, "id");
  } catch (const json::exception& e) {
    throw RegistrationError(std::string("unexpected catalog response: ") + e.what(), response.status);
  }

  if (record.uuid.empty()) {
    throw RegistrationError("catalog response lacks the file uuid", response.status);
  }

  BOOST_LOG_TRIVIAL(info) << "Catalog client: Registered file " << record.uuid;
  return record;
}

} // namespace catalog
} // namespace cirrus
