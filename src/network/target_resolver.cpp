#include "network/target_resolver.hpp"
#include "network/network_error.hpp"
#include "crypto/encoding.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace cirrus {
namespace network {

using json = nlohmann::json;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BridgeTargetResolver::BridgeTargetResolver(std::shared_ptr<Transport> transport, std::string network_url,
                                           std::string bridge_user, std::string bridge_password)
  : transport_(std::move(transport))
  , network_url_(std::move(network_url))
  , bridge_user_(std::move(bridge_user))
  , bridge_password_(std::move(bridge_password)) {
  if (!transport_) {
    throw std::invalid_argument("Bridge resolver: transport is required");
  }
}

std::string BridgeTargetResolver::authorization() const {
  return "Basic " + crypto::base64_encode(bridge_user_ + ":" + crypto::sha256_hex(bridge_password_));
}

HttpResponse BridgeTargetResolver::post(const std::string& url, const std::string& body, AbortHandle& abort_handle) {
  HttpRequest request;
  request.method = "POST";
  request.url = url;
  request.headers["Authorization"] = authorization();
  request.headers["Content-Type"] = "application/json";
  request.body = body;

  abort_handle.throw_if_aborted();
  return transport_->send(request, &abort_handle);
}

//==============================================
// RESOLUTION
//==============================================

TransferDescriptor BridgeTargetResolver::resolve(const std::string& bucket_id, std::uint64_t content_length,
                                                 AbortHandle& abort_handle) {
  BOOST_LOG_TRIVIAL(info) << "Bridge resolver: Requesting upload target in bucket " << bucket_id
                          << " for " << content_length << " bytes";

  if (bucket_id.empty()) {
    throw TargetResolutionError("bucket id is empty");
  }
  if (bridge_user_.empty() || bridge_password_.empty()) {
    throw TargetResolutionError("storage network credentials are missing");
  }

  json slot;
  slot["index"] = 0;
  slot["size"] = content_length;
  json body;
  body["uploads"] = json::array({slot});

  HttpResponse response;
  try {
    response = post(network_url_ + "/v2/buckets/" + bucket_id + "/files/start?multiparts=1",
                    body.dump(), abort_handle);
  } catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Bridge resolver: " << e.what();
    throw TargetResolutionError(e.what());
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "Bridge resolver: Bridge answered with status " << response.status;
    throw TargetResolutionError("bridge answered with HTTP status " + std::to_string(response.status) +
                                (response.body.empty() ? "" : ": " + response.body));
  }

  TransferDescriptor descriptor;
  descriptor.content_length = content_length;
  try {
    auto answer = json::parse(response.body);
    const auto& uploads = answer.at("uploads");
    if (!uploads.is_array() || uploads.empty()) {
      throw TargetResolutionError("bridge returned no upload slots");
    }
    const auto& first = uploads.front();
    descriptor.url = first.value("url", "");
    descriptor.remote_object_id = first.value("uuid", "");
  } catch (const json::exception& e) {
    throw TargetResolutionError(std::string("unexpected bridge response: ") + e.what());
  }

  if (descriptor.url.empty() || descriptor.remote_object_id.empty()) {
    throw TargetResolutionError("bridge response lacks an upload url or uuid");
  }

  BOOST_LOG_TRIVIAL(info) << "Bridge resolver: Upload target resolved for object " << descriptor.remote_object_id;
  return descriptor;
}

//==============================================
// COMMIT
//==============================================

std::string BridgeTargetResolver::commit(const CommitRequest& request, AbortHandle& abort_handle) {
  BOOST_LOG_TRIVIAL(info) << "Bridge resolver: Committing shard " << request.shard_id
                          << " in bucket " << request.bucket_id;

  if (request.bucket_id.empty() || request.index.empty() ||
      request.shard_id.empty() || request.content_hash.empty()) {
    throw CommitError("bucket, index, shard and hash are all required");
  }

  json shard;
  shard["hash"] = request.content_hash;
  shard["uuid"] = request.shard_id;
  json body;
  body["index"] = request.index;
  body["shards"] = json::array({shard});

  HttpResponse response;
  try {
    response = post(network_url_ + "/v2/buckets/" + request.bucket_id + "/files/finish",
                    body.dump(), abort_handle);
  } catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Bridge resolver: " << e.what();
    throw CommitError(e.what());
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "Bridge resolver: Commit answered with status " << response.status;
    throw CommitError("bridge answered with HTTP status " + std::to_string(response.status) +
                      (response.body.empty() ? "" : ": " + response.body));
  }

  std::string file_id;
  try {
    file_id = json::parse(response.body).value("id", "");
  } catch (const json::exception& e) {
    throw CommitError(std::string("unexpected bridge response: ") + e.what());
  }
  if (file_id.empty()) {
    throw CommitError("bridge response lacks a file id");
  }

  BOOST_LOG_TRIVIAL(info) << "Bridge resolver: Shard " << request.shard_id << " committed as file " << file_id;
  return file_id;
}

} // namespace network
} // namespace cirrus
