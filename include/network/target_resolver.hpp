#ifndef CIRRUS_NETWORK_TARGET_RESOLVER_HPP
#define CIRRUS_NETWORK_TARGET_RESOLVER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "network/transport.hpp"

namespace cirrus {
namespace network {

// Where one upload attempt sends its ciphertext. Never reused across attempts.
struct TransferDescriptor {
  std::string url;
  std::uint64_t content_length = 0;
  std::string remote_object_id;
};

// What the storage network needs to finalize a transferred object
struct CommitRequest {
  std::string bucket_id;
  std::string index;          // hex object index the key was derived from
  std::string shard_id;       // TransferDescriptor::remote_object_id
  std::string content_hash;   // RIPEMD-160(SHA-256(ciphertext)) as hex
};

// Turns account/bucket context into a Transfer Descriptor and finalizes the
// object once its bytes are stored. This is the seam where a sharding strategy
// would hand out several targets instead of one.
class TargetResolver {
public:
  virtual ~TargetResolver() = default;

  // Throws TargetResolutionError, or TransferAbortedError once abort_handle fires
  virtual TransferDescriptor resolve(const std::string& bucket_id, std::uint64_t content_length,
                                     AbortHandle& abort_handle) = 0;
  // Returns the committed file id. Throws CommitError, or TransferAbortedError.
  virtual std::string commit(const CommitRequest& request, AbortHandle& abort_handle) = 0;

protected:
  TargetResolver() = default;
};

// Asks the storage network bridge for a pre-signed upload URL:
//   POST {network_url}/v2/buckets/{bucket}/files/start?multiparts=1
//   {"uploads": [{"index": 0, "size": N}]}
// and reads uploads[0].url and uploads[0].uuid from the answer. Commits with
//   POST {network_url}/v2/buckets/{bucket}/files/finish
//   {"index": "<hex>", "shards": [{"hash": "<hex>", "uuid": "<slot uuid>"}]}
// and reads the file id from "id".
class BridgeTargetResolver : public TargetResolver {
public:
  BridgeTargetResolver(std::shared_ptr<Transport> transport, std::string network_url,
                       std::string bridge_user, std::string bridge_password);

  TransferDescriptor resolve(const std::string& bucket_id, std::uint64_t content_length,
                             AbortHandle& abort_handle) override;
  std::string commit(const CommitRequest& request, AbortHandle& abort_handle) override;

  // "Basic base64(user:sha256hex(password))"
  std::string authorization() const;

private:
  // POSTs a JSON document to the bridge, passing aborts through untouched
  HttpResponse post(const std::string& url, const std::string& body, AbortHandle& abort_handle);

  std::shared_ptr<Transport> transport_;
  std::string network_url_;
  std::string bridge_user_;
  std::string bridge_password_;
};

} // namespace network
} // namespace cirrus

#endif // CIRRUS_NETWORK_TARGET_RESOLVER_HPP
