#pragma once

#include "AwsCredentials.h"
#include "ObjectStoreClient.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace s3 {

constexpr const char* kDomain = "S3";

std::string HexEncode(const std::string& bytes);
std::string Sha256Hex(const std::string& data);
// Raw 32-byte MAC.
std::string HmacSha256(const std::string& key, const std::string& data);

// RFC 3986 encoding as SigV4 expects it; '/' is kept when `encodeSlash` is
// false so object keys stay readable in the path.
std::string UriEncode(const std::string& s, bool encodeSlash);

struct SigningRequest {
  std::string method;
  std::string canonicalUri;  // already encoded
  std::map<std::string, std::string> query{};
  // Lower-case names; every header listed here is signed.
  std::map<std::string, std::string> headers{};
  std::string payloadHash;
};

std::string CanonicalQuery(const std::map<std::string, std::string>& query);
std::string CanonicalRequest(const SigningRequest& req);

// Value of the Authorization header for `req` at `amzDate`
// ("YYYYMMDDTHHMMSSZ").
std::string SignRequest(const SigningRequest& req,
                        const aws::Credentials& creds,
                        const std::string& region,
                        const std::string& amzDate);

// "2009-10-12T17:50:30.000Z" -> seconds since the epoch.
std::optional<std::int64_t> ParseTimestamp(const std::string& iso8601);

// One ListObjectsV2 page.
struct ListPage {
  std::vector<ObjectInfo> objects{};
  bool truncated{false};
  std::string continuationToken{};
};
OpResult ParseListObjectsResponse(const std::string& xml, ListPage& page);

// Failure for a non-2xx response, using the <Error> body when present.
OpResult ParseErrorResponse(long httpStatus, const std::string& body);

}  // namespace s3

struct S3ClientConfig {
  std::string bucket;
  std::string region;
  // scheme://host[:port]; empty means the regional AWS endpoint.
  std::string endpoint{};
  std::optional<aws::Credentials> credentials{};
};

// ObjectStoreClient speaking the S3 REST API with path-style addressing.
// Requests are blocking; instances are safe to share between worker
// threads since every request uses its own easy handle.
class S3Client final : public ObjectStoreClient {
public:
  explicit S3Client(S3ClientConfig config);

  std::string BucketName() const override { return config_.bucket; }
  const std::string& Endpoint() const { return endpoint_; }

  ListResult ListObjects(const std::string& prefix) override;
  StreamResult GetObject(const std::string& key) override;
  OpResult PutObject(const std::string& key, ByteStream& body) override;
  OpResult DeleteObject(const std::string& key) override;

private:
  struct Response {
    long status{0};
    std::string body{};
  };

  // Signs and performs one request. A non-ok result means the request never
  // produced an HTTP response (or the upload stream failed).
  OpResult Perform(const std::string& method,
                   const std::string& key,
                   const std::map<std::string, std::string>& query,
                   ByteStream* upload,
                   Response& out);

  std::string ObjectPath(const std::string& key) const;

  S3ClientConfig config_;
  std::string endpoint_;
  std::string host_;
};
