#include "S3Client.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <wx/log.h>
#include <wx/mstream.h>
#include <wx/xml/xml.h>

namespace s3 {

namespace {
constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";
constexpr const char* kService = "s3";
constexpr const char* kUnsignedPayload = "UNSIGNED-PAYLOAD";

OpResult S3Failure(ErrorKind kind, std::string code, std::string message) {
  return Failure(kDomain, kind, std::move(code), std::move(message));
}

std::string ChildText(const wxXmlNode* parent, const char* name) {
  for (auto* child = parent->GetChildren(); child; child = child->GetNext()) {
    if (child->GetType() == wxXML_ELEMENT_NODE && child->GetName() == name) {
      return child->GetNodeContent().ToStdString(wxConvUTF8);
    }
  }
  return {};
}

// wxXmlDocument reports parse errors through wxLogError; keep them quiet,
// the caller turns them into an ErrorRecord.
bool LoadXml(const std::string& xml, wxXmlDocument& doc) {
  wxLogNull quiet;
  wxMemoryInputStream in(xml.data(), xml.size());
  return doc.Load(in) && doc.GetRoot();
}
}  // namespace

std::string HexEncode(const std::string& bytes) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0xF]);
  }
  return out;
}

std::string Sha256Hex(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr);
  return HexEncode(std::string(reinterpret_cast<const char*>(digest), len));
}

std::string HmacSha256(const std::string& key, const std::string& data) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &len);
  return std::string(reinterpret_cast<const char*>(mac), len);
}

std::string UriEncode(const std::string& s, bool encodeSlash) {
  auto isUnreserved = [](unsigned char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
  };
  std::string out;
  out.reserve(s.size());
  const char* hex = "0123456789ABCDEF";
  for (unsigned char c : s) {
    if (isUnreserved(c) || (c == '/' && !encodeSlash)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[(c >> 4) & 0xF]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

std::string CanonicalQuery(const std::map<std::string, std::string>& query) {
  std::string out;
  for (const auto& [name, value] : query) {
    if (!out.empty()) out.push_back('&');
    out += UriEncode(name, true) + "=" + UriEncode(value, true);
  }
  return out;
}

namespace {
std::string SignedHeaders(const std::map<std::string, std::string>& headers) {
  std::string out;
  for (const auto& [name, value] : headers) {
    if (!out.empty()) out.push_back(';');
    out += name;
  }
  return out;
}
}  // namespace

std::string CanonicalRequest(const SigningRequest& req) {
  std::string canonicalHeaders;
  for (const auto& [name, value] : req.headers) canonicalHeaders += name + ":" + value + "\n";

  return req.method + "\n" + req.canonicalUri + "\n" + CanonicalQuery(req.query) + "\n" +
         canonicalHeaders + "\n" + SignedHeaders(req.headers) + "\n" + req.payloadHash;
}

std::string SignRequest(const SigningRequest& req,
                        const aws::Credentials& creds,
                        const std::string& region,
                        const std::string& amzDate) {
  const auto date = amzDate.substr(0, 8);
  const auto scope = date + "/" + region + "/" + kService + "/aws4_request";
  const auto stringToSign = std::string(kAlgorithm) + "\n" + amzDate + "\n" + scope + "\n" +
                            Sha256Hex(CanonicalRequest(req));

  auto key = HmacSha256("AWS4" + creds.secretAccessKey, date);
  key = HmacSha256(key, region);
  key = HmacSha256(key, kService);
  key = HmacSha256(key, "aws4_request");
  const auto signature = HexEncode(HmacSha256(key, stringToSign));

  return std::string(kAlgorithm) + " Credential=" + creds.accessKeyId + "/" + scope +
         ", SignedHeaders=" + SignedHeaders(req.headers) + ", Signature=" + signature;
}

std::optional<std::int64_t> ParseTimestamp(const std::string& iso8601) {
  std::tm tm{};
  if (std::sscanf(iso8601.c_str(), "%d-%d-%dT%d:%d:%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  return static_cast<std::int64_t>(timegm(&tm));
}

OpResult ParseListObjectsResponse(const std::string& xml, ListPage& page) {
  wxXmlDocument doc;
  if (!LoadXml(xml, doc)) {
    return S3Failure(ErrorKind::InvalidData, "ParsingError", "Malformed ListObjectsV2 response");
  }
  const auto* root = doc.GetRoot();
  if (root->GetName() != "ListBucketResult") {
    return S3Failure(ErrorKind::InvalidData, "ParsingError",
                     "Unexpected response element " + root->GetName().ToStdString());
  }

  for (auto* node = root->GetChildren(); node; node = node->GetNext()) {
    if (node->GetType() != wxXML_ELEMENT_NODE || node->GetName() != "Contents") continue;

    ObjectInfo info;
    info.key = ChildText(node, "Key");
    if (info.key.empty()) continue;

    unsigned long long size = 0;
    if (wxString::FromUTF8(ChildText(node, "Size")).ToULongLong(&size)) info.size = size;
    info.lastModified = ParseTimestamp(ChildText(node, "LastModified"));
    info.storageClass = ChildText(node, "StorageClass");
    page.objects.push_back(std::move(info));
  }

  page.truncated = ChildText(root, "IsTruncated") == "true";
  page.continuationToken = ChildText(root, "NextContinuationToken");
  if (page.truncated && page.continuationToken.empty()) {
    return S3Failure(ErrorKind::InvalidData, "ParsingError",
                     "Truncated listing without a continuation token");
  }
  return Success();
}

OpResult ParseErrorResponse(long httpStatus, const std::string& body) {
  std::string code;
  std::string message;

  wxXmlDocument doc;
  if (!body.empty() && LoadXml(body, doc) && doc.GetRoot()->GetName() == "Error") {
    code = ChildText(doc.GetRoot(), "Code");
    message = ChildText(doc.GetRoot(), "Message");
  }
  if (code.empty()) code = "HTTP " + std::to_string(httpStatus);
  if (message.empty()) message = "Request failed with HTTP status " + std::to_string(httpStatus);

  auto kind = ErrorKind::Service;
  if (httpStatus == 404 || code == "NoSuchKey" || code == "NoSuchBucket") {
    kind = ErrorKind::NotFound;
  } else if (httpStatus == 403 || code == "AccessDenied") {
    kind = ErrorKind::PermissionDenied;
  }
  return S3Failure(kind, std::move(code), std::move(message));
}

}  // namespace s3

namespace {

struct CurlDeleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string AmzDateNow() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(data, size * nmemb);
  return size * nmemb;
}

struct UploadState {
  ByteStream* stream{nullptr};
  std::vector<char> chunk{};
  size_t offset{0};
  OpResult error{.ok = true};
};

size_t ReadBody(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* st = static_cast<UploadState*>(userdata);
  const size_t room = size * nitems;

  if (st->offset >= st->chunk.size()) {
    auto res = st->stream->Read(st->chunk, kStreamChunkSize);
    st->offset = 0;
    if (!res.ok) {
      st->error = std::move(res);
      return CURL_READFUNC_ABORT;
    }
    if (st->chunk.empty()) return 0;
  }

  const size_t n = std::min(room, st->chunk.size() - st->offset);
  std::copy_n(st->chunk.data() + st->offset, n, buffer);
  st->offset += n;
  return n;
}

std::string HostOf(const std::string& endpoint) {
  auto rest = endpoint;
  const auto scheme = rest.find("://");
  if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
  const auto slash = rest.find('/');
  return slash == std::string::npos ? rest : rest.substr(0, slash);
}

}  // namespace

S3Client::S3Client(S3ClientConfig config) : config_(std::move(config)) {
  EnsureCurlGlobalInit();

  endpoint_ = config_.endpoint.empty() ? "https://s3." + config_.region + ".amazonaws.com"
                                       : config_.endpoint;
  while (EndsWith(endpoint_, '/')) endpoint_.pop_back();
  host_ = HostOf(endpoint_);
}

std::string S3Client::ObjectPath(const std::string& key) const {
  auto path = "/" + s3::UriEncode(config_.bucket, true);
  if (!key.empty()) path += "/" + s3::UriEncode(key, false);
  return path;
}

OpResult S3Client::Perform(const std::string& method,
                           const std::string& key,
                           const std::map<std::string, std::string>& query,
                           ByteStream* upload,
                           Response& out) {
  if (!config_.credentials) {
    return s3::S3Failure(ErrorKind::PermissionDenied, "Credentials Error",
                         "No AWS credentials found in the environment or the shared credentials file");
  }

  s3::SigningRequest req{
      .method = method,
      .canonicalUri = ObjectPath(key),
      .query = query,
      .payloadHash = upload ? s3::kUnsignedPayload : s3::Sha256Hex(""),
  };
  const auto amzDate = AmzDateNow();
  req.headers["host"] = host_;
  req.headers["x-amz-content-sha256"] = req.payloadHash;
  req.headers["x-amz-date"] = amzDate;
  if (!config_.credentials->sessionToken.empty()) {
    req.headers["x-amz-security-token"] = config_.credentials->sessionToken;
  }
  const auto authorization = s3::SignRequest(req, *config_.credentials, config_.region, amzDate);

  CurlPtr curl(curl_easy_init());
  if (!curl) return s3::S3Failure(ErrorKind::Unexpected, "Unknown Error", "curl_easy_init failed");

  SlistPtr headers;
  auto addHeader = [&headers](const std::string& line) {
    auto* appended = curl_slist_append(headers.get(), line.c_str());
    if (appended) {
      headers.release();
      headers.reset(appended);
    }
  };
  addHeader("Authorization: " + authorization);
  for (const auto& [name, value] : req.headers) addHeader(name + ": " + value);
  addHeader("Expect:");

  auto url = endpoint_ + req.canonicalUri;
  const auto queryString = s3::CanonicalQuery(query);
  if (!queryString.empty()) url += "?" + queryString;
  wxLogDebug("S3 %s %s", method, url);

  char errbuf[CURL_ERROR_SIZE] = {0};
  UploadState upState{.stream = upload};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "ferry/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);

  if (upload) {
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, &ReadBody);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &upState);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE,
                     static_cast<curl_off_t>(upload->Size().value_or(0)));
  } else if (method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    if (rc == CURLE_ABORTED_BY_CALLBACK && !upState.error.ok) return upState.error;
    std::string message = curl_easy_strerror(rc);
    if (errbuf[0]) message += std::string(": ") + errbuf;
    return s3::S3Failure(ErrorKind::Service, "Request Error", std::move(message));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
  return Success();
}

ListResult S3Client::ListObjects(const std::string& prefix) {
  ListResult result{.status = Success()};
  std::string token;

  do {
    std::map<std::string, std::string> query{{"list-type", "2"}};
    if (!prefix.empty()) query["prefix"] = prefix;
    if (!token.empty()) query["continuation-token"] = token;

    Response resp;
    auto res = Perform("GET", {}, query, nullptr, resp);
    if (!res.ok) return {.status = std::move(res)};
    if (resp.status / 100 != 2) return {.status = s3::ParseErrorResponse(resp.status, resp.body)};

    s3::ListPage page;
    res = s3::ParseListObjectsResponse(resp.body, page);
    if (!res.ok) return {.status = std::move(res)};

    for (auto& obj : page.objects) result.objects.push_back(std::move(obj));
    token = page.truncated ? page.continuationToken : std::string();
  } while (!token.empty());

  wxLogVerbose("S3 listed %lu objects under '%s'", static_cast<unsigned long>(result.objects.size()), prefix);
  return result;
}

StreamResult S3Client::GetObject(const std::string& key) {
  if (key.empty()) {
    return {.status = s3::S3Failure(ErrorKind::InvalidData, "Validation Error", "Empty object key")};
  }

  Response resp;
  auto res = Perform("GET", key, {}, nullptr, resp);
  if (!res.ok) return {.status = std::move(res)};
  if (resp.status / 100 != 2) return {.status = s3::ParseErrorResponse(resp.status, resp.body)};

  return {.status = Success(), .stream = std::make_unique<MemoryByteStream>(std::move(resp.body))};
}

OpResult S3Client::PutObject(const std::string& key, ByteStream& body) {
  if (key.empty()) return s3::S3Failure(ErrorKind::InvalidData, "Validation Error", "Empty object key");
  if (!body.Size()) {
    return s3::S3Failure(ErrorKind::InvalidData, "Validation Error", "Upload size is unknown");
  }

  Response resp;
  auto res = Perform("PUT", key, {}, &body, resp);
  if (!res.ok) return res;
  if (resp.status / 100 != 2) return s3::ParseErrorResponse(resp.status, resp.body);
  return Success();
}

OpResult S3Client::DeleteObject(const std::string& key) {
  if (key.empty()) return s3::S3Failure(ErrorKind::InvalidData, "Validation Error", "Empty object key");

  Response resp;
  auto res = Perform("DELETE", key, {}, nullptr, resp);
  if (!res.ok) return res;
  if (resp.status / 100 != 2) return s3::ParseErrorResponse(resp.status, resp.body);
  return Success();
}
