// Shared HTTP layer for the REST cloud clients: bearer auth, libcurl
// transfers, JSON helpers and HTTP status -> ClientError mapping.
#pragma once
#include "CloudStorageClient.hpp"
#include <json/json.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace openxfer {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;        // request body (JSON, or empty)
    std::string uploadFrom;  // local file streamed as the body instead
    std::string downloadTo;  // local file receiving the response body
    bool authorize = true;   // add "Authorization: Bearer ..."
    ByteProgressCB progress;
    CancelCB shouldCancel;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // lowercase names
};

class RestCloudClient : public CloudStorageClient {
public:
    void setAccessToken(const std::string& token) override;
    bool isAuthenticated() const override;
    void setTuning(const IoTuning& tuning) override;

protected:
    RestCloudClient();

    // Runs the request; true only for a 2xx status. Transport failures and
    // error statuses are mapped into err (see httpError).
    bool send(const HttpRequest& req, HttpResponse& resp, const std::string& what, ClientError& err);

    // Default status mapping; providers refine it from the error body.
    virtual void httpError(long status, const std::string& body, const std::string& what, ClientError& err) const;

    static bool parseJson(const std::string& text, Json::Value& out, ClientError& err);
    static std::string toJson(const Json::Value& v);
    // "2024-05-01T10:20:30Z" (fractional seconds allowed) -> epoch seconds, 0 if unparsable.
    static std::uint64_t parseIsoTime(const std::string& s);
    static std::string urlEscape(const std::string& s);

    IoTuning tuning() const;

private:
    mutable std::mutex mtx_;
    std::string token_;
    IoTuning tuning_{};
};

} // namespace openxfer
