#include "openxfer/RestCloudClient.hpp"
#include "openxfer/Log.hpp"
#include "curl/CurlSupport.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <memory>
#include <sstream>

namespace openxfer {

namespace {

size_t collectHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const size_t len = size * nitems;
    std::string line(buffer, len);
    auto colon = line.find(':');
    if (headers && colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        std::string value = line.substr(colon + 1);
        const auto b = value.find_first_not_of(" \t");
        const auto e = value.find_last_not_of(" \t\r\n");
        value = (b == std::string::npos) ? std::string() : value.substr(b, e - b + 1);
        (*headers)[name] = value;
    }
    return len;
}

// Provider error text: {"error": {"message": ...}} (Google, Graph) or
// {"error_summary": ...} (Dropbox).
std::string errorDetail(const std::string& body) {
    if (body.empty()) return {};
    Json::Value root;
    Json::CharReaderBuilder rb;
    std::string errs;
    std::istringstream in(body);
    if (!Json::parseFromStream(rb, in, &root, &errs) || !root.isObject()) return {};
    if (root.isMember("error_summary")) return root["error_summary"].asString();
    const Json::Value& e = root["error"];
    if (e.isObject() && e.isMember("message")) return e["message"].asString();
    if (e.isString()) return e.asString();
    return {};
}

} // namespace

RestCloudClient::RestCloudClient() {
    curl::ensureCurlInitialized();
}

void RestCloudClient::setAccessToken(const std::string& token) {
    std::lock_guard<std::mutex> lk(mtx_);
    token_ = token;
}

bool RestCloudClient::isAuthenticated() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !token_.empty();
}

void RestCloudClient::setTuning(const IoTuning& tuning) {
    std::lock_guard<std::mutex> lk(mtx_);
    tuning_ = tuning;
}

IoTuning RestCloudClient::tuning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tuning_;
}

bool RestCloudClient::send(const HttpRequest& req, HttpResponse& resp, const std::string& what, ClientError& err) {
    std::string token;
    IoTuning tuning;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        token = token_;
        tuning = tuning_;
    }
    if (req.authorize && token.empty()) {
        err.set(ErrorKind::AuthenticationRequired, what + ": not signed in to " + cloudProviderName(provider()));
        return false;
    }

    curl::unique_curl_easy c{curl_easy_init()};
    if (!c) {
        err.set(ErrorKind::Unknown, what + ": curl_easy_init failed");
        return false;
    }

    curl::unique_curl_slist headers;
    bool ok = true;
    if (req.authorize) ok = curl::appendSlist(headers, "Authorization: Bearer " + token);
    for (const auto& h : req.headers) ok = ok && curl::appendSlist(headers, h);
    if (!ok) {
        err.set(ErrorKind::Unknown, what + ": out of memory");
        return false;
    }

    resp = HttpResponse{};
    char errorBuffer[CURL_ERROR_SIZE]{};
    curl_easy_setopt(c.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(c.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.get(), CURLOPT_HEADERFUNCTION, collectHeader);
    curl_easy_setopt(c.get(), CURLOPT_HEADERDATA, &resp.headers);
    curl::applyCommonOptions(c.get(), tuning);

    FILE* upload = nullptr;
    FILE* download = nullptr;
    if (!req.uploadFrom.empty()) {
        upload = std::fopen(req.uploadFrom.c_str(), "rb");
        if (!upload) {
            err = ClientError::fromErrno(errno, "open " + req.uploadFrom);
            return false;
        }
        std::fseek(upload, 0, SEEK_END);
        const long size = std::ftell(upload);
        std::fseek(upload, 0, SEEK_SET);
        curl_easy_setopt(c.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(c.get(), CURLOPT_READFUNCTION, curl::readFromFile);
        curl_easy_setopt(c.get(), CURLOPT_READDATA, upload);
        curl_easy_setopt(c.get(), CURLOPT_INFILESIZE_LARGE, (curl_off_t)(size > 0 ? size : 0));
        if (req.method != "PUT") curl_easy_setopt(c.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
    } else if (req.method == "GET") {
        curl_easy_setopt(c.get(), CURLOPT_HTTPGET, 1L);
    } else {
        if (req.method == "DELETE" && req.body.empty()) {
            curl_easy_setopt(c.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
        } else {
            curl_easy_setopt(c.get(), CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)req.body.size());
            curl_easy_setopt(c.get(), CURLOPT_POSTFIELDS, req.body.c_str());
            if (req.method != "POST") curl_easy_setopt(c.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }
    }

    if (!req.downloadTo.empty()) {
        download = std::fopen(req.downloadTo.c_str(), "wb");
        if (!download) {
            err = ClientError::fromErrno(errno, "open " + req.downloadTo);
            if (upload) std::fclose(upload);
            return false;
        }
        // The body of an error reply must not land in the target file.
        curl_easy_setopt(c.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, curl::writeToFile);
        curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, download);
    } else {
        curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, curl::writeToString);
        curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &resp.body);
    }

    curl::XferContext ctx{req.progress, req.shouldCancel, upload != nullptr};
    curl::installProgress(c.get(), (req.progress || req.shouldCancel) ? &ctx : nullptr);

    const CURLcode code = curl_easy_perform(c.get());
    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    if (upload) std::fclose(upload);
    bool closeFailed = false;
    if (download) closeFailed = std::fclose(download) != 0;

    bool success = false;
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        httpError(resp.status, resp.body, what, err);
    } else if (code != CURLE_OK) {
        err = curl::fromCurl(code, what, errorBuffer);
    } else if (resp.status < 200 || resp.status >= 300) {
        httpError(resp.status, resp.body, what, err);
    } else if (closeFailed) {
        err = ClientError::fromErrno(errno, "close " + req.downloadTo);
    } else {
        success = true;
    }
    if (!success) {
        LOGD("%s %s -> %ld (%s)", req.method.c_str(), req.url.c_str(), resp.status, err.message.c_str());
        if (download) std::remove(req.downloadTo.c_str());
    }
    return success;
}

void RestCloudClient::httpError(long status, const std::string& body, const std::string& what, ClientError& err) const {
    std::string msg = what + ": HTTP " + std::to_string(status);
    const std::string detail = errorDetail(body);
    if (!detail.empty()) msg += " " + detail;
    if (status == 400) err.set(ErrorKind::InvalidInput, msg);
    else if (status == 401) err.set(ErrorKind::AuthenticationRequired, msg);
    else if (status == 403) err.set(ErrorKind::PermissionDenied, msg);
    else if (status == 404) err.set(ErrorKind::FileNotFound, msg);
    else if (status == 409 || status == 412) err.set(ErrorKind::FileExists, msg);
    else if (status == 408 || status == 504) err.set(ErrorKind::NetworkError, msg, true);
    else if (status == 413 || status == 507) err.set(ErrorKind::StorageFull, msg);
    else if (status == 429 || status >= 500) err.set(ErrorKind::NetworkError, msg);
    else err.set(ErrorKind::Unknown, msg);
}

bool RestCloudClient::parseJson(const std::string& text, Json::Value& out, ClientError& err) {
    Json::CharReaderBuilder rb;
    std::string errs;
    std::istringstream in(text);
    if (!Json::parseFromStream(rb, in, &out, &errs)) {
        err.set(ErrorKind::Unknown, "Invalid JSON reply: " + errs);
        return false;
    }
    return true;
}

std::string RestCloudClient::toJson(const Json::Value& v) {
    Json::StreamWriterBuilder wb;
    wb["indentation"] = "";
    return Json::writeString(wb, v);
}

std::uint64_t RestCloudClient::parseIsoTime(const std::string& s) {
    std::tm tm{};
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d", &year, &mon, &day, &hour, &min, &sec) != 6) return 0;
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const time_t t = timegm(&tm);
    return t > 0 ? (std::uint64_t)t : 0;
}

std::string RestCloudClient::urlEscape(const std::string& s) {
    char* esc = curl_easy_escape(nullptr, s.c_str(), (int)s.size());
    if (!esc) return {};
    std::string out(esc);
    curl_free(esc);
    return out;
}

} // namespace openxfer
