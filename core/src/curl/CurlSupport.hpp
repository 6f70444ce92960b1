// libcurl plumbing shared by the FTP client and the cloud REST clients:
// RAII handles, callbacks and CURLcode -> ClientError mapping.
#pragma once
#include "openxfer/TransferTypes.hpp"
#include <curl/curl.h>
#include <cstdio>
#include <memory>
#include <string>

namespace openxfer::curl {

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept {
        if (c) curl_easy_cleanup(c);
    }
};
using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l) curl_slist_free_all(l);
    }
};
using unique_curl_slist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Appends one line; returns false on allocation failure.
bool appendSlist(unique_curl_slist& list, const std::string& line);

// curl_global_init once per process.
bool ensureCurlInitialized();

// Passed as XFERINFODATA; the callback aborts the transfer when cancel fires.
struct XferContext {
    ByteProgressCB progress;
    CancelCB shouldCancel;
    bool upload = false;
};

int xferInfo(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata);
size_t readFromFile(char* buffer, size_t size, size_t nitems, void* userdata);
size_t writeToString(char* ptr, size_t size, size_t nmemb, void* userdata);

// Keepalive, timeouts (including a low-speed stall guard) and buffer size.
void applyCommonOptions(CURL* curl, const IoTuning& tuning);

void installProgress(CURL* curl, XferContext* ctx);

ClientError fromCurl(CURLcode code, const std::string& what, const char* errorBuffer);

// Percent-encodes each segment of a "/"-separated path, keeping the slashes.
std::string escapePath(CURL* curl, const std::string& path);

} // namespace openxfer::curl
