#include "CurlSupport.hpp"
#include "openxfer/Log.hpp"
#include <algorithm>
#include <mutex>

namespace openxfer::curl {

namespace {
std::once_flag g_curl_once;
CURLcode g_curl_init = CURLE_FAILED_INIT;

// Transfers below 1 KiB/s for the whole timeout window count as stalled.
constexpr long kLowSpeedLimitBytesPerSecond = 1024;
} // namespace

bool appendSlist(unique_curl_slist& list, const std::string& line) {
    curl_slist* appended = curl_slist_append(list.get(), line.c_str());
    if (!appended) return false;
    list.release();
    list.reset(appended);
    return true;
}

bool ensureCurlInitialized() {
    std::call_once(g_curl_once, [] {
        g_curl_init = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (g_curl_init != CURLE_OK) LOGE("curl_global_init failed: %s", curl_easy_strerror(g_curl_init));
    });
    return g_curl_init == CURLE_OK;
}

int xferInfo(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    auto* ctx = static_cast<XferContext*>(clientp);
    if (!ctx) return 0;
    if (ctx->shouldCancel && ctx->shouldCancel()) return 1; // -> CURLE_ABORTED_BY_CALLBACK
    if (ctx->progress) {
        const curl_off_t total = ctx->upload ? ultotal : dltotal;
        const curl_off_t now = ctx->upload ? ulnow : dlnow;
        if (now > 0) ctx->progress((std::size_t)now, (std::size_t)std::max<curl_off_t>(total, 0));
    }
    return 0;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    FILE* f = static_cast<FILE*>(userdata);
    if (!f) return 0;
    return std::fwrite(ptr, size, nmemb, f) * size;
}

size_t readFromFile(char* buffer, size_t size, size_t nitems, void* userdata) {
    FILE* f = static_cast<FILE*>(userdata);
    if (!f) return CURL_READFUNC_ABORT;
    const size_t n = std::fread(buffer, 1, size * nitems, f);
    if (n == 0 && std::ferror(f)) return CURL_READFUNC_ABORT;
    return n;
}

size_t writeToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) return 0;
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void applyCommonOptions(CURL* curl, const IoTuning& tuning) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 60L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 10L);

    const long timeoutMs = (long)tuning.timeout.count();
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    // Whole-transfer time is unbounded; a stall is detected by the low-speed guard.
    const long stallSeconds = std::max(1L, timeoutMs / 1000);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytesPerSecond);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);
#ifdef CURLOPT_FTP_RESPONSE_TIMEOUT
    curl_easy_setopt(curl, CURLOPT_FTP_RESPONSE_TIMEOUT, stallSeconds);
#endif
    if (tuning.chunkSize > 0) {
        const long buf = (long)std::min<std::size_t>(tuning.chunkSize, CURL_MAX_READ_SIZE);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, buf);
        curl_easy_setopt(curl, CURLOPT_UPLOAD_BUFFERSIZE, buf);
    }
}

void installProgress(CURL* curl, XferContext* ctx) {
    if (!ctx) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        return;
    }
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferInfo);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

ClientError fromCurl(CURLcode code, const std::string& what, const char* errorBuffer) {
    ClientError e;
    if (code == CURLE_OK) return e;
    std::string msg = what + ": " + curl_easy_strerror(code);
    if (errorBuffer && *errorBuffer) msg += std::string(" (") + errorBuffer + ")";
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            e.set(ErrorKind::NetworkError, msg, true);
            break;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            e.set(ErrorKind::FileNotFound, msg);
            break;
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            e.set(ErrorKind::PermissionDenied, msg);
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            e.set(ErrorKind::Cancelled, what + ": cancelled");
            break;
        case CURLE_REMOTE_DISK_FULL:
            e.set(ErrorKind::StorageFull, msg);
            break;
        case CURLE_URL_MALFORMAT:
            e.set(ErrorKind::InvalidInput, msg);
            break;
        case CURLE_WRITE_ERROR:
        case CURLE_READ_ERROR:
            e.set(ErrorKind::Unknown, msg);
            break;
        default:
            e.set(ErrorKind::NetworkError, msg);
            break;
    }
    return e;
}

std::string escapePath(CURL* curl, const std::string& path) {
    std::string out;
    std::string seg;
    auto flush = [&]() {
        if (seg.empty()) return;
        char* esc = curl_easy_escape(curl, seg.c_str(), (int)seg.size());
        if (esc) {
            out += esc;
            curl_free(esc);
        }
        seg.clear();
    };
    for (char c : path) {
        if (c == '/') {
            flush();
            out += '/';
        } else {
            seg.push_back(c);
        }
    }
    flush();
    return out;
}

} // namespace openxfer::curl
