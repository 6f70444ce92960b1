// FTP backend on libcurl: transfers through the URL interface, namespace
// changes through QUOTE commands on the same control connection.
#include "openxfer/CurlFtpClient.hpp"
#include "openxfer/Log.hpp"
#include "CurlSupport.hpp"
#include <cerrno>
#include <cstdio>

namespace openxfer {

namespace {

CURL* handle(void* p) { return static_cast<CURL*>(p); }

std::string baseName(const std::string& p) {
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

} // namespace

CurlFtpClient::CurlFtpClient() {
    curl::ensureCurlInitialized();
}

CurlFtpClient::~CurlFtpClient() {
    disconnect();
}

bool CurlFtpClient::requireConnected(ClientError& err) const {
    if (connected_ && curl_) return true;
    err.set(ErrorKind::NetworkError, "Not connected");
    return false;
}

bool CurlFtpClient::prepare(const std::string& remotePath, bool asDirectory, ClientError& err) {
    CURL* c = handle(curl_);
    curl_easy_reset(c);

    std::string path = remotePath.empty() ? std::string("/") : remotePath;
    if (path.front() != '/') path.insert(path.begin(), '/');
    if (asDirectory && path.back() != '/') path.push_back('/');
    // "ftp://host/%2F..." keeps the path absolute instead of relative to the login dir.
    const std::string url = "ftp://" + opt_.host + ":" + std::to_string(opt_.port) + "/%2F" +
                            curl::escapePath(c, path.substr(1));
    if (curl_easy_setopt(c, CURLOPT_URL, url.c_str()) != CURLE_OK) {
        err.set(ErrorKind::InvalidInput, "Invalid FTP URL: " + url);
        return false;
    }
    const std::string user = opt_.username.empty() ? std::string("anonymous") : opt_.username;
    curl_easy_setopt(c, CURLOPT_USERNAME, user.c_str());
    if (opt_.password) curl_easy_setopt(c, CURLOPT_PASSWORD, opt_.password->c_str());
    curl_easy_setopt(c, CURLOPT_FTP_USE_EPSV, 1L);
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
    curl::applyCommonOptions(c, tuning_);
    return true;
}

bool CurlFtpClient::connect(const ConnectionDescriptor& opt, ClientError& err) {
    if (connected_) {
        err.set(ErrorKind::InvalidOperation, "Already connected");
        return false;
    }
    if (!curl::ensureCurlInitialized()) {
        err.set(ErrorKind::Unknown, "libcurl initialization failed");
        return false;
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        err.set(ErrorKind::Unknown, "curl_easy_init failed");
        return false;
    }
    opt_ = opt;
    if (!prepare("/", true, err)) {
        disconnect();
        return false;
    }
    char errorBuffer[CURL_ERROR_SIZE]{};
    curl_easy_setopt(handle(curl_), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(handle(curl_), CURLOPT_NOBODY, 1L);
    const CURLcode code = curl_easy_perform(handle(curl_));
    if (code != CURLE_OK) {
        err = curl::fromCurl(code, "FTP login to " + opt.host, errorBuffer);
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("ftp: connected to %s:%u", opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void CurlFtpClient::disconnect() {
    if (curl_) {
        curl_easy_cleanup(handle(curl_));
        curl_ = nullptr;
    }
    connected_ = false;
}

bool CurlFtpClient::get(const std::string& remote,
                        const std::string& local,
                        ClientError& err,
                        ByteProgressCB progress,
                        CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;
    if (!prepare(remote, false, err)) return false;

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }

    CURL* c = handle(curl_);
    char errorBuffer[CURL_ERROR_SIZE]{};
    curl::XferContext ctx{std::move(progress), std::move(shouldCancel), false};
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl::writeToFile);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, lf);
    curl::installProgress(c, &ctx);

    const CURLcode code = curl_easy_perform(c);
    const int closeRc = std::fclose(lf);
    if (code != CURLE_OK) {
        err = curl::fromCurl(code, "download " + remote, errorBuffer);
        return false;
    }
    if (closeRc != 0) {
        err = ClientError::fromErrno(errno, "close " + local);
        return false;
    }
    return true;
}

bool CurlFtpClient::put(const std::string& local,
                        const std::string& remote,
                        ClientError& err,
                        ByteProgressCB progress,
                        CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);

    if (!prepare(remote, false, err)) {
        std::fclose(lf);
        return false;
    }
    CURL* c = handle(curl_);
    char errorBuffer[CURL_ERROR_SIZE]{};
    curl::XferContext ctx{std::move(progress), std::move(shouldCancel), true};
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(c, CURLOPT_READFUNCTION, curl::readFromFile);
    curl_easy_setopt(c, CURLOPT_READDATA, lf);
    curl_easy_setopt(c, CURLOPT_INFILESIZE_LARGE, (curl_off_t)(fsz > 0 ? fsz : 0));
    curl::installProgress(c, &ctx);

    const CURLcode code = curl_easy_perform(c);
    std::fclose(lf);
    if (code != CURLE_OK) {
        err = curl::fromCurl(code, "upload " + remote, errorBuffer);
        return false;
    }
    return true;
}

bool CurlFtpClient::exists(const std::string& remote_path,
                           bool& isDir,
                           ClientError& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

// Directory probe (CWD) first, then file probe (SIZE/MDTM). Missing paths
// return false with err left empty.
bool CurlFtpClient::stat(const std::string& remote_path,
                         FileInfo& info,
                         ClientError& err) {
    if (!requireConnected(err)) return false;
    CURL* c = handle(curl_);
    char errorBuffer[CURL_ERROR_SIZE]{};

    if (!prepare(remote_path, true, err)) return false;
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    CURLcode code = curl_easy_perform(c);
    if (code == CURLE_OK) {
        info = FileInfo{};
        info.name = baseName(remote_path);
        info.is_dir = true;
        return true;
    }
    if (code != CURLE_REMOTE_ACCESS_DENIED && code != CURLE_REMOTE_FILE_NOT_FOUND) {
        err = curl::fromCurl(code, "stat " + remote_path, errorBuffer);
        return false;
    }

    if (!prepare(remote_path, false, err)) return false;
    errorBuffer[0] = '\0';
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_FILETIME, 1L);
    code = curl_easy_perform(c);
    if (code == CURLE_REMOTE_FILE_NOT_FOUND || code == CURLE_REMOTE_ACCESS_DENIED) {
        err.clear();
        return false; // does not exist
    }
    if (code != CURLE_OK) {
        err = curl::fromCurl(code, "stat " + remote_path, errorBuffer);
        return false;
    }
    curl_off_t size = -1;
    long filetime = -1;
    curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &size);
    curl_easy_getinfo(c, CURLINFO_FILETIME, &filetime);
    info = FileInfo{};
    info.name = baseName(remote_path);
    info.size = size > 0 ? (std::uint64_t)size : 0;
    info.mtime = filetime > 0 ? (std::uint64_t)filetime : 0;
    info.mode = 0644;
    return true;
}

bool CurlFtpClient::quote(const std::vector<std::string>& commands, const std::string& what, ClientError& err) {
    if (!requireConnected(err)) return false;
    if (!prepare("/", true, err)) return false;

    curl::unique_curl_slist list;
    for (const auto& cmd : commands) {
        if (!curl::appendSlist(list, cmd)) {
            err.set(ErrorKind::Unknown, "Out of memory building FTP command list");
            return false;
        }
    }
    CURL* c = handle(curl_);
    char errorBuffer[CURL_ERROR_SIZE]{};
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_QUOTE, list.get());

    const CURLcode code = curl_easy_perform(c);
    curl_easy_setopt(c, CURLOPT_QUOTE, static_cast<curl_slist*>(nullptr));
    if (code == CURLE_OK) return true;

    long responseCode = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &responseCode);
    err = curl::fromCurl(code, what, errorBuffer);
    if (code == CURLE_QUOTE_ERROR) {
        // 550: action not taken (missing file, or no access); 552: quota
        if (responseCode == 550) err.kind = ErrorKind::FileNotFound;
        else if (responseCode == 552) err.kind = ErrorKind::StorageFull;
        else if (responseCode == 553) err.kind = ErrorKind::InvalidInput;
        else err.kind = ErrorKind::Unknown;
    }
    LOGD("ftp: %s failed, response %ld", what.c_str(), responseCode);
    return false;
}

bool CurlFtpClient::mkdir(const std::string& remote_dir,
                          ClientError& err,
                          unsigned int mode) {
    (void)mode;
    if (quote({"MKD " + remote_dir}, "mkdir " + remote_dir, err)) return true;
    // MKD answers 550 for existing entries too.
    ClientError probe;
    bool isDir = false;
    if (exists(remote_dir, isDir, probe)) err.set(ErrorKind::FileExists, "mkdir " + remote_dir + ": already exists");
    return false;
}

bool CurlFtpClient::removeFile(const std::string& remote_path,
                               ClientError& err) {
    return quote({"DELE " + remote_path}, "delete " + remote_path, err);
}

bool CurlFtpClient::removeDir(const std::string& remote_dir,
                              ClientError& err) {
    return quote({"RMD " + remote_dir}, "rmdir " + remote_dir, err);
}

bool CurlFtpClient::rename(const std::string& from,
                           const std::string& to,
                           ClientError& err,
                           bool overwrite) {
    if (!overwrite) {
        bool isDir = false;
        if (exists(to, isDir, err)) {
            err.set(ErrorKind::FileExists, "rename " + from + " -> " + to + ": target exists");
            return false;
        }
        if (!err.empty()) return false;
    }
    return quote({"RNFR " + from, "RNTO " + to}, "rename " + from + " -> " + to, err);
}

std::unique_ptr<RemoteClient> CurlFtpClient::newConnectionLike(const ConnectionDescriptor& opt,
                                                               ClientError& err) {
    auto ptr = std::make_unique<CurlFtpClient>();
    ptr->setTuning(tuning_);
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace openxfer
