// Path normalization and parsing.
#include "openxfer/PathResolver.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace openxfer {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string collapseSlashes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    return out;
}

std::string stripTrailingSlash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

bool isKnownScheme(const std::string& scheme) {
    return scheme == "smb" || scheme == "sftp" || scheme == "ftp" ||
           scheme == "cloud" || scheme == "file";
}

bool parsePort(const std::string& s, std::uint16_t& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s)
        if (!std::isdigit((unsigned char)c)) return false;
    const long v = std::stol(s);
    if (v <= 0 || v > 65535) return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

} // namespace

std::string PathResolver::normalize(const std::string& raw) {
    std::string s = trim(raw);
    std::replace(s.begin(), s.end(), '\\', '/');

    const auto colon = s.find(':');
    if (colon != std::string::npos && colon > 0) {
        const std::string scheme = toLower(s.substr(0, colon));
        if (isKnownScheme(scheme)) {
            std::string rest = s.substr(colon + 1);
            std::size_t i = 0;
            while (i < rest.size() && rest[i] == '/') ++i;
            rest = collapseSlashes(rest.substr(i));
            // file:// URIs are plain local paths
            if (scheme == "file") return "/" + rest;
            return scheme + "://" + rest;
        }
    }
    return collapseSlashes(s);
}

std::optional<TransferPath> PathResolver::resolve(const std::string& raw, std::string& err) {
    err.clear();
    const std::string s = normalize(raw);
    if (s.empty()) {
        err = "Empty path";
        return std::nullopt;
    }

    const auto sep = s.find("://");
    if (sep == std::string::npos) {
        std::error_code ec;
        std::filesystem::path p(s);
        if (!p.is_absolute()) {
            p = std::filesystem::absolute(p, ec);
            if (ec) {
                err = "Cannot make path absolute: " + s;
                return std::nullopt;
            }
        }
        return TransferPath(LocalPath{stripTrailingSlash(p.lexically_normal().generic_string())});
    }

    const std::string scheme = s.substr(0, sep);
    const std::string rest = s.substr(sep + 3);
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    const std::string pathPart = slash == std::string::npos ? std::string() : rest.substr(slash);

    if (scheme == "cloud") {
        auto provider = cloudProviderFromAlias(authority);
        if (!provider) {
            err = "Unknown cloud provider: " + authority;
            return std::nullopt;
        }
        std::string idOrPath = pathPart;
        while (!idOrPath.empty() && idOrPath.front() == '/') idOrPath.erase(idOrPath.begin());
        while (!idOrPath.empty() && idOrPath.back() == '/') idOrPath.pop_back();
        if (idOrPath.empty()) {
            err = "Cloud path has no item: " + s;
            return std::nullopt;
        }
        return TransferPath(CloudPath{*provider, idOrPath});
    }

    std::string user;
    std::string hostPort = authority;
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        user = authority.substr(0, at);
        hostPort = authority.substr(at + 1);
    }

    std::string host = hostPort;
    std::uint16_t port = 0;
    const auto colon = hostPort.rfind(':');
    if (colon != std::string::npos) {
        host = hostPort.substr(0, colon);
        if (!parsePort(hostPort.substr(colon + 1), port)) {
            err = "Invalid port in: " + s;
            return std::nullopt;
        }
    }
    host = toLower(host);
    if (host.empty()) {
        err = "Missing host in: " + s;
        return std::nullopt;
    }

    const std::string remote = stripTrailingSlash(pathPart.empty() ? std::string("/") : pathPart);

    if (scheme == "smb") {
        const auto shareEnd = remote.find('/', 1);
        const std::string share = remote.substr(1, shareEnd == std::string::npos ? std::string::npos : shareEnd - 1);
        if (share.empty()) {
            err = "SMB path needs a share: " + s;
            return std::nullopt;
        }
        SmbPath p;
        p.host = host;
        p.port = port ? port : kDefaultSmbPort;
        p.share = share;
        p.remotePath = shareEnd == std::string::npos ? std::string("/") : remote.substr(shareEnd);
        return TransferPath(p);
    }
    if (scheme == "sftp") {
        SftpPath p;
        p.host = host;
        p.port = port ? port : kDefaultSftpPort;
        p.user = user;
        p.remotePath = remote;
        return TransferPath(p);
    }
    if (scheme == "ftp") {
        FtpPath p;
        p.host = host;
        p.port = port ? port : kDefaultFtpPort;
        p.remotePath = remote;
        return TransferPath(p);
    }

    err = "Unsupported scheme: " + scheme;
    return std::nullopt;
}

} // namespace openxfer
