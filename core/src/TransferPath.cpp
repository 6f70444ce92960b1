// TransferPath helpers: endpoint keys, URIs and path arithmetic.
#include "openxfer/TransferPath.hpp"
#include <algorithm>
#include <cctype>

namespace openxfer {

namespace {

std::string joinHostPort(const std::string& host, std::uint16_t port) {
    return host + ":" + std::to_string(port);
}

std::string lastSegment(const std::string& p) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

// "/a/b" -> "/a", "/a" -> "/", "/" -> nullopt
std::optional<std::string> parentPath(const std::string& p) {
    if (p.empty() || p == "/") return std::nullopt;
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return std::nullopt;
    if (pos == 0) return std::string("/");
    return p.substr(0, pos);
}

std::string replaceLast(const std::string& p, const std::string& name) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return name;
    return p.substr(0, pos + 1) + name;
}

} // namespace

const char* cloudProviderName(CloudProvider p) {
    switch (p) {
        case CloudProvider::GoogleDrive: return "google_drive";
        case CloudProvider::Dropbox:     return "dropbox";
        case CloudProvider::OneDrive:    return "onedrive";
    }
    return "unknown";
}

std::optional<CloudProvider> cloudProviderFromAlias(const std::string& alias) {
    std::string a = alias;
    std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (a == "google_drive" || a == "googledrive" || a == "google") return CloudProvider::GoogleDrive;
    if (a == "dropbox") return CloudProvider::Dropbox;
    if (a == "onedrive") return CloudProvider::OneDrive;
    return std::nullopt;
}

std::vector<std::string> CloudPath::segments() const {
    std::vector<std::string> out;
    std::string cur;
    for (char c : idOrPath) {
        if (c == '/') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

Protocol protocolOf(const TransferPath& p) {
    return std::visit(overloaded{
        [](const LocalPath&) { return Protocol::Local; },
        [](const SmbPath&)   { return Protocol::Smb; },
        [](const SftpPath&)  { return Protocol::Sftp; },
        [](const FtpPath&)   { return Protocol::Ftp; },
        [](const CloudPath&) { return Protocol::Cloud; },
    }, p);
}

std::string endpointKey(const TransferPath& p) {
    return std::visit(overloaded{
        [](const LocalPath&)   { return std::string("local"); },
        [](const SmbPath& s)   { return "smb://" + joinHostPort(s.host, s.port); },
        [](const SftpPath& s)  { return "sftp://" + joinHostPort(s.host, s.port); },
        [](const FtpPath& f)   { return "ftp://" + joinHostPort(f.host, f.port); },
        [](const CloudPath& c) { return cloudEndpointKey(c.provider, {}); },
    }, p);
}

std::string cloudEndpointKey(CloudProvider provider, const std::string& account) {
    std::string key = std::string("cloud://") + cloudProviderName(provider);
    if (!account.empty()) key += "#" + account;
    return key;
}

std::string toUri(const TransferPath& p) {
    return std::visit(overloaded{
        [](const LocalPath& l) { return l.path; },
        [](const SmbPath& s) {
            return "smb://" + joinHostPort(s.host, s.port) + "/" + s.share +
                   (s.remotePath == "/" ? std::string() : s.remotePath);
        },
        [](const SftpPath& s) {
            return "sftp://" + (s.user.empty() ? std::string() : s.user + "@") +
                   joinHostPort(s.host, s.port) + s.remotePath;
        },
        [](const FtpPath& f) { return "ftp://" + joinHostPort(f.host, f.port) + f.remotePath; },
        [](const CloudPath& c) {
            return std::string("cloud://") + cloudProviderName(c.provider) + "/" + c.idOrPath;
        },
    }, p);
}

std::string fileName(const TransferPath& p) {
    return std::visit(overloaded{
        [](const LocalPath& l) { return lastSegment(l.path); },
        [](const SmbPath& s)   { return lastSegment(s.remotePath); },
        [](const SftpPath& s)  { return lastSegment(s.remotePath); },
        [](const FtpPath& f)   { return lastSegment(f.remotePath); },
        [](const CloudPath& c) {
            auto segs = c.segments();
            return segs.empty() ? std::string() : segs.back();
        },
    }, p);
}

TransferPath withFileName(const TransferPath& p, const std::string& name) {
    return std::visit(overloaded{
        [&](LocalPath l) -> TransferPath { l.path = replaceLast(l.path, name); return l; },
        [&](SmbPath s) -> TransferPath { s.remotePath = replaceLast(s.remotePath, name); return s; },
        [&](SftpPath s) -> TransferPath { s.remotePath = replaceLast(s.remotePath, name); return s; },
        [&](FtpPath f) -> TransferPath { f.remotePath = replaceLast(f.remotePath, name); return f; },
        [&](CloudPath c) -> TransferPath { c.idOrPath = replaceLast(c.idOrPath, name); return c; },
    }, p);
}

std::optional<TransferPath> parentOf(const TransferPath& p) {
    return std::visit(overloaded{
        [](LocalPath l) -> std::optional<TransferPath> {
            auto parent = parentPath(l.path);
            if (!parent) return std::nullopt;
            l.path = *parent;
            return TransferPath(l);
        },
        [](SmbPath s) -> std::optional<TransferPath> {
            auto parent = parentPath(s.remotePath);
            if (!parent) return std::nullopt;
            s.remotePath = *parent;
            return TransferPath(s);
        },
        [](SftpPath s) -> std::optional<TransferPath> {
            auto parent = parentPath(s.remotePath);
            if (!parent) return std::nullopt;
            s.remotePath = *parent;
            return TransferPath(s);
        },
        [](FtpPath f) -> std::optional<TransferPath> {
            auto parent = parentPath(f.remotePath);
            if (!parent) return std::nullopt;
            f.remotePath = *parent;
            return TransferPath(f);
        },
        [](CloudPath c) -> std::optional<TransferPath> {
            auto segs = c.segments();
            if (segs.size() < 2) return std::nullopt;
            std::string joined;
            for (std::size_t i = 0; i + 1 < segs.size(); ++i) {
                if (!joined.empty()) joined += "/";
                joined += segs[i];
            }
            c.idOrPath = joined;
            return TransferPath(c);
        },
    }, p);
}

bool sameEndpoint(const TransferPath& a, const TransferPath& b) {
    if (a.index() != b.index()) return false;
    return std::visit(overloaded{
        [&](const LocalPath&) { return true; },
        [&](const SmbPath& x) {
            const auto& y = std::get<SmbPath>(b);
            return x.host == y.host && x.port == y.port && x.share == y.share;
        },
        [&](const SftpPath& x) {
            const auto& y = std::get<SftpPath>(b);
            return x.host == y.host && x.port == y.port && x.user == y.user;
        },
        [&](const FtpPath& x) {
            const auto& y = std::get<FtpPath>(b);
            return x.host == y.host && x.port == y.port;
        },
        [&](const CloudPath& x) { return x.provider == std::get<CloudPath>(b).provider; },
    }, a);
}

std::pair<std::string, std::optional<std::string>> splitParentAndName(const CloudPath& p) {
    auto segs = p.segments();
    if (segs.size() < 2) return {std::string(), std::nullopt};
    std::string parent;
    for (std::size_t i = 0; i + 1 < segs.size(); ++i) {
        if (!parent.empty()) parent += "/";
        parent += segs[i];
    }
    if (p.provider == CloudProvider::Dropbox) parent = "/" + parent;
    return {parent, segs.back()};
}

} // namespace openxfer
