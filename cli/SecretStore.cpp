// SecretStore implementation: optional insecure fallback with QSettings.
#include "SecretStore.hpp"
#include "openxfer/Log.hpp"
#include <QSettings>
#include <QVariant>
#include <cstdlib>

static bool fallbackEnabledEnv() {
    const char* v = std::getenv("OPEN_XFER_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

void SecretStore::setSecret(const QString& key, const QString& value) {
    if (!fallbackEnabledEnv()) return;
    QSettings s("OpenXfer", "Secrets");
    s.setValue(key, value);
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    if (!fallbackEnabledEnv()) return std::nullopt;
    QSettings s("OpenXfer", "Secrets");
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    const QString out = v.toString();
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

void SecretStore::removeSecret(const QString& key) {
    if (!fallbackEnabledEnv()) return;
    QSettings s("OpenXfer", "Secrets");
    s.remove(key);
}

bool SecretStore::insecureFallbackActive() {
    return fallbackEnabledEnv();
}

QString SecretStore::endpointKey(openxfer::Protocol protocol, const QString& host, quint16 port,
                                 const QString& field) {
    const QString scheme = QString::fromLatin1(openxfer::protocolName(protocol)).toLower();
    return QString("%1://%2:%3:%4").arg(scheme, host).arg(port).arg(field);
}

QString SecretStore::cloudTokenKey(openxfer::CloudProvider provider) {
    return QString("cloud:%1:token").arg(QString::fromLatin1(openxfer::cloudProviderName(provider)));
}

QString SecretStore::cloudAccountKey(openxfer::CloudProvider provider) {
    return QString("cloud:%1:account").arg(QString::fromLatin1(openxfer::cloudProviderName(provider)));
}

std::optional<openxfer::ConnectionDescriptor> SecretStore::lookup(openxfer::Protocol protocol,
                                                                  const std::string& host,
                                                                  std::uint16_t port) const {
    const QString h = QString::fromStdString(host);
    auto field = [&](const char* name) { return getSecret(endpointKey(protocol, h, port, name)); };

    const auto user = field("user");
    const auto password = field("password");
    const auto key = field("key");
    const auto passphrase = field("passphrase");
    if (!user && !password && !key) {
        LOGD("no stored credentials for %s:%u", host.c_str(), (unsigned)port);
        return std::nullopt;
    }

    openxfer::ConnectionDescriptor d;
    d.protocol = protocol;
    d.host = host;
    d.port = port;
    if (user) d.username = user->toStdString();
    if (password) d.password = password->toStdString();
    if (key) d.private_key_path = key->toStdString();
    if (passphrase) d.private_key_passphrase = passphrase->toStdString();
    return d;
}

std::optional<std::string> SecretStore::cloudToken(openxfer::CloudProvider provider) const {
    const auto token = getSecret(cloudTokenKey(provider));
    if (!token) return std::nullopt;
    return token->toStdString();
}

std::optional<std::string> SecretStore::cloudAccount(openxfer::CloudProvider provider) const {
    const auto account = getSecret(cloudAccountKey(provider));
    if (!account || account->isEmpty()) return std::nullopt;
    return account->toStdString();
}
