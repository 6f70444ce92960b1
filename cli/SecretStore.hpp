// Secret storage for the CLI and the credential source of the transfer core.
// Secrets live in an insecure QSettings fallback that must be enabled via env var.
#pragma once
#include <QString>
#include "openxfer/Credentials.hpp"
#include <optional>

// Key schema:
//   "<scheme>://<host>:<port>:user|password|key|passphrase"
//   "cloud:<provider>:token"
//   "cloud:<provider>:account"
class SecretStore : public openxfer::CredentialsProvider {
public:
    // Store a secret under a logical key.
    void setSecret(const QString& key, const QString& value);

    // Retrieve a secret if present.
    std::optional<QString> getSecret(const QString& key) const;

    void removeSecret(const QString& key);

    // Whether OPEN_XFER_ENABLE_INSECURE_FALLBACK=1 is set. Without it nothing
    // is read or written.
    static bool insecureFallbackActive();

    static QString endpointKey(openxfer::Protocol protocol, const QString& host, quint16 port, const QString& field);
    static QString cloudTokenKey(openxfer::CloudProvider provider);
    static QString cloudAccountKey(openxfer::CloudProvider provider);

    std::optional<openxfer::ConnectionDescriptor> lookup(openxfer::Protocol protocol,
                                                         const std::string& host,
                                                         std::uint16_t port) const override;
    std::optional<std::string> cloudToken(openxfer::CloudProvider provider) const override;
    std::optional<std::string> cloudAccount(openxfer::CloudProvider provider) const override;
};
