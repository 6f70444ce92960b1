#include "AppSettings.hpp"
#include <QByteArray>
#include <QSettings>
#include <QStringList>
#include <QUrl>

namespace {

// Endpoint keys contain "//", which QSettings would read as group separators.
QString encodeKey(const QString& key) {
    return QString::fromLatin1(QUrl::toPercentEncoding(key));
}

QString decodeKey(const QString& stored) {
    return QUrl::fromPercentEncoding(stored.toLatin1());
}

} // namespace

AppSettings AppSettings::load() {
    AppSettings out;
    QSettings s("OpenXfer", "OpenXfer");
    out.userLimit = s.value("Network/userLimit", 0).toInt();
    out.stagingDir = s.value("Staging/dir", QString()).toString();

    s.beginGroup("Network/recommendedThreads");
    for (const QString& k : s.childKeys()) {
        const int n = s.value(k, 0).toInt();
        if (n > 0) out.recommendedThreads.insert(decodeKey(k), n);
    }
    s.endGroup();

    s.beginGroup("Network/bufferSize");
    for (const QString& k : s.childKeys()) {
        const qulonglong bytes = s.value(k, 0).toULongLong();
        if (bytes > 0) out.bufferSizes.insert(decodeKey(k), bytes);
    }
    s.endGroup();
    return out;
}

void AppSettings::save() const {
    QSettings s("OpenXfer", "OpenXfer");
    s.setValue("Network/userLimit", userLimit);
    s.setValue("Staging/dir", stagingDir);

    s.remove("Network/recommendedThreads");
    s.beginGroup("Network/recommendedThreads");
    for (auto it = recommendedThreads.constBegin(); it != recommendedThreads.constEnd(); ++it)
        s.setValue(encodeKey(it.key()), it.value());
    s.endGroup();

    s.remove("Network/bufferSize");
    s.beginGroup("Network/bufferSize");
    for (auto it = bufferSizes.constBegin(); it != bufferSizes.constEnd(); ++it)
        s.setValue(encodeKey(it.key()), it.value());
    s.endGroup();
    s.sync();
}

void AppSettings::applyTo(openxfer::AdmissionController& admission) const {
    admission.setUserNetworkLimit(userLimit);
    for (auto it = recommendedThreads.constBegin(); it != recommendedThreads.constEnd(); ++it)
        admission.setRecommendedThreads(it.key().toStdString(), it.value());
    for (auto it = bufferSizes.constBegin(); it != bufferSizes.constEnd(); ++it)
        admission.setRecommendedBufferSize(it.key().toStdString(), (std::size_t)it.value());
}

openxfer::StagingConfig AppSettings::stagingConfig() const {
    openxfer::StagingConfig cfg;
    cfg.directory = stagingDir.toStdString();
    return cfg;
}
