// Persisted CLI settings (QSettings "OpenXfer"/"OpenXfer"): network limits
// applied to the admission controller and the staging directory.
#pragma once
#include <QMap>
#include <QString>
#include "openxfer/AdmissionController.hpp"
#include "openxfer/TempFileManager.hpp"

struct AppSettings {
    int userLimit = 0;                  // Network/userLimit, 0 = protocol defaults
    QMap<QString, int> recommendedThreads;  // Network/recommendedThreads/<key>
    QMap<QString, qulonglong> bufferSizes;  // Network/bufferSize/<key>
    QString stagingDir;                 // Staging/dir, empty = system temp

    static AppSettings load();
    void save() const;

    void applyTo(openxfer::AdmissionController& admission) const;
    openxfer::StagingConfig stagingConfig() const;
};
