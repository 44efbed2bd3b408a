#include "CurationSettings.h"

#include <QDebug>

CurationSettings::CurationSettings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

CurationConfig CurationSettings::load(QString* errorString) const
{
    bool modeOk = true;
    const ScanMode mode = scanModeFromName(
        m_settings.value(QStringLiteral("curation/mode"), QStringLiteral("deep")).toString(), &modeOk);
    if (!modeOk)
        qWarning() << "[Settings] Unknown curation/mode, using deep";

    const CurationConfig preset = CurationConfig::forMode(mode);
    CurationConfig c = preset;

    // ── Matching ─────────────────────────────────────────────────────
    c.threshold = m_settings.value(QStringLiteral("matching/threshold"), preset.threshold).toDouble();
    c.uncertainFloor = m_settings.value(QStringLiteral("matching/uncertainFloor"),
                                        preset.uncertainFloor).toDouble();
    c.useContentHash = m_settings.value(QStringLiteral("matching/useContentHash"),
                                        preset.useContentHash).toBool();
    c.thoroughGrouping = m_settings.value(QStringLiteral("matching/thoroughGrouping"),
                                          preset.thoroughGrouping).toBool();

    // ── Export ───────────────────────────────────────────────────────
    c.exportNew = m_settings.value(QStringLiteral("export/new"), preset.exportNew).toBool();
    c.exportDuplicates = m_settings.value(QStringLiteral("export/duplicates"),
                                          preset.exportDuplicates).toBool();
    c.exportUncertain = m_settings.value(QStringLiteral("export/uncertain"),
                                         preset.exportUncertain).toBool();
    c.exportPreviouslyReviewed = m_settings.value(QStringLiteral("export/previouslyReviewed"),
                                                  preset.exportPreviouslyReviewed).toBool();
    c.exportDir = m_settings.value(QStringLiteral("export/dir")).toString();

    // ── Workers ──────────────────────────────────────────────────────
    c.workerThreads = m_settings.value(QStringLiteral("workers/threads"), preset.workerThreads).toInt();
    c.batchSize = m_settings.value(QStringLiteral("workers/batchSize"), preset.batchSize).toInt();

    // ── Cleanup ──────────────────────────────────────────────────────
    c.backupDir = m_settings.value(QStringLiteral("cleanup/backupDir")).toString();
    c.reportsDir = m_settings.value(QStringLiteral("cleanup/reportsDir")).toString();
    c.dryRun = m_settings.value(QStringLiteral("cleanup/dryRun"), preset.dryRun).toBool();
    c.minFreeSpaceMarginBytes = m_settings.value(QStringLiteral("cleanup/minFreeSpaceMargin"),
                                                 preset.minFreeSpaceMarginBytes).toLongLong();

    c.historyLimit = m_settings.value(QStringLiteral("history/limit"), preset.historyLimit).toInt();

    // ── Quality weights (scalar boundaries only) ─────────────────────
    QualityWeights& w = c.weights;
    w.maxBitratePoints = m_settings.value(QStringLiteral("quality/maxBitratePoints"),
                                          w.maxBitratePoints).toInt();
    w.referenceBitrateKbps = m_settings.value(QStringLiteral("quality/referenceBitrate"),
                                              w.referenceBitrateKbps).toInt();
    w.vbrBonus = m_settings.value(QStringLiteral("quality/vbrBonus"), w.vbrBonus).toInt();
    w.recentDays = m_settings.value(QStringLiteral("quality/recentDays"), w.recentDays).toInt();
    w.moderateDays = m_settings.value(QStringLiteral("quality/moderateDays"), w.moderateDays).toInt();

    m_settings.beginGroup(QStringLiteral("formatPoints"));
    for (const QString& fmt : m_settings.childKeys())
        w.formatPoints.insert(fmt.toLower(), m_settings.value(fmt).toInt());
    m_settings.endGroup();

    QString err;
    if (!c.validate(&err)) {
        qWarning() << "[Settings] Invalid stored config:" << err << "- using" << scanModeName(mode) << "preset";
        if (errorString) *errorString = err;
        return preset;
    }
    return c;
}

bool CurationSettings::save(const CurationConfig& c, QString* errorString)
{
    if (!c.validate(errorString))
        return false;

    m_settings.setValue(QStringLiteral("curation/mode"), scanModeName(c.mode));
    m_settings.setValue(QStringLiteral("matching/threshold"), c.threshold);
    m_settings.setValue(QStringLiteral("matching/uncertainFloor"), c.uncertainFloor);
    m_settings.setValue(QStringLiteral("matching/useContentHash"), c.useContentHash);
    m_settings.setValue(QStringLiteral("matching/thoroughGrouping"), c.thoroughGrouping);
    m_settings.setValue(QStringLiteral("export/new"), c.exportNew);
    m_settings.setValue(QStringLiteral("export/duplicates"), c.exportDuplicates);
    m_settings.setValue(QStringLiteral("export/uncertain"), c.exportUncertain);
    m_settings.setValue(QStringLiteral("export/previouslyReviewed"), c.exportPreviouslyReviewed);
    m_settings.setValue(QStringLiteral("export/dir"), c.exportDir);
    m_settings.setValue(QStringLiteral("workers/threads"), c.workerThreads);
    m_settings.setValue(QStringLiteral("workers/batchSize"), c.batchSize);
    m_settings.setValue(QStringLiteral("cleanup/backupDir"), c.backupDir);
    m_settings.setValue(QStringLiteral("cleanup/reportsDir"), c.reportsDir);
    m_settings.setValue(QStringLiteral("cleanup/dryRun"), c.dryRun);
    m_settings.setValue(QStringLiteral("cleanup/minFreeSpaceMargin"), c.minFreeSpaceMarginBytes);
    m_settings.setValue(QStringLiteral("history/limit"), c.historyLimit);

    const QualityWeights& w = c.weights;
    m_settings.setValue(QStringLiteral("quality/maxBitratePoints"), w.maxBitratePoints);
    m_settings.setValue(QStringLiteral("quality/referenceBitrate"), w.referenceBitrateKbps);
    m_settings.setValue(QStringLiteral("quality/vbrBonus"), w.vbrBonus);
    m_settings.setValue(QStringLiteral("quality/recentDays"), w.recentDays);
    m_settings.setValue(QStringLiteral("quality/moderateDays"), w.moderateDays);

    const QualityWeights defaults = QualityWeights::defaults();
    m_settings.beginGroup(QStringLiteral("formatPoints"));
    m_settings.remove(QString());
    for (auto it = w.formatPoints.constBegin(); it != w.formatPoints.constEnd(); ++it) {
        if (defaults.formatPoints.value(it.key(), -1) != it.value())
            m_settings.setValue(it.key(), it.value());
    }
    m_settings.endGroup();

    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        if (errorString) *errorString = QStringLiteral("Cannot write %1").arg(m_settings.fileName());
        qWarning() << "[Settings] Write failed:" << m_settings.fileName();
        return false;
    }
    emit configChanged();
    return true;
}

QString CurationSettings::lastLibraryPath() const
{
    return m_settings.value(QStringLiteral("library/lastPath")).toString();
}

void CurationSettings::setLastLibraryPath(const QString& path)
{
    m_settings.setValue(QStringLiteral("library/lastPath"), path);
}
