#include "preferencestore.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QStringView>
#include <QTimer>

Q_LOGGING_CATEGORY(lcStore, "prefbridge.store")

namespace {

const int DebounceInterval = 100;

// QSettings treats slash and backslash as group separators, normalizes repeated and
// edge slashes, and drops empty keys. Keys are escaped before they reach it
// so every user key maps to exactly one flat, non-empty settings key.
QString settingsKey(const QString &key)
{
    QString escaped = key;
    escaped.replace(QLatin1Char('%'), QLatin1String("%25"))
           .replace(QLatin1Char('/'), QLatin1String("%2F"))
           .replace(QLatin1Char('\\'), QLatin1String("%5C"));
    return QLatin1Char('_') + escaped;
}

QString userKey(const QString &stored)
{
    QString key;
    key.reserve(stored.size());
    for (qsizetype i = 1; i < stored.size(); ++i) {
        const QChar c = stored.at(i);
        if (c != QLatin1Char('%')) {
            key += c;
            continue;
        }
        const QStringView code = QStringView(stored).mid(i + 1, 2);
        if (code == QLatin1String("2F")) {
            key += QLatin1Char('/');
        } else if (code == QLatin1String("5C")) {
            key += QLatin1Char('\\');
        } else {
            key += QLatin1Char('%');
        }
        i += 2;
    }
    return key;
}

// The file holds one JSON object with the user keys as written. Nested
// objects and arrays come back as QVariantMap and QVariantList values.
bool readJsonFile(QIODevice &device, QSettings::SettingsMap &map)
{
    const QByteArray data = device.readAll();
    if (data.trimmed().isEmpty()) {
        return true;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcStore) << "Malformed preference file:" << error.errorString();
        return false;
    }

    const QJsonObject object = document.object();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        // null means absent
        if (it.value().isNull() || it.value().isUndefined()) {
            continue;
        }
        map.insert(settingsKey(it.key()), it.value().toVariant());
    }
    return true;
}

bool writeJsonFile(QIODevice &device, const QSettings::SettingsMap &map)
{
    QJsonObject object;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        object.insert(userKey(it.key()), QJsonValue::fromVariant(it.value()));
    }
    const QJsonDocument document(object);
    return device.write(document.toJson(QJsonDocument::Indented)) >= 0;
}

QSettings::Format jsonFormat()
{
    static const QSettings::Format format =
        QSettings::registerFormat(QStringLiteral("json"), readJsonFile, writeJsonFile);
    return format;
}

} // namespace

class PreferenceStorePrivate
{
public:
    QString configPath;
    QSettings *settings;
    QFileSystemWatcher *watcher;
    QTimer *debounceTimer;
    // Last known content, used to tell external writes from our own
    QVariantMap cachedValues;

    explicit PreferenceStorePrivate(const QString &path)
        : configPath(path)
        , settings(nullptr)
        , watcher(nullptr)
        , debounceTimer(nullptr)
    {
        QDir dir;
        dir.mkpath(QFileInfo(configPath).absolutePath());
        settings = new QSettings(configPath, jsonFormat());
        if (settings->status() != QSettings::NoError) {
            qCWarning(lcStore) << "Failed to read preference file:" << configPath
                               << "status" << settings->status();
        }
        cachedValues = readAll();
    }

    ~PreferenceStorePrivate()
    {
        delete settings;
    }

    QVariantMap readAll() const
    {
        QVariantMap result;
        const QStringList keys = settings->allKeys();
        for (const QString &key : keys) {
            result.insert(userKey(key), settings->value(key));
        }
        return result;
    }

    void flush()
    {
        settings->sync();
        if (settings->status() != QSettings::NoError) {
            qCWarning(lcStore) << "Failed to write preference file:" << configPath
                               << "status" << settings->status();
        }
    }

    QVariantMap detectChanges()
    {
        settings->sync();
        const QVariantMap current = readAll();

        QVariantMap changes;
        for (auto it = current.constBegin(); it != current.constEnd(); ++it) {
            auto cached = cachedValues.constFind(it.key());
            if (cached == cachedValues.constEnd() || cached.value() != it.value()) {
                changes.insert(it.key(), it.value());
            }
        }
        for (auto it = cachedValues.constBegin(); it != cachedValues.constEnd(); ++it) {
            if (!current.contains(it.key())) {
                changes.insert(it.key(), QVariant());
            }
        }

        cachedValues = current;
        return changes;
    }

    // Atomic saves replace the file, which drops it from the watcher
    void watchFile()
    {
        if (watcher->files().contains(configPath) || !QFileInfo::exists(configPath)) {
            return;
        }
        if (!watcher->addPath(configPath)) {
            qCWarning(lcStore) << "Failed to watch preference file:" << configPath;
        }
    }
};

static PreferenceStore *s_instance = nullptr;
static QMutex s_mutex;

PreferenceStore* PreferenceStore::instance()
{
    QMutexLocker locker(&s_mutex);
    if (!s_instance) {
        QString domain = QCoreApplication::applicationName();
        if (domain.isEmpty()) {
            domain = QStringLiteral("standard");
        }
        s_instance = new PreferenceStore(defaultPath(domain));
    }
    return s_instance;
}

QString PreferenceStore::defaultPath(const QString &domain)
{
    QString configDir = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
    configDir += "/prefbridge";
    return configDir + "/" + domain + ".json";
}

PreferenceStore::PreferenceStore(const QString &fileName, QObject *parent)
    : QObject(parent)
    , d_ptr(new PreferenceStorePrivate(fileName))
{
    Q_D(PreferenceStore);

    d->watcher = new QFileSystemWatcher(this);
    d->watchFile();

    QString configDir = QFileInfo(d->configPath).absolutePath();
    if (QFileInfo::exists(configDir)) {
        if (!d->watcher->addPath(configDir)) {
            qCWarning(lcStore) << "Failed to watch preference directory:" << configDir;
        }
    }

    d->debounceTimer = new QTimer(this);
    d->debounceTimer->setSingleShot(true);
    d->debounceTimer->setInterval(DebounceInterval);

    connect(d->watcher, &QFileSystemWatcher::fileChanged,
            this, &PreferenceStore::onFileChanged);
    connect(d->watcher, &QFileSystemWatcher::directoryChanged,
            this, &PreferenceStore::onFileChanged);

    connect(d->debounceTimer, &QTimer::timeout, this, [this]() {
        Q_D(PreferenceStore);
        const QVariantMap changes = d->detectChanges();
        if (!changes.isEmpty()) {
            qCDebug(lcStore) << "External change in" << d->configPath << changes.keys();
            notify(changes);
            emit externalValuesChanged(changes);
        }
        d->watchFile();
    });
}

PreferenceStore::~PreferenceStore()
{
}

QVariant PreferenceStore::value(const QString &key) const
{
    Q_D(const PreferenceStore);
    return d->settings->value(settingsKey(key));
}

bool PreferenceStore::contains(const QString &key) const
{
    Q_D(const PreferenceStore);
    return d->settings->contains(settingsKey(key));
}

QStringList PreferenceStore::allKeys() const
{
    Q_D(const PreferenceStore);
    QStringList keys;
    const QStringList stored = d->settings->allKeys();
    for (const QString &key : stored) {
        keys.append(userKey(key));
    }
    return keys;
}

QVariantMap PreferenceStore::values() const
{
    Q_D(const PreferenceStore);
    return d->readAll();
}

void PreferenceStore::setValue(const QString &key, const QVariant &value)
{
    QVariantMap changes;
    changes.insert(key, value);
    applyChanges(changes);
}

void PreferenceStore::setValues(const QVariantMap &values)
{
    applyChanges(values);
}

void PreferenceStore::remove(const QString &key)
{
    QVariantMap changes;
    changes.insert(key, QVariant());
    applyChanges(changes);
}

void PreferenceStore::removeValues(const QStringList &keys)
{
    QVariantMap changes;
    for (const QString &key : keys) {
        changes.insert(key, QVariant());
    }
    applyChanges(changes);
}

void PreferenceStore::clear()
{
    removeValues(allKeys());
}

void PreferenceStore::sync()
{
    Q_D(PreferenceStore);
    d->flush();
}

QString PreferenceStore::fileName() const
{
    Q_D(const PreferenceStore);
    return d->configPath;
}

QSettings::Status PreferenceStore::status() const
{
    Q_D(const PreferenceStore);
    return d->settings->status();
}

void PreferenceStore::applyChanges(const QVariantMap &changes)
{
    Q_D(PreferenceStore);
    QVariantMap applied;
    for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
        const QString &key = it.key();
        const QString stored = settingsKey(key);
        if (it.value().isNull()) {
            if (!d->settings->contains(stored)) {
                continue;
            }
            d->settings->remove(stored);
            d->cachedValues.remove(key);
            applied.insert(key, QVariant());
        } else {
            if (d->settings->contains(stored) && d->settings->value(stored) == it.value()) {
                continue;
            }
            d->settings->setValue(stored, it.value());
            d->cachedValues.insert(key, it.value());
            applied.insert(key, it.value());
        }
    }

    if (applied.isEmpty()) {
        return;
    }
    d->flush();
    notify(applied);
}

void PreferenceStore::notify(const QVariantMap &changes)
{
    for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
        emit valueChanged(it.key(), it.value());
    }
    emit valuesChanged(changes);
}

void PreferenceStore::onFileChanged(const QString &path)
{
    Q_D(PreferenceStore);
    Q_UNUSED(path);
    if (!d->debounceTimer->isActive()) {
        d->debounceTimer->start();
    }
}
