#ifndef PREFERENCESTORE_H
#define PREFERENCESTORE_H

#include "prefbridge_global.h"
#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <memory>

class PreferenceStorePrivate;

// Persistent key/value store backed by a JSON file. Writing a null value
// removes the key. Writes are flushed immediately and changes made to the
// file by other processes are picked up through a file watcher.
class PREFBRIDGE_EXPORT PreferenceStore : public QObject
{
    Q_OBJECT

public:
    static PreferenceStore* instance();
    static QString defaultPath(const QString &domain);

    explicit PreferenceStore(const QString &fileName, QObject *parent = nullptr);
    ~PreferenceStore();

    QVariant value(const QString &key) const;
    bool contains(const QString &key) const;
    QStringList allKeys() const;
    QVariantMap values() const;

    void setValue(const QString &key, const QVariant &value);
    void setValues(const QVariantMap &values);
    void remove(const QString &key);
    void removeValues(const QStringList &keys);
    void clear();
    void sync();

    QString fileName() const;
    QSettings::Status status() const;

signals:
    void valueChanged(const QString &key, const QVariant &value);
    void valuesChanged(const QVariantMap &changes);
    void externalValuesChanged(const QVariantMap &changes);

private:
    PreferenceStore(const PreferenceStore&) = delete;
    PreferenceStore& operator=(const PreferenceStore&) = delete;

    void applyChanges(const QVariantMap &changes);
    void notify(const QVariantMap &changes);

    std::unique_ptr<PreferenceStorePrivate> d_ptr;
    Q_DECLARE_PRIVATE(PreferenceStore)

private slots:
    void onFileChanged(const QString &path);
};

#endif // PREFERENCESTORE_H
