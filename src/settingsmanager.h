#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include "prefbridge_global.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

class PreferenceStore;

// Bridge module over a PreferenceStore. A host dispatcher finds it by the
// "BridgeModule" class info and calls the invokable methods by name.
class PREFBRIDGE_EXPORT SettingsManager : public QObject
{
    Q_OBJECT
    Q_CLASSINFO("BridgeModule", "SettingsManager")
    Q_PROPERTY(QVariantMap constants READ getConstants CONSTANT)

public:
    static QString moduleName();

    explicit SettingsManager(PreferenceStore &store, QObject *parent = nullptr);

    // Host-invokable methods
    Q_INVOKABLE QVariant getValue(const QString &key) const;
    Q_INVOKABLE void setValue(const QString &key, const QVariant &value);
    Q_INVOKABLE void setValues(const QVariantMap &values);
    Q_INVOKABLE void deleteValues(const QStringList &keys);

    // Store content at the time the module was constructed
    Q_INVOKABLE QVariantMap getConstants() const;

signals:
    // Full store content after a change made by anyone but this module
    void settingsUpdated(const QVariantMap &settings);

private:
    void onStoreChanged(const QVariantMap &changes);

    PreferenceStore &m_store;
    const QVariantMap m_constants;
    bool m_ignoringUpdates;
};

#endif // SETTINGSMANAGER_H
