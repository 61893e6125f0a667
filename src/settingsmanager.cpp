#include "settingsmanager.h"
#include "preferencestore.h"
#include <QLoggingCategory>
#include <QScopedValueRollback>

Q_LOGGING_CATEGORY(lcManager, "prefbridge.manager")

QString SettingsManager::moduleName()
{
    return QStringLiteral("SettingsManager");
}

SettingsManager::SettingsManager(PreferenceStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_constants(store.values())
    , m_ignoringUpdates(false)
{
    connect(&m_store, &PreferenceStore::valuesChanged,
            this, &SettingsManager::onStoreChanged);
    qCDebug(lcManager) << "Installed over" << m_store.fileName()
                       << "with" << m_constants.size() << "keys";
}

QVariant SettingsManager::getValue(const QString &key) const
{
    return m_store.value(key);
}

void SettingsManager::setValue(const QString &key, const QVariant &value)
{
    QScopedValueRollback<bool> guard(m_ignoringUpdates, true);
    m_store.setValue(key, value);
}

void SettingsManager::setValues(const QVariantMap &values)
{
    QScopedValueRollback<bool> guard(m_ignoringUpdates, true);
    m_store.setValues(values);
}

void SettingsManager::deleteValues(const QStringList &keys)
{
    QScopedValueRollback<bool> guard(m_ignoringUpdates, true);
    m_store.removeValues(keys);
}

QVariantMap SettingsManager::getConstants() const
{
    return m_constants;
}

void SettingsManager::onStoreChanged(const QVariantMap &changes)
{
    if (m_ignoringUpdates) {
        return;
    }
    qCDebug(lcManager) << "Store changed:" << changes.keys();
    emit settingsUpdated(m_store.values());
}
