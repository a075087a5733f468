#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ConnectionPool::ConnectionPool(int maxSize)
    : m_maxSize(qMax(1, maxSize))
{
}

ConnectionPool::~ConnectionPool()
{
    clear();
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QMutexLocker locker(&m_mutex);

    if (m_enabled && !m_idle.isEmpty()) {
        QNetworkAccessManager* nam = m_idle.dequeue();
        m_active.insert(nam);
        LOG_DEBUG(QStringLiteral("ConnectionPool: reused idle manager (active=%1, idle=%2)")
                      .arg(m_active.size())
                      .arg(m_idle.size()));
        return nam;
    }

    if (m_enabled && m_active.size() >= m_maxSize) {
        LOG_WARNING(QStringLiteral("ConnectionPool: max pool size %1 exceeded, "
                                   "creating overflow manager (active=%2)")
                        .arg(m_maxSize)
                        .arg(m_active.size()));
    }

    auto* nam = new QNetworkAccessManager;
    m_active.insert(nam);
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam) {
        return;
    }

    QMutexLocker locker(&m_mutex);
    if (!m_active.remove(nam)) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release called on untracked manager, deleting"));
        nam->deleteLater();
        return;
    }

    // Overflow managers and a disabled pool never keep idle entries.
    const int totalAfterReturn = m_idle.size() + m_active.size() + 1;
    if (!m_enabled || totalAfterReturn > m_maxSize) {
        nam->deleteLater();
        return;
    }

    m_idle.enqueue(nam);
}

void ConnectionPool::clear()
{
    QMutexLocker locker(&m_mutex);
    qDeleteAll(m_idle);
    m_idle.clear();

    qDeleteAll(m_active);
    m_active.clear();
}

void ConnectionPool::resize(int maxSize)
{
    QMutexLocker locker(&m_mutex);
    m_maxSize = qMax(1, maxSize);

    while (m_idle.size() + m_active.size() > m_maxSize && !m_idle.isEmpty()) {
        delete m_idle.dequeue();
    }
}

void ConnectionPool::setEnabled(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_enabled = enabled;
    if (!m_enabled) {
        qDeleteAll(m_idle);
        m_idle.clear();
    }
}

bool ConnectionPool::isEnabled() const
{
    QMutexLocker locker(&m_mutex);
    return m_enabled;
}

int ConnectionPool::maxSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxSize;
}

int ConnectionPool::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active.size();
}

int ConnectionPool::idleCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_idle.size();
}
