#pragma once
#include <QMutex>
#include <QNetworkAccessManager>
#include <QQueue>
#include <QSet>
#include <utility>

// Pool of QNetworkAccessManager instances so upstream TCP/TLS sessions are
// reused across client requests.
class ConnectionPool {
public:
    // Returns its manager to the pool when destroyed.
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, QNetworkAccessManager* nam)
            : m_pool(pool), m_nam(nam) {}
        Lease(Lease&& other) noexcept
            : m_pool(std::exchange(other.m_pool, nullptr))
            , m_nam(std::exchange(other.m_nam, nullptr)) {}
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                reset();
                m_pool = std::exchange(other.m_pool, nullptr);
                m_nam = std::exchange(other.m_nam, nullptr);
            }
            return *this;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { reset(); }

        QNetworkAccessManager* get() const { return m_nam; }
        QNetworkAccessManager* operator->() const { return m_nam; }
        explicit operator bool() const { return m_nam != nullptr; }

        // Detaches the manager; the caller must hand it back with release().
        QNetworkAccessManager* take() {
            m_pool = nullptr;
            return std::exchange(m_nam, nullptr);
        }
        void reset() {
            if (m_pool && m_nam)
                m_pool->release(m_nam);
            m_pool = nullptr;
            m_nam = nullptr;
        }

    private:
        ConnectionPool* m_pool = nullptr;
        QNetworkAccessManager* m_nam = nullptr;
    };

    explicit ConnectionPool(int maxSize = 10);
    ~ConnectionPool();
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease lease() { return Lease(this, acquire()); }
    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);
    void clear();
    void resize(int maxSize);
    void setEnabled(bool enabled);
    bool isEnabled() const;
    int maxSize() const;
    int activeCount() const;
    int idleCount() const;

private:
    int m_maxSize;
    bool m_enabled = true;
    QQueue<QNetworkAccessManager*> m_idle;
    QSet<QNetworkAccessManager*> m_active;
    mutable QMutex m_mutex;
};
