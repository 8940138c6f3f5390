#pragma once
/*
Sandcastle - OneShot
Role: Single-delivery channel. One producer fulfills it at most once; the consumer
      observes the value (or the closed channel) through a QFuture.
Threading: send/close are serialized by an internal mutex; the future is safe to
           share across threads.
*/
#include <QFuture>
#include <QMutex>
#include <QMutexLocker>
#include <QPromise>

template <typename T>
class OneShot {
public:
    OneShot() { m_promise.start(); }
    ~OneShot() { close(); }

    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    QFuture<T> future() { return m_promise.future(); }

    // Returns false when the channel already delivered or was closed.
    bool send(const T& value) {
        QMutexLocker lock(&m_mutex);
        if (m_settled)
            return false;
        m_settled = true;
        m_promise.addResult(value);
        m_promise.finish();
        return true;
    }

    // Drops the sender without a value. The future finishes canceled and
    // carries no result.
    void close() {
        QMutexLocker lock(&m_mutex);
        if (m_settled)
            return;
        m_settled = true;
        m_promise.future().cancel();
        m_promise.finish();
    }

    bool isSettled() const {
        QMutexLocker lock(&m_mutex);
        return m_settled;
    }

private:
    mutable QMutex m_mutex;
    QPromise<T> m_promise;
    bool m_settled = false;
};
