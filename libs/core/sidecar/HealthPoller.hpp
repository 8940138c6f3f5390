#pragma once
/*
Sandcastle - HealthPoller
Role: Confirms the sidecar accepts requests before it is declared ready.
Inputs/Outputs: Takes a port; resolves a QFuture<int> with the number of attempts used,
                or fails it with SidecarError(HealthCheckFailed).
Threading: Runs on its owner's event loop (QNetworkAccessManager + QTimer); never blocks.
Performance: Fixed-interval polling, no jitter; budget = maxAttempts * retryIntervalMs.
*/
#include <memory>
#include <QFuture>
#include <QObject>
#include <QPromise>
#include <QString>
#include <QUrl>
#include "SidecarTypes.hpp"

class QNetworkAccessManager;
class QNetworkReply;

struct HealthPolicy {
    QString host = QStringLiteral("localhost");
    QString path = QStringLiteral("/api/health");
    int maxAttempts = 50;
    int retryIntervalMs = 100;
    int requestTimeoutMs = 2000;

    int budgetMs() const { return maxAttempts * retryIntervalMs; }
};

class HealthPoller : public QObject {
    Q_OBJECT

public:
    explicit HealthPoller(HealthPolicy policy, QObject* parent = nullptr);
    ~HealthPoller() override;

    // Starts polling. A poll already in progress keeps running and its
    // future is returned instead.
    QFuture<int> poll(Port port);

    const HealthPolicy& policy() const { return m_policy; }
    int attempts() const { return m_attempt; }

signals:
    void probeFailed(int attempt, const QString& reason);
    void ready(int attempts);

private:
    void probe();
    void onReply(QNetworkReply* reply);
    void retryOrFail(const QString& reason);

    HealthPolicy m_policy;
    QNetworkAccessManager* m_network;
    QUrl m_url;
    int m_attempt = 0;
    std::unique_ptr<QPromise<int>> m_promise;
};
